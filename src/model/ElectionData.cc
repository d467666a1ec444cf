#include "ElectionData.h"
#include "../common/ElectionError.h"
#include <algorithm>
#include <set>

namespace nposim {

// ============================================================================
// NOMINATOR
// ============================================================================

void Nominator::addTarget(const AccountID& candidateID) {
    if (!hasTarget(candidateID)) {
        targets.push_back(candidateID);
    }
}

void Nominator::removeTarget(const AccountID& candidateID) {
    targets.erase(std::remove(targets.begin(), targets.end(), candidateID), targets.end());
}

bool Nominator::hasTarget(const AccountID& candidateID) const {
    return std::find(targets.begin(), targets.end(), candidateID) != targets.end();
}

// ============================================================================
// ELECTION DATA
// ============================================================================

void ElectionData::addCandidate(const Candidate& candidate) {
    if (findCandidate(candidate.accountID)) {
        throw ValidationError("Duplicate candidate account ID: " + candidate.accountID, "candidates");
    }
    candidates.push_back(candidate);
}

void ElectionData::addNominator(const Nominator& nominator) {
    if (findNominator(nominator.accountID)) {
        throw ValidationError("Duplicate nominator account ID: " + nominator.accountID, "nominators");
    }
    nominators.push_back(nominator);
}

void ElectionData::validate() const {
    if (candidates.empty()) {
        throw ValidationError(
            "Election data must contain at least one validator candidate, but found 0. "
            "Please add at least one candidate.",
            "candidates");
    }

    std::set<AccountID> candidateIDs;
    for (const Candidate& candidate : candidates) {
        if (!candidateIDs.insert(candidate.accountID).second) {
            throw ValidationError("Duplicate candidate account ID: " + candidate.accountID, "candidates");
        }
    }

    std::set<AccountID> nominatorIDs;
    for (const Nominator& nominator : nominators) {
        if (!nominatorIDs.insert(nominator.accountID).second) {
            throw ValidationError("Duplicate nominator account ID: " + nominator.accountID, "nominators");
        }
    }

    for (const Nominator& nominator : nominators) {
        for (const AccountID& target : nominator.targets) {
            if (candidateIDs.count(target) != 0) {
                continue;
            }

            std::string available;
            const size_t listed = std::min(candidates.size(),
                                           static_cast<size_t>(Constants::MAX_LISTED_CANDIDATES));
            for (size_t i = 0; i < listed; ++i) {
                if (i > 0) available += ", ";
                available += candidates[i].accountID;
            }
            if (candidates.size() > listed) {
                available += " (and " + std::to_string(candidates.size() - listed) + " more)";
            }

            throw ValidationError("Nominator '" + nominator.accountID +
                                  "' votes for non-existent candidate '" + target +
                                  "'. Available candidates: " + available,
                                  "nominators.targets");
        }
    }
}

Candidate* ElectionData::findCandidate(const AccountID& accountID) {
    for (Candidate& candidate : candidates) {
        if (candidate.accountID == accountID) return &candidate;
    }
    return nullptr;
}

const Candidate* ElectionData::findCandidate(const AccountID& accountID) const {
    for (const Candidate& candidate : candidates) {
        if (candidate.accountID == accountID) return &candidate;
    }
    return nullptr;
}

Nominator* ElectionData::findNominator(const AccountID& accountID) {
    for (Nominator& nominator : nominators) {
        if (nominator.accountID == accountID) return &nominator;
    }
    return nullptr;
}

const Nominator* ElectionData::findNominator(const AccountID& accountID) const {
    for (const Nominator& nominator : nominators) {
        if (nominator.accountID == accountID) return &nominator;
    }
    return nullptr;
}

} // namespace nposim
