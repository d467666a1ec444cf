#include "ElectionOverrides.h"
#include "../common/ElectionError.h"
#include <algorithm>
#include <iterator>

namespace nposim {

// ============================================================================
// CONSTRUCTION
// ============================================================================

void ElectionOverrides::setCandidateStake(const AccountID& accountID, const Balance& stake) {
    candidateStakes_[accountID] = stake;
}

void ElectionOverrides::setNominatorStake(const AccountID& accountID, const Balance& stake) {
    nominatorStakes_[accountID] = stake;
}

void ElectionOverrides::addVotingEdge(const AccountID& nominatorID, const AccountID& candidateID) {
    votingEdges_.push_back(EdgeModification(EdgeAction::ADD, nominatorID, candidateID));
}

void ElectionOverrides::removeVotingEdge(const AccountID& nominatorID, const AccountID& candidateID) {
    votingEdges_.push_back(EdgeModification(EdgeAction::REMOVE, nominatorID, candidateID));
}

void ElectionOverrides::modifyVotingEdge(const AccountID& nominatorID, const AccountID& candidateID,
                                         const boost::optional<Balance>& weight) {
    EdgeModification modification(EdgeAction::MODIFY, nominatorID, candidateID);
    modification.weight = weight;
    votingEdges_.push_back(modification);
}

void ElectionOverrides::addEdgeModification(const EdgeModification& modification) {
    votingEdges_.push_back(modification);
}

bool ElectionOverrides::empty() const {
    return candidateStakes_.empty() && nominatorStakes_.empty() &&
           votingEdges_.empty() && !activeSetSize_;
}

// ============================================================================
// TEXT DIRECTIVES
// ============================================================================

std::pair<AccountID, Balance> ElectionOverrides::parseStakeDirective(const std::string& text,
                                                                     const std::string& kind) {
    const std::string field = "override_" + kind + "_stake";

    std::string::size_type eq = text.find('=');
    if (eq == std::string::npos || text.find('=', eq + 1) != std::string::npos) {
        throw ValidationError("Invalid " + kind + " stake override format: '" + text +
                              "'. Expected format: account_id=stake", field);
    }

    AccountID accountID = trim(text.substr(0, eq));
    if (accountID.empty()) {
        throw ValidationError("Missing account id in " + kind + " stake override: '" + text + "'", field);
    }

    Balance stake = parseBalance(text.substr(eq + 1), field);
    return std::make_pair(accountID, stake);
}

EdgeModification ElectionOverrides::parseEdgeDirective(const std::string& text) {
    const std::string field = "override_voting_edge";

    std::string::size_type colon = text.find(':');
    std::string::size_type eq = text.find('=');
    if (colon == std::string::npos || eq == std::string::npos || eq < colon ||
        text.find('=', eq + 1) != std::string::npos) {
        throw ValidationError("Invalid voting edge override format: '" + text +
                              "'. Expected format: action:nominator_id=candidate_id", field);
    }

    EdgeModification modification;
    modification.action = parseEdgeAction(text.substr(0, colon));
    modification.nominatorID = trim(text.substr(colon + 1, eq - colon - 1));
    modification.candidateID = trim(text.substr(eq + 1));

    if (modification.nominatorID.empty() || modification.candidateID.empty()) {
        throw ValidationError("Missing account id in voting edge override: '" + text + "'", field);
    }
    return modification;
}

// ============================================================================
// APPLICATION
// ============================================================================

ElectionData ElectionOverrides::applyTo(const ElectionData& data) const {
    ElectionData working = data;

    for (const auto& entry : candidateStakes_) {
        Candidate* candidate = working.findCandidate(entry.first);
        if (candidate) {
            candidate->stake = entry.second;
        }
    }

    for (const auto& entry : nominatorStakes_) {
        Nominator* nominator = working.findNominator(entry.first);
        if (nominator) {
            nominator->stake = entry.second;
        }
    }

    for (const EdgeModification& modification : votingEdges_) {
        Nominator* nominator = working.findNominator(modification.nominatorID);
        if (!nominator) {
            continue;
        }

        switch (modification.action) {
            case EdgeAction::ADD:
                nominator->addTarget(modification.candidateID);
                break;
            case EdgeAction::REMOVE:
                nominator->removeTarget(modification.candidateID);
                break;
            case EdgeAction::MODIFY: {
                // remove then add, keeping the target's original position
                auto& targets = nominator->targets;
                auto first = std::find(targets.begin(), targets.end(), modification.candidateID);
                const auto position = std::distance(targets.begin(), first);
                const bool present = first != targets.end();
                nominator->removeTarget(modification.candidateID);
                if (present) {
                    targets.insert(targets.begin() + position, modification.candidateID);
                } else {
                    nominator->addTarget(modification.candidateID);
                }
                break;
            }
        }
    }

    return working;
}

} // namespace nposim
