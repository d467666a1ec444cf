#include "SyntheticDataBuilder.h"
#include "../common/ElectionError.h"
#include <algorithm>

namespace nposim {

SyntheticDataBuilder::SyntheticDataBuilder() {
}

SyntheticDataBuilder& SyntheticDataBuilder::addCandidate(const AccountID& accountID, const Balance& stake) {
    data_.addCandidate(Candidate(accountID, stake));
    return *this;
}

SyntheticDataBuilder& SyntheticDataBuilder::addNominator(const AccountID& accountID, const Balance& stake,
                                                         const std::vector<AccountID>& targets) {
    Nominator nominator(accountID, stake);
    for (const AccountID& target : targets) {
        nominator.addTarget(target);
    }
    data_.addNominator(nominator);
    return *this;
}

SyntheticDataBuilder& SyntheticDataBuilder::addVotingEdge(const AccountID& nominatorID,
                                                          const AccountID& candidateID) {
    Nominator* nominator = data_.findNominator(nominatorID);
    if (nominator == nullptr) {
        throw ValidationError("Nominator not found: " + nominatorID, "nominators");
    }
    nominator->addTarget(candidateID);
    return *this;
}

SyntheticDataBuilder& SyntheticDataBuilder::populate(uint32_t candidateCount, uint32_t nominatorCount,
                                                     uint32_t targetsPerNominator,
                                                     uint64_t minStake, uint64_t maxStake,
                                                     RandomSource random) {
    if (maxStake < minStake) {
        throw ValidationError("Synthetic stake range is empty", "synthetic.stake");
    }
    const uint64_t span = maxStake - minStake;
    auto drawStake = [&random, minStake, span]() -> Balance {
        if (span == 0) {
            return Balance(minStake);
        }
        // span + 1 would overflow for the full 64-bit range
        uint64_t bound = span == UINT64_MAX ? span : span + 1;
        return Balance(minStake) + random(bound);
    };

    const size_t firstCandidate = data_.candidates.size();
    for (uint32_t i = 0; i < candidateCount; ++i) {
        addCandidate("candidate-" + std::to_string(firstCandidate + i), drawStake());
    }

    const size_t pool = data_.candidates.size();
    const uint32_t perNominator = static_cast<uint32_t>(std::min<size_t>(targetsPerNominator, pool));
    const size_t firstNominator = data_.nominators.size();

    for (uint32_t i = 0; i < nominatorCount; ++i) {
        std::vector<AccountID> targets;
        // Partial Fisher-Yates over candidate indices
        std::vector<size_t> indices(pool);
        for (size_t j = 0; j < pool; ++j) {
            indices[j] = j;
        }
        for (uint32_t j = 0; j < perNominator; ++j) {
            size_t pick = j + static_cast<size_t>(random(pool - j));
            std::swap(indices[j], indices[pick]);
            targets.push_back(data_.candidates[indices[j]].accountID);
        }
        addNominator("nominator-" + std::to_string(firstNominator + i), drawStake(), targets);
    }

    return *this;
}

ElectionData SyntheticDataBuilder::build() const {
    data_.validate();
    return data_;
}

} // namespace nposim
