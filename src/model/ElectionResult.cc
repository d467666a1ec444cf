#include "ElectionResult.h"
#include <utility>

namespace nposim {

ElectionResult::ElectionResult(std::vector<SelectedValidator> selectedValidators,
                               std::vector<StakeAllocation> stakeDistribution,
                               const Balance& totalStake,
                               AlgorithmType algorithmUsed,
                               const ExecutionMetadata& executionMetadata)
    : selectedValidators_(std::move(selectedValidators))
    , stakeDistribution_(std::move(stakeDistribution))
    , totalStake_(totalStake)
    , algorithmUsed_(algorithmUsed)
    , executionMetadata_(executionMetadata)
{
}

ElectionResult ElectionResult::withMetadata(const ExecutionMetadata& metadata) const {
    return ElectionResult(selectedValidators_, stakeDistribution_, totalStake_, algorithmUsed_, metadata);
}

const SelectedValidator* ElectionResult::findValidator(const AccountID& accountID) const {
    for (const SelectedValidator& validator : selectedValidators_) {
        if (validator.accountID == accountID) {
            return &validator;
        }
    }
    return nullptr;
}

Balance ElectionResult::allocatedStake() const {
    Balance sum = 0;
    for (const StakeAllocation& allocation : stakeDistribution_) {
        sum += allocation.amount;
    }
    return sum;
}

bool ElectionResult::sameOutcome(const ElectionResult& other) const {
    return selectedValidators_ == other.selectedValidators_ &&
           stakeDistribution_ == other.stakeDistribution_ &&
           totalStake_ == other.totalStake_ &&
           algorithmUsed_ == other.algorithmUsed_;
}

} // namespace nposim
