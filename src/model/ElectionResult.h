#ifndef ELECTION_RESULT_H
#define ELECTION_RESULT_H

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "../common/NposimDefs.h"

namespace nposim {

/**
 * @brief Winner of the election
 */
struct SelectedValidator {
    AccountID accountID;
    Balance totalBackingStake;
    uint32_t nominatorCount;
    boost::optional<uint32_t> rank;   // 1-based round in which it was elected

    SelectedValidator() : totalBackingStake(0), nominatorCount(0) {}

    bool operator==(const SelectedValidator& other) const {
        return accountID == other.accountID && totalBackingStake == other.totalBackingStake &&
               nominatorCount == other.nominatorCount && rank == other.rank;
    }
};

/**
 * @brief Part of a voter's stake attributed to one winner
 *
 * A candidate's own bond appears with nominatorID == validatorID and
 * selfStake set.
 */
struct StakeAllocation {
    AccountID nominatorID;
    AccountID validatorID;
    Balance amount;
    double proportion;   // amount / voter stake, display only
    bool selfStake;

    StakeAllocation() : amount(0), proportion(0.0), selfStake(false) {}

    bool operator==(const StakeAllocation& other) const {
        return nominatorID == other.nominatorID && validatorID == other.validatorID &&
               amount == other.amount && proportion == other.proportion &&
               selfStake == other.selfStake;
    }
};

struct ExecutionMetadata {
    boost::optional<BlockNumber> blockNumber;
    boost::optional<std::string> executionTimestamp;  // RFC 3339, UTC
    boost::optional<std::string> dataSource;

    bool operator==(const ExecutionMetadata& other) const {
        return blockNumber == other.blockNumber &&
               executionTimestamp == other.executionTimestamp &&
               dataSource == other.dataSource;
    }
};

/**
 * @brief Outcome of one election execution (immutable once assembled)
 */
class ElectionResult {
public:
    ElectionResult(std::vector<SelectedValidator> selectedValidators,
                   std::vector<StakeAllocation> stakeDistribution,
                   const Balance& totalStake,
                   AlgorithmType algorithmUsed,
                   const ExecutionMetadata& executionMetadata = ExecutionMetadata());

    const std::vector<SelectedValidator>& selectedValidators() const { return selectedValidators_; }
    const std::vector<StakeAllocation>& stakeDistribution() const { return stakeDistribution_; }
    const Balance& totalStake() const { return totalStake_; }
    AlgorithmType algorithmUsed() const { return algorithmUsed_; }
    const ExecutionMetadata& executionMetadata() const { return executionMetadata_; }

    /**
     * @brief Copy carrying different execution metadata
     */
    ElectionResult withMetadata(const ExecutionMetadata& metadata) const;

    const SelectedValidator* findValidator(const AccountID& accountID) const;
    bool isSelected(const AccountID& accountID) const { return findValidator(accountID) != nullptr; }

    /**
     * @brief Sum of all allocation amounts
     */
    Balance allocatedStake() const;

    /**
     * @brief Same winners and allocations, ignoring execution metadata
     */
    bool sameOutcome(const ElectionResult& other) const;

    bool operator==(const ElectionResult& other) const {
        return sameOutcome(other) && executionMetadata_ == other.executionMetadata_;
    }

private:
    std::vector<SelectedValidator> selectedValidators_;
    std::vector<StakeAllocation> stakeDistribution_;
    Balance totalStake_;
    AlgorithmType algorithmUsed_;
    ExecutionMetadata executionMetadata_;
};

} // namespace nposim

#endif // ELECTION_RESULT_H
