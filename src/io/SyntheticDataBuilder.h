#ifndef SYNTHETIC_DATA_BUILDER_H
#define SYNTHETIC_DATA_BUILDER_H

#include <functional>
#include "../model/ElectionData.h"

namespace nposim {

/**
 * @brief Programmatic source of election datasets
 *
 * Accounts need not exist anywhere and stakes may be zero. Identifiers are
 * checked as they are added; build() runs the full dataset validation.
 */
class SyntheticDataBuilder {
public:
    /**
     * @brief Uniform draw in [0, bound)
     */
    using RandomSource = std::function<uint64_t(uint64_t bound)>;

    SyntheticDataBuilder();

    /**
     * @throws ValidationError (field "candidates") on duplicate id
     */
    SyntheticDataBuilder& addCandidate(const AccountID& accountID, const Balance& stake);

    /**
     * @throws ValidationError (field "nominators") on duplicate id
     */
    SyntheticDataBuilder& addNominator(const AccountID& accountID, const Balance& stake,
                                       const std::vector<AccountID>& targets = std::vector<AccountID>());

    /**
     * @throws ValidationError (field "nominators") if the nominator is unknown
     */
    SyntheticDataBuilder& addVotingEdge(const AccountID& nominatorID, const AccountID& candidateID);

    /**
     * @brief Fill with random candidates and nominators
     *
     * Candidates are named "candidate-<i>", nominators "nominator-<i>". Each
     * nominator approves up to @p targetsPerNominator distinct candidates.
     * Stakes are drawn in [minStake, maxStake].
     */
    SyntheticDataBuilder& populate(uint32_t candidateCount, uint32_t nominatorCount,
                                   uint32_t targetsPerNominator,
                                   uint64_t minStake, uint64_t maxStake,
                                   RandomSource random);

    /**
     * @throws ValidationError if the collected dataset is inconsistent
     */
    ElectionData build() const;

    size_t candidateCount() const { return data_.candidates.size(); }
    size_t nominatorCount() const { return data_.nominators.size(); }

private:
    ElectionData data_;
};

} // namespace nposim

#endif // SYNTHETIC_DATA_BUILDER_H
