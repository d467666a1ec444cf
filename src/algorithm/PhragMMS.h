#ifndef PHRAGMMS_H
#define PHRAGMMS_H

#include "ElectionGraph.h"
#include "StakeBalancer.h"

namespace nposim {

/**
 * @brief PhragMMS election (the "parallel" algorithm)
 *
 * Each round picks the candidate with the highest maximin score
 *   sum(budget_v) / (1 + sum(contribution_v))
 * over its approving voters, where a voter's contribution is the fraction of
 * each elected candidate's backing it provides. The winner is inserted with
 * the score as threshold: voters move stake from winners backed above the
 * threshold onto the new winner. The solution is balanced after every round.
 *
 * Scores are compared as exact fractions. Ties go to the earliest candidate.
 */
class PhragMMS {
public:
    PhragMMS();

    void setBalancing(const BalancingConfig& config) { balancer_.setConfig(config); }
    void setLogCallback(LogCallback callback);

    /**
     * @brief Elect @p toElect winners and assign edge weights
     * @throws AlgorithmError if every voter has zero stake or candidates run out
     */
    void run(ElectionGraph& graph, uint32_t toElect) const;

    /**
     * @brief Find the unelected candidate with the highest score
     * @param threshold receives the winner's score, floored, in stake units
     * @return candidate index or ElectionGraph::NONE
     */
    size_t findMaxScore(const ElectionGraph& graph, Balance& threshold) const;

    /**
     * @brief Move stake onto a freshly elected candidate
     */
    void insertElected(ElectionGraph& graph, size_t winner, const Balance& threshold) const;

private:
    StakeBalancer balancer_;
    LogCallback logCallback_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // PHRAGMMS_H
