#ifndef SEQUENTIAL_PHRAGMEN_H
#define SEQUENTIAL_PHRAGMEN_H

#include "ElectionGraph.h"
#include "StakeBalancer.h"

namespace nposim {

/**
 * @brief Sequential Phragmen election
 *
 * Elects one winner per round, always the candidate with the lowest load
 * score (1 + sum of approving voter stake x load) / approval stake, computed
 * in fixed point scaled by 2^128. Voter loads are raised to the winner's
 * score, and once all rounds are done each voter's budget is split across its
 * elected candidates in proportion to the load each edge carries. The split is
 * then equalized by the StakeBalancer.
 *
 * Ties are broken by candidate ingestion order. Candidates with no approval
 * stake are only picked when no candidate with stake is left.
 *
 * NOTE: Plain C++ class, NOT an OMNeT++ module.
 */
class SequentialPhragmen {
public:
    /**
     * @param label algorithm reported in errors (MULTI_PHASE reuses this class)
     */
    explicit SequentialPhragmen(AlgorithmType label = AlgorithmType::SEQUENTIAL_PHRAGMEN);

    void setBalancing(const BalancingConfig& config) { balancer_.setConfig(config); }
    void setLogCallback(LogCallback callback);

    /**
     * @brief Elect @p toElect winners and assign edge weights
     * @throws AlgorithmError if every voter has zero stake or candidates run out
     */
    void run(ElectionGraph& graph, uint32_t toElect) const;

    /**
     * @brief Split every voter's budget across its elected edges by load
     */
    void assignWeights(ElectionGraph& graph) const;

private:
    AlgorithmType label_;
    StakeBalancer balancer_;
    LogCallback logCallback_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // SEQUENTIAL_PHRAGMEN_H
