#ifndef RESULT_ASSEMBLER_H
#define RESULT_ASSEMBLER_H

#include "../algorithm/ElectionGraph.h"
#include "../model/ElectionResult.h"

namespace nposim {

/**
 * @brief Turns a solved election graph into an ElectionResult
 *
 * Winners are listed in election order with their round as rank. Every
 * positive edge weight becomes one stake allocation, in voter order then edge
 * order. The assembled result is checked before it is handed out: the winner
 * count must equal the active set size and the allocations must add up to the
 * reported total stake.
 */
class ResultAssembler {
public:
    explicit ResultAssembler(AlgorithmType algorithm);

    void setLogCallback(LogCallback callback);

    /**
     * @throws AlgorithmError when the solution fails validation
     */
    ElectionResult assemble(const ElectionGraph& graph, uint32_t activeSetSize) const;

    /**
     * @brief Final gate on any result
     * @throws AlgorithmError on a cardinality or conservation mismatch
     */
    void validate(const ElectionResult& result, uint32_t activeSetSize) const;

    /**
     * @brief Share of a voter's stake, in parts per billion, as a double in [0,1]
     */
    static double proportionOf(const Balance& amount, const Balance& stake);

private:
    AlgorithmType algorithm_;
    LogCallback logCallback_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // RESULT_ASSEMBLER_H
