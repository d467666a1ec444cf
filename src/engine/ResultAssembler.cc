#include "ResultAssembler.h"
#include "../common/ElectionError.h"

namespace nposim {

namespace {
    const uint64_t PERBILL = 1000000000ULL;
}

ResultAssembler::ResultAssembler(AlgorithmType algorithm)
    : algorithm_(algorithm)
{
}

void ResultAssembler::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
}

ElectionResult ResultAssembler::assemble(const ElectionGraph& graph, uint32_t activeSetSize) const {
    const std::vector<CandidateNode>& candidates = graph.candidates();

    std::vector<uint32_t> nominatorCounts(candidates.size(), 0);
    std::vector<Balance> backing(candidates.size(), Balance(0));
    std::vector<StakeAllocation> distribution;

    for (const VoterNode& voter : graph.voters()) {
        for (const VoterEdge& edge : voter.edges) {
            if (!candidates[edge.candidate].elected || edge.weight == 0) {
                continue;
            }

            StakeAllocation allocation;
            allocation.nominatorID = voter.accountID;
            allocation.validatorID = candidates[edge.candidate].accountID;
            allocation.amount = edge.weight;
            allocation.proportion = proportionOf(edge.weight, voter.budget);
            allocation.selfStake = voter.selfVote;
            distribution.push_back(allocation);

            backing[edge.candidate] += edge.weight;
            if (!voter.selfVote) {
                ++nominatorCounts[edge.candidate];
            }
        }
    }

    std::vector<SelectedValidator> validators;
    validators.reserve(graph.winners().size());
    for (size_t index : graph.winners()) {
        SelectedValidator validator;
        validator.accountID = candidates[index].accountID;
        validator.totalBackingStake = backing[index];
        validator.nominatorCount = nominatorCounts[index];
        validator.rank = candidates[index].round;
        validators.push_back(validator);
    }

    ElectionResult result(validators, distribution, graph.participatingStake(), algorithm_);
    validate(result, activeSetSize);

    log("Assembled " + std::to_string(validators.size()) + " validators and " +
        std::to_string(distribution.size()) + " allocations, total stake " +
        balanceToString(result.totalStake()));
    return result;
}

void ResultAssembler::validate(const ElectionResult& result, uint32_t activeSetSize) const {
    if (result.selectedValidators().size() != activeSetSize) {
        throw AlgorithmError("Expected " + std::to_string(activeSetSize) + " validators, selected " +
                             std::to_string(result.selectedValidators().size()), algorithm_);
    }

    Balance allocated = result.allocatedStake();
    if (allocated != result.totalStake()) {
        throw AlgorithmError("Stake allocations sum to " + balanceToString(allocated) +
                             " but total stake is " + balanceToString(result.totalStake()), algorithm_);
    }
}

double ResultAssembler::proportionOf(const Balance& amount, const Balance& stake) {
    if (stake == 0) {
        return 0.0;
    }
    Balance parts = amount * PERBILL / stake;
    if (parts > PERBILL) {
        parts = PERBILL;
    }
    return parts.convert_to<double>() / static_cast<double>(PERBILL);
}

void ResultAssembler::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[Assembler] " + message);
    }
}

} // namespace nposim
