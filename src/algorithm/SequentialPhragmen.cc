#include "SequentialPhragmen.h"
#include "../common/ElectionError.h"

namespace nposim {

SequentialPhragmen::SequentialPhragmen(AlgorithmType label)
    : label_(label)
{
}

void SequentialPhragmen::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
    balancer_.setLogCallback(callback);
}

void SequentialPhragmen::run(ElectionGraph& graph, uint32_t toElect) const {
    if (!graph.hasStake()) {
        throw AlgorithmError("All candidate and nominator stakes are zero, nothing to elect with", label_);
    }

    const ExtendedBalance& scale = Constants::loadScale();
    std::vector<CandidateNode>& candidates = graph.candidates();
    std::vector<VoterNode>& voters = graph.voters();

    log("Electing " + std::to_string(toElect) + " of " + std::to_string(candidates.size()) +
        " candidates from " + std::to_string(voters.size()) + " voters");

    for (uint32_t round = 0; round < toElect; ++round) {
        // Score numerators: 1 + sum(stake * load) over approving voters
        std::vector<ExtendedBalance> numerators(candidates.size(), scale);
        for (const VoterNode& voter : voters) {
            if (voter.budget == 0 || voter.load == 0) {
                continue;
            }
            const ExtendedBalance weighted = voter.budget * voter.load;
            for (const VoterEdge& edge : voter.edges) {
                if (!candidates[edge.candidate].elected) {
                    numerators[edge.candidate] += weighted;
                }
            }
        }

        size_t best = ElectionGraph::NONE;
        size_t firstUnbacked = ElectionGraph::NONE;
        ExtendedBalance bestScore = 0;
        for (size_t c = 0; c < candidates.size(); ++c) {
            const CandidateNode& candidate = candidates[c];
            if (candidate.elected) {
                continue;
            }
            if (candidate.approvalStake == 0) {
                if (firstUnbacked == ElectionGraph::NONE) {
                    firstUnbacked = c;
                }
                continue;
            }
            ExtendedBalance score = numerators[c] / candidate.approvalStake;
            if (best == ElectionGraph::NONE || score < bestScore) {
                best = c;
                bestScore = score;
            }
        }

        if (best == ElectionGraph::NONE) {
            if (firstUnbacked == ElectionGraph::NONE) {
                throw AlgorithmError("Ran out of candidates after electing " +
                                     std::to_string(round) + " of " + std::to_string(toElect), label_);
            }
            graph.markElected(firstUnbacked, round + 1);
            log("Round " + std::to_string(round + 1) + ": elected " +
                candidates[firstUnbacked].accountID + " without approval stake");
            continue;
        }

        graph.markElected(best, round + 1);
        for (VoterNode& voter : voters) {
            for (VoterEdge& edge : voter.edges) {
                if (edge.candidate != best) {
                    continue;
                }
                if (bestScore > voter.load) {
                    edge.load = bestScore - voter.load;
                    voter.load = bestScore;
                }
            }
        }

        log("Round " + std::to_string(round + 1) + ": elected " + candidates[best].accountID);
    }

    assignWeights(graph);
    balancer_.balance(graph);
}

void SequentialPhragmen::assignWeights(ElectionGraph& graph) const {
    std::vector<CandidateNode>& candidates = graph.candidates();

    for (VoterNode& voter : graph.voters()) {
        std::vector<VoterEdge*> elected;
        for (VoterEdge& edge : voter.edges) {
            edge.weight = 0;
            if (candidates[edge.candidate].elected) {
                elected.push_back(&edge);
            }
        }
        if (elected.empty() || voter.budget == 0) {
            continue;
        }

        if (voter.load == 0) {
            elected.front()->weight = voter.budget;
            continue;
        }

        // Proportional to load; the last elected edge absorbs rounding
        Balance assigned = 0;
        for (size_t i = 0; i + 1 < elected.size(); ++i) {
            Balance weight = voter.budget * elected[i]->load / voter.load;
            elected[i]->weight = weight;
            assigned += weight;
        }
        elected.back()->weight = voter.budget > assigned ? Balance(voter.budget - assigned) : Balance(0);
    }

    graph.recomputeBackedStakes();
}

void SequentialPhragmen::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[SeqPhragmen] " + message);
    }
}

} // namespace nposim
