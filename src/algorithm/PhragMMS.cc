#include "PhragMMS.h"
#include "../common/ElectionError.h"

namespace nposim {

PhragMMS::PhragMMS() {
}

void PhragMMS::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
    balancer_.setLogCallback(callback);
}

void PhragMMS::run(ElectionGraph& graph, uint32_t toElect) const {
    if (!graph.hasStake()) {
        throw AlgorithmError("All candidate and nominator stakes are zero, nothing to elect with",
                             AlgorithmType::PARALLEL_PHRAGMEN);
    }

    log("Electing " + std::to_string(toElect) + " of " + std::to_string(graph.candidates().size()) +
        " candidates from " + std::to_string(graph.voters().size()) + " voters");

    for (uint32_t round = 0; round < toElect; ++round) {
        Balance threshold = 0;
        size_t winner = findMaxScore(graph, threshold);
        if (winner == ElectionGraph::NONE) {
            throw AlgorithmError("Ran out of candidates after electing " +
                                 std::to_string(round) + " of " + std::to_string(toElect),
                                 AlgorithmType::PARALLEL_PHRAGMEN);
        }

        graph.markElected(winner, round + 1);
        insertElected(graph, winner, threshold);
        balancer_.balance(graph);

        log("Round " + std::to_string(round + 1) + ": elected " +
            graph.candidates()[winner].accountID + " at threshold " + balanceToString(threshold));
    }
}

size_t PhragMMS::findMaxScore(const ElectionGraph& graph, Balance& threshold) const {
    const ExtendedBalance& scale = Constants::loadScale();
    const std::vector<CandidateNode>& candidates = graph.candidates();

    std::vector<Balance> numerators(candidates.size(), Balance(0));
    std::vector<ExtendedBalance> denominators(candidates.size(), scale);

    for (const VoterNode& voter : graph.voters()) {
        ExtendedBalance contribution = 0;
        for (const VoterEdge& edge : voter.edges) {
            const CandidateNode& candidate = candidates[edge.candidate];
            if (candidate.elected && edge.weight > 0 && candidate.backedStake > 0) {
                contribution += edge.weight * scale / candidate.backedStake;
            }
        }
        for (const VoterEdge& edge : voter.edges) {
            if (!candidates[edge.candidate].elected) {
                numerators[edge.candidate] += voter.budget;
                denominators[edge.candidate] += contribution;
            }
        }
    }

    size_t best = ElectionGraph::NONE;
    size_t firstUnbacked = ElectionGraph::NONE;
    for (size_t c = 0; c < candidates.size(); ++c) {
        if (candidates[c].elected) {
            continue;
        }
        if (numerators[c] == 0) {
            if (firstUnbacked == ElectionGraph::NONE) {
                firstUnbacked = c;
            }
            continue;
        }
        // a/b > c/d  <=>  a*d > c*b
        if (best == ElectionGraph::NONE ||
            numerators[c] * denominators[best] > numerators[best] * denominators[c]) {
            best = c;
        }
    }

    if (best == ElectionGraph::NONE) {
        threshold = 0;
        return firstUnbacked;
    }

    threshold = numerators[best] * scale / denominators[best];
    return best;
}

void PhragMMS::insertElected(ElectionGraph& graph, size_t winner, const Balance& threshold) const {
    std::vector<CandidateNode>& candidates = graph.candidates();

    for (VoterNode& voter : graph.voters()) {
        VoterEdge* target = nullptr;
        Balance used = 0;
        for (VoterEdge& edge : voter.edges) {
            if (edge.candidate == winner) {
                target = &edge;
            }
            used += edge.weight;
        }
        if (target == nullptr) {
            continue;
        }

        Balance moved = voter.budget > used ? Balance(voter.budget - used) : Balance(0);
        for (VoterEdge& edge : voter.edges) {
            if (&edge == target || edge.weight == 0) {
                continue;
            }
            CandidateNode& candidate = candidates[edge.candidate];
            if (candidate.backedStake <= threshold) {
                continue;
            }
            Balance keep = edge.weight * threshold / candidate.backedStake;
            Balance taken = edge.weight - keep;
            edge.weight = keep;
            candidate.backedStake -= taken;
            moved += taken;
        }

        target->weight += moved;
        candidates[winner].backedStake += moved;
    }
}

void PhragMMS::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[PhragMMS] " + message);
    }
}

} // namespace nposim
