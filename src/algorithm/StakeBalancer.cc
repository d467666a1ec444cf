#include "StakeBalancer.h"
#include <algorithm>

namespace nposim {

StakeBalancer::StakeBalancer() {
}

StakeBalancer::StakeBalancer(const BalancingConfig& config)
    : config_(config)
{
}

void StakeBalancer::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
}

int StakeBalancer::balance(ElectionGraph& graph) const {
    if (config_.iterations <= 0) {
        return 0;
    }

    int passes = 0;
    while (true) {
        Balance maxDifference = 0;
        for (VoterNode& voter : graph.voters()) {
            Balance difference = balanceVoter(graph, voter);
            if (difference > maxDifference) {
                maxDifference = difference;
            }
        }
        ++passes;

        if (maxDifference <= config_.tolerance || passes >= config_.iterations) {
            break;
        }
    }

    log("Balancing finished after " + std::to_string(passes) + " pass(es)");
    return passes;
}

Balance StakeBalancer::balanceVoter(ElectionGraph& graph, VoterNode& voter) const {
    std::vector<CandidateNode>& candidates = graph.candidates();

    std::vector<VoterEdge*> elected;
    for (VoterEdge& edge : voter.edges) {
        if (candidates[edge.candidate].elected) {
            elected.push_back(&edge);
        }
    }
    if (elected.size() < 2) {
        return 0;
    }

    // Spread between the most backed winner this voter pays for and the
    // least backed winner it approves, plus any unspent budget
    Balance used = 0;
    Balance maxBacked = 0;
    Balance minBacked = candidates[elected.front()->candidate].backedStake;
    bool spending = false;
    for (const VoterEdge* edge : elected) {
        used += edge->weight;
        const Balance& backed = candidates[edge->candidate].backedStake;
        if (backed < minBacked) {
            minBacked = backed;
        }
        if (edge->weight > 0) {
            if (!spending || backed > maxBacked) {
                maxBacked = backed;
            }
            spending = true;
        }
    }

    Balance difference = voter.budget;
    if (spending) {
        difference = maxBacked > minBacked ? Balance(maxBacked - minBacked) : Balance(0);
        if (used < voter.budget) {
            difference += voter.budget - used;
        }
        if (difference < config_.tolerance) {
            return difference;
        }
    }

    for (VoterEdge* edge : elected) {
        candidates[edge->candidate].backedStake -= edge->weight;
        edge->weight = 0;
    }

    std::stable_sort(elected.begin(), elected.end(),
        [&candidates](const VoterEdge* a, const VoterEdge* b) {
            const Balance& ba = candidates[a->candidate].backedStake;
            const Balance& bb = candidates[b->candidate].backedStake;
            if (ba != bb) {
                return ba < bb;
            }
            return a->candidate < b->candidate;
        });

    // Fill the least backed winners up to a common level
    Balance cumulative = 0;
    size_t lastIndex = elected.size() - 1;
    for (size_t i = 0; i < elected.size(); ++i) {
        const Balance& backed = candidates[elected[i]->candidate].backedStake;
        if (backed * i - cumulative > voter.budget) {
            lastIndex = i - 1;
            break;
        }
        cumulative += backed;
    }

    const Balance lastStake = candidates[elected[lastIndex]->candidate].backedStake;
    const Balance ways = lastIndex + 1;
    const Balance excess = voter.budget + cumulative - lastStake * ways;
    const Balance share = excess / ways;
    const Balance remainder = excess % ways;

    for (size_t i = 0; i <= lastIndex; ++i) {
        CandidateNode& candidate = candidates[elected[i]->candidate];
        Balance weight = share + lastStake - candidate.backedStake;
        if (i == 0) {
            weight += remainder;
        }
        elected[i]->weight = weight;
        candidate.backedStake += weight;
    }

    return difference;
}

void StakeBalancer::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[Balancer] " + message);
    }
}

} // namespace nposim
