#include "ElectionGraph.h"
#include <map>

namespace nposim {

constexpr size_t ElectionGraph::NONE;

ElectionGraph ElectionGraph::fromData(const ElectionData& data) {
    ElectionGraph graph;
    std::map<AccountID, size_t> index;

    graph.candidates_.reserve(data.candidates.size());
    for (const Candidate& candidate : data.candidates) {
        CandidateNode node;
        node.accountID = candidate.accountID;
        index[candidate.accountID] = graph.candidates_.size();
        graph.candidates_.push_back(node);
    }

    // Self votes first, in candidate order
    graph.voters_.reserve(data.candidates.size() + data.nominators.size());
    for (size_t i = 0; i < data.candidates.size(); ++i) {
        VoterNode voter;
        voter.accountID = data.candidates[i].accountID;
        voter.budget = data.candidates[i].stake;
        voter.selfVote = true;
        voter.edges.push_back(VoterEdge(i));
        graph.voters_.push_back(voter);
    }

    for (const Nominator& nominator : data.nominators) {
        VoterNode voter;
        voter.accountID = nominator.accountID;
        voter.budget = nominator.stake;

        for (const AccountID& target : nominator.targets) {
            auto it = index.find(target);
            if (it == index.end()) {
                continue;
            }
            bool duplicate = false;
            for (const VoterEdge& edge : voter.edges) {
                if (edge.candidate == it->second) {
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate) {
                voter.edges.push_back(VoterEdge(it->second));
            }
        }

        if (voter.edges.empty()) {
            continue;
        }
        graph.voters_.push_back(voter);
    }

    for (const VoterNode& voter : graph.voters_) {
        for (const VoterEdge& edge : voter.edges) {
            graph.candidates_[edge.candidate].approvalStake += voter.budget;
        }
    }

    return graph;
}

void ElectionGraph::markElected(size_t candidate, uint32_t round) {
    CandidateNode& node = candidates_[candidate];
    node.elected = true;
    node.round = round;
    winners_.push_back(candidate);
}

bool ElectionGraph::hasStake() const {
    for (const VoterNode& voter : voters_) {
        if (voter.budget > 0) {
            return true;
        }
    }
    return false;
}

Balance ElectionGraph::participatingStake() const {
    Balance total = 0;
    for (const VoterNode& voter : voters_) {
        for (const VoterEdge& edge : voter.edges) {
            if (candidates_[edge.candidate].elected) {
                total += voter.budget;
                break;
            }
        }
    }
    return total;
}

void ElectionGraph::recomputeBackedStakes() {
    for (CandidateNode& candidate : candidates_) {
        candidate.backedStake = 0;
    }
    for (const VoterNode& voter : voters_) {
        for (const VoterEdge& edge : voter.edges) {
            candidates_[edge.candidate].backedStake += edge.weight;
        }
    }
}

size_t ElectionGraph::edgeCount() const {
    size_t count = 0;
    for (const VoterNode& voter : voters_) {
        count += voter.edges.size();
    }
    return count;
}

} // namespace nposim
