#ifndef ELECTION_GRAPH_H
#define ELECTION_GRAPH_H

#include <vector>
#include <limits>
#include "../model/ElectionData.h"

namespace nposim {

/**
 * @brief Candidate as seen by the selection algorithms
 */
struct CandidateNode {
    AccountID accountID;
    Balance approvalStake;     // stake of every voter approving this candidate
    Balance backedStake;       // sum of edge weights assigned to it
    bool elected;
    uint32_t round;            // 1-based election round, 0 while unelected

    CandidateNode() : approvalStake(0), backedStake(0), elected(false), round(0) {}
};

/**
 * @brief Approval of one voter for one candidate
 */
struct VoterEdge {
    size_t candidate;          // index into ElectionGraph::candidates()
    ExtendedBalance load;      // Phragmen load share carried by this edge
    Balance weight;            // stake attributed to the candidate

    explicit VoterEdge(size_t c) : candidate(c), load(0), weight(0) {}
};

/**
 * @brief Stake holder taking part in the election
 *
 * Every candidate votes for itself with its self-stake; nominators follow
 * with their non-empty approval lists.
 */
struct VoterNode {
    AccountID accountID;
    Balance budget;
    bool selfVote;
    ExtendedBalance load;
    std::vector<VoterEdge> edges;

    VoterNode() : budget(0), selfVote(false), load(0) {}
};

/**
 * @brief Index-based arena shared by all selection algorithms
 *
 * Candidates keep ingestion order, which is the tie-break authority.
 */
class ElectionGraph {
public:
    static constexpr size_t NONE = std::numeric_limits<size_t>::max();

    /**
     * @brief Build voters and edges from a validated dataset
     */
    static ElectionGraph fromData(const ElectionData& data);

    std::vector<CandidateNode>& candidates() { return candidates_; }
    const std::vector<CandidateNode>& candidates() const { return candidates_; }
    std::vector<VoterNode>& voters() { return voters_; }
    const std::vector<VoterNode>& voters() const { return voters_; }

    /**
     * @brief Winners in election order
     */
    const std::vector<size_t>& winners() const { return winners_; }

    void markElected(size_t candidate, uint32_t round);

    /**
     * @brief True when at least one voter has a positive budget
     */
    bool hasStake() const;

    /**
     * @brief Stake of every voter backing at least one winner
     */
    Balance participatingStake() const;

    /**
     * @brief Rebuild backedStake of every candidate from edge weights
     */
    void recomputeBackedStakes();

    size_t edgeCount() const;

private:
    std::vector<CandidateNode> candidates_;
    std::vector<VoterNode> voters_;
    std::vector<size_t> winners_;
};

} // namespace nposim

#endif // ELECTION_GRAPH_H
