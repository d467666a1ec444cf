#ifndef ELECTION_OVERRIDES_H
#define ELECTION_OVERRIDES_H

#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/optional.hpp>
#include "ElectionData.h"

namespace nposim {

/**
 * @brief One change to a nominator's approval list
 *
 * MODIFY is a remove followed by an add of the same target; the optional
 * weight is carried for serialization only.
 */
struct EdgeModification {
    EdgeAction action;
    AccountID nominatorID;
    AccountID candidateID;
    boost::optional<Balance> weight;

    EdgeModification() : action(EdgeAction::ADD) {}
    EdgeModification(EdgeAction a, const AccountID& nominator, const AccountID& candidate)
        : action(a), nominatorID(nominator), candidateID(candidate) {}

    bool operator==(const EdgeModification& other) const {
        return action == other.action && nominatorID == other.nominatorID &&
               candidateID == other.candidateID && weight == other.weight;
    }
};

/**
 * @brief "What if" changes applied to a copy of the dataset before selection
 *
 * Overrides are best effort: identifiers missing from the dataset are skipped.
 */
class ElectionOverrides {
public:
    ElectionOverrides() = default;

    // ========================================================================
    // CONSTRUCTION
    // ========================================================================

    void setCandidateStake(const AccountID& accountID, const Balance& stake);
    void setNominatorStake(const AccountID& accountID, const Balance& stake);

    void addVotingEdge(const AccountID& nominatorID, const AccountID& candidateID);
    void removeVotingEdge(const AccountID& nominatorID, const AccountID& candidateID);
    void modifyVotingEdge(const AccountID& nominatorID, const AccountID& candidateID,
                          const boost::optional<Balance>& weight = boost::none);
    void addEdgeModification(const EdgeModification& modification);

    void setActiveSetSize(uint32_t size) { activeSetSize_ = size; }

    // ========================================================================
    // TEXT DIRECTIVES
    // ========================================================================

    /**
     * @brief Parse "account_id=stake"
     * @param kind "candidate" or "nominator", used in messages and field name
     * @throws ValidationError (field "override_<kind>_stake")
     */
    static std::pair<AccountID, Balance> parseStakeDirective(const std::string& text,
                                                             const std::string& kind);

    /**
     * @brief Parse "action:nominator_id=candidate_id"
     * @throws ValidationError (field "override_voting_edge")
     */
    static EdgeModification parseEdgeDirective(const std::string& text);

    // ========================================================================
    // APPLICATION
    // ========================================================================

    /**
     * @brief Return a modified copy of @p data; @p data itself is untouched
     *
     * Order: candidate stakes, nominator stakes, then edge modifications in
     * list order.
     */
    ElectionData applyTo(const ElectionData& data) const;

    // ========================================================================
    // QUERIES
    // ========================================================================

    const std::map<AccountID, Balance>& candidateStakes() const { return candidateStakes_; }
    const std::map<AccountID, Balance>& nominatorStakes() const { return nominatorStakes_; }
    const std::vector<EdgeModification>& votingEdges() const { return votingEdges_; }
    const boost::optional<uint32_t>& activeSetSize() const { return activeSetSize_; }

    bool empty() const;

    bool operator==(const ElectionOverrides& other) const {
        return candidateStakes_ == other.candidateStakes_ &&
               nominatorStakes_ == other.nominatorStakes_ &&
               votingEdges_ == other.votingEdges_ &&
               activeSetSize_ == other.activeSetSize_;
    }

private:
    std::map<AccountID, Balance> candidateStakes_;
    std::map<AccountID, Balance> nominatorStakes_;
    std::vector<EdgeModification> votingEdges_;
    boost::optional<uint32_t> activeSetSize_;
};

} // namespace nposim

#endif // ELECTION_OVERRIDES_H
