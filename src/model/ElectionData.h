#ifndef ELECTION_DATA_H
#define ELECTION_DATA_H

#include <string>
#include <vector>
#include <map>
#include <boost/optional.hpp>
#include "../common/NposimDefs.h"

namespace nposim {

/**
 * @brief Optional on-chain details of a candidate
 */
struct CandidateMetadata {
    boost::optional<uint8_t> commissionRate;   // percent, 0-100
    boost::optional<std::string> onChainStatus;

    bool operator==(const CandidateMetadata& other) const {
        return commissionRate == other.commissionRate && onChainStatus == other.onChainStatus;
    }
};

/**
 * @brief Validator candidate
 */
struct Candidate {
    AccountID accountID;
    Balance stake;       // self-stake
    boost::optional<CandidateMetadata> metadata;

    Candidate() : stake(0) {}
    Candidate(const AccountID& id, const Balance& selfStake)
        : accountID(id), stake(selfStake) {}

    bool operator==(const Candidate& other) const {
        return accountID == other.accountID && stake == other.stake && metadata == other.metadata;
    }
};

/**
 * @brief Stakeholder approving a list of candidates
 *
 * Targets keep insertion order; duplicates are ignored on insertion.
 */
struct Nominator {
    AccountID accountID;
    Balance stake;
    std::vector<AccountID> targets;
    boost::optional<std::map<std::string, std::string>> metadata;

    Nominator() : stake(0) {}
    Nominator(const AccountID& id, const Balance& totalStake)
        : accountID(id), stake(totalStake) {}

    /**
     * @brief Append a target unless already present
     */
    void addTarget(const AccountID& candidateID);

    /**
     * @brief Remove every occurrence of a target
     */
    void removeTarget(const AccountID& candidateID);

    bool hasTarget(const AccountID& candidateID) const;

    bool operator==(const Nominator& other) const {
        return accountID == other.accountID && stake == other.stake &&
               targets == other.targets && metadata == other.metadata;
    }
};

/**
 * @brief Provenance of a dataset
 */
struct ElectionMetadata {
    boost::optional<BlockNumber> blockNumber;
    boost::optional<std::string> chain;

    bool operator==(const ElectionMetadata& other) const {
        return blockNumber == other.blockNumber && chain == other.chain;
    }
};

/**
 * @brief Complete input of one election
 *
 * Invariants checked by validate():
 * - at least one candidate
 * - candidate ids unique, nominator ids unique (separately)
 * - every nominator target names an existing candidate
 */
struct ElectionData {
    std::vector<Candidate> candidates;
    std::vector<Nominator> nominators;
    boost::optional<ElectionMetadata> metadata;

    /**
     * @brief Append a candidate
     * @throws ValidationError (field "candidates") on duplicate id
     */
    void addCandidate(const Candidate& candidate);

    /**
     * @brief Append a nominator
     * @throws ValidationError (field "nominators") on duplicate id
     */
    void addNominator(const Nominator& nominator);

    /**
     * @brief Check all structural invariants
     * @throws ValidationError naming the offending field
     */
    void validate() const;

    Candidate* findCandidate(const AccountID& accountID);
    const Candidate* findCandidate(const AccountID& accountID) const;
    Nominator* findNominator(const AccountID& accountID);
    const Nominator* findNominator(const AccountID& accountID) const;

    bool operator==(const ElectionData& other) const {
        return candidates == other.candidates && nominators == other.nominators &&
               metadata == other.metadata;
    }
    bool operator!=(const ElectionData& other) const { return !(*this == other); }
};

} // namespace nposim

#endif // ELECTION_DATA_H
