#ifndef ELECTION_CONFIG_H
#define ELECTION_CONFIG_H

#include <boost/optional.hpp>
#include "ElectionOverrides.h"

namespace nposim {

/**
 * @brief Post-selection stake balancing parameters
 */
struct BalancingConfig {
    int iterations;        // 0 disables balancing
    Balance tolerance;     // stop once no voter improves by more than this

    BalancingConfig()
        : iterations(Constants::DEFAULT_BALANCING_ITERATIONS)
        , tolerance(Constants::DEFAULT_BALANCING_TOLERANCE) {}
    BalancingConfig(int iters, const Balance& tol) : iterations(iters), tolerance(tol) {}

    bool operator==(const BalancingConfig& other) const {
        return iterations == other.iterations && tolerance == other.tolerance;
    }
};

/**
 * @brief Validated, immutable election configuration
 *
 * Only ElectionConfigBuilder::build() creates instances, so a configuration
 * that reaches the engine always has a positive active set size.
 */
class ElectionConfiguration {
public:
    AlgorithmType algorithm() const { return algorithm_; }
    uint32_t activeSetSize() const { return activeSetSize_; }
    const boost::optional<ElectionOverrides>& overrides() const { return overrides_; }
    const boost::optional<BlockNumber>& blockNumber() const { return blockNumber_; }
    const BalancingConfig& balancing() const { return balancing_; }

    /**
     * @brief Active set size after applying an active-set override, if any
     */
    uint32_t effectiveActiveSetSize() const;

    /**
     * @brief Check the active set against the candidate pool
     * @throws InsufficientCandidates when more winners are requested than exist
     */
    void validateAgainstData(size_t candidateCount) const;

    bool operator==(const ElectionConfiguration& other) const {
        return algorithm_ == other.algorithm_ && activeSetSize_ == other.activeSetSize_ &&
               overrides_ == other.overrides_ && blockNumber_ == other.blockNumber_ &&
               balancing_ == other.balancing_;
    }

private:
    friend class ElectionConfigBuilder;
    ElectionConfiguration();

    AlgorithmType algorithm_;
    uint32_t activeSetSize_;
    boost::optional<ElectionOverrides> overrides_;
    boost::optional<BlockNumber> blockNumber_;
    BalancingConfig balancing_;
};

/**
 * @brief Raw configuration collected from a caller, frozen by build()
 */
class ElectionConfigBuilder {
public:
    ElectionConfigBuilder();

    ElectionConfigBuilder& algorithm(AlgorithmType algorithm);
    ElectionConfigBuilder& algorithm(const std::string& name);
    ElectionConfigBuilder& activeSetSize(uint32_t size);
    ElectionConfigBuilder& overrides(const ElectionOverrides& overrides);
    ElectionConfigBuilder& blockNumber(BlockNumber block);
    ElectionConfigBuilder& balancing(const BalancingConfig& balancing);

    /**
     * @brief Validate and freeze
     * @throws ValidationError (field "active_set_size", "balancing.iterations")
     */
    ElectionConfiguration build() const;

private:
    ElectionConfiguration raw_;
};

} // namespace nposim

#endif // ELECTION_CONFIG_H
