#ifndef STAKE_BALANCER_H
#define STAKE_BALANCER_H

#include "ElectionGraph.h"
#include "../model/ElectionConfig.h"

namespace nposim {

/**
 * @brief Post-selection stake equalization
 *
 * Each pass visits every voter with two or more elected approvals and
 * redistributes its budget so that the backing of its winners is as even as
 * the budget allows. Passes stop after the configured iteration count or once
 * no voter sees an imbalance above the tolerance. Edge weights of each voter
 * always sum to its budget afterwards.
 *
 * NOTE: Plain C++ class; logging is delegated to the caller.
 */
class StakeBalancer {
public:
    StakeBalancer();
    explicit StakeBalancer(const BalancingConfig& config);

    void setConfig(const BalancingConfig& config) { config_ = config; }
    const BalancingConfig& config() const { return config_; }

    void setLogCallback(LogCallback callback);

    /**
     * @brief Run balancing passes over the graph
     * @return number of passes performed
     */
    int balance(ElectionGraph& graph) const;

    /**
     * @brief Rebalance a single voter
     * @return imbalance observed before the rebalance
     */
    Balance balanceVoter(ElectionGraph& graph, VoterNode& voter) const;

private:
    BalancingConfig config_;
    LogCallback logCallback_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // STAKE_BALANCER_H
