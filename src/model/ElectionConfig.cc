#include "ElectionConfig.h"
#include "../common/ElectionError.h"

namespace nposim {

// ============================================================================
// CONFIGURATION
// ============================================================================

ElectionConfiguration::ElectionConfiguration()
    : algorithm_(AlgorithmType::SEQUENTIAL_PHRAGMEN)
    , activeSetSize_(Constants::DEFAULT_ACTIVE_SET_SIZE)
{
}

uint32_t ElectionConfiguration::effectiveActiveSetSize() const {
    if (overrides_ && overrides_->activeSetSize()) {
        return *overrides_->activeSetSize();
    }
    return activeSetSize_;
}

void ElectionConfiguration::validateAgainstData(size_t candidateCount) const {
    const uint32_t requested = effectiveActiveSetSize();
    if (requested == 0) {
        throw ValidationError("Active set size must be positive", "active_set_size");
    }
    if (requested > candidateCount) {
        throw InsufficientCandidates(requested, static_cast<uint32_t>(candidateCount));
    }
}

// ============================================================================
// BUILDER
// ============================================================================

ElectionConfigBuilder::ElectionConfigBuilder() {
}

ElectionConfigBuilder& ElectionConfigBuilder::algorithm(AlgorithmType algorithm) {
    raw_.algorithm_ = algorithm;
    return *this;
}

ElectionConfigBuilder& ElectionConfigBuilder::algorithm(const std::string& name) {
    raw_.algorithm_ = parseAlgorithm(name);
    return *this;
}

ElectionConfigBuilder& ElectionConfigBuilder::activeSetSize(uint32_t size) {
    raw_.activeSetSize_ = size;
    return *this;
}

ElectionConfigBuilder& ElectionConfigBuilder::overrides(const ElectionOverrides& overrides) {
    raw_.overrides_ = overrides;
    return *this;
}

ElectionConfigBuilder& ElectionConfigBuilder::blockNumber(BlockNumber block) {
    raw_.blockNumber_ = block;
    return *this;
}

ElectionConfigBuilder& ElectionConfigBuilder::balancing(const BalancingConfig& balancing) {
    raw_.balancing_ = balancing;
    return *this;
}

ElectionConfiguration ElectionConfigBuilder::build() const {
    if (raw_.activeSetSize_ == 0) {
        throw ValidationError("Active set size must be positive", "active_set_size");
    }
    if (raw_.overrides_ && raw_.overrides_->activeSetSize() && *raw_.overrides_->activeSetSize() == 0) {
        throw ValidationError("Active set size override must be positive", "overrides.active_set_size");
    }
    if (raw_.balancing_.iterations < 0) {
        throw ValidationError("Balancing iterations must not be negative", "balancing.iterations");
    }
    if (raw_.balancing_.tolerance < 0) {
        throw ValidationError("Balancing tolerance must not be negative", "balancing.tolerance");
    }
    return raw_;
}

} // namespace nposim
