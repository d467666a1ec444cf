#include "ElectionEngine.h"
#include "ResultAssembler.h"
#include "../algorithm/ElectionGraph.h"
#include "../algorithm/SequentialPhragmen.h"
#include "../algorithm/PhragMMS.h"
#include "../common/ElectionError.h"
#include <ctime>

namespace nposim {

ElectionEngine::ElectionEngine()
    : clock_(&ElectionEngine::systemTimestamp)
{
}

void ElectionEngine::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
}

void ElectionEngine::setClock(ClockCallback clock) {
    clock_ = clock;
}

void ElectionEngine::setDataSource(const std::string& label) {
    dataSource_ = label;
}

ElectionResult ElectionEngine::execute(const ElectionConfiguration& config, const ElectionData& data) const {
    data.validate();

    // Overrides always act on a copy
    ElectionData working = data;
    if (config.overrides() && !config.overrides()->empty()) {
        working = config.overrides()->applyTo(data);
        working.validate();
        log("Applied overrides: " + std::to_string(config.overrides()->candidateStakes().size()) +
            " candidate stake(s), " + std::to_string(config.overrides()->nominatorStakes().size()) +
            " nominator stake(s), " + std::to_string(config.overrides()->votingEdges().size()) + " edge(s)");
    }

    const uint32_t activeSetSize = config.effectiveActiveSetSize();
    config.validateAgainstData(working.candidates.size());

    log("Running " + algorithmName(config.algorithm()) + " for " + std::to_string(activeSetSize) +
        " seats over " + std::to_string(working.candidates.size()) + " candidates and " +
        std::to_string(working.nominators.size()) + " nominators");

    ElectionGraph graph = ElectionGraph::fromData(working);

    switch (config.algorithm()) {
        case AlgorithmType::SEQUENTIAL_PHRAGMEN:
        case AlgorithmType::MULTI_PHASE: {
            SequentialPhragmen phragmen(config.algorithm());
            phragmen.setBalancing(config.balancing());
            phragmen.setLogCallback(logCallback_);
            phragmen.run(graph, activeSetSize);
            break;
        }
        case AlgorithmType::PARALLEL_PHRAGMEN: {
            PhragMMS phragmms;
            phragmms.setBalancing(config.balancing());
            phragmms.setLogCallback(logCallback_);
            phragmms.run(graph, activeSetSize);
            break;
        }
    }

    ResultAssembler assembler(config.algorithm());
    assembler.setLogCallback(logCallback_);
    ElectionResult result = assembler.assemble(graph, activeSetSize);

    ExecutionMetadata metadata;
    if (config.blockNumber()) {
        metadata.blockNumber = config.blockNumber();
    } else if (working.metadata && working.metadata->blockNumber) {
        metadata.blockNumber = working.metadata->blockNumber;
    }
    if (clock_) {
        metadata.executionTimestamp = clock_();
    }
    if (!dataSource_.empty()) {
        metadata.dataSource = dataSource_;
    }

    log("Election complete: " + std::to_string(result.selectedValidators().size()) + " validators selected");
    return result.withMetadata(metadata);
}

std::string ElectionEngine::systemTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc;
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer);
}

void ElectionEngine::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[Engine] " + message);
    }
}

} // namespace nposim
