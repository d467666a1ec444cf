#include "ElectionSimulator.h"
#include "../common/ElectionError.h"
#include "../io/JsonCodec.h"
#include "../io/SyntheticDataBuilder.h"
#include <algorithm>

namespace nposim {

Define_Module(ElectionSimulator);

ElectionSimulator::~ElectionSimulator() {
    cancelAndDelete(electionTimer_);
}

// ============================================================================
// INITIALIZATION
// ============================================================================

void ElectionSimulator::initialize() {
    dataSource_ = par("dataSource").stdstringValue();
    outputFile_ = par("outputFile").stdstringValue();
    diagnosticsEnabled_ = par("diagnostics").boolValue();
    diagnosticsFile_ = par("diagnosticsFile").stdstringValue();

    validatorsSelectedSignal_ = registerSignal("validatorsSelected");
    backingStakeSignal_ = registerSignal("backingStake");
    allocationsSignal_ = registerSignal("allocations");

    try {
        outputFormat_ = ResultFormatter::parseFormat(par("outputFormat").stdstringValue());
        config_ = std::make_unique<ElectionConfiguration>(buildConfiguration());
        data_ = std::make_unique<ElectionData>(loadDataset());
    }
    catch (const ElectionError& e) {
        throw cRuntimeError("Election setup failed [%s]: %s", e.code().c_str(), e.what());
    }

    engine_ = std::make_unique<ElectionEngine>();
    engine_->setDataSource(dataSource_);
    engine_->setLogCallback([this](const std::string& msg) {
        onComponentLog(msg);
    });

    EV_INFO << "[Election] " << algorithmName(config_->algorithm()) << " configured for "
            << config_->effectiveActiveSetSize() << " seats" << endl;
    EV_INFO << "  - Data source: " << dataSource_ << endl;
    EV_INFO << "  - Candidates: " << data_->candidates.size() << endl;
    EV_INFO << "  - Nominators: " << data_->nominators.size() << endl;
    EV_INFO << "  - Balancing: " << config_->balancing().iterations << " iteration(s), tolerance "
            << balanceToString(config_->balancing().tolerance) << endl;

    electionTimer_ = new cMessage("electionTimer");
    scheduleAt(simTime() + par("startDelay"), electionTimer_);
}

ElectionConfiguration ElectionSimulator::buildConfiguration() const {
    ElectionConfigBuilder builder;
    builder.algorithm(par("algorithm").stdstringValue());

    int activeSetSize = par("activeSetSize").intValue();
    if (activeSetSize < 0) {
        throw ValidationError("Active set size must be positive", "active_set_size");
    }
    builder.activeSetSize(static_cast<uint32_t>(activeSetSize));

    long blockNumber = par("blockNumber").intValue();
    if (blockNumber >= 0) {
        builder.blockNumber(static_cast<BlockNumber>(blockNumber));
    }

    builder.balancing(BalancingConfig(par("balancingIterations").intValue(),
                                      parseBalance(par("balancingTolerance").stdstringValue(),
                                                   "balancing.tolerance")));

    ElectionOverrides overrides = buildOverrides();
    if (!overrides.empty()) {
        builder.overrides(overrides);
    }
    return builder.build();
}

ElectionOverrides ElectionSimulator::buildOverrides() const {
    ElectionOverrides overrides;

    for (const std::string& directive : cStringTokenizer(par("overrideCandidateStakes").stringValue(), ",").asVector()) {
        auto stake = ElectionOverrides::parseStakeDirective(directive, "candidate");
        overrides.setCandidateStake(stake.first, stake.second);
    }
    for (const std::string& directive : cStringTokenizer(par("overrideNominatorStakes").stringValue(), ",").asVector()) {
        auto stake = ElectionOverrides::parseStakeDirective(directive, "nominator");
        overrides.setNominatorStake(stake.first, stake.second);
    }
    for (const std::string& directive : cStringTokenizer(par("overrideVotingEdges").stringValue(), ",").asVector()) {
        overrides.addEdgeModification(ElectionOverrides::parseEdgeDirective(directive));
    }

    int activeSetOverride = par("overrideActiveSetSize").intValue();
    if (activeSetOverride > 0) {
        overrides.setActiveSetSize(static_cast<uint32_t>(activeSetOverride));
    }
    return overrides;
}

ElectionData ElectionSimulator::loadDataset() {
    if (dataSource_ == "file") {
        std::string path = par("inputFile").stdstringValue();
        if (path.empty()) {
            throw ValidationError("dataSource is 'file' but inputFile is empty", "input_file");
        }
        return JsonCodec::loadDataFile(path);
    }

    if (dataSource_ == "synthetic") {
        int candidates = par("syntheticCandidates").intValue();
        int nominators = par("syntheticNominators").intValue();
        int targets = par("syntheticTargetsPerNominator").intValue();
        long minStake = par("syntheticMinStake").intValue();
        long maxStake = par("syntheticMaxStake").intValue();
        if (candidates <= 0 || nominators < 0 || targets < 0 || minStake < 0 || maxStake < minStake) {
            throw ValidationError("Synthetic dataset parameters out of range", "synthetic");
        }

        SyntheticDataBuilder builder;
        builder.populate(static_cast<uint32_t>(candidates), static_cast<uint32_t>(nominators),
                         static_cast<uint32_t>(targets),
                         static_cast<uint64_t>(minStake), static_cast<uint64_t>(maxStake),
                         [this](uint64_t bound) { return drawRandom(bound); });
        return builder.build();
    }

    throw ValidationError("Unknown data source '" + dataSource_ + "', expected file or synthetic",
                          "data_source");
}

// ============================================================================
// MESSAGE HANDLING
// ============================================================================

void ElectionSimulator::handleMessage(cMessage* msg) {
    if (msg == electionTimer_) {
        runElection();
        return;
    }
    EV_WARN << "[Election] Unexpected message " << msg->getName() << endl;
    delete msg;
}

void ElectionSimulator::runElection() {
    EV_INFO << "[Election] Running at t=" << simTime() << endl;

    try {
        result_ = std::make_unique<ElectionResult>(engine_->execute(*config_, *data_));

        ElectionData effectiveData = config_->overrides() ? config_->overrides()->applyTo(*data_) : *data_;
        writeOutput(*result_, effectiveData);
    }
    catch (const ElectionError& e) {
        throw cRuntimeError("Election failed [%s]: %s", e.code().c_str(), e.what());
    }

    emit(validatorsSelectedSignal_, static_cast<long>(result_->selectedValidators().size()));
    for (const SelectedValidator& validator : result_->selectedValidators()) {
        emit(backingStakeSignal_, validator.totalBackingStake.convert_to<double>());
    }
    emit(allocationsSignal_, static_cast<long>(result_->stakeDistribution().size()));

    EV_INFO << "[Election] Selected " << result_->selectedValidators().size()
            << " validators, total stake " << balanceToString(result_->totalStake()) << endl;
}

void ElectionSimulator::writeOutput(const ElectionResult& result, const ElectionData& effectiveData) {
    std::string rendered = ResultFormatter::format(result, outputFormat_);
    if (outputFile_.empty()) {
        EV_INFO << rendered << endl;
    } else {
        JsonCodec::writeTextFile(rendered, outputFile_);
        EV_INFO << "[Election] Result written to " << outputFile_ << endl;
    }

    if (!diagnosticsEnabled_) {
        return;
    }

    DiagnosticsGenerator generator;
    generator.setLogCallback([this](const std::string& msg) {
        onComponentLog(msg);
    });
    Diagnostics diagnostics = generator.generate(result, effectiveData);

    if (diagnosticsFile_.empty()) {
        EV_INFO << DiagnosticsGenerator::render(diagnostics) << endl;
    } else {
        JsonCodec::writeTextFile(JsonCodec::write(DiagnosticsGenerator::toJson(diagnostics)) + "\n",
                                 diagnosticsFile_);
        EV_INFO << "[Election] Diagnostics written to " << diagnosticsFile_ << endl;
    }
    for (const std::string& warning : diagnostics.warnings) {
        EV_WARN << "[Diagnostics] " << warning << endl;
    }
}

// ============================================================================
// UTILITY
// ============================================================================

uint64_t ElectionSimulator::drawRandom(uint64_t bound) {
    if (bound <= 1) {
        return 0;
    }
    cRNG* rng = getRNG(0);
    uint64_t value = (static_cast<uint64_t>(rng->intRand()) << 32) | rng->intRand();
    return value % bound;
}

void ElectionSimulator::onComponentLog(const std::string& message) {
    EV_DEBUG << message << endl;
}

void ElectionSimulator::finish() {
    recordStatistics();
    EV_INFO << "[Election] Finished" << endl;
}

void ElectionSimulator::recordStatistics() {
    if (!result_) {
        EV_WARN << "[Stats] No election result to record" << endl;
        return;
    }

    const std::vector<SelectedValidator>& validators = result_->selectedValidators();
    recordScalar("validatorsSelected", static_cast<double>(validators.size()));
    recordScalar("allocations", static_cast<double>(result_->stakeDistribution().size()));
    recordScalar("totalStake", result_->totalStake().convert_to<double>());

    if (!validators.empty()) {
        Balance minBacking = validators.front().totalBackingStake;
        Balance maxBacking = minBacking;
        for (const SelectedValidator& validator : validators) {
            minBacking = std::min(minBacking, validator.totalBackingStake);
            maxBacking = std::max(maxBacking, validator.totalBackingStake);
        }
        recordScalar("minBackingStake", minBacking.convert_to<double>());
        recordScalar("maxBackingStake", maxBacking.convert_to<double>());
        EV_INFO << "[Stats] Backing range: " << balanceToString(minBacking)
                << " - " << balanceToString(maxBacking) << endl;
    }
}

} // namespace nposim
