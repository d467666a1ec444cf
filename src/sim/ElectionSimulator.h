#ifndef ELECTION_SIMULATOR_H
#define ELECTION_SIMULATOR_H

#include <omnetpp.h>
#include <memory>
#include "../common/NposimDefs.h"
#include "../engine/ElectionEngine.h"
#include "../diagnostics/DiagnosticsGenerator.h"
#include "../io/ResultFormatter.h"

using namespace omnetpp;

namespace nposim {

/**
 * @brief Front end of the election simulator
 *
 * Reads the election setup from NED parameters, loads or synthesizes the
 * dataset, runs the election when its timer fires and writes the result.
 *
 * Integrates:
 * - ElectionEngine (selection, balancing, result assembly)
 * - JsonCodec / SyntheticDataBuilder (dataset sources)
 * - ResultFormatter and DiagnosticsGenerator (output)
 *
 * Component logs are forwarded to EV_DEBUG. Any election error ends the run
 * with a cRuntimeError carrying the error code and message.
 */
class ElectionSimulator : public cSimpleModule {
public:
    ElectionSimulator() = default;
    ~ElectionSimulator() override;

protected:
    // OMNeT++ lifecycle
    void initialize() override;
    void handleMessage(cMessage* msg) override;
    void finish() override;

private:
    // ========================================================================
    // INITIALIZATION HELPERS
    // ========================================================================

    ElectionConfiguration buildConfiguration() const;
    ElectionOverrides buildOverrides() const;
    ElectionData loadDataset();

    // ========================================================================
    // ELECTION
    // ========================================================================

    void runElection();
    void writeOutput(const ElectionResult& result, const ElectionData& effectiveData);

    // ========================================================================
    // UTILITY
    // ========================================================================

    uint64_t drawRandom(uint64_t bound);
    void onComponentLog(const std::string& message);
    void recordStatistics();

    // ========================================================================
    // COMPONENT INSTANCES
    // ========================================================================

    std::unique_ptr<ElectionEngine> engine_;
    std::unique_ptr<ElectionConfiguration> config_;
    std::unique_ptr<ElectionData> data_;
    std::unique_ptr<ElectionResult> result_;

    // ========================================================================
    // PARAMETERS
    // ========================================================================

    std::string dataSource_;
    std::string outputFile_;
    OutputFormat outputFormat_ = OutputFormat::JSON;
    bool diagnosticsEnabled_ = false;
    std::string diagnosticsFile_;

    // ========================================================================
    // TIMERS AND STATISTICS
    // ========================================================================

    cMessage* electionTimer_ = nullptr;

    simsignal_t validatorsSelectedSignal_;
    simsignal_t backingStakeSignal_;
    simsignal_t allocationsSignal_;
};

} // namespace nposim

#endif // ELECTION_SIMULATOR_H
