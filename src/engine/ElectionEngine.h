#ifndef ELECTION_ENGINE_H
#define ELECTION_ENGINE_H

#include "../model/ElectionConfig.h"
#include "../model/ElectionData.h"
#include "../model/ElectionResult.h"

namespace nposim {

/**
 * @brief Runs one election end to end
 *
 * Pipeline: validate dataset, apply overrides to a copy, validate the copy,
 * check the active set against the candidate pool, run the configured
 * algorithm, assemble and validate the result, stamp execution metadata.
 *
 * The engine holds no per-run state; the caller's dataset is never modified
 * and independent executions may run concurrently on separate engines.
 *
 * NOTE: Plain C++ class. The OMNeT++ front end (ElectionSimulator) forwards
 * the log callback to EV.
 */
class ElectionEngine {
public:
    using ClockCallback = std::function<std::string()>;

    ElectionEngine();
    ~ElectionEngine() = default;

    void setLogCallback(LogCallback callback);

    /**
     * @brief Source of the execution timestamp (defaults to the system clock)
     */
    void setClock(ClockCallback clock);

    /**
     * @brief Label written to execution_metadata.data_source
     */
    void setDataSource(const std::string& label);

    /**
     * @brief Execute an election
     * @throws ValidationError, InsufficientCandidates, AlgorithmError
     */
    ElectionResult execute(const ElectionConfiguration& config, const ElectionData& data) const;

    /**
     * @brief Current UTC time as RFC 3339 ("2026-01-31T12:00:00Z")
     *
     * Uses the reentrant gmtime_r (POSIX) or gmtime_s (Windows).
     */
    static std::string systemTimestamp();

private:
    LogCallback logCallback_;
    ClockCallback clock_;
    std::string dataSource_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // ELECTION_ENGINE_H
