#ifndef DIAGNOSTICS_GENERATOR_H
#define DIAGNOSTICS_GENERATOR_H

#include <json/json.h>
#include "../model/ElectionData.h"
#include "../model/ElectionResult.h"

namespace nposim {

/**
 * @brief Why a candidate was or was not selected
 */
struct ValidatorExplanation {
    AccountID accountID;
    bool selected;
    std::string reason;
    std::vector<std::string> keyFactors;

    ValidatorExplanation() : selected(false) {}
};

struct StakeAnalysis {
    Balance totalStake;
    Balance averageStakePerValidator;
    Balance minBacking;
    Balance maxBacking;
    Balance selfStake;        // allocated from candidates' own bonds
    Balance nominatedStake;   // allocated from nominators

    StakeAnalysis() : totalStake(0), averageStakePerValidator(0), minBacking(0), maxBacking(0),
                      selfStake(0), nominatedStake(0) {}
};

struct Diagnostics {
    std::vector<ValidatorExplanation> validatorExplanations;
    StakeAnalysis stakeAnalysis;
    std::vector<std::string> algorithmInsights;
    std::vector<std::string> warnings;
};

/**
 * @brief Post-hoc report over a computed result
 *
 * Works only from the result and the dataset that produced it; no election
 * algorithm is run again.
 */
class DiagnosticsGenerator {
public:
    DiagnosticsGenerator();

    void setLogCallback(LogCallback callback);

    /**
     * @throws InvalidData if the result names validators missing from @p data
     */
    Diagnostics generate(const ElectionResult& result, const ElectionData& data) const;

    static Json::Value toJson(const Diagnostics& diagnostics);
    static std::string render(const Diagnostics& diagnostics);

private:
    LogCallback logCallback_;

    void log(const std::string& message) const;
};

} // namespace nposim

#endif // DIAGNOSTICS_GENERATOR_H
