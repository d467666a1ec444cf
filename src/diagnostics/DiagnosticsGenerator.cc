#include "DiagnosticsGenerator.h"
#include "../common/ElectionError.h"
#include <algorithm>
#include <sstream>

namespace nposim {

DiagnosticsGenerator::DiagnosticsGenerator() {
}

void DiagnosticsGenerator::setLogCallback(LogCallback callback) {
    logCallback_ = callback;
}

Diagnostics DiagnosticsGenerator::generate(const ElectionResult& result, const ElectionData& data) const {
    Diagnostics diagnostics;
    const size_t count = data.candidates.size();

    // Approval stake = own bond + stake of every approving nominator
    std::map<AccountID, size_t> index;
    std::vector<Balance> approvalStake(count);
    std::vector<uint32_t> approvers(count, 0);
    for (size_t i = 0; i < count; ++i) {
        index[data.candidates[i].accountID] = i;
        approvalStake[i] = data.candidates[i].stake;
    }

    uint32_t zeroStakeNominators = 0;
    uint32_t idleNominators = 0;
    for (const Nominator& nominator : data.nominators) {
        if (nominator.stake == 0) {
            ++zeroStakeNominators;
        }
        if (nominator.targets.empty()) {
            ++idleNominators;
        }
        for (const AccountID& target : nominator.targets) {
            auto it = index.find(target);
            if (it != index.end()) {
                approvalStake[it->second] += nominator.stake;
                ++approvers[it->second];
            }
        }
    }

    for (const SelectedValidator& validator : result.selectedValidators()) {
        if (index.find(validator.accountID) == index.end()) {
            throw InvalidData("Result names validator '" + validator.accountID +
                              "' which is not a candidate of the dataset");
        }
    }

    // Approval ranking, ties by ingestion order
    std::vector<size_t> order(count);
    for (size_t i = 0; i < count; ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&approvalStake](size_t a, size_t b) {
        return approvalStake[a] > approvalStake[b];
    });
    std::vector<size_t> approvalRank(count);
    for (size_t position = 0; position < count; ++position) {
        approvalRank[order[position]] = position + 1;
    }

    // Stake analysis
    StakeAnalysis& analysis = diagnostics.stakeAnalysis;
    analysis.totalStake = result.totalStake();
    bool first = true;
    for (const SelectedValidator& validator : result.selectedValidators()) {
        if (first || validator.totalBackingStake < analysis.minBacking) {
            analysis.minBacking = validator.totalBackingStake;
        }
        if (first || validator.totalBackingStake > analysis.maxBacking) {
            analysis.maxBacking = validator.totalBackingStake;
        }
        first = false;
    }
    if (!result.selectedValidators().empty()) {
        analysis.averageStakePerValidator = result.totalStake() / result.selectedValidators().size();
    }
    for (const StakeAllocation& allocation : result.stakeDistribution()) {
        if (allocation.selfStake) {
            analysis.selfStake += allocation.amount;
        } else {
            analysis.nominatedStake += allocation.amount;
        }
    }

    // Per-candidate explanations
    for (size_t i = 0; i < count; ++i) {
        const Candidate& candidate = data.candidates[i];
        const SelectedValidator* validator = result.findValidator(candidate.accountID);

        ValidatorExplanation explanation;
        explanation.accountID = candidate.accountID;
        explanation.selected = validator != nullptr;

        std::ostringstream approval;
        approval << "Approval stake " << balanceToString(approvalStake[i])
                 << " (rank " << approvalRank[i] << " of " << count << ")";
        explanation.keyFactors.push_back(approval.str());
        explanation.keyFactors.push_back("Self stake " + balanceToString(candidate.stake));
        explanation.keyFactors.push_back(std::to_string(approvers[i]) + " nominator(s) approving");

        if (validator) {
            std::ostringstream reason;
            reason << "Selected";
            if (validator->rank) {
                reason << " in round " << *validator->rank;
            }
            reason << " with total backing " << balanceToString(validator->totalBackingStake)
                   << " from " << validator->nominatorCount << " nominator(s)";
            explanation.reason = reason.str();
        } else if (approvalStake[i] == 0) {
            explanation.reason = "Not selected: no self stake and no approving stake";
        } else if (!result.selectedValidators().empty() && approvalStake[i] < analysis.minBacking) {
            explanation.reason = "Not selected: approval stake " + balanceToString(approvalStake[i]) +
                                 " is below the lowest winning backing " +
                                 balanceToString(analysis.minBacking);
        } else {
            // Phragmen ranks by load-adjusted score, so raw approval can exceed a winner's backing
            explanation.reason = "Not selected: approval stake " + balanceToString(approvalStake[i]) +
                                 " did not give the best load-adjusted score in any round";
        }
        diagnostics.validatorExplanations.push_back(explanation);
    }

    // Warnings
    for (const SelectedValidator& validator : result.selectedValidators()) {
        if (validator.totalBackingStake == 0) {
            diagnostics.warnings.push_back("Validator " + validator.accountID +
                                           " was selected with zero backing stake");
        }
    }
    for (size_t i = 0; i < count; ++i) {
        if (approvalStake[i] == 0) {
            diagnostics.warnings.push_back("Candidate " + data.candidates[i].accountID +
                                           " has no stake behind it");
        }
    }
    if (zeroStakeNominators > 0) {
        diagnostics.warnings.push_back(std::to_string(zeroStakeNominators) + " nominator(s) have zero stake");
    }
    if (idleNominators > 0) {
        diagnostics.warnings.push_back(std::to_string(idleNominators) + " nominator(s) approve no candidates");
    }

    // Algorithm insights
    switch (result.algorithmUsed()) {
        case AlgorithmType::SEQUENTIAL_PHRAGMEN:
            diagnostics.algorithmInsights.push_back(
                "Sequential Phragmen elected the lowest-load candidate each round; rank is the round");
            break;
        case AlgorithmType::PARALLEL_PHRAGMEN:
            diagnostics.algorithmInsights.push_back(
                "PhragMMS elected the candidate with the highest maximin score each round and rebalanced after every round");
            break;
        case AlgorithmType::MULTI_PHASE:
            diagnostics.algorithmInsights.push_back(
                "Multi-phase election resolved with Sequential Phragmen as the on-chain fallback does");
            break;
    }
    diagnostics.algorithmInsights.push_back("Backing spread after balancing: " +
                                            balanceToString(analysis.maxBacking - analysis.minBacking));

    log("Generated diagnostics for " + std::to_string(count) + " candidates with " +
        std::to_string(diagnostics.warnings.size()) + " warning(s)");
    return diagnostics;
}

Json::Value DiagnosticsGenerator::toJson(const Diagnostics& diagnostics) {
    Json::Value root(Json::objectValue);

    Json::Value explanations(Json::arrayValue);
    for (const ValidatorExplanation& explanation : diagnostics.validatorExplanations) {
        Json::Value entry(Json::objectValue);
        entry["account_id"] = explanation.accountID;
        entry["selected"] = explanation.selected;
        entry["reason"] = explanation.reason;
        if (!explanation.keyFactors.empty()) {
            Json::Value factors(Json::arrayValue);
            for (const std::string& factor : explanation.keyFactors) {
                factors.append(factor);
            }
            entry["key_factors"] = factors;
        }
        explanations.append(entry);
    }
    root["validator_explanations"] = explanations;

    const StakeAnalysis& analysis = diagnostics.stakeAnalysis;
    Json::Value stake(Json::objectValue);
    stake["total_stake"] = balanceToString(analysis.totalStake);
    stake["average_stake_per_validator"] = balanceToString(analysis.averageStakePerValidator);
    stake["min_backing"] = balanceToString(analysis.minBacking);
    stake["max_backing"] = balanceToString(analysis.maxBacking);
    stake["self_stake"] = balanceToString(analysis.selfStake);
    stake["nominated_stake"] = balanceToString(analysis.nominatedStake);
    root["stake_analysis"] = stake;

    if (!diagnostics.algorithmInsights.empty()) {
        Json::Value insights(Json::arrayValue);
        for (const std::string& insight : diagnostics.algorithmInsights) {
            insights.append(insight);
        }
        root["algorithm_insights"] = insights;
    }
    if (!diagnostics.warnings.empty()) {
        Json::Value warnings(Json::arrayValue);
        for (const std::string& warning : diagnostics.warnings) {
            warnings.append(warning);
        }
        root["warnings"] = warnings;
    }
    return root;
}

std::string DiagnosticsGenerator::render(const Diagnostics& diagnostics) {
    std::ostringstream out;
    out << "Election Diagnostics\n";
    out << "====================\n";

    const StakeAnalysis& analysis = diagnostics.stakeAnalysis;
    out << "Total stake: " << balanceToString(analysis.totalStake)
        << " (self " << balanceToString(analysis.selfStake)
        << ", nominated " << balanceToString(analysis.nominatedStake) << ")\n";
    out << "Average per validator: " << balanceToString(analysis.averageStakePerValidator) << "\n";
    out << "Backing range: " << balanceToString(analysis.minBacking)
        << " - " << balanceToString(analysis.maxBacking) << "\n\n";

    for (const ValidatorExplanation& explanation : diagnostics.validatorExplanations) {
        out << (explanation.selected ? "[+] " : "[-] ") << explanation.accountID << ": "
            << explanation.reason << "\n";
        for (const std::string& factor : explanation.keyFactors) {
            out << "      " << factor << "\n";
        }
    }

    for (const std::string& insight : diagnostics.algorithmInsights) {
        out << "Note: " << insight << "\n";
    }
    for (const std::string& warning : diagnostics.warnings) {
        out << "Warning: " << warning << "\n";
    }
    return out.str();
}

void DiagnosticsGenerator::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_("[Diagnostics] " + message);
    }
}

} // namespace nposim
