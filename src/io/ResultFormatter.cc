#include "ResultFormatter.h"
#include "JsonCodec.h"
#include "../common/ElectionError.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nposim {

OutputFormat ResultFormatter::parseFormat(const std::string& name) {
    std::string lowered = trim(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "json") {
        return OutputFormat::JSON;
    }
    if (lowered == "human-readable" || lowered == "human") {
        return OutputFormat::HUMAN_READABLE;
    }
    throw ValidationError("Unknown output format '" + name + "', expected json or human-readable",
                          "output_format");
}

std::string ResultFormatter::format(const ElectionResult& result, OutputFormat outputFormat) {
    switch (outputFormat) {
        case OutputFormat::HUMAN_READABLE:
            return humanReadable(result);
        case OutputFormat::JSON:
            break;
    }
    return JsonCodec::write(JsonCodec::toJson(result)) + "\n";
}

std::string ResultFormatter::humanReadable(const ElectionResult& result) {
    std::ostringstream out;
    out << "Election Results\n";
    out << "================\n";
    out << "Algorithm: " << algorithmName(result.algorithmUsed()) << "\n";
    out << "Total Stake: " << balanceToString(result.totalStake()) << "\n";
    out << "Selected Validators: " << result.selectedValidators().size() << "\n\n";

    out << "Selected Validators:\n";
    const size_t shown = std::min<size_t>(result.selectedValidators().size(),
                                          Constants::MAX_HUMAN_READABLE_ROWS);
    for (size_t i = 0; i < shown; ++i) {
        const SelectedValidator& validator = result.selectedValidators()[i];
        out << (i + 1) << ". " << validator.accountID
            << " - Stake: " << balanceToString(validator.totalBackingStake)
            << ", Nominators: " << validator.nominatorCount << "\n";
    }
    if (result.selectedValidators().size() > shown) {
        out << "... and " << (result.selectedValidators().size() - shown) << " more\n";
    }

    const ExecutionMetadata& metadata = result.executionMetadata();
    if (metadata.blockNumber) {
        out << "Block: " << *metadata.blockNumber << "\n";
    }
    if (metadata.executionTimestamp) {
        out << "Executed: " << *metadata.executionTimestamp << "\n";
    }
    return out.str();
}

} // namespace nposim
