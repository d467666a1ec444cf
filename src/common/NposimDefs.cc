#include "NposimDefs.h"
#include "ElectionError.h"
#include <algorithm>
#include <cctype>

namespace nposim {

std::string algorithmName(AlgorithmType algorithm) {
    switch (algorithm) {
        case AlgorithmType::SEQUENTIAL_PHRAGMEN:
            return "sequential-phragmen";
        case AlgorithmType::PARALLEL_PHRAGMEN:
            return "parallel-phragmen";
        case AlgorithmType::MULTI_PHASE:
            return "multi-phase";
    }
    return "unknown";
}

AlgorithmType parseAlgorithm(const std::string& name) {
    std::string lower = trim(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "sequential-phragmen" || lower == "sequential" || lower == "seq-phragmen") {
        return AlgorithmType::SEQUENTIAL_PHRAGMEN;
    }
    if (lower == "parallel-phragmen" || lower == "parallel" || lower == "phragmms") {
        return AlgorithmType::PARALLEL_PHRAGMEN;
    }
    if (lower == "multi-phase" || lower == "multiphase") {
        return AlgorithmType::MULTI_PHASE;
    }
    throw ValidationError("Unknown algorithm type: " + name +
                          " (expected sequential-phragmen, parallel-phragmen or multi-phase)",
                          "algorithm");
}

std::string edgeActionName(EdgeAction action) {
    switch (action) {
        case EdgeAction::ADD:
            return "add";
        case EdgeAction::REMOVE:
            return "remove";
        case EdgeAction::MODIFY:
            return "modify";
    }
    return "unknown";
}

EdgeAction parseEdgeAction(const std::string& name) {
    std::string lower = trim(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "add") return EdgeAction::ADD;
    if (lower == "remove") return EdgeAction::REMOVE;
    if (lower == "modify" || lower == "replace") return EdgeAction::MODIFY;

    throw ValidationError("Unknown voting edge action: " + name, "override_voting_edge");
}

Balance parseBalance(const std::string& text, const std::string& field) {
    std::string digits = trim(text);
    if (digits.empty()) {
        throw ValidationError("Empty stake value", field);
    }
    for (char ch : digits) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw ValidationError("Invalid stake value '" + digits +
                                  "': expected a non-negative integer", field);
        }
    }
    return Balance(digits);
}

std::string balanceToString(const Balance& value) {
    return value.str();
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    std::string::size_type begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    std::string::size_type end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

namespace Constants {

const ExtendedBalance& loadScale() {
    static const ExtendedBalance scale = ExtendedBalance(1) << 128;
    return scale;
}

} // namespace Constants

} // namespace nposim
