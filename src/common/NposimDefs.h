#ifndef NPOSIM_DEFS_H
#define NPOSIM_DEFS_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <functional>
#include <boost/multiprecision/cpp_int.hpp>

namespace nposim {

// ============================================================================
// TYPE ALIASES
// ============================================================================

using AccountID = std::string;
using BlockNumber = uint64_t;

/**
 * @brief Stake amount (arbitrary precision, never negative)
 */
using Balance = boost::multiprecision::cpp_int;

/**
 * @brief Fixed-point value scaled by Constants::LOAD_SCALE
 */
using ExtendedBalance = boost::multiprecision::cpp_int;

using LogCallback = std::function<void(const std::string&)>;

// ============================================================================
// ENUMS
// ============================================================================

enum class AlgorithmType {
    SEQUENTIAL_PHRAGMEN = 0,
    PARALLEL_PHRAGMEN = 1,  // PhragMMS
    MULTI_PHASE = 2
};

enum class EdgeAction {
    ADD = 0,
    REMOVE = 1,
    MODIFY = 2
};

/**
 * @brief Canonical algorithm name ("sequential-phragmen", ...)
 */
std::string algorithmName(AlgorithmType algorithm);

/**
 * @brief Parse an algorithm name, case-insensitive, synonyms accepted
 * @throws ValidationError (field "algorithm") for unknown names
 */
AlgorithmType parseAlgorithm(const std::string& name);

std::string edgeActionName(EdgeAction action);
EdgeAction parseEdgeAction(const std::string& name);

// ============================================================================
// HELPERS
// ============================================================================

/**
 * @brief Parse a non-negative decimal stake
 * @throws ValidationError naming @p field on malformed input
 */
Balance parseBalance(const std::string& text, const std::string& field);

std::string balanceToString(const Balance& value);

std::string trim(const std::string& text);

// ============================================================================
// CONSTANTS
// ============================================================================

namespace Constants {
    // Fixed-point scale for loads and scores (2^128)
    const ExtendedBalance& loadScale();

    // Post-selection stake balancing
    constexpr int DEFAULT_BALANCING_ITERATIONS = 10;
    constexpr uint64_t DEFAULT_BALANCING_TOLERANCE = 0;

    // Front-end defaults
    constexpr int DEFAULT_ACTIVE_SET_SIZE = 100;
    constexpr int MAX_LISTED_CANDIDATES = 5;  // in dangling-target messages
    constexpr int MAX_HUMAN_READABLE_ROWS = 10;
}

} // namespace nposim

#endif // NPOSIM_DEFS_H
