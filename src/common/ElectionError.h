#ifndef ELECTION_ERROR_H
#define ELECTION_ERROR_H

#include <stdexcept>
#include <string>
#include <cstdint>
#include "NposimDefs.h"

namespace nposim {

/**
 * @brief Base of every error the election core reports
 *
 * Errors are thrown to the caller and never partially applied: a call either
 * returns a complete result or throws one of the kinds below.
 */
class ElectionError : public std::runtime_error {
public:
    enum class Kind {
        VALIDATION = 0,
        INSUFFICIENT_CANDIDATES = 1,
        ALGORITHM = 2,
        INVALID_DATA = 3
    };

    ElectionError(Kind kind, const std::string& message);

    Kind kind() const { return kind_; }

    /**
     * @brief Stable identifier ("VALIDATION_ERROR", ...) for structured output
     */
    std::string code() const;

private:
    Kind kind_;
};

/**
 * @brief Malformed or inconsistent input, optionally naming the field
 */
class ValidationError : public ElectionError {
public:
    explicit ValidationError(const std::string& message, const std::string& field = "");

    const std::string& field() const { return field_; }
    bool hasField() const { return !field_.empty(); }

private:
    std::string field_;
};

/**
 * @brief Requested active set is larger than the candidate pool
 */
class InsufficientCandidates : public ElectionError {
public:
    InsufficientCandidates(uint32_t requested, uint32_t available);

    uint32_t requested() const { return requested_; }
    uint32_t available() const { return available_; }

private:
    uint32_t requested_;
    uint32_t available_;
};

/**
 * @brief Selection algorithm failed or broke an invariant
 */
class AlgorithmError : public ElectionError {
public:
    AlgorithmError(const std::string& message, AlgorithmType algorithm);

    AlgorithmType algorithm() const { return algorithm_; }

private:
    AlgorithmType algorithm_;
};

/**
 * @brief Malformed persisted or serialized structure
 */
class InvalidData : public ElectionError {
public:
    explicit InvalidData(const std::string& message);
};

} // namespace nposim

#endif // ELECTION_ERROR_H
