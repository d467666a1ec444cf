#include "ElectionError.h"

namespace nposim {

ElectionError::ElectionError(Kind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{
}

std::string ElectionError::code() const {
    switch (kind_) {
        case Kind::VALIDATION:
            return "VALIDATION_ERROR";
        case Kind::INSUFFICIENT_CANDIDATES:
            return "INSUFFICIENT_CANDIDATES";
        case Kind::ALGORITHM:
            return "ALGORITHM_ERROR";
        case Kind::INVALID_DATA:
            return "INVALID_DATA";
    }
    return "UNKNOWN_ERROR";
}

ValidationError::ValidationError(const std::string& message, const std::string& field)
    : ElectionError(Kind::VALIDATION, "Validation error: " + message)
    , field_(field)
{
}

InsufficientCandidates::InsufficientCandidates(uint32_t requested, uint32_t available)
    : ElectionError(Kind::INSUFFICIENT_CANDIDATES,
                    "Insufficient candidates: requested " + std::to_string(requested) +
                    ", available " + std::to_string(available))
    , requested_(requested)
    , available_(available)
{
}

AlgorithmError::AlgorithmError(const std::string& message, AlgorithmType algorithm)
    : ElectionError(Kind::ALGORITHM,
                    "Algorithm error: " + message + " (algorithm: " + algorithmName(algorithm) + ")")
    , algorithm_(algorithm)
{
}

InvalidData::InvalidData(const std::string& message)
    : ElectionError(Kind::INVALID_DATA, "Invalid data: " + message)
{
}

} // namespace nposim
