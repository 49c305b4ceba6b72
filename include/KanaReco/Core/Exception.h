#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for KanaReco
 *
 * Lower layers throw these for malformed data. The public recognition
 * entry points never let them escape: they are converted into fallback
 * results at the Recognizer boundary.
 */

#include <stdexcept>
#include <string>

namespace Kana::Reco {

/**
 * @brief Base class of all KanaReco exceptions
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input data violates a precondition (non-finite coordinates etc.)
 */
class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

} // namespace Kana::Reco
