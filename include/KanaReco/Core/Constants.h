#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and precision constants for KanaReco
 */

#include <cmath>
#include <cstdint>
#include <limits>

namespace Kana::Reco {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = PI / 2.0;
constexpr double QUARTER_PI = PI / 4.0;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// =============================================================================
// Precision Constants
// =============================================================================

/// Tolerance for floating point comparison
constexpr double EPSILON = 1e-9;

// =============================================================================
// Drawing Limits
// =============================================================================

/// Stroke count above which a drawing is reported as suspicious by validation
constexpr int32_t MAX_EXPECTED_STROKES = 20;

/// Default number of templates kept resident before cleanup evicts
constexpr size_t DEFAULT_MAX_TEMPLATE_CACHE = 20;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Check if two doubles are approximately equal
 */
inline bool ApproxEqual(double a, double b, double epsilon = EPSILON) {
    return std::abs(a - b) <= epsilon;
}

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Clamp a score to [0, 1]
 */
inline double ClampUnit(double value) {
    return Clamp(value, 0.0, 1.0);
}

inline double DegToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

inline double RadToDeg(double radians) {
    return radians * RAD_TO_DEG;
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

} // namespace Kana::Reco
