#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace specaxis {

/// Coordinate sample value type
using Value = double;

/// Scale factor relative to the canonical unit of a family
using ScaleFactor = double;

/// Index type for axis samples
using Index = std::size_t;

/// Physical quantity family of an axis
enum class QuantityFamily : std::uint8_t {
    UNKNOWN = 0,
    LENGTH,      // canonical unit: meter
    FREQUENCY,   // canonical unit: hertz
    VELOCITY,    // canonical unit: meter/second
    REDSHIFT     // recognized, no scale table
};

/// Doppler convention relating velocity and frequency shift
enum class DopplerConvention : std::uint8_t {
    RADIO,
    OPTICAL,
    RELATIVISTIC
};

/// Outcome of an in-place unit conversion
enum class ConversionStatus : std::uint8_t {
    CONVERTED = 0,
    ALREADY_CONVERTED
};

/// Running min/max of a set of values
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::max();
    T max_value = std::numeric_limits<T>::lowest();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    bool isEmpty() const { return min_value > max_value; }

    void extend(T value) {
        if (value < min_value) min_value = value;
        if (value > max_value) max_value = value;
    }
};

using ValueRange = Range<Value>;

/// Convert quantity family to its canonical name
inline std::string toString(QuantityFamily f) {
    switch (f) {
        case QuantityFamily::LENGTH: return "length";
        case QuantityFamily::FREQUENCY: return "frequency";
        case QuantityFamily::VELOCITY: return "velocity";
        case QuantityFamily::REDSHIFT: return "redshift";
        default: return "unknown";
    }
}

/// Convert Doppler convention to string
inline std::string toString(DopplerConvention c) {
    switch (c) {
        case DopplerConvention::RADIO: return "radio";
        case DopplerConvention::OPTICAL: return "optical";
        case DopplerConvention::RELATIVISTIC: return "relativistic";
    }
    return "unknown";
}

/// Convert conversion status to string
inline std::string toString(ConversionStatus s) {
    switch (s) {
        case ConversionStatus::CONVERTED: return "converted";
        case ConversionStatus::ALREADY_CONVERTED: return "already converted";
    }
    return "unknown";
}

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail

/**
 * @brief Parse a quantity family name.
 *
 * Case-insensitive; also accepts the short forms "velo" and "freq".
 *
 * @return The family, or std::nullopt if the name is not recognized
 */
inline std::optional<QuantityFamily> parseFamily(const std::string& name) {
    const std::string n = detail::toLower(name);
    if (n == "length") return QuantityFamily::LENGTH;
    if (n == "frequency" || n == "freq") return QuantityFamily::FREQUENCY;
    if (n == "velocity" || n == "velo") return QuantityFamily::VELOCITY;
    if (n == "redshift") return QuantityFamily::REDSHIFT;
    return std::nullopt;
}

} // namespace specaxis
