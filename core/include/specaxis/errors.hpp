#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace specaxis {

/**
 * @brief Base class for all axis conversion errors.
 */
class AxisError : public std::runtime_error {
public:
    explicit AxisError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/// Unit string not registered under the relevant family
class UnknownUnit : public AxisError {
public:
    explicit UnknownUnit(const std::string& unit)
        : AxisError("unknown unit: '" + unit + "'"), unit_(unit) {}

    UnknownUnit(const std::string& unit, QuantityFamily family)
        : AxisError("unknown " + toString(family) + " unit: '" + unit + "'"),
          unit_(unit) {}

    const std::string& unit() const noexcept { return unit_; }

private:
    std::string unit_;
};

/// Axis-type token not registered
class UnknownAxisType : public AxisError {
public:
    explicit UnknownAxisType(const std::string& xtype)
        : AxisError("unknown axis type: '" + xtype + "'") {}
};

/// Target unit belongs to a different quantity family than the axis
class IncompatibleFamily : public AxisError {
public:
    IncompatibleFamily(QuantityFamily expected, QuantityFamily actual,
                       const std::string& unit)
        : AxisError("unit '" + unit + "' is a " + toString(actual) +
                    " unit, expected " + toString(expected)),
          expected_(expected), actual_(actual) {}

    QuantityFamily expected() const noexcept { return expected_; }
    QuantityFamily actual() const noexcept { return actual_; }

private:
    QuantityFamily expected_;
    QuantityFamily actual_;
};

/// A required argument was omitted
class MissingParameter : public AxisError {
public:
    explicit MissingParameter(const std::string& msg)
        : AxisError(msg) {}
};

/// A unit-name argument is not registered for its role
class InvalidUnit : public AxisError {
public:
    InvalidUnit(const std::string& unit, QuantityFamily family)
        : AxisError("bad " + toString(family) + " units: '" + unit + "'") {}
};

/// A numeric argument is outside its valid domain
class InvalidParameter : public AxisError {
public:
    explicit InvalidParameter(const std::string& msg)
        : AxisError(msg) {}
};

/// Doppler convention is not radio, optical or relativistic
class UnknownConvention : public AxisError {
public:
    explicit UnknownConvention(const std::string& convention)
        : AxisError("convention \"" + convention + "\" is not allowed") {}
};

/// Conversion between reference frames was requested
class FrameConversionUnsupported : public AxisError {
public:
    FrameConversionUnsupported(const std::string& from, const std::string& to)
        : AxisError("converting frames from " + from + " to " + to +
                    " is not supported") {}
};

} // namespace specaxis
