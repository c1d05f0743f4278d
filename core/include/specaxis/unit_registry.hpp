#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace specaxis {

/// Family and reference frame implied by an axis-type token
struct AxisTypeInfo {
    QuantityFamily family = QuantityFamily::UNKNOWN;
    std::string frame = "rest";
};

/// Unit name -> scale factor relative to the family's canonical unit
using UnitScales = std::map<std::string, ScaleFactor>;

/// Family -> unit scales
using ScaleTable = std::map<QuantityFamily, UnitScales>;

/// Axis-type token (e.g. "VLSR") -> family and frame
using AxisTypeTable = std::map<std::string, AxisTypeInfo>;

/// Family -> canonical unit name
using CanonicalUnits = std::map<QuantityFamily, std::string>;

/**
 * @brief Immutable lookup tables for spectroscopic units.
 *
 * A UnitRegistry holds, for every recognized unit string, its scale
 * factor relative to the canonical SI unit of its quantity family, and
 * maps axis-type tokens to a family and a reference frame label.
 *
 * The unit-to-family index is derived from the scale table, so the two
 * can never disagree. Registries are constructed once and shared as
 * `std::shared_ptr<const UnitRegistry>`; no method mutates them.
 *
 * Usage:
 * @code
 * auto registry = UnitRegistry::standard();
 * double f = registry->scaleFactor(QuantityFamily::LENGTH, "nm");  // 1e-9
 * @endcode
 */
class UnitRegistry {
public:
    /**
     * @brief Build a registry from explicit tables.
     *
     * @param scales Scale factors per family
     * @param axis_types Axis-type token table
     * @param canonical Canonical unit name per family; families without
     *        an entry use their first unit with scale 1
     * @throws std::invalid_argument if a scale factor is not positive and
     *         finite, a unit name appears in two families, a family is
     *         UNKNOWN, or a canonical unit is not registered with scale 1
     */
    UnitRegistry(ScaleTable scales, AxisTypeTable axis_types,
                 CanonicalUnits canonical = {});

    /// Shared registry built from the standard tables
    static std::shared_ptr<const UnitRegistry> standard();

    /// The standard length, frequency and velocity scale tables
    static ScaleTable standardScales();

    /// The standard axis-type token table
    static AxisTypeTable standardAxisTypes();

    // =========================================================================
    // Lookups
    // =========================================================================

    /**
     * @brief Scale factor of a unit relative to its family's canonical unit.
     *
     * @throws UnknownUnit if the unit is not registered under the family
     */
    [[nodiscard]] ScaleFactor scaleFactor(QuantityFamily family,
                                          const std::string& unit) const;

    /**
     * @brief Family a unit belongs to.
     *
     * @throws UnknownUnit if the unit is not registered
     */
    [[nodiscard]] QuantityFamily familyOf(const std::string& unit) const;

    /**
     * @brief Family and frame implied by an axis-type token.
     *
     * @throws UnknownAxisType if the token is not registered
     */
    [[nodiscard]] const AxisTypeInfo& familyAndFrameOf(const std::string& xtype) const;

    /// Check if a unit is registered under any family
    [[nodiscard]] bool hasUnit(const std::string& unit) const {
        return unit_families_.count(unit) > 0;
    }

    /// Check if a unit is registered under the given family
    [[nodiscard]] bool hasUnit(QuantityFamily family, const std::string& unit) const;

    /// Check if an axis-type token is registered
    [[nodiscard]] bool hasAxisType(const std::string& xtype) const {
        return axis_types_.count(xtype) > 0;
    }

    /// Unit names registered under a family (sorted)
    [[nodiscard]] std::vector<std::string> unitsOf(QuantityFamily family) const;

    /// Canonical unit of a family (empty if the family has none)
    [[nodiscard]] const std::string& canonicalUnit(QuantityFamily family) const;

    /// Families with a scale table
    [[nodiscard]] std::vector<QuantityFamily> families() const;

    /// Total number of registered units
    [[nodiscard]] std::size_t size() const noexcept { return unit_families_.size(); }

    [[nodiscard]] const ScaleTable& scales() const noexcept { return scales_; }
    [[nodiscard]] const AxisTypeTable& axisTypes() const noexcept { return axis_types_; }

private:
    ScaleTable scales_;
    AxisTypeTable axis_types_;
    CanonicalUnits canonical_;
    std::map<std::string, QuantityFamily> unit_families_;
};

} // namespace specaxis
