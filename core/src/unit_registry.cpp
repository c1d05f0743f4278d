#include "specaxis/unit_registry.hpp"
#include <cmath>

namespace specaxis {

UnitRegistry::UnitRegistry(ScaleTable scales, AxisTypeTable axis_types,
                           CanonicalUnits canonical)
    : scales_(std::move(scales)),
      axis_types_(std::move(axis_types)),
      canonical_(std::move(canonical)) {
    for (const auto& [family, units] : scales_) {
        if (family == QuantityFamily::UNKNOWN) {
            throw std::invalid_argument("scale table for unknown family");
        }
        for (const auto& [name, factor] : units) {
            if (!std::isfinite(factor) || factor <= 0.0) {
                throw std::invalid_argument("scale factor of '" + name +
                                            "' must be positive and finite");
            }
            auto inserted = unit_families_.emplace(name, family);
            if (!inserted.second) {
                throw std::invalid_argument("unit '" + name +
                                            "' registered under both " +
                                            toString(inserted.first->second) +
                                            " and " + toString(family));
            }
        }
    }

    for (const auto& [token, info] : axis_types_) {
        if (info.family == QuantityFamily::UNKNOWN) {
            throw std::invalid_argument("axis type '" + token + "' has no family");
        }
    }

    for (const auto& [family, name] : canonical_) {
        auto it = scales_.find(family);
        if (it == scales_.end() || it->second.count(name) == 0 ||
            it->second.at(name) != 1.0) {
            throw std::invalid_argument("canonical " + toString(family) +
                                        " unit '" + name +
                                        "' must be registered with scale 1");
        }
    }

    // Families without an explicit canonical unit take their first unit of scale 1
    for (const auto& [family, units] : scales_) {
        if (canonical_.count(family)) continue;
        for (const auto& [name, factor] : units) {
            if (factor == 1.0) {
                canonical_[family] = name;
                break;
            }
        }
    }
}

std::shared_ptr<const UnitRegistry> UnitRegistry::standard() {
    static const std::shared_ptr<const UnitRegistry> instance =
        std::make_shared<UnitRegistry>(
            standardScales(), standardAxisTypes(),
            CanonicalUnits{
                {QuantityFamily::LENGTH, "m"},
                {QuantityFamily::FREQUENCY, "Hz"},
                {QuantityFamily::VELOCITY, "m/s"}});
    return instance;
}

ScaleTable UnitRegistry::standardScales() {
    ScaleTable table;

    table[QuantityFamily::LENGTH] = {
        {"meters", 1.0}, {"m", 1.0},
        {"centimeters", 1e-2}, {"cm", 1e-2},
        {"millimeters", 1e-3}, {"mm", 1e-3},
        {"nanometers", 1e-9}, {"nm", 1e-9},
        {"micrometers", 1e-6}, {"micron", 1e-6}, {"microns", 1e-6}, {"um", 1e-6},
        {"kilometers", 1e3}, {"km", 1e3},
        {"angstroms", 1e-10}, {"A", 1e-10},
    };

    table[QuantityFamily::FREQUENCY] = {
        {"Hz", 1.0},
        {"kHz", 1e3},
        {"MHz", 1e6},
        {"GHz", 1e9},
        {"THz", 1e12},
    };

    table[QuantityFamily::VELOCITY] = {
        {"meters/second", 1.0}, {"m/s", 1.0},
        {"kilometers/s", 1e3}, {"km/s", 1e3}, {"kms", 1e3},
        {"centimeters/s", 1e-2}, {"cm/s", 1e-2}, {"cms", 1e-2},
    };

    return table;
}

AxisTypeTable UnitRegistry::standardAxisTypes() {
    const auto velocity = QuantityFamily::VELOCITY;
    const auto frequency = QuantityFamily::FREQUENCY;
    const auto length = QuantityFamily::LENGTH;

    return {
        {"VLSR", {velocity, "LSR"}},
        {"VRAD", {velocity, "LSR"}},
        {"VELO", {velocity, "LSR"}},
        {"VOPT", {velocity, "LSR"}},
        {"VHEL", {velocity, "heliocentric"}},
        {"VGEO", {velocity, "geocentric"}},
        {"VREST", {velocity, "rest"}},
        {"velocity", {velocity, "LSR"}},
        {"Z", {QuantityFamily::REDSHIFT, "rest"}},
        {"FREQ", {frequency, "rest"}},
        {"frequency", {frequency, "rest"}},
        {"WAV", {length, "rest"}},
        {"WAVE", {length, "rest"}},
        {"wavelength", {length, "rest"}},
    };
}

ScaleFactor UnitRegistry::scaleFactor(QuantityFamily family,
                                      const std::string& unit) const {
    auto table = scales_.find(family);
    if (table == scales_.end()) {
        throw UnknownUnit(unit, family);
    }
    auto it = table->second.find(unit);
    if (it == table->second.end()) {
        throw UnknownUnit(unit, family);
    }
    return it->second;
}

QuantityFamily UnitRegistry::familyOf(const std::string& unit) const {
    auto it = unit_families_.find(unit);
    if (it == unit_families_.end()) {
        throw UnknownUnit(unit);
    }
    return it->second;
}

const AxisTypeInfo& UnitRegistry::familyAndFrameOf(const std::string& xtype) const {
    auto it = axis_types_.find(xtype);
    if (it == axis_types_.end()) {
        throw UnknownAxisType(xtype);
    }
    return it->second;
}

bool UnitRegistry::hasUnit(QuantityFamily family, const std::string& unit) const {
    auto it = unit_families_.find(unit);
    return it != unit_families_.end() && it->second == family;
}

std::vector<std::string> UnitRegistry::unitsOf(QuantityFamily family) const {
    std::vector<std::string> result;
    auto table = scales_.find(family);
    if (table == scales_.end()) {
        return result;
    }
    result.reserve(table->second.size());
    for (const auto& entry : table->second) {
        result.push_back(entry.first);
    }
    return result;
}

const std::string& UnitRegistry::canonicalUnit(QuantityFamily family) const {
    static const std::string none;
    auto it = canonical_.find(family);
    return it == canonical_.end() ? none : it->second;
}

std::vector<QuantityFamily> UnitRegistry::families() const {
    std::vector<QuantityFamily> result;
    result.reserve(scales_.size());
    for (const auto& entry : scales_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace specaxis
