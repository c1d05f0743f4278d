#include "specaxis/spectroscopic_axis.hpp"
#include "specaxis/algorithms/doppler.hpp"
#include <cmath>

namespace specaxis {

namespace {

void requireCenterFrequency(std::optional<double> center_frequency,
                            const char* direction) {
    if (!center_frequency) {
        throw MissingParameter(std::string("cannot convert ") + direction +
                               " without specifying a central frequency");
    }
    if (!std::isfinite(*center_frequency) || *center_frequency <= 0.0) {
        throw InvalidParameter("central frequency must be positive and finite, got " +
                               std::to_string(*center_frequency));
    }
}

std::vector<Value> scaled(const std::vector<Value>& values, double factor) {
    std::vector<Value> result(values);
    for (auto& v : result) {
        v *= factor;
    }
    return result;
}

} // namespace

SpectroscopicAxis::SpectroscopicAxis(std::vector<Value> values, std::string unit,
                                     AxisOptions options,
                                     std::shared_ptr<const UnitRegistry> registry)
    : values_(std::move(values)),
      units_(std::move(unit)),
      frame_(std::move(options.frame)),
      reffreq_(options.reffreq),
      redshift_(options.redshift),
      registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("SpectroscopicAxis requires a unit registry");
    }

    if (options.xtype && registry_->hasAxisType(*options.xtype)) {
        const AxisTypeInfo& info = registry_->familyAndFrameOf(*options.xtype);
        if (registry_->hasUnit(units_)) {
            QuantityFamily unit_family = registry_->familyOf(units_);
            if (unit_family != info.family) {
                throw IncompatibleFamily(info.family, unit_family, units_);
            }
        }
        xtype_ = info.family;
        frame_ = info.frame;
    } else {
        xtype_ = registry_->familyOf(units_);
    }
}

SpectroscopicAxis SpectroscopicAxis::create(std::vector<Value> values, std::string unit,
                                            std::string frame,
                                            std::optional<std::string> xtype,
                                            std::optional<double> reffreq,
                                            std::optional<double> redshift) {
    AxisOptions options;
    options.frame = std::move(frame);
    options.xtype = std::move(xtype);
    options.reffreq = reffreq;
    options.redshift = redshift;
    return SpectroscopicAxis(std::move(values), std::move(unit), std::move(options));
}

ValueRange SpectroscopicAxis::range() const {
    ValueRange r;
    for (Value v : values_) {
        r.extend(v);
    }
    return r;
}

ConversionStatus SpectroscopicAxis::convertTo(const std::string& unit,
                                              const std::string& frame) {
    if (unit == units_ && frame == frame_) {
        notify("already in " + unit + " (" + frame + " frame)");
        return ConversionStatus::ALREADY_CONVERTED;
    }
    if (frame != frame_) {
        throw FrameConversionUnsupported(frame_, frame);
    }

    QuantityFamily target_family = registry_->familyOf(unit);
    if (target_family != xtype_) {
        throw IncompatibleFamily(xtype_, target_family, unit);
    }

    const double factor = currentScale() / registry_->scaleFactor(xtype_, unit);
    for (auto& v : values_) {
        v *= factor;
    }
    units_ = unit;
    return ConversionStatus::CONVERTED;
}

void SpectroscopicAxis::velocityToFrequency(std::optional<double> center_frequency,
                                            const std::string& frequency_units,
                                            const std::string& convention) {
    requireCenterFrequency(center_frequency, "velocity to frequency");
    if (!registry_->hasUnit(QuantityFamily::FREQUENCY, frequency_units)) {
        throw InvalidUnit(frequency_units, QuantityFamily::FREQUENCY);
    }
    requireFamily(QuantityFamily::VELOCITY);
    const DopplerConvention doppler = algorithms::parseConvention(convention);

    const double to_ms = currentScale();
    const double to_hz = registry_->scaleFactor(QuantityFamily::FREQUENCY, frequency_units);
    const double rest_hz = *center_frequency * to_hz;

    std::vector<Value> result = algorithms::frequenciesFromVelocities(
        scaled(values_, to_ms), rest_hz, doppler);

    values_ = scaled(result, 1.0 / to_hz);
    units_ = frequency_units;
    xtype_ = QuantityFamily::FREQUENCY;
}

void SpectroscopicAxis::frequencyToVelocity(std::optional<double> center_frequency,
                                            const std::string& center_frequency_units,
                                            const std::string& velocity_units,
                                            const std::string& convention) {
    requireCenterFrequency(center_frequency, "frequency to velocity");
    if (!registry_->hasUnit(QuantityFamily::FREQUENCY, center_frequency_units)) {
        throw InvalidUnit(center_frequency_units, QuantityFamily::FREQUENCY);
    }
    if (!registry_->hasUnit(QuantityFamily::VELOCITY, velocity_units)) {
        throw InvalidUnit(velocity_units, QuantityFamily::VELOCITY);
    }
    requireFamily(QuantityFamily::FREQUENCY);
    const DopplerConvention doppler = algorithms::parseConvention(convention);

    const double to_hz = currentScale();
    const double rest_hz = *center_frequency *
        registry_->scaleFactor(QuantityFamily::FREQUENCY, center_frequency_units);
    const double to_ms = registry_->scaleFactor(QuantityFamily::VELOCITY, velocity_units);

    std::vector<Value> result = algorithms::velocitiesFromFrequencies(
        scaled(values_, to_hz), rest_hz, doppler);

    values_ = scaled(result, 1.0 / to_ms);
    units_ = velocity_units;
    xtype_ = QuantityFamily::VELOCITY;
}

ScaleFactor SpectroscopicAxis::currentScale() const {
    return registry_->scaleFactor(xtype_, units_);
}

void SpectroscopicAxis::requireFamily(QuantityFamily family) const {
    if (xtype_ != family) {
        throw IncompatibleFamily(family, xtype_, units_);
    }
}

void SpectroscopicAxis::notify(const std::string& message) const {
    if (notice_) {
        notice_(message);
    }
}

} // namespace specaxis
