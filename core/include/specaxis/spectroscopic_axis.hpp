#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "unit_registry.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace specaxis {

/**
 * @brief Informational notice callback.
 *
 * Receives a human-readable message for events that are not errors,
 * such as a conversion request that is already satisfied.
 */
using NoticeCallback = std::function<void(const std::string& message)>;

/**
 * @brief Options for constructing a SpectroscopicAxis.
 */
struct AxisOptions {
    /// Reference frame label (overridden by a recognized xtype)
    std::string frame = "rest";

    /// Axis-type token such as "VLSR" or "FREQ" (empty = infer from unit)
    std::optional<std::string> xtype;

    /// Reference frequency, carried for downstream use
    std::optional<double> reffreq;

    /// Redshift, carried for downstream use
    std::optional<double> redshift;
};

/**
 * @brief The independent axis of a spectrum, annotated with its units.
 *
 * A SpectroscopicAxis owns a sequence of coordinate samples (wavelength,
 * frequency, velocity or redshift) together with the unit string, the
 * quantity family the samples represent, and a reference frame label.
 * Unit and Doppler conversions rewrite the samples in place.
 *
 * Every operation validates its arguments before touching the samples,
 * so an operation that throws leaves the axis unchanged.
 *
 * Usage:
 * @code
 * SpectroscopicAxis axis({0.0, 1000.0}, "m/s");
 * axis.velocityToFrequency(1.42e9, "Hz", "radio");
 * axis.convertTo("GHz");
 * @endcode
 */
class SpectroscopicAxis {
public:
    /**
     * @brief Construct from samples and a unit.
     *
     * If options.xtype names a registered axis type, the family and frame
     * come from the axis-type table and options.frame is ignored.
     * Otherwise the family is inferred from the unit.
     *
     * @param values Coordinate samples
     * @param unit Unit of the samples
     * @param options Frame, xtype and auxiliary metadata
     * @param registry Unit tables to resolve names against
     * @throws UnknownUnit if no xtype matches and the unit is not registered
     * @throws IncompatibleFamily if the unit contradicts the xtype's family
     */
    SpectroscopicAxis(std::vector<Value> values, std::string unit,
                      AxisOptions options = {},
                      std::shared_ptr<const UnitRegistry> registry = UnitRegistry::standard());

    /**
     * @brief Construct with the standard registry.
     */
    static SpectroscopicAxis create(std::vector<Value> values, std::string unit,
                                    std::string frame = "rest",
                                    std::optional<std::string> xtype = std::nullopt,
                                    std::optional<double> reffreq = std::nullopt,
                                    std::optional<double> redshift = std::nullopt);

    SpectroscopicAxis(SpectroscopicAxis&&) noexcept = default;
    SpectroscopicAxis& operator=(SpectroscopicAxis&&) noexcept = default;
    SpectroscopicAxis(const SpectroscopicAxis&) = default;
    SpectroscopicAxis& operator=(const SpectroscopicAxis&) = default;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get number of samples
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    /// Check if the axis has no samples
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    /// Get sample array
    [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

    /// Get sample at index
    [[nodiscard]] Value at(Index i) const { return values_.at(i); }

    /// Minimum and maximum sample
    [[nodiscard]] ValueRange range() const;

    // =========================================================================
    // Metadata
    // =========================================================================

    [[nodiscard]] const std::string& units() const noexcept { return units_; }
    [[nodiscard]] const std::string& frame() const noexcept { return frame_; }
    [[nodiscard]] QuantityFamily xtype() const noexcept { return xtype_; }

    [[nodiscard]] std::optional<double> reffreq() const noexcept { return reffreq_; }
    void setReffreq(std::optional<double> f) noexcept { reffreq_ = f; }

    [[nodiscard]] std::optional<double> redshift() const noexcept { return redshift_; }
    void setRedshift(std::optional<double> z) noexcept { redshift_ = z; }

    [[nodiscard]] const std::shared_ptr<const UnitRegistry>& registry() const noexcept {
        return registry_;
    }

    /// Receive informational notices (nullptr to discard them)
    void setNoticeCallback(NoticeCallback callback) { notice_ = std::move(callback); }

    // =========================================================================
    // Conversions
    // =========================================================================

    /**
     * @brief Convert the samples to another unit of the same family.
     *
     * @param unit Target unit
     * @param frame Target frame; must equal the current frame
     * @return ALREADY_CONVERTED if unit and frame already match, else CONVERTED
     * @throws FrameConversionUnsupported if frame differs from the current frame
     * @throws UnknownUnit if unit, or the current unit, is not registered
     * @throws IncompatibleFamily if unit belongs to another family
     */
    ConversionStatus convertTo(const std::string& unit,
                               const std::string& frame = "rest");

    /**
     * @brief Convert velocity samples to frequencies.
     *
     * @param center_frequency Rest frequency, in frequency_units
     * @param frequency_units Units of center_frequency and of the result
     * @param convention "radio", "optical" or "relativistic"
     * @throws MissingParameter if center_frequency is not given
     * @throws InvalidUnit if frequency_units is not a frequency unit
     * @throws InvalidParameter if center_frequency is not positive and finite
     * @throws IncompatibleFamily if the axis is not velocity-typed
     * @throws UnknownConvention for any other convention
     */
    void velocityToFrequency(std::optional<double> center_frequency,
                             const std::string& frequency_units = "Hz",
                             const std::string& convention = "radio");

    /**
     * @brief Convert frequency samples to velocities.
     *
     * @param center_frequency Rest frequency, in center_frequency_units
     * @param center_frequency_units Units of center_frequency
     * @param velocity_units Units of the result
     * @param convention "radio", "optical" or "relativistic"
     * @throws MissingParameter if center_frequency is not given
     * @throws InvalidUnit if a unit argument is not registered for its role
     * @throws InvalidParameter if center_frequency is not positive and finite
     * @throws IncompatibleFamily if the axis is not frequency-typed
     * @throws UnknownConvention for any other convention
     */
    void frequencyToVelocity(std::optional<double> center_frequency,
                             const std::string& center_frequency_units = "Hz",
                             const std::string& velocity_units = "m/s",
                             const std::string& convention = "radio");

private:
    /// Scale factor of the current unit; throws if the axis family lacks it
    ScaleFactor currentScale() const;

    /// Check that the axis currently holds the given family
    void requireFamily(QuantityFamily family) const;

    void notify(const std::string& message) const;

    std::vector<Value> values_;
    std::string units_;
    std::string frame_ = "rest";
    QuantityFamily xtype_ = QuantityFamily::UNKNOWN;

    // Auxiliary metadata
    std::optional<double> reffreq_;
    std::optional<double> redshift_;

    std::shared_ptr<const UnitRegistry> registry_;
    NoticeCallback notice_;
};

} // namespace specaxis
