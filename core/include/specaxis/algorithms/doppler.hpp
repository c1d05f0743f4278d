#pragma once

#include "../types.hpp"
#include "../errors.hpp"
#include <string>
#include <vector>

namespace specaxis {
namespace algorithms {

/// Speed of light in m/s
constexpr double SPEED_OF_LIGHT_MS = 2.99792458e8;

/**
 * @brief Parse a Doppler convention name.
 *
 * @throws UnknownConvention unless the name is exactly "radio", "optical"
 *         or "relativistic"
 */
DopplerConvention parseConvention(const std::string& name);

/**
 * @brief Observed frequency of a source moving at the given velocity.
 *
 * Conventions (f0 = rest frequency, V = velocity, c = speed of light):
 * - Radio:        f = f0 (1 - V/c)
 * - Optical:      f = f0 / (1 + V/c)
 * - Relativistic: f = f0 sqrt(1 - (V/c)^2) / (1 + V/c)
 *
 * @param velocity_ms Velocity in m/s
 * @param rest_frequency Rest frequency; the result is in the same units
 * @param convention Doppler convention
 */
double frequencyFromVelocity(double velocity_ms, double rest_frequency,
                             DopplerConvention convention);

/**
 * @brief Velocity of a source observed at the given frequency.
 *
 * Inverse of frequencyFromVelocity:
 * - Radio:        V = c (f0 - f) / f0
 * - Optical:      V = c (f0 - f) / f
 * - Relativistic: V = c (f0^2 - f^2) / (f0^2 + f^2)
 *
 * @param frequency Observed frequency
 * @param rest_frequency Rest frequency, same units as frequency
 * @param convention Doppler convention
 * @return Velocity in m/s
 */
double velocityFromFrequency(double frequency, double rest_frequency,
                             DopplerConvention convention);

/**
 * @brief Apply frequencyFromVelocity to every sample.
 */
std::vector<double> frequenciesFromVelocities(const std::vector<double>& velocities_ms,
                                              double rest_frequency,
                                              DopplerConvention convention);

/**
 * @brief Apply velocityFromFrequency to every sample.
 */
std::vector<double> velocitiesFromFrequencies(const std::vector<double>& frequencies,
                                              double rest_frequency,
                                              DopplerConvention convention);

} // namespace algorithms
} // namespace specaxis
