#pragma once

/**
 * @file specaxis.hpp
 * @brief Main header for the SpecAxis library.
 *
 * Include this header to get access to all SpecAxis functionality.
 *
 * @example
 * @code
 * #include <specaxis/specaxis.hpp>
 *
 * int main() {
 *     // HI line observed in LSR velocity
 *     specaxis::SpectroscopicAxis axis({-10.0, 0.0, 10.0}, "km/s");
 *
 *     axis.velocityToFrequency(1420.405752, "MHz", "radio");
 *     for (double f : axis.values()) {
 *         std::cout << f << " " << axis.units() << "\n";
 *     }
 *
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"

// Data structures
#include "unit_registry.hpp"
#include "spectroscopic_axis.hpp"

// I/O
#include "io/registry_reader.hpp"

// Algorithms
#include "algorithms/doppler.hpp"

/**
 * @namespace specaxis
 * @brief Root namespace for the SpecAxis library.
 */

/**
 * @namespace specaxis::io
 * @brief Loading unit registries from configuration files.
 */

/**
 * @namespace specaxis::algorithms
 * @brief Doppler conversion formulas.
 */
