/**
 * Example usage of the SpecAxis C++ library.
 *
 * Compile with:
 *   g++ -std=c++17 -I../core/include axis_example.cpp -o example -lspecaxis -lpugixml
 */

#include <iostream>
#include <vector>

#include "specaxis/specaxis.hpp"

using namespace specaxis;

namespace {

/// HI 21 cm rest frequency in MHz
constexpr double HI_REST_MHZ = 1420.405752;

void printAxis(const SpectroscopicAxis& axis) {
    std::cout << "  [";
    for (std::size_t i = 0; i < axis.size(); ++i) {
        std::cout << (i ? ", " : "") << axis.at(i);
    }
    std::cout << "] " << axis.units()
              << " (" << toString(axis.xtype()) << ", " << axis.frame() << " frame)\n";
}

} // namespace

void exampleUnitConversion() {
    std::cout << "========================================\n";
    std::cout << "Unit Conversion\n";
    std::cout << "========================================\n";

    // H-alpha and H-beta in nanometers
    auto axis = SpectroscopicAxis::create({656.28, 486.13}, "nm");
    printAxis(axis);

    axis.convertTo("A");
    std::cout << "Converted to angstroms:\n";
    printAxis(axis);

    axis.setNoticeCallback([](const std::string& msg) {
        std::cout << "  notice: " << msg << "\n";
    });
    auto status = axis.convertTo("A");
    std::cout << "Second conversion: " << toString(status) << "\n";
}

void exampleDoppler() {
    std::cout << "\n========================================\n";
    std::cout << "Doppler Conversion\n";
    std::cout << "========================================\n";

    AxisOptions options;
    options.xtype = "VLSR";
    SpectroscopicAxis axis({-50.0, 0.0, 50.0}, "km/s", options);
    std::cout << "Velocity axis:\n";
    printAxis(axis);

    axis.velocityToFrequency(HI_REST_MHZ, "MHz", "radio");
    std::cout << "Radio convention frequencies:\n";
    printAxis(axis);

    axis.frequencyToVelocity(HI_REST_MHZ, "MHz", "km/s", "relativistic");
    std::cout << "Back to velocity, relativistic convention:\n";
    printAxis(axis);
}

void exampleErrors() {
    std::cout << "\n========================================\n";
    std::cout << "Error Handling\n";
    std::cout << "========================================\n";

    auto axis = SpectroscopicAxis::create({1.0, 2.0}, "GHz");

    try {
        axis.convertTo("km/s");
    } catch (const IncompatibleFamily& e) {
        std::cout << "  " << e.what() << "\n";
    }

    try {
        axis.convertTo("MHz", "LSR");
    } catch (const FrameConversionUnsupported& e) {
        std::cout << "  " << e.what() << "\n";
    }

    try {
        SpectroscopicAxis::create({1.0}, "furlongs");
    } catch (const UnknownUnit& e) {
        std::cout << "  " << e.what() << "\n";
    }

    // Nothing above modified the axis
    printAxis(axis);
}

int main() {
    std::cout << "SpecAxis C++ Library Examples\n\n";

    try {
        exampleUnitConversion();
        exampleDoppler();
        exampleErrors();

        std::cout << "\n========================================\n";
        std::cout << "Examples completed successfully!\n";
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
