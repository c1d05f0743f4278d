#include "specaxis/algorithms/doppler.hpp"
#include <algorithm>
#include <cmath>

namespace specaxis {
namespace algorithms {

DopplerConvention parseConvention(const std::string& name) {
    if (name == "radio") return DopplerConvention::RADIO;
    if (name == "optical") return DopplerConvention::OPTICAL;
    if (name == "relativistic") return DopplerConvention::RELATIVISTIC;
    throw UnknownConvention(name);
}

double frequencyFromVelocity(double velocity_ms, double rest_frequency,
                             DopplerConvention convention) {
    const double beta = velocity_ms / SPEED_OF_LIGHT_MS;

    switch (convention) {
        case DopplerConvention::RADIO:
            return rest_frequency * (1.0 - beta);
        case DopplerConvention::OPTICAL:
            return rest_frequency / (1.0 + beta);
        case DopplerConvention::RELATIVISTIC:
            return rest_frequency * std::sqrt(1.0 - beta * beta) / (1.0 + beta);
    }
    throw UnknownConvention(toString(convention));
}

double velocityFromFrequency(double frequency, double rest_frequency,
                             DopplerConvention convention) {
    switch (convention) {
        case DopplerConvention::RADIO:
            return SPEED_OF_LIGHT_MS * (rest_frequency - frequency) / rest_frequency;
        case DopplerConvention::OPTICAL:
            return SPEED_OF_LIGHT_MS * (rest_frequency - frequency) / frequency;
        case DopplerConvention::RELATIVISTIC: {
            const double f0_sq = rest_frequency * rest_frequency;
            const double f_sq = frequency * frequency;
            return SPEED_OF_LIGHT_MS * (f0_sq - f_sq) / (f0_sq + f_sq);
        }
    }
    throw UnknownConvention(toString(convention));
}

std::vector<double> frequenciesFromVelocities(const std::vector<double>& velocities_ms,
                                              double rest_frequency,
                                              DopplerConvention convention) {
    std::vector<double> result(velocities_ms.size());
    std::transform(velocities_ms.begin(), velocities_ms.end(), result.begin(),
        [=](double v) { return frequencyFromVelocity(v, rest_frequency, convention); });
    return result;
}

std::vector<double> velocitiesFromFrequencies(const std::vector<double>& frequencies,
                                              double rest_frequency,
                                              DopplerConvention convention) {
    std::vector<double> result(frequencies.size());
    std::transform(frequencies.begin(), frequencies.end(), result.begin(),
        [=](double f) { return velocityFromFrequency(f, rest_frequency, convention); });
    return result;
}

} // namespace algorithms
} // namespace specaxis
