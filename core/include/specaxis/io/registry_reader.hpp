#pragma once

#include "../unit_registry.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace specaxis {
namespace io {

/**
 * @brief Exception thrown when a unit registry document cannot be loaded.
 */
class RegistryParseError : public std::runtime_error {
public:
    explicit RegistryParseError(const std::string& msg)
        : std::runtime_error("unit registry parse error: " + msg) {}
};

/**
 * @brief Reader for XML unit registry configuration files.
 *
 * The document lists the scale factor of every unit per quantity family
 * and the family/frame implied by each axis-type token:
 *
 * @code{.xml}
 * <unitRegistry>
 *   <family name="length" canonical="m">
 *     <unit name="m" scale="1.0"/>
 *     <unit name="nm" scale="1e-9"/>
 *   </family>
 *   <axisType name="VLSR" family="velocity" frame="LSR"/>
 * </unitRegistry>
 * @endcode
 *
 * The canonical attribute is optional. An axisType without a frame
 * attribute gets the "rest" frame.
 *
 * Usage:
 * @code
 * RegistryReader reader;
 * auto registry = reader.read("units.xml");
 * SpectroscopicAxis axis({1.0, 2.0}, "nm", {}, registry);
 * @endcode
 */
class RegistryReader {
public:
    RegistryReader();
    ~RegistryReader();

    // Non-copyable
    RegistryReader(const RegistryReader&) = delete;
    RegistryReader& operator=(const RegistryReader&) = delete;

    // Movable
    RegistryReader(RegistryReader&&) noexcept;
    RegistryReader& operator=(RegistryReader&&) noexcept;

    /**
     * @brief Read a registry file.
     *
     * @param filename Path to the XML document
     * @return The loaded registry
     * @throws RegistryParseError if the file cannot be read or is invalid,
     *         or if this reader has been moved from
     */
    std::shared_ptr<const UnitRegistry> read(const std::string& filename);

    /**
     * @brief Parse a registry document held in memory.
     *
     * @param content XML content
     * @return The loaded registry
     * @throws RegistryParseError if the content is invalid, or if this
     *         reader has been moved from
     */
    std::shared_ptr<const UnitRegistry> parseString(const std::string& content);

    /**
     * @brief Get the last error message (if any).
     */
    [[nodiscard]] const std::string& lastError() const noexcept {
        return last_error_;
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::string last_error_;
};

/**
 * @brief Convenience function to load a registry file.
 */
inline std::shared_ptr<const UnitRegistry> loadRegistry(const std::string& filename) {
    RegistryReader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace specaxis
