#include "specaxis/io/registry_reader.hpp"
#include <cerrno>
#include <cstdlib>
#include <pugixml.hpp>

namespace specaxis {
namespace io {

namespace xml {
    constexpr const char* ROOT = "unitRegistry";
    constexpr const char* FAMILY = "family";
    constexpr const char* UNIT = "unit";
    constexpr const char* AXIS_TYPE = "axisType";

    constexpr const char* NAME = "name";
    constexpr const char* SCALE = "scale";
    constexpr const char* CANONICAL = "canonical";
    constexpr const char* FRAME = "frame";
}

class RegistryReader::Impl {
public:
    Impl() = default;

    std::shared_ptr<const UnitRegistry> read(const std::string& filename) {
        pugi::xml_document doc;
        pugi::xml_parse_result result = doc.load_file(filename.c_str());

        if (!result) {
            throw RegistryParseError("failed to parse file " + filename + ": " +
                                     std::string(result.description()));
        }
        return parseDocument(doc);
    }

    std::shared_ptr<const UnitRegistry> parseString(const std::string& content) {
        pugi::xml_document doc;
        pugi::xml_parse_result result = doc.load_string(content.c_str());

        if (!result) {
            throw RegistryParseError("failed to parse content: " +
                                     std::string(result.description()));
        }
        return parseDocument(doc);
    }

private:
    std::shared_ptr<const UnitRegistry> parseDocument(const pugi::xml_document& doc) {
        auto root = doc.child(xml::ROOT);
        if (!root) {
            throw RegistryParseError(std::string("no ") + xml::ROOT + " element found");
        }

        ScaleTable scales;
        CanonicalUnits canonical;
        for (auto family_node : root.children(xml::FAMILY)) {
            QuantityFamily family = parseFamilyAttribute(family_node, xml::NAME);
            UnitScales& units = scales[family];

            for (auto unit_node : family_node.children(xml::UNIT)) {
                std::string name = requireAttribute(unit_node, xml::NAME);
                double scale = parseNumber(requireAttribute(unit_node, xml::SCALE), name);
                if (!units.emplace(name, scale).second) {
                    throw RegistryParseError("duplicate unit '" + name + "' in " +
                                             toString(family));
                }
            }

            if (auto attr = family_node.attribute(xml::CANONICAL)) {
                canonical[family] = attr.value();
            }
        }

        AxisTypeTable axis_types;
        for (auto node : root.children(xml::AXIS_TYPE)) {
            std::string token = requireAttribute(node, xml::NAME);
            AxisTypeInfo info;
            info.family = parseFamilyAttribute(node, xml::FAMILY);
            if (auto frame = node.attribute(xml::FRAME)) {
                info.frame = frame.value();
            }
            if (!axis_types.emplace(token, info).second) {
                throw RegistryParseError("duplicate axis type '" + token + "'");
            }
        }

        try {
            return std::make_shared<UnitRegistry>(std::move(scales),
                                                  std::move(axis_types),
                                                  std::move(canonical));
        } catch (const std::invalid_argument& e) {
            throw RegistryParseError(e.what());
        }
    }

    static std::string requireAttribute(const pugi::xml_node& node, const char* name) {
        auto attr = node.attribute(name);
        if (!attr || attr.value()[0] == '\0') {
            throw RegistryParseError(std::string("<") + node.name() +
                                     "> is missing attribute '" + name + "'");
        }
        return attr.value();
    }

    static QuantityFamily parseFamilyAttribute(const pugi::xml_node& node,
                                               const char* name) {
        std::string value = requireAttribute(node, name);
        auto family = parseFamily(value);
        if (!family) {
            throw RegistryParseError("unknown quantity family '" + value + "'");
        }
        return *family;
    }

    static double parseNumber(const std::string& text, const std::string& unit) {
        const char* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || errno == ERANGE) {
            throw RegistryParseError("invalid scale '" + text + "' for unit '" +
                                     unit + "'");
        }
        return value;
    }
};

RegistryReader::RegistryReader() : impl_(std::make_unique<Impl>()) {}
RegistryReader::~RegistryReader() = default;
RegistryReader::RegistryReader(RegistryReader&&) noexcept = default;
RegistryReader& RegistryReader::operator=(RegistryReader&&) noexcept = default;

std::shared_ptr<const UnitRegistry> RegistryReader::read(const std::string& filename) {
    if (!impl_) {
        last_error_ = "registry reader has been moved from";
        throw RegistryParseError(last_error_);
    }
    try {
        return impl_->read(filename);
    } catch (const RegistryParseError& e) {
        last_error_ = e.what();
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        throw RegistryParseError(e.what());
    }
}

std::shared_ptr<const UnitRegistry> RegistryReader::parseString(const std::string& content) {
    if (!impl_) {
        last_error_ = "registry reader has been moved from";
        throw RegistryParseError(last_error_);
    }
    try {
        return impl_->parseString(content);
    } catch (const RegistryParseError& e) {
        last_error_ = e.what();
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        throw RegistryParseError(e.what());
    }
}

} // namespace io
} // namespace specaxis
