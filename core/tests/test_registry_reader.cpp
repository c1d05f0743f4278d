#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "specaxis/io/registry_reader.hpp"
#include "specaxis/spectroscopic_axis.hpp"
#include <utility>

using namespace specaxis;
using namespace specaxis::io;
using Catch::Approx;

namespace {

const char* const MINIMAL_REGISTRY = R"(<?xml version="1.0"?>
<unitRegistry>
  <family name="length" canonical="m">
    <unit name="m" scale="1.0"/>
    <unit name="pc" scale="3.0857e16"/>
  </family>
  <family name="FREQ">
    <unit name="Hz" scale="1"/>
    <unit name="MHz" scale="1e6"/>
  </family>
  <family name="velocity">
    <unit name="m/s" scale="1"/>
    <unit name="km/s" scale="1000"/>
  </family>
  <axisType name="VLSR" family="velocity" frame="LSR"/>
  <axisType name="FREQ" family="frequency"/>
</unitRegistry>
)";

std::string withFamily(const std::string& family_xml) {
    return "<unitRegistry>" + family_xml + "</unitRegistry>";
}

} // namespace

TEST_CASE("Registry reader parses documents", "[registry_reader]") {
    RegistryReader reader;

    SECTION("Minimal registry") {
        auto registry = reader.parseString(MINIMAL_REGISTRY);
        REQUIRE(registry->size() == 6);
        REQUIRE(registry->scaleFactor(QuantityFamily::LENGTH, "pc") == Approx(3.0857e16));
        REQUIRE(registry->familyOf("MHz") == QuantityFamily::FREQUENCY);
        REQUIRE(registry->canonicalUnit(QuantityFamily::LENGTH) == "m");
        REQUIRE(registry->canonicalUnit(QuantityFamily::FREQUENCY) == "Hz");
        REQUIRE(registry->familyAndFrameOf("VLSR").frame == "LSR");
        REQUIRE(registry->familyAndFrameOf("FREQ").frame == "rest");
        REQUIRE_FALSE(registry->hasUnit("nm"));
    }

    SECTION("Loaded registry drives an axis") {
        auto registry = reader.parseString(MINIMAL_REGISTRY);
        SpectroscopicAxis axis({1.0, 2.0}, "pc", {}, registry);
        axis.convertTo("m");
        REQUIRE(axis.at(1) == Approx(6.1714e16));

        REQUIRE_THROWS_AS(SpectroscopicAxis({1.0}, "nm", {}, registry), UnknownUnit);
    }

    SECTION("Empty registry") {
        auto registry = reader.parseString("<unitRegistry/>");
        REQUIRE(registry->size() == 0);
        REQUIRE(registry->families().empty());
    }
}

TEST_CASE("Registry reader rejects invalid documents", "[registry_reader]") {
    RegistryReader reader;

    SECTION("Malformed XML") {
        REQUIRE_THROWS_AS(reader.parseString("<unitRegistry><family"), RegistryParseError);
        REQUIRE_FALSE(reader.lastError().empty());
    }

    SECTION("Missing root element") {
        REQUIRE_THROWS_AS(reader.parseString("<units/>"), RegistryParseError);
    }

    SECTION("Unknown family") {
        REQUIRE_THROWS_AS(
            reader.parseString(withFamily("<family name=\"mass\"><unit name=\"kg\" scale=\"1\"/></family>")),
            RegistryParseError);
    }

    SECTION("Missing or malformed scale") {
        REQUIRE_THROWS_AS(
            reader.parseString(withFamily("<family name=\"length\"><unit name=\"m\"/></family>")),
            RegistryParseError);
        REQUIRE_THROWS_AS(
            reader.parseString(withFamily("<family name=\"length\"><unit name=\"m\" scale=\"one\"/></family>")),
            RegistryParseError);
        REQUIRE_THROWS_AS(
            reader.parseString(withFamily("<family name=\"length\"><unit name=\"m\" scale=\"-1\"/></family>")),
            RegistryParseError);
    }

    SECTION("Unit registered twice") {
        REQUIRE_THROWS_AS(
            reader.parseString(withFamily(
                "<family name=\"length\"><unit name=\"m\" scale=\"1\"/></family>"
                "<family name=\"velocity\"><unit name=\"m\" scale=\"1\"/></family>")),
            RegistryParseError);
    }

    SECTION("Axis type without family") {
        REQUIRE_THROWS_AS(reader.parseString(withFamily("<axisType name=\"VLSR\"/>")),
                          RegistryParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(reader.read("/nonexistent/unit_registry.xml"), RegistryParseError);
        REQUIRE_FALSE(reader.lastError().empty());
    }
}

TEST_CASE("Registry reader after move", "[registry_reader]") {
    RegistryReader source;
    RegistryReader target(std::move(source));

    REQUIRE_THROWS_AS(source.parseString(MINIMAL_REGISTRY), RegistryParseError);
    REQUIRE_THROWS_AS(source.read("/nonexistent/unit_registry.xml"), RegistryParseError);
    REQUIRE_FALSE(source.lastError().empty());

    auto registry = target.parseString(MINIMAL_REGISTRY);
    REQUIRE(registry->hasUnit("km/s"));
}

TEST_CASE("Shipped registry matches the standard tables", "[registry_reader]") {
    auto loaded = loadRegistry(std::string(SPECAXIS_TEST_DATA_DIR) + "/unit_registry.xml");
    auto standard = UnitRegistry::standard();

    REQUIRE(loaded->size() == standard->size());
    REQUIRE(loaded->axisTypes().size() == standard->axisTypes().size());

    for (QuantityFamily family : standard->families()) {
        REQUIRE(loaded->canonicalUnit(family) == standard->canonicalUnit(family));
        for (const auto& unit : standard->unitsOf(family)) {
            REQUIRE(loaded->scaleFactor(family, unit) ==
                    Approx(standard->scaleFactor(family, unit)));
        }
    }

    for (const auto& [token, info] : standard->axisTypes()) {
        const auto& other = loaded->familyAndFrameOf(token);
        REQUIRE(other.family == info.family);
        REQUIRE(other.frame == info.frame);
    }
}
