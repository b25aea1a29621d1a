#include <doctest/doctest.h>
#include "massing/MassingConfig.h"

using namespace massing;

TEST_SUITE("MassingConfig") {
    TEST_CASE("defaults are valid") {
        MassingConfig config;
        CHECK(config.validate().empty());
        CHECK(config.moduleCm == 50);
        CHECK(config.heightCm == 300);
        CHECK(config.areaTolerance == doctest::Approx(0.05));
        CHECK(config.maxPasses == 3);
    }

    TEST_CASE("out of range values are reported") {
        MassingConfig config;
        config.moduleCm = 40;
        config.heightCm = 0;
        config.areaTolerance = 0.0;
        config.maxPasses = 0;
        CHECK(config.validate().size() == 4);

        MassingConfig wide;
        wide.moduleCm = 350;
        CHECK(wide.validate().size() == 1);

        MassingConfig edge;
        edge.moduleCm = 300;
        CHECK(edge.validate().empty());
    }

    TEST_CASE("json keys override defaults") {
        MassingConfig config;
        REQUIRE(MassingConfig::loadFromJsonString(
            R"({"module_cm": 150, "floor_height": 280.4, "area_tolerance": 0.1, "auto_module": true})", config));
        CHECK(config.moduleCm == 150);
        CHECK(config.heightCm == 280);
        CHECK(config.areaTolerance == doctest::Approx(0.1));
        CHECK(config.autoModule);
        CHECK(config.maxPasses == 3);
        CHECK(config.smallRoomWarningM2 == doctest::Approx(2.0));
    }

    TEST_CASE("missing keys keep current values") {
        MassingConfig config;
        config.moduleCm = 120;
        REQUIRE(MassingConfig::loadFromJsonString(R"({"max_passes": 5})", config));
        CHECK(config.moduleCm == 120);
        CHECK(config.maxPasses == 5);
    }

    TEST_CASE("malformed documents leave config untouched") {
        MassingConfig config;
        config.moduleCm = 100;
        CHECK_FALSE(MassingConfig::loadFromJsonString("{module_cm", config));
        CHECK_FALSE(MassingConfig::loadFromJsonString("[1, 2]", config));
        CHECK_FALSE(MassingConfig::loadFromJsonString(R"({"module_cm": 150, "max_passes": "many"})", config));
        CHECK(config.moduleCm == 100);
        CHECK(config.maxPasses == 3);
    }

    TEST_CASE("missing file") {
        MassingConfig config;
        CHECK_FALSE(MassingConfig::loadFromJson("/nonexistent/runtime.json", config));
    }
}
