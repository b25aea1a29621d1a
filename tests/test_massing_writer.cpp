#include <doctest/doctest.h>
#include "massing/MassingWriter.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace massing;

namespace {

MassingRun runSmallHouse(const MassingConfig& config) {
    std::vector<RoomInput> rows(5);
    rows[0].name = "Living Room";
    rows[0].areaM2 = 35.5;
    rows[1].name = "Kitchen";
    rows[1].areaM2 = 18.0;
    rows[2].name = "Master Bedroom";
    rows[2].areaM2 = 22.0;
    rows[3].name = "Bathroom 1";
    rows[3].areaM2 = 8.5;
    rows[4].name = "Hallway";
    rows[4].areaM2 = 10.0;

    MassingRun run;
    REQUIRE(MassingPipeline().run(rows, config, run));
    return run;
}

} // namespace

TEST_SUITE("MassingWriter") {
    TEST_CASE("document layout") {
        MassingConfig config;
        config.moduleCm = 150;
        config.heightCm = 280;
        MassingRun run = runSmallHouse(config);

        nlohmann::json j = MassingWriter::toJson(run, config);
        CHECK(j["version"] == 1);
        CHECK(j["module_cm"] == 150);
        CHECK(j["module_searched"] == false);
        CHECK(j["height_cm"] == 280);
        CHECK(j["circulation_excluded"] == 1);

        REQUIRE(j["records"].size() == 4);
        const nlohmann::json& living = j["records"][0];
        CHECK(living["name"] == "Living Room");
        CHECK(living["type"] == "living");
        CHECK(living["category"] == "public");
        CHECK(living["width_cm"] == 600);
        CHECK(living["depth_cm"] == 600);
        CHECK(living["height_cm"] == 280);
        CHECK(living["area_m2"].get<double>() == doctest::Approx(36.0));
        CHECK(living["target_area_m2"].get<double>() == doctest::Approx(35.5));
        CHECK(living["degraded"] == false);
        REQUIRE(living["color"].size() == 3);
        CHECK(living["color"][0] == 150);
        CHECK(living["color"][2] == 255);

        REQUIRE(j["diagnostics"].size() == 2);
        CHECK(j["diagnostics"][0]["kind"] == "area_outside_tolerance");
        CHECK(j["diagnostics"][0]["room"] == "Master Bedroom");
        CHECK(j["diagnostics"][0]["row"] == 3);

        CHECK(j["stats"]["rooms"] == 4);
        CHECK(j["stats"]["total_walls"] == 8);
        CHECK(j["stats"]["optimizer_converged"] == true);
        CHECK(j["stats"]["optimizer_extra_passes"] == 0);
        CHECK(j["stats"]["common_lengths"][0]["length_cm"] == 300);
    }

    TEST_CASE("save writes readable json") {
        MassingConfig config;
        MassingRun run = runSmallHouse(config);

        std::filesystem::path path = std::filesystem::temp_directory_path() / "massing_writer_test.json";
        REQUIRE(MassingWriter::save(path.string(), run, config));

        std::ifstream file(path);
        REQUIRE(file.is_open());
        nlohmann::json j = nlohmann::json::parse(file);
        file.close();
        std::remove(path.string().c_str());

        CHECK(j["module_cm"] == 50);
        CHECK(j["records"].size() == 4);
        CHECK(j["diagnostics"].empty());
    }

    TEST_CASE("unwritable path fails") {
        MassingConfig config;
        MassingRun run = runSmallHouse(config);
        CHECK_FALSE(MassingWriter::save("/nonexistent/dir/massing.json", run, config));
    }
}
