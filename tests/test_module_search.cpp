#include <doctest/doctest.h>
#include "massing/ModuleSearch.h"

using namespace massing;

namespace {

RoomInput makeInput(const std::string& name, double areaM2) {
    RoomInput input;
    input.name = name;
    input.areaM2 = areaM2;
    return input;
}

const ModuleCandidate* findCandidate(const ModuleSearchResult& result, int module) {
    for (const ModuleCandidate& candidate : result.candidates) {
        if (candidate.moduleCm == module) return &candidate;
    }
    return nullptr;
}

} // namespace

TEST_SUITE("ModuleSearch") {
    TEST_CASE("candidate modules") {
        std::vector<int> modules = ModuleSearch::candidateModules();
        REQUIRE(modules.size() == 20);
        CHECK(modules.front() == 50);
        CHECK(modules[1] == 60);
        CHECK(modules[15] == 200);
        CHECK(modules[16] == 225);
        CHECK(modules.back() == 300);
    }

    TEST_CASE("small house prefers the fine module") {
        std::vector<RoomInput> rooms = {
            makeInput("Living Room", 35.5),
            makeInput("Kitchen", 18.0),
            makeInput("Master Bedroom", 22.0),
            makeInput("Bathroom 1", 8.5),
            makeInput("Hallway", 12.0),
        };
        ModuleSearchResult result = ModuleSearch::findBestModule(rooms, ProportionPolicyTable::standard(), 150);
        CHECK(result.found);
        CHECK(result.moduleCm == 50);
        CHECK(result.candidates.size() == 20);

        const ModuleCandidate* fine = findCandidate(result, 50);
        REQUIRE(fine != nullptr);
        CHECK(fine->qualifies);
        CHECK(fine->degradedRooms == 0);
        CHECK(fine->totalErrorM2 == doctest::Approx(1.0));

        const ModuleCandidate* coarse = findCandidate(result, 300);
        REQUIRE(coarse != nullptr);
        CHECK(coarse->degradedRooms == 1);
        CHECK_FALSE(coarse->qualifies);

        for (const ModuleCandidate& candidate : result.candidates) {
            if (candidate.qualifies) {
                CHECK(candidate.totalErrorM2 >= fine->totalErrorM2);
            }
        }
    }

    TEST_CASE("nothing to size keeps the fallback") {
        ModuleSearchResult onlyHall = ModuleSearch::findBestModule({makeInput("Corridor", 8.0)},
                                                                   ProportionPolicyTable::standard(), 120);
        CHECK_FALSE(onlyHall.found);
        CHECK(onlyHall.moduleCm == 120);

        ModuleSearchResult empty = ModuleSearch::findBestModule({}, ProportionPolicyTable::standard(), 60);
        CHECK_FALSE(empty.found);
        CHECK(empty.moduleCm == 60);
    }

    TEST_CASE("non-positive areas are ignored") {
        std::vector<RoomInput> rooms = {makeInput("Kitchen", 12.0), makeInput("Office", -4.0)};
        ModuleSearchResult result = ModuleSearch::findBestModule(rooms, ProportionPolicyTable::standard(), 150);
        CHECK(result.found);
        // 400x300 hits 12 m2 exactly on a 50 module
        CHECK(result.moduleCm == 50);
        CHECK(findCandidate(result, 50)->totalErrorM2 == doctest::Approx(0.0));
    }
}
