#include <doctest/doctest.h>
#include "massing/ProportionPolicy.h"
#include "massing/RoomType.h"

using namespace massing;

TEST_SUITE("ProportionPolicy") {
    TEST_CASE("standard table is consistent for every type") {
        const ProportionPolicyTable& table = ProportionPolicyTable::standard();
        for (size_t i = 0; i < kRoomTypeCount; ++i) {
            const ProportionPolicy& policy = table.get(static_cast<RoomType>(i));
            CAPTURE(i);
            CHECK(policy.isConsistent());
            CHECK(policy.minWallCm >= 100);
            CHECK(policy.minWallCm <= 300);
        }
    }

    TEST_CASE("fallback is the unclassified policy") {
        const ProportionPolicyTable& table = ProportionPolicyTable::standard();
        CHECK(&table.fallback() == &table.get(RoomType::Unclassified));
        REQUIRE_FALSE(table.fallback().ratios.empty());
        CHECK(table.fallback().ratios.front().w == 3);
        CHECK(table.fallback().ratios.front().d == 2);
    }

    TEST_CASE("ratio normalization") {
        Ratio r{2, 3};
        CHECK(r.value() == doctest::Approx(2.0 / 3.0));
        CHECK(r.normalized() == doctest::Approx(1.5));
        CHECK(Ratio{5, 4}.normalized() == doctest::Approx(1.25));
    }

    TEST_CASE("footprint aspect is long over short") {
        CHECK(footprintAspect(600, 300) == doctest::Approx(2.0));
        CHECK(footprintAspect(300, 600) == doctest::Approx(2.0));
        CHECK(footprintAspect(450, 450) == doctest::Approx(1.0));
    }

    TEST_CASE("aspect bounds are inclusive") {
        const ProportionPolicy& kitchen = ProportionPolicyTable::standard().get(RoomType::Kitchen);
        CHECK(kitchen.acceptsAspect(2.0));
        CHECK_FALSE(kitchen.acceptsAspect(2.01));
        CHECK(kitchen.acceptsAspect(1.0));
    }

    TEST_CASE("inconsistent policies are detected") {
        ProportionPolicy narrow{{{3, 1}}, 0.5, 1.5, 120};
        CHECK_FALSE(narrow.isConsistent());

        ProportionPolicy empty{{}, 0.5, 1.5, 120};
        CHECK_FALSE(empty.isConsistent());

        ProportionPolicy aboveOne{{{1, 1}}, 1.2, 1.5, 120};
        CHECK_FALSE(aboveOne.isConsistent());
    }
}

TEST_SUITE("RoomCategory") {
    TEST_CASE("categories by type") {
        CHECK(roomCategory(RoomType::Living) == RoomCategory::Public);
        CHECK(roomCategory(RoomType::Kitchen) == RoomCategory::Public);
        CHECK(roomCategory(RoomType::Bedroom) == RoomCategory::Private);
        CHECK(roomCategory(RoomType::Bathroom) == RoomCategory::Private);
        CHECK(roomCategory(RoomType::Office) == RoomCategory::Private);
        CHECK(roomCategory(RoomType::Utility) == RoomCategory::Service);
        CHECK(roomCategory(RoomType::Unclassified) == RoomCategory::Public);
    }

    TEST_CASE("category colors") {
        CategoryColor pub = categoryColor(RoomCategory::Public);
        CHECK(pub.r == 150);
        CHECK(pub.g == 180);
        CHECK(pub.b == 255);
        CategoryColor service = categoryColor(RoomCategory::Service);
        CHECK(service.b == 150);
    }
}
