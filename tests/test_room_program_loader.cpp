#include <doctest/doctest.h>
#include "massing/RoomProgramLoader.h"

using namespace massing;

TEST_SUITE("RoomProgramLoader") {
    TEST_CASE("comma separated with header") {
        RoomProgram program = RoomProgramLoader::parse("Room,Area\nLiving Room,35.5\nKitchen,18\n");
        CHECK(program.hadHeader);
        CHECK(program.delimiter == ',');
        CHECK(program.rejected.empty());
        REQUIRE(program.rows.size() == 2);
        CHECK(program.rows[0].name == "Living Room");
        CHECK(program.rows[0].areaM2 == doctest::Approx(35.5));
        CHECK(program.rows[0].sourceLine == 2);
        CHECK(program.rows[1].sourceLine == 3);
    }

    TEST_CASE("headerless program") {
        RoomProgram program = RoomProgramLoader::parse("Bedroom,12\nBathroom,4.5");
        CHECK_FALSE(program.hadHeader);
        REQUIRE(program.rows.size() == 2);
        CHECK(program.rows[1].areaM2 == doctest::Approx(4.5));
    }

    TEST_CASE("semicolons with decimal commas") {
        RoomProgram program = RoomProgramLoader::parse("Nome;Area\nSala de Estar;35,5\nCozinha;18\n");
        CHECK(program.delimiter == ';');
        REQUIRE(program.rows.size() == 2);
        CHECK(program.rows[0].name == "Sala de Estar");
        CHECK(program.rows[0].areaM2 == doctest::Approx(35.5));
    }

    TEST_CASE("quoted names keep delimiters") {
        RoomProgram program = RoomProgramLoader::parse("\"Bedroom, Master\",22\n");
        REQUIRE(program.rows.size() == 1);
        CHECK(program.rows[0].name == "Bedroom, Master");
        CHECK(program.rows[0].areaM2 == doctest::Approx(22.0));
    }

    TEST_CASE("bad rows are reported with their line") {
        RoomProgram program = RoomProgramLoader::parse("Room,Area\nLiving,abc\nKitchen\n\nBath,8.5\r\n");
        REQUIRE(program.rejected.size() == 2);
        CHECK(program.rejected[0].kind == DiagnosticKind::InvalidInputRow);
        CHECK(program.rejected[0].row == 2);
        CHECK(program.rejected[0].roomName == "Living");
        CHECK(program.rejected[0].message == "unparsable area 'abc'");
        CHECK(program.rejected[1].row == 3);
        CHECK(program.rejected[1].message == "missing area");

        REQUIRE(program.rows.size() == 1);
        CHECK(program.rows[0].name == "Bath");
        CHECK(program.rows[0].sourceLine == 5);
    }

    TEST_CASE("non-positive areas are passed through") {
        RoomProgram program = RoomProgramLoader::parse("Office,-3\nStorage,0\n");
        REQUIRE(program.rows.size() == 2);
        CHECK(program.rows[0].areaM2 == doctest::Approx(-3.0));
        CHECK(program.rejected.empty());
    }

    TEST_CASE("byte order mark is ignored") {
        RoomProgram program = RoomProgramLoader::parse("\xEF\xBB\xBFRoom,Area\nKitchen,18\n");
        CHECK(program.hadHeader);
        REQUIRE(program.rows.size() == 1);
        CHECK(program.rows[0].name == "Kitchen");
    }

    TEST_CASE("empty text") {
        RoomProgram program = RoomProgramLoader::parse("");
        CHECK(program.rows.empty());
        CHECK(program.rejected.empty());
        CHECK_FALSE(program.hadHeader);
    }

    TEST_CASE("area parsing") {
        CHECK(RoomProgramLoader::parseArea(" 7 ", ',').value() == doctest::Approx(7.0));
        CHECK(RoomProgramLoader::parseArea("12,25", ';').value() == doctest::Approx(12.25));
        CHECK_FALSE(RoomProgramLoader::parseArea("12,25", ',').has_value());
        CHECK_FALSE(RoomProgramLoader::parseArea("12.5x", ',').has_value());
        CHECK_FALSE(RoomProgramLoader::parseArea("", ',').has_value());
        CHECK_FALSE(RoomProgramLoader::parseArea("inf", ',').has_value());
        CHECK_FALSE(RoomProgramLoader::parseArea("nan", ',').has_value());
    }

    TEST_CASE("row splitting") {
        std::vector<std::string> fields = RoomProgramLoader::splitRow("\"He said \"\"hi\"\"\", 3 ", ',');
        REQUIRE(fields.size() == 2);
        CHECK(fields[0] == "He said \"hi\"");
        CHECK(fields[1] == "3");

        CHECK(RoomProgramLoader::splitRow("a;b;c", ';').size() == 3);
        CHECK(RoomProgramLoader::splitRow("", ',').size() == 1);
    }

    TEST_CASE("delimiter detection") {
        CHECK(RoomProgramLoader::detectDelimiter("Room,Area") == ',');
        CHECK(RoomProgramLoader::detectDelimiter("Sala;35,5") == ';');
        CHECK(RoomProgramLoader::detectDelimiter("\"a;b\",3") == ',');
        CHECK(RoomProgramLoader::detectDelimiter("Kitchen") == ',');
    }

    TEST_CASE("missing file") {
        RoomProgram program;
        CHECK_FALSE(RoomProgramLoader::loadFromFile("/nonexistent/program.csv", program));
    }
}
