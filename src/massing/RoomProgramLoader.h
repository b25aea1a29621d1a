#pragma once

// Room program table reader (CSV: name, area in m2)
// Comma or semicolon separated; a non-numeric first row is taken as the header.

#include "MassingTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace massing {

struct RoomProgram {
    std::vector<RoomInput> rows;
    std::vector<MassingDiagnostic> rejected;  // Rows that could not be read
    char delimiter = ',';
    bool hadHeader = false;
};

class RoomProgramLoader {
public:
    // Never fails; bad rows end up in RoomProgram::rejected
    static RoomProgram parse(const std::string& text);

    static bool loadFromFile(const std::string& path, RoomProgram& program);

    // Split one line, honoring double quotes ("" is a literal quote)
    static std::vector<std::string> splitRow(const std::string& line, char delimiter);

    // Area in m2; a decimal comma is accepted when the delimiter is ';'
    static std::optional<double> parseArea(const std::string& text, char delimiter);

    static char detectDelimiter(const std::string& line);
};

} // namespace massing
