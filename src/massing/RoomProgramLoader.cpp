#include "RoomProgramLoader.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace massing {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

MassingDiagnostic invalidRow(int line, const std::string& name, const std::string& message) {
    MassingDiagnostic diag;
    diag.kind = DiagnosticKind::InvalidInputRow;
    diag.row = line;
    diag.roomName = name;
    diag.message = message;
    return diag;
}

} // namespace

char RoomProgramLoader::detectDelimiter(const std::string& line) {
    size_t commas = 0;
    size_t semicolons = 0;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') quoted = !quoted;
        else if (!quoted && c == ',') ++commas;
        else if (!quoted && c == ';') ++semicolons;
    }
    return semicolons > 0 && semicolons >= commas ? ';' : ',';
}

std::vector<std::string> RoomProgramLoader::splitRow(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

std::optional<double> RoomProgramLoader::parseArea(const std::string& text, char delimiter) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    if (delimiter == ';') {
        std::replace(value.begin(), value.end(), ',', '.');
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    double area = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(area)) {
        return std::nullopt;
    }
    return area;
}

RoomProgram RoomProgramLoader::parse(const std::string& text) {
    RoomProgram program;

    std::istringstream stream(text);
    std::string line;
    int lineNumber = 0;
    bool firstRow = true;

    while (std::getline(stream, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // UTF-8 byte order mark from spreadsheet exports
        if (lineNumber == 1 && line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (isBlank(line)) {
            continue;
        }

        if (firstRow) {
            program.delimiter = detectDelimiter(line);
        }

        std::vector<std::string> fields = splitRow(line, program.delimiter);
        const std::string name = fields.empty() ? std::string() : fields[0];

        std::optional<double> area;
        if (fields.size() >= 2) {
            area = parseArea(fields[1], program.delimiter);
        }

        if (!area) {
            if (firstRow) {
                // Column titles
                program.hadHeader = true;
            } else if (fields.size() < 2 || fields[1].empty()) {
                program.rejected.push_back(invalidRow(lineNumber, name, "missing area"));
            } else {
                program.rejected.push_back(invalidRow(lineNumber, name, "unparsable area '" + fields[1] + "'"));
            }
            firstRow = false;
            continue;
        }
        firstRow = false;

        RoomInput row;
        row.name = name;
        row.areaM2 = *area;
        row.sourceLine = lineNumber;
        program.rows.push_back(row);
    }

    return program;
}

bool RoomProgramLoader::loadFromFile(const std::string& path, RoomProgram& program) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomProgramLoader: Failed to open %s", path.c_str());
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    program = parse(content);

    for (const MassingDiagnostic& diag : program.rejected) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "RoomProgramLoader: Row %d skipped (%s)",
                    diag.row, diag.message.c_str());
    }
    SDL_Log("RoomProgramLoader: Loaded %zu rows from %s", program.rows.size(), path.c_str());
    return true;
}

} // namespace massing
