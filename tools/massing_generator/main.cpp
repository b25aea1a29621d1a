// Standalone room massing tool
// Turns a room program (CSV of names and areas) into module-aligned room volumes

#include "massing/MassingConfig.h"
#include "massing/MassingPipeline.h"
#include "massing/MassingWriter.h"
#include "massing/RoomProgramLoader.h"
#include "massing/RoomTypeClassifier.h"
#include <SDL3/SDL_log.h>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace massing;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <program.csv> <output.json> [options]\n"
              << "\n"
              << "Dimensions every room of a program on a shared construction module and\n"
              << "aligns wall lengths between rooms so the volumes can be arranged freely.\n"
              << "\n"
              << "Arguments:\n"
              << "  program.csv      Room name and area (m2) per row, comma or semicolon separated\n"
              << "  output.json      Massing records for the geometry generator\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>         Runtime JSON configuration\n"
              << "  --module <cm|auto>      Construction module, 50-300 cm (default: 50)\n"
              << "  --height <cm>           Floor-to-floor height (default: 300)\n"
              << "  --tolerance <value>     Area tolerance for wall sharing (default: 0.05)\n"
              << "  --max-passes <value>    Optimizer sweeps (default: 3)\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Corridors, halls and entries are recognized and left out of the massing.\n"
              << "\n"
              << "Example:\n"
              << "  " << programName << " program.csv massing.json --module 150 --height 280\n";
}

// Command-line values applied after the config file
struct Overrides {
    std::string configPath;
    std::string module;
    std::string height;
    std::string tolerance;
    std::string maxPasses;
};

bool applyOverrides(const Overrides& overrides, MassingConfig& config) {
    try {
        if (!overrides.module.empty()) {
            if (overrides.module == "auto") {
                config.autoModule = true;
            } else {
                config.moduleCm = std::stoi(overrides.module);
                config.autoModule = false;
            }
        }
        if (!overrides.height.empty()) {
            config.heightCm = std::stoi(overrides.height);
        }
        if (!overrides.tolerance.empty()) {
            config.areaTolerance = std::stod(overrides.tolerance);
        }
        if (!overrides.maxPasses.empty()) {
            config.maxPasses = std::stoi(overrides.maxPasses);
        }
    } catch (const std::logic_error& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid numeric option: %s", e.what());
        return false;
    }
    return true;
}

void logResults(const MassingRun& run) {
    SDL_Log(" ");
    SDL_Log("Final dimensions (module %dcm):", run.moduleCm);
    for (size_t i = 0; i < run.records.size(); ++i) {
        const MassingRecord& r = run.records[i];
        const char* status = r.degraded ? " [DEGRADED]" : (r.optimized ? " [OPTIMIZED]" : "");
        SDL_Log("  %zu. %s (%s): %.2fx%.2fm = %.2fm2 (%+.2fm2)%s",
                i + 1, r.name.c_str(), roomTypeName(r.type),
                r.widthCm / 100.0, r.depthCm / 100.0, r.areaM2(),
                r.areaM2() - r.targetAreaCm2 / 10000.0, status);
    }

    const MassingStats& s = run.stats;
    SDL_Log(" ");
    SDL_Log("Wall surfaces: %d, unique lengths: %d", s.totalWalls, s.uniqueLengths);
    SDL_Log("Walls in shared lengths: %d (%.0f%%)", s.sharedWalls, s.sharingPercent);
    SDL_Log("Area requested: %.2fm2, actual: %.2fm2 (%+.2f%%)", s.requestedM2, s.actualM2, s.variancePercent);
    SDL_Log("Most common lengths:");
    for (const WallLengthUsage& usage : s.commonLengths) {
        std::string rooms;
        for (size_t i = 0; i < usage.rooms.size() && i < 3; ++i) {
            if (i > 0) rooms += ", ";
            rooms += usage.rooms[i];
        }
        SDL_Log("  %.2fm: %d walls - %s", usage.lengthCm / 100.0, usage.walls, rooms.c_str());
    }

    for (const MassingDiagnostic& d : run.diagnostics) {
        if (d.kind != DiagnosticKind::InvalidInputRow) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s: %s (%s)",
                        diagnosticKindName(d.kind), d.roomName.c_str(), d.message.c_str());
        }
    }
}

int main(int argc, char* argv[]) {
    // Check for help flag first
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string programPath = argv[1];
    std::string outputPath = argv[2];
    Overrides overrides;

    // Parse optional arguments
    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            overrides.configPath = argv[++i];
        } else if (arg == "--module" && i + 1 < argc) {
            overrides.module = argv[++i];
        } else if (arg == "--height" && i + 1 < argc) {
            overrides.height = argv[++i];
        } else if (arg == "--tolerance" && i + 1 < argc) {
            overrides.tolerance = argv[++i];
        } else if (arg == "--max-passes" && i + 1 < argc) {
            overrides.maxPasses = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    MassingConfig config;
    if (!overrides.configPath.empty() && !MassingConfig::loadFromJson(overrides.configPath, config)) {
        return 1;
    }
    if (!applyOverrides(overrides, config)) {
        return 1;
    }

    SDL_Log("Massing Generator");
    SDL_Log("=================");
    SDL_Log("Program: %s", programPath.c_str());
    SDL_Log("Output: %s", outputPath.c_str());
    if (config.autoModule) {
        SDL_Log("Module: auto");
    } else {
        SDL_Log("Module: %d cm", config.moduleCm);
    }
    SDL_Log("Height: %d cm", config.heightCm);
    SDL_Log("Area tolerance: %.1f%%", config.areaTolerance * 100.0);

    RoomProgram program;
    if (!RoomProgramLoader::loadFromFile(programPath, program)) {
        return 1;
    }

    SDL_Log(" ");
    SDL_Log("Room type detection:");
    for (size_t i = 0; i < program.rows.size(); ++i) {
        const RoomInput& row = program.rows[i];
        SDL_Log("  %zu. %s (%.1fm2) -> [%s]", i + 1, row.name.c_str(), row.areaM2,
                roomTypeName(RoomTypeClassifier::classify(row.name)));
    }

    MassingPipeline pipeline;
    MassingRun run;
    if (!pipeline.run(program.rows, config, run)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Massing failed: invalid configuration");
        return 1;
    }

    // Unreadable rows come first, in file order
    run.diagnostics.insert(run.diagnostics.begin(), program.rejected.begin(), program.rejected.end());
    run.rejectedRows += program.rejected.size();

    if (run.records.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "No valid room data found in %s", programPath.c_str());
        return 1;
    }

    logResults(run);

    if (!MassingWriter::save(outputPath, run, config)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to save massing!");
        return 1;
    }

    SDL_Log("Massing complete: %zu volumes", run.records.size());
    return 0;
}
