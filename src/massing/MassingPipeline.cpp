#include "MassingPipeline.h"
#include "DimensionSolver.h"
#include "ModuleGrid.h"
#include "RoomTypeClassifier.h"
#include <SDL3/SDL_log.h>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace massing {

namespace {

bool hasVisibleText(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

MassingDiagnostic makeDiagnostic(DiagnosticKind kind, int row, const std::string& name, const std::string& message) {
    MassingDiagnostic diag;
    diag.kind = kind;
    diag.row = row;
    diag.roomName = name;
    diag.message = message;
    return diag;
}

std::string formatArea(double m2) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", m2);
    return buffer;
}

struct ClassifiedRow {
    RoomInput input;
    RoomType type;
    int row;
};

} // namespace

MassingPipeline::MassingPipeline(const ProportionPolicyTable& table)
    : table_(table)
{
}

RoomResult MassingPipeline::solveRoom(const RoomInput& row, RoomType type, int moduleCm, int heightCm) const {
    SolvedDimensions dims = DimensionSolver::solve(row.areaM2, table_.get(type), moduleCm, table_.fallback());

    RoomResult room;
    room.name = row.name;
    room.type = type;
    room.widthCm = dims.widthCm;
    room.depthCm = dims.depthCm;
    room.targetAreaCm2 = row.areaM2 * kCm2PerM2;
    room.heightCm = heightCm;
    room.degraded = dims.degraded;
    return room;
}

bool MassingPipeline::run(const std::vector<RoomInput>& rows, const MassingConfig& config, MassingRun& out) const {
    out = MassingRun{};

    std::vector<std::string> problems = config.validate();
    if (!problems.empty()) {
        for (const std::string& problem : problems) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MassingPipeline: Invalid configuration: %s", problem.c_str());
        }
        return false;
    }

    // Validate and classify
    std::vector<ClassifiedRow> accepted;
    for (size_t i = 0; i < rows.size(); ++i) {
        const RoomInput& input = rows[i];
        const int row = input.sourceLine > 0 ? input.sourceLine : static_cast<int>(i + 1);

        if (!hasVisibleText(input.name)) {
            out.diagnostics.push_back(makeDiagnostic(DiagnosticKind::InvalidInputRow, row, input.name,
                                                     "empty room name"));
            ++out.rejectedRows;
            continue;
        }
        if (!std::isfinite(input.areaM2) || input.areaM2 <= 0.0) {
            out.diagnostics.push_back(makeDiagnostic(DiagnosticKind::InvalidInputRow, row, input.name,
                                                     "area must be greater than 0"));
            ++out.rejectedRows;
            continue;
        }

        RoomType type = RoomTypeClassifier::classify(input.name);
        if (type == RoomType::Circulation) {
            SDL_Log("MassingPipeline: Skipping circulation room: %s", input.name.c_str());
            ++out.circulationDropped;
            continue;
        }

        if (input.areaM2 < config.smallRoomWarningM2) {
            out.diagnostics.push_back(makeDiagnostic(DiagnosticKind::SmallRoom, row, input.name,
                                                     "very small room (" + formatArea(input.areaM2) + " m2)"));
        }

        accepted.push_back({input, type, row});
    }

    for (const MassingDiagnostic& diag : out.diagnostics) {
        if (diag.kind == DiagnosticKind::InvalidInputRow) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MassingPipeline: Row %d skipped (%s)",
                        diag.row, diag.message.c_str());
        }
    }

    // Module
    out.moduleCm = config.moduleCm;
    if (config.autoModule) {
        std::vector<RoomInput> inputs;
        inputs.reserve(accepted.size());
        for (const ClassifiedRow& entry : accepted) {
            inputs.push_back(entry.input);
        }

        out.moduleSearched = true;
        out.moduleSearch = ModuleSearch::findBestModule(inputs, table_, config.moduleCm);
        out.moduleCm = out.moduleSearch.moduleCm;
        if (out.moduleSearch.found) {
            SDL_Log("MassingPipeline: Selected module %dcm", out.moduleCm);
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "MassingPipeline: No module fits every room, keeping %dcm", out.moduleCm);
        }
    }

    // Initial footprints
    out.rooms.reserve(accepted.size());
    for (const ClassifiedRow& entry : accepted) {
        RoomResult room = solveRoom(entry.input, entry.type, out.moduleCm, config.heightCm);
        if (room.degraded) {
            out.diagnostics.push_back(makeDiagnostic(DiagnosticKind::NoAcceptableProportion, entry.row, room.name,
                                                     std::string("no ") + roomTypeName(room.type) +
                                                     " proportion fits the module, generic shape used"));
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MassingPipeline: Degraded fit for %s (%dx%dcm)",
                        room.name.c_str(), room.widthCm, room.depthCm);
        }
        out.rooms.push_back(room);
    }

    // Wall sharing
    OptimizerSettings settings;
    settings.moduleCm = out.moduleCm;
    settings.areaTolerance = config.areaTolerance;
    settings.maxPasses = config.maxPasses;
    out.optimizer = GridOptimizer(table_, settings).optimize(out.rooms);

    SDL_Log("MassingPipeline: %zu substitutions in %d passes, shared lengths %zu -> %zu",
            out.optimizer.substitutions.size(), out.optimizer.passes,
            out.optimizer.sharedLengthsBefore, out.optimizer.sharedLengthsAfter);
    if (out.optimizer.extraPasses > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MassingPipeline: Optimizer needed %d passes beyond max_passes=%d",
                    out.optimizer.extraPasses, config.maxPasses);
    }

    for (size_t i = 0; i < out.rooms.size(); ++i) {
        const RoomResult& room = out.rooms[i];
        if (!room.degraded && room.areaDeviation() > config.areaTolerance) {
            out.diagnostics.push_back(makeDiagnostic(
                DiagnosticKind::AreaOutsideTolerance, accepted[i].row, room.name,
                formatArea(room.areaM2()) + " m2 for " + formatArea(room.targetAreaM2()) + " m2 requested"));
        }
    }

    MassingEmission emission = emitMassingRecords(out.rooms);
    out.records = std::move(emission.records);
    out.circulationDropped += emission.circulationDropped;
    out.stats = analyzeMassing(out.rooms);

    SDL_Log("MassingPipeline: %zu rooms massed, %zu circulation excluded, %zu rows rejected",
            out.records.size(), out.circulationDropped, out.rejectedRows);
    return true;
}

} // namespace massing
