#include "MassingWriter.h"
#include <SDL3/SDL_log.h>
#include <fstream>

namespace massing {

nlohmann::json MassingWriter::toJson(const MassingRun& run, const MassingConfig& config) {
    nlohmann::json j;
    j["version"] = 1;
    j["module_cm"] = run.moduleCm;
    j["module_searched"] = run.moduleSearched;
    j["height_cm"] = config.heightCm;
    j["area_tolerance"] = config.areaTolerance;

    nlohmann::json recordsJson = nlohmann::json::array();
    for (const MassingRecord& r : run.records) {
        nlohmann::json rj;
        rj["name"] = r.name;
        rj["type"] = roomTypeName(r.type);
        rj["category"] = roomCategoryName(r.category);
        rj["color"] = {r.color.r, r.color.g, r.color.b};
        rj["width_cm"] = r.widthCm;
        rj["depth_cm"] = r.depthCm;
        rj["height_cm"] = r.heightCm;
        rj["area_m2"] = r.areaM2();
        rj["target_area_m2"] = r.targetAreaCm2 / 10000.0;
        rj["degraded"] = r.degraded;
        rj["optimized"] = r.optimized;
        recordsJson.push_back(rj);
    }
    j["records"] = recordsJson;
    j["circulation_excluded"] = run.circulationDropped;

    nlohmann::json diagnosticsJson = nlohmann::json::array();
    for (const MassingDiagnostic& d : run.diagnostics) {
        nlohmann::json dj;
        dj["kind"] = diagnosticKindName(d.kind);
        dj["row"] = d.row;
        dj["room"] = d.roomName;
        dj["message"] = d.message;
        diagnosticsJson.push_back(dj);
    }
    j["diagnostics"] = diagnosticsJson;

    const MassingStats& s = run.stats;
    nlohmann::json statsJson;
    statsJson["rooms"] = s.roomCount;
    statsJson["optimized_rooms"] = s.optimizedRooms;
    statsJson["degraded_rooms"] = s.degradedRooms;
    statsJson["total_walls"] = s.totalWalls;
    statsJson["unique_lengths"] = s.uniqueLengths;
    statsJson["shared_walls"] = s.sharedWalls;
    statsJson["sharing_percent"] = s.sharingPercent;
    statsJson["requested_m2"] = s.requestedM2;
    statsJson["actual_m2"] = s.actualM2;
    statsJson["variance_percent"] = s.variancePercent;

    nlohmann::json lengthsJson = nlohmann::json::array();
    for (const WallLengthUsage& usage : s.commonLengths) {
        nlohmann::json uj;
        uj["length_cm"] = usage.lengthCm;
        uj["walls"] = usage.walls;
        uj["rooms"] = usage.rooms;
        lengthsJson.push_back(uj);
    }
    statsJson["common_lengths"] = lengthsJson;
    statsJson["optimizer_passes"] = run.optimizer.passes;
    statsJson["optimizer_extra_passes"] = run.optimizer.extraPasses;
    statsJson["optimizer_converged"] = run.optimizer.converged;
    j["stats"] = statsJson;

    return j;
}

bool MassingWriter::save(const std::string& path, const MassingRun& run, const MassingConfig& config) {
    nlohmann::json j = toJson(run, config);

    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MassingWriter: Failed to write massing: %s", path.c_str());
        return false;
    }

    file << j.dump(2);
    SDL_Log("MassingWriter: Saved %zu records to: %s", run.records.size(), path.c_str());
    return true;
}

} // namespace massing
