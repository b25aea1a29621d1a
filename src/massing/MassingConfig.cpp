#include "MassingConfig.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace massing {

std::vector<std::string> MassingConfig::validate() const {
    std::vector<std::string> problems;

    if (moduleCm < kMinModuleCm || moduleCm > kMaxModuleCm) {
        problems.push_back("module_cm must be between " + std::to_string(kMinModuleCm) + " and " +
                           std::to_string(kMaxModuleCm) + " cm (got " + std::to_string(moduleCm) + ")");
    }
    if (heightCm <= 0) {
        problems.push_back("floor_height must be greater than 0 (got " + std::to_string(heightCm) + ")");
    }
    if (!(areaTolerance > 0.0 && areaTolerance < 1.0)) {
        problems.push_back("area_tolerance must be in (0, 1) (got " + std::to_string(areaTolerance) + ")");
    }
    if (maxPasses < 1) {
        problems.push_back("max_passes must be at least 1 (got " + std::to_string(maxPasses) + ")");
    }
    if (smallRoomWarningM2 < 0.0) {
        problems.push_back("small_room_warning_m2 must not be negative");
    }

    return problems;
}

bool MassingConfig::loadFromJson(const std::string& path, MassingConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MassingConfig: Failed to open config file: %s", path.c_str());
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content, config);
}

bool MassingConfig::loadFromJsonString(const std::string& jsonString, MassingConfig& config) {
    MassingConfig loaded = config;

    try {
        json j = json::parse(jsonString);
        if (!j.is_object()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MassingConfig: Expected a JSON object");
            return false;
        }

        loaded.moduleCm = j.value("module_cm", loaded.moduleCm);
        loaded.areaTolerance = j.value("area_tolerance", loaded.areaTolerance);
        loaded.maxPasses = j.value("max_passes", loaded.maxPasses);
        loaded.autoModule = j.value("auto_module", loaded.autoModule);
        loaded.smallRoomWarningM2 = j.value("small_room_warning_m2", loaded.smallRoomWarningM2);

        // Heights are often written with decimals
        if (j.contains("floor_height")) {
            loaded.heightCm = static_cast<int>(std::lround(j["floor_height"].get<double>()));
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MassingConfig: JSON parse error: %s", e.what());
        return false;
    }

    config = loaded;
    SDL_Log("MassingConfig: module=%dcm height=%dcm tolerance=%.1f%% passes=%d%s",
            config.moduleCm, config.heightCm, config.areaTolerance * 100.0, config.maxPasses,
            config.autoModule ? " (auto module)" : "");
    return true;
}

} // namespace massing
