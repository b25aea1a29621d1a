#pragma once

// Run parameters for one massing pass. Passed explicitly into every pipeline call.

#include <string>
#include <vector>

namespace massing {

struct MassingConfig {
    int moduleCm = 50;                // Every wall is a multiple of this
    int heightCm = 300;               // Floor-to-floor height of the volumes
    double areaTolerance = 0.05;      // Relative area budget for wall-sharing substitutions
    int maxPasses = 3;                // Expected optimizer sweeps, extended until stable
    bool autoModule = false;          // Search for the best module instead of moduleCm
    double smallRoomWarningM2 = 2.0;  // Warn below this requested area

    // Recognized ranges
    static constexpr int kMinModuleCm = 50;
    static constexpr int kMaxModuleCm = 300;

    // Human-readable problems, empty when usable
    std::vector<std::string> validate() const;

    // Runtime JSON document (module_cm, floor_height, area_tolerance, max_passes,
    // auto_module, small_room_warning_m2). Missing keys keep the values already in config.
    static bool loadFromJson(const std::string& path, MassingConfig& config);
    static bool loadFromJsonString(const std::string& jsonString, MassingConfig& config);
};

} // namespace massing
