#pragma once

// Picks the construction module that fits a whole room program best

#include "MassingTypes.h"
#include "ProportionPolicy.h"
#include <vector>

namespace massing {

struct ModuleCandidate {
    int moduleCm = 0;
    double totalErrorM2 = 0.0;  // Sum of |actual - requested| over solved rooms
    size_t degradedRooms = 0;
    bool qualifies = false;     // No room needed the fallback shape
};

struct ModuleSearchResult {
    int moduleCm = 0;
    bool found = false;  // False when no candidate qualified and the fallback was kept
    std::vector<ModuleCandidate> candidates;
};

class ModuleSearch {
public:
    // 50..200 cm in 10 cm steps, then 225, 250, 275, 300
    static std::vector<int> candidateModules();

    // Lowest total area error among qualifying modules, smaller module on ties.
    // Circulation rooms and rows with non-positive area are ignored.
    static ModuleSearchResult findBestModule(const std::vector<RoomInput>& rooms,
                                             const ProportionPolicyTable& table,
                                             int fallbackModuleCm);
};

} // namespace massing
