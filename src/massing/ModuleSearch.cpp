#include "ModuleSearch.h"
#include "DimensionSolver.h"
#include "ModuleGrid.h"
#include "RoomTypeClassifier.h"

namespace massing {

std::vector<int> ModuleSearch::candidateModules() {
    std::vector<int> modules;
    for (int m = 50; m <= 200; m += 10) {
        modules.push_back(m);
    }
    for (int m = 225; m <= 300; m += 25) {
        modules.push_back(m);
    }
    return modules;
}

ModuleSearchResult ModuleSearch::findBestModule(const std::vector<RoomInput>& rooms,
                                                const ProportionPolicyTable& table,
                                                int fallbackModuleCm) {
    // Classify once; the type does not depend on the module
    struct Entry {
        double areaM2;
        RoomType type;
    };
    std::vector<Entry> entries;
    for (const RoomInput& room : rooms) {
        if (!(room.areaM2 > 0.0)) continue;
        RoomType type = RoomTypeClassifier::classify(room.name);
        if (type == RoomType::Circulation) continue;
        entries.push_back({room.areaM2, type});
    }

    ModuleSearchResult result;
    result.moduleCm = fallbackModuleCm;

    double bestError = 0.0;
    for (int module : candidateModules()) {
        ModuleCandidate candidate;
        candidate.moduleCm = module;

        for (const Entry& entry : entries) {
            SolvedDimensions dims = DimensionSolver::solve(entry.areaM2, table.get(entry.type), module,
                                                           table.fallback());
            if (dims.degraded) {
                ++candidate.degradedRooms;
            }
            candidate.totalErrorM2 += dims.areaErrorCm2 / kCm2PerM2;
        }

        candidate.qualifies = !entries.empty() && candidate.degradedRooms == 0;
        if (candidate.qualifies && (!result.found || candidate.totalErrorM2 < bestError)) {
            bestError = candidate.totalErrorM2;
            result.moduleCm = module;
            result.found = true;
        }

        result.candidates.push_back(candidate);
    }

    return result;
}

} // namespace massing
