#pragma once

// Room program -> massing records in one call:
// validate rows, classify, pick module, solve, optimize wall sharing, emit.

#include "GridOptimizer.h"
#include "MassingConfig.h"
#include "MassingRecord.h"
#include "MassingStats.h"
#include "MassingTypes.h"
#include "ModuleSearch.h"
#include "ProportionPolicy.h"
#include <vector>

namespace massing {

struct MassingRun {
    int moduleCm = 0;                         // Module actually used
    bool moduleSearched = false;
    ModuleSearchResult moduleSearch;          // Filled when the module was searched

    std::vector<RoomResult> rooms;            // Solved and optimized, circulation excluded
    std::vector<MassingRecord> records;
    size_t circulationDropped = 0;
    size_t rejectedRows = 0;

    std::vector<MassingDiagnostic> diagnostics;
    OptimizeReport optimizer;
    MassingStats stats;
};

class MassingPipeline {
public:
    explicit MassingPipeline(const ProportionPolicyTable& table = ProportionPolicyTable::standard());

    // False only for an unusable configuration; bad rows and awkward rooms become diagnostics
    bool run(const std::vector<RoomInput>& rows, const MassingConfig& config, MassingRun& out) const;

    // Initial footprint for one classified room
    RoomResult solveRoom(const RoomInput& row, RoomType type, int moduleCm, int heightCm) const;

private:
    const ProportionPolicyTable& table_;
};

} // namespace massing
