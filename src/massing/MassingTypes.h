#pragma once

#include "RoomType.h"
#include <cmath>
#include <string>
#include <vector>

namespace massing {

// One row of the room program
struct RoomInput {
    std::string name;
    double areaM2 = 0.0;
    int sourceLine = 0;  // Line in the program file, 0 when not read from one
};

// Working footprint of a room during a run.
// Width/depth are mutated only by the optimizer; everything else is fixed at creation.
struct RoomResult {
    std::string name;
    RoomType type = RoomType::Unclassified;
    int widthCm = 0;
    int depthCm = 0;
    double targetAreaCm2 = 0.0;
    int heightCm = 0;
    bool degraded = false;   // Resolved with the generic fallback shape
    bool optimized = false;  // Changed by the grid optimizer

    double areaCm2() const { return static_cast<double>(widthCm) * static_cast<double>(depthCm); }
    double areaM2() const { return areaCm2() / 10000.0; }
    double targetAreaM2() const { return targetAreaCm2 / 10000.0; }

    // Relative deviation from the requested area
    double areaDeviation() const {
        return targetAreaCm2 > 0.0 ? std::abs(areaCm2() - targetAreaCm2) / targetAreaCm2 : 0.0;
    }
};

enum class DiagnosticKind {
    InvalidInputRow,         // Row skipped
    NoAcceptableProportion,  // Degraded-fit fallback used
    AreaOutsideTolerance,    // Module too coarse to hit the area closely
    SmallRoom                // Suspiciously small requested area
};

const char* diagnosticKindName(DiagnosticKind kind);

// Warning or skip surfaced alongside results; never fatal to the batch
struct MassingDiagnostic {
    DiagnosticKind kind = DiagnosticKind::InvalidInputRow;
    int row = 0;            // 1-based source row, 0 when not tied to a row
    std::string roomName;
    std::string message;
};

} // namespace massing
