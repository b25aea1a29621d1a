#pragma once

// Initial per-room footprint: preferred proportions snapped to the construction module

#include "ProportionPolicy.h"

namespace massing {

struct SolvedDimensions {
    int widthCm = 0;
    int depthCm = 0;
    double areaErrorCm2 = 0.0;  // |w*d - target|
    int ratioIndex = -1;        // Index into the policy that produced it
    bool degraded = false;      // Produced by the fallback policy, aspect not guaranteed
};

class DimensionSolver {
public:
    // Footprint for one ratio after module snapping and minimum-wall correction.
    // Width follows the ratio's w side.
    static SolvedDimensions fitRatio(double areaCm2, const Ratio& ratio, int minWallCm, int moduleCm);

    // Best accepted ratio of the policy by area error (earliest ratio on ties).
    // When every ratio breaks the aspect range, the fallback policy's first ratio is used
    // with the room's own minimum wall, and the result is marked degraded.
    static SolvedDimensions solve(double areaM2, const ProportionPolicy& policy, int moduleCm,
                                  const ProportionPolicy& fallback = ProportionPolicyTable::standard().fallback());
};

} // namespace massing
