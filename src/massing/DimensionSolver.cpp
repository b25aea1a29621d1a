#include "DimensionSolver.h"
#include "ModuleGrid.h"
#include <cmath>
#include <limits>

namespace massing {

SolvedDimensions DimensionSolver::fitRatio(double areaCm2, const Ratio& ratio, int minWallCm, int moduleCm) {
    // Ideal rectangle of the requested area with the given proportion
    double length = std::sqrt(areaCm2 * ratio.value());
    double width = areaCm2 / length;

    int w = snapToModule(length, moduleCm);
    int d = snapToModule(width, moduleCm);

    if (w < minWallCm || d < minWallCm) {
        const int raised = ceilToModule(minWallCm, moduleCm);
        int other = snapToModule(areaCm2 / raised, moduleCm);
        if (other < raised) other = raised;

        if (w <= d) {
            w = raised;
            d = other;
        } else {
            d = raised;
            w = other;
        }
    }

    SolvedDimensions result;
    result.widthCm = w;
    result.depthCm = d;
    result.areaErrorCm2 = std::abs(static_cast<double>(w) * d - areaCm2);
    return result;
}

SolvedDimensions DimensionSolver::solve(double areaM2, const ProportionPolicy& policy, int moduleCm,
                                        const ProportionPolicy& fallback) {
    const double areaCm2 = areaM2 * kCm2PerM2;

    SolvedDimensions best;
    double bestError = std::numeric_limits<double>::infinity();

    for (size_t i = 0; i < policy.ratios.size(); ++i) {
        SolvedDimensions candidate = fitRatio(areaCm2, policy.ratios[i], policy.minWallCm, moduleCm);
        if (!policy.acceptsAspect(footprintAspect(candidate.widthCm, candidate.depthCm))) {
            continue;
        }
        // Strict comparison keeps the earliest ratio on ties
        if (candidate.areaErrorCm2 < bestError) {
            bestError = candidate.areaErrorCm2;
            best = candidate;
            best.ratioIndex = static_cast<int>(i);
        }
    }

    if (best.ratioIndex >= 0) {
        return best;
    }

    // No proportion of this type survives snapping: generic shape, flagged
    Ratio generic = fallback.ratios.empty() ? Ratio{1, 1} : fallback.ratios.front();
    SolvedDimensions degraded = fitRatio(areaCm2, generic, policy.minWallCm, moduleCm);
    degraded.ratioIndex = 0;
    degraded.degraded = true;
    return degraded;
}

} // namespace massing
