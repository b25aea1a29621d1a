#pragma once

// Greedy wall-sharing optimizer.
// Moves room edges onto lengths other rooms already use so volumes can be placed
// against each other with aligned walls. Deterministic, bounded local search.

#include "MassingTypes.h"
#include "ProportionPolicy.h"
#include <map>
#include <vector>

namespace massing {

// Wall length (cm) -> number of rooms using it on their width or depth edge.
// A square room counts once for its length.
class WallLengthHistogram {
public:
    static WallLengthHistogram build(const std::vector<RoomResult>& rooms);

    void add(int widthCm, int depthCm);
    void remove(int widthCm, int depthCm);

    int count(int lengthCm) const;

    // Lengths used by at least two rooms
    size_t sharedLengthCount() const;

    // Shared lengths ordered by descending usage, then ascending length
    std::vector<int> sharedLengths() const;

    const std::map<int, int>& counts() const { return counts_; }

private:
    std::map<int, int> counts_;
};

// (room, edge) pairs whose length is used by two or more rooms
int sharedEdgePairs(const std::vector<RoomResult>& rooms, const WallLengthHistogram& histogram);

struct Substitution {
    size_t roomIndex = 0;
    int pass = 0;
    int oldWidthCm = 0;
    int oldDepthCm = 0;
    int newWidthCm = 0;
    int newDepthCm = 0;
    int sharedLengthCm = 0;  // Target length the room moved onto
};

struct OptimizeReport {
    int passes = 0;
    int extraPasses = 0;     // Passes run past maxPasses to settle
    bool converged = false;  // Last pass made no change
    size_t sharedLengthsBefore = 0;
    size_t sharedLengthsAfter = 0;
    int sharedEdgesBefore = 0;
    int sharedEdgesAfter = 0;
    std::vector<Substitution> substitutions;
};

struct OptimizerSettings {
    int moduleCm = 50;
    double areaTolerance = 0.05;  // Relative to each room's target area
    int maxPasses = 3;  // Expected sweeps; the search continues past it until nothing changes
};

class GridOptimizer {
public:
    GridOptimizer(const ProportionPolicyTable& table, const OptimizerSettings& settings);

    // Refines rooms in place, order preserved. A substitution is committed only when it
    // raises the number of shared edges without losing a shared length, and keeps the
    // room's aspect range, minimum wall, module alignment and area tolerance.
    // Always returns at a fixed point, so optimizing the result again changes nothing.
    OptimizeReport optimize(std::vector<RoomResult>& rooms) const;

    static OptimizeReport optimize(std::vector<RoomResult>& rooms, const ProportionPolicyTable& table,
                                   int moduleCm, double areaTolerance = 0.05, int maxPasses = 3);

private:
    struct Candidate {
        int widthCm;
        int depthCm;
        int targetCm;
        int usage;
        double areaErrorCm2;
    };

    std::vector<Candidate> collectCandidates(const RoomResult& room, const WallLengthHistogram& others,
                                             const std::vector<int>& targets) const;
    bool tryImproveRoom(std::vector<RoomResult>& rooms, size_t index, WallLengthHistogram& histogram,
                        int pass, OptimizeReport& report) const;

    const ProportionPolicyTable& table_;
    OptimizerSettings settings_;
};

} // namespace massing
