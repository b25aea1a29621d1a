#include "GridOptimizer.h"
#include "ModuleGrid.h"
#include <algorithm>
#include <cmath>

namespace massing {

namespace {

// Float slack on the relative area check
constexpr double kToleranceEpsilon = 1e-9;

} // namespace

WallLengthHistogram WallLengthHistogram::build(const std::vector<RoomResult>& rooms) {
    WallLengthHistogram histogram;
    for (const RoomResult& room : rooms) {
        histogram.add(room.widthCm, room.depthCm);
    }
    return histogram;
}

void WallLengthHistogram::add(int widthCm, int depthCm) {
    counts_[widthCm] += 1;
    if (depthCm != widthCm) {
        counts_[depthCm] += 1;
    }
}

void WallLengthHistogram::remove(int widthCm, int depthCm) {
    auto decrement = [this](int length) {
        auto it = counts_.find(length);
        if (it == counts_.end()) return;
        if (--it->second <= 0) {
            counts_.erase(it);
        }
    };
    decrement(widthCm);
    if (depthCm != widthCm) {
        decrement(depthCm);
    }
}

int WallLengthHistogram::count(int lengthCm) const {
    auto it = counts_.find(lengthCm);
    return it != counts_.end() ? it->second : 0;
}

size_t WallLengthHistogram::sharedLengthCount() const {
    size_t shared = 0;
    for (const auto& [length, count] : counts_) {
        if (count >= 2) ++shared;
    }
    return shared;
}

std::vector<int> WallLengthHistogram::sharedLengths() const {
    std::vector<std::pair<int, int>> entries;
    for (const auto& [length, count] : counts_) {
        if (count >= 2) entries.emplace_back(length, count);
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<int> lengths;
    lengths.reserve(entries.size());
    for (const auto& entry : entries) {
        lengths.push_back(entry.first);
    }
    return lengths;
}

int sharedEdgePairs(const std::vector<RoomResult>& rooms, const WallLengthHistogram& histogram) {
    int pairs = 0;
    for (const RoomResult& room : rooms) {
        if (histogram.count(room.widthCm) >= 2) ++pairs;
        if (histogram.count(room.depthCm) >= 2) ++pairs;
    }
    return pairs;
}

GridOptimizer::GridOptimizer(const ProportionPolicyTable& table, const OptimizerSettings& settings)
    : table_(table), settings_(settings)
{
}

std::vector<GridOptimizer::Candidate> GridOptimizer::collectCandidates(
    const RoomResult& room, const WallLengthHistogram& others, const std::vector<int>& targets) const {

    const ProportionPolicy& policy = table_.get(room.type);
    const int module = settings_.moduleCm;
    std::vector<Candidate> candidates;

    if (room.targetAreaCm2 <= 0.0) {
        return candidates;
    }

    // Replace the edge other rooms use less; both when usage ties
    const int widthUsage = others.count(room.widthCm);
    const int depthUsage = others.count(room.depthCm);
    bool replaceWidth = widthUsage <= depthUsage;
    bool replaceDepth = room.widthCm != room.depthCm && depthUsage <= widthUsage;

    auto consider = [&](int targetCm, bool asWidth) {
        if (!isModuleMultiple(targetCm, module) || targetCm < policy.minWallCm) return;

        int otherCm = snapToModule(room.targetAreaCm2 / targetCm, module);
        if (otherCm < policy.minWallCm) return;

        int w = asWidth ? targetCm : otherCm;
        int d = asWidth ? otherCm : targetCm;
        if (w == room.widthCm && d == room.depthCm) return;
        if (!policy.acceptsAspect(footprintAspect(w, d))) return;

        double areaError = std::abs(static_cast<double>(w) * d - room.targetAreaCm2);
        if (areaError / room.targetAreaCm2 > settings_.areaTolerance + kToleranceEpsilon) return;

        candidates.push_back({w, d, targetCm, others.count(targetCm), areaError});
    };

    for (int target : targets) {
        if (replaceWidth) consider(target, true);
        if (replaceDepth) consider(target, false);
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.usage != b.usage) return a.usage > b.usage;
        return a.areaErrorCm2 < b.areaErrorCm2;
    });
    return candidates;
}

bool GridOptimizer::tryImproveRoom(std::vector<RoomResult>& rooms, size_t index, WallLengthHistogram& histogram,
                                   int pass, OptimizeReport& report) const {
    RoomResult& room = rooms[index];

    WallLengthHistogram others = histogram;
    others.remove(room.widthCm, room.depthCm);

    std::vector<Candidate> candidates = collectCandidates(room, others, histogram.sharedLengths());
    if (candidates.empty()) {
        return false;
    }

    const int baseEdges = sharedEdgePairs(rooms, histogram);
    const size_t baseLengths = histogram.sharedLengthCount();
    const int oldWidth = room.widthCm;
    const int oldDepth = room.depthCm;

    for (const Candidate& candidate : candidates) {
        WallLengthHistogram trial = others;
        trial.add(candidate.widthCm, candidate.depthCm);

        room.widthCm = candidate.widthCm;
        room.depthCm = candidate.depthCm;

        if (sharedEdgePairs(rooms, trial) > baseEdges && trial.sharedLengthCount() >= baseLengths) {
            histogram = std::move(trial);
            room.optimized = true;

            Substitution sub;
            sub.roomIndex = index;
            sub.pass = pass;
            sub.oldWidthCm = oldWidth;
            sub.oldDepthCm = oldDepth;
            sub.newWidthCm = candidate.widthCm;
            sub.newDepthCm = candidate.depthCm;
            sub.sharedLengthCm = candidate.targetCm;
            report.substitutions.push_back(sub);
            return true;
        }

        room.widthCm = oldWidth;
        room.depthCm = oldDepth;
    }

    return false;
}

OptimizeReport GridOptimizer::optimize(std::vector<RoomResult>& rooms) const {
    OptimizeReport report;

    WallLengthHistogram histogram = WallLengthHistogram::build(rooms);
    report.sharedLengthsBefore = histogram.sharedLengthCount();
    report.sharedEdgesBefore = sharedEdgePairs(rooms, histogram);

    // Every commit raises the shared edge count, which is at most two per room,
    // so a fixed point is always reached within this many passes
    const int maxPasses = std::max(1, settings_.maxPasses);
    const int passLimit = std::max(maxPasses, static_cast<int>(rooms.size() * 2) + 1);
    for (int pass = 1; pass <= passLimit; ++pass) {
        int changed = 0;
        for (size_t i = 0; i < rooms.size(); ++i) {
            if (tryImproveRoom(rooms, i, histogram, pass, report)) {
                ++changed;
            }
        }
        report.passes = pass;
        if (changed == 0) {
            report.converged = true;
            break;
        }
    }
    report.extraPasses = std::max(0, report.passes - maxPasses);

    report.sharedLengthsAfter = histogram.sharedLengthCount();
    report.sharedEdgesAfter = sharedEdgePairs(rooms, histogram);
    return report;
}

OptimizeReport GridOptimizer::optimize(std::vector<RoomResult>& rooms, const ProportionPolicyTable& table,
                                       int moduleCm, double areaTolerance, int maxPasses) {
    OptimizerSettings settings;
    settings.moduleCm = moduleCm;
    settings.areaTolerance = areaTolerance;
    settings.maxPasses = maxPasses;
    return GridOptimizer(table, settings).optimize(rooms);
}

} // namespace massing
