#include "MassingStats.h"
#include <algorithm>
#include <map>

namespace massing {

MassingStats analyzeMassing(const std::vector<RoomResult>& rooms, size_t topLengths) {
    MassingStats stats;
    stats.roomCount = rooms.size();

    std::map<int, WallLengthUsage> usage;
    for (const RoomResult& room : rooms) {
        if (room.optimized) ++stats.optimizedRooms;
        if (room.degraded) ++stats.degradedRooms;

        stats.requestedM2 += room.targetAreaM2();
        stats.actualM2 += room.areaM2();

        for (int length : {room.widthCm, room.depthCm}) {
            WallLengthUsage& entry = usage[length];
            entry.lengthCm = length;
            entry.walls += 1;
            if (entry.rooms.empty() || entry.rooms.back() != room.name) {
                entry.rooms.push_back(room.name);
            }
        }
    }

    stats.totalWalls = static_cast<int>(rooms.size() * 2);
    stats.uniqueLengths = static_cast<int>(usage.size());
    for (const auto& [length, entry] : usage) {
        if (entry.walls > 1) {
            stats.sharedWalls += entry.walls;
        }
    }
    if (stats.totalWalls > 0) {
        stats.sharingPercent = 100.0 * stats.sharedWalls / stats.totalWalls;
    }
    if (stats.requestedM2 > 0.0) {
        stats.variancePercent = 100.0 * (stats.actualM2 - stats.requestedM2) / stats.requestedM2;
    }

    for (auto& [length, entry] : usage) {
        stats.commonLengths.push_back(std::move(entry));
    }
    std::sort(stats.commonLengths.begin(), stats.commonLengths.end(),
              [](const WallLengthUsage& a, const WallLengthUsage& b) {
                  if (a.walls != b.walls) return a.walls > b.walls;
                  return a.lengthCm < b.lengthCm;
              });
    if (stats.commonLengths.size() > topLengths) {
        stats.commonLengths.resize(topLengths);
    }

    return stats;
}

} // namespace massing
