#pragma once

#include "MassingTypes.h"
#include <vector>

namespace massing {

struct WallLengthUsage {
    int lengthCm = 0;
    int walls = 0;                   // Edges of this length across all rooms
    std::vector<std::string> rooms;  // Rooms with at least one such edge
};

// Wall-sharing and area-accuracy summary of a result set
struct MassingStats {
    size_t roomCount = 0;
    size_t optimizedRooms = 0;
    size_t degradedRooms = 0;

    int totalWalls = 0;       // Two per room
    int uniqueLengths = 0;
    int sharedWalls = 0;      // Edges whose length appears more than once
    double sharingPercent = 0.0;

    double requestedM2 = 0.0;
    double actualM2 = 0.0;
    double variancePercent = 0.0;

    // Most common first, then shorter first
    std::vector<WallLengthUsage> commonLengths;
};

MassingStats analyzeMassing(const std::vector<RoomResult>& rooms, size_t topLengths = 5);

} // namespace massing
