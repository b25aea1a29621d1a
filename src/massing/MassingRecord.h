#pragma once

// Final per-room tuples handed to the geometry generator

#include "MassingTypes.h"
#include <vector>

namespace massing {

struct MassingRecord {
    std::string name;
    RoomType type = RoomType::Unclassified;
    RoomCategory category = RoomCategory::Public;
    CategoryColor color{0, 0, 0};
    int widthCm = 0;
    int depthCm = 0;
    int heightCm = 0;
    double areaCm2 = 0.0;
    double targetAreaCm2 = 0.0;
    bool degraded = false;
    bool optimized = false;

    double areaM2() const { return areaCm2 / 10000.0; }
};

struct MassingEmission {
    std::vector<MassingRecord> records;
    size_t circulationDropped = 0;
};

MassingRecord makeMassingRecord(const RoomResult& room);

// Assembles records in input order; circulation rooms are dropped and counted
MassingEmission emitMassingRecords(const std::vector<RoomResult>& rooms);

} // namespace massing
