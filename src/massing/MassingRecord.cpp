#include "MassingRecord.h"

namespace massing {

MassingRecord makeMassingRecord(const RoomResult& room) {
    MassingRecord record;
    record.name = room.name;
    record.type = room.type;
    record.category = roomCategory(room.type);
    record.color = categoryColor(record.category);
    record.widthCm = room.widthCm;
    record.depthCm = room.depthCm;
    record.heightCm = room.heightCm;
    record.areaCm2 = room.areaCm2();
    record.targetAreaCm2 = room.targetAreaCm2;
    record.degraded = room.degraded;
    record.optimized = room.optimized;
    return record;
}

MassingEmission emitMassingRecords(const std::vector<RoomResult>& rooms) {
    MassingEmission emission;
    emission.records.reserve(rooms.size());

    for (const RoomResult& room : rooms) {
        if (room.type == RoomType::Circulation) {
            ++emission.circulationDropped;
            continue;
        }
        emission.records.push_back(makeMassingRecord(room));
    }

    return emission;
}

} // namespace massing
