#pragma once

#include <cstdint>
#include <string>

namespace massing {

// Room categories recognized by the classifier
enum class RoomType : uint8_t {
    Living = 0,
    Bedroom,
    Kitchen,
    Bathroom,
    Office,
    Circulation,    // Corridors are never massed
    Utility,
    Unclassified,   // Generic proportions
    Count
};

constexpr size_t kRoomTypeCount = static_cast<size_t>(RoomType::Count);

// Grouping used by the renderer to color volumes
enum class RoomCategory : uint8_t {
    Public = 0,
    Private,
    Service
};

struct CategoryColor {
    uint8_t r, g, b;
};

const char* roomTypeName(RoomType type);

const char* roomCategoryName(RoomCategory category);
RoomCategory roomCategory(RoomType type);

// Pastel display color for a category
CategoryColor categoryColor(RoomCategory category);

} // namespace massing
