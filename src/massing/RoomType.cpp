#include "RoomType.h"

namespace massing {

const char* roomTypeName(RoomType type) {
    switch (type) {
        case RoomType::Living: return "living";
        case RoomType::Bedroom: return "bedroom";
        case RoomType::Kitchen: return "kitchen";
        case RoomType::Bathroom: return "bathroom";
        case RoomType::Office: return "office";
        case RoomType::Circulation: return "circulation";
        case RoomType::Utility: return "utility";
        case RoomType::Unclassified: return "unclassified";
        default: return "unclassified";
    }
}

const char* roomCategoryName(RoomCategory category) {
    switch (category) {
        case RoomCategory::Public: return "public";
        case RoomCategory::Private: return "private";
        case RoomCategory::Service: return "service";
        default: return "public";
    }
}

RoomCategory roomCategory(RoomType type) {
    switch (type) {
        case RoomType::Bedroom:
        case RoomType::Bathroom:
        case RoomType::Office:
            return RoomCategory::Private;
        case RoomType::Utility:
        case RoomType::Circulation:
            return RoomCategory::Service;
        case RoomType::Living:
        case RoomType::Kitchen:
        case RoomType::Unclassified:
        default:
            return RoomCategory::Public;
    }
}

CategoryColor categoryColor(RoomCategory category) {
    switch (category) {
        case RoomCategory::Public: return {150, 180, 255};   // Light blue
        case RoomCategory::Private: return {255, 150, 150};  // Light red
        case RoomCategory::Service: return {255, 255, 150};  // Light yellow
        default: return {200, 200, 200};
    }
}

} // namespace massing
