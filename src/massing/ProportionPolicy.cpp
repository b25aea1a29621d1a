#include "ProportionPolicy.h"

namespace massing {

bool ProportionPolicy::isConsistent() const {
    if (ratios.empty() || minWallCm <= 0) return false;
    if (aspectMin > 1.0 || aspectMax < 1.0) return false;
    for (const Ratio& r : ratios) {
        if (r.w <= 0 || r.d <= 0) return false;
        if (!acceptsAspect(r.normalized())) return false;
    }
    return true;
}

ProportionPolicyTable::ProportionPolicyTable(const std::array<ProportionPolicy, kRoomTypeCount>& policies)
    : policies_(policies)
{
}

const ProportionPolicyTable& ProportionPolicyTable::standard() {
    static const std::array<ProportionPolicy, kRoomTypeCount> kPolicies = {{
        // Living
        {{{4, 3}, {5, 4}, {3, 2}}, 0.6, 1.5, 270},
        // Bedroom
        {{{3, 2}, {4, 3}, {5, 4}}, 0.5, 1.5, 240},
        // Kitchen
        {{{5, 3}, {3, 2}, {4, 3}}, 0.5, 2.0, 180},
        // Bathroom
        {{{3, 2}, {2, 1}, {5, 4}}, 0.4, 2.0, 120},
        // Office
        {{{3, 2}, {4, 3}, {5, 4}}, 0.6, 1.5, 210},
        // Circulation
        {{{2, 1}, {3, 1}, {5, 2}}, 0.3, 3.0, 100},
        // Utility
        {{{2, 1}, {3, 2}, {1, 1}}, 0.4, 2.5, 100},
        // Unclassified
        {{{3, 2}, {4, 3}, {5, 4}, {1, 1}}, 0.5, 1.5, 120},
    }};
    static const ProportionPolicyTable kStandard(kPolicies);
    return kStandard;
}

const ProportionPolicy& ProportionPolicyTable::get(RoomType type) const {
    size_t index = static_cast<size_t>(type);
    if (index >= kRoomTypeCount) {
        index = static_cast<size_t>(RoomType::Unclassified);
    }
    return policies_[index];
}

} // namespace massing
