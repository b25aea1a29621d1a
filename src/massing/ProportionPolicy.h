#pragma once

// Architecturally acceptable room shapes, per room type.
// This table is the only place ratios, aspect bounds and minimum walls are defined.

#include "RoomType.h"
#include <array>
#include <vector>

namespace massing {

// Width:depth proportion, e.g. 4:3
struct Ratio {
    int w = 1;
    int d = 1;

    double value() const { return static_cast<double>(w) / static_cast<double>(d); }

    // Long side over short side
    double normalized() const {
        double v = value();
        return v >= 1.0 ? v : 1.0 / v;
    }
};

struct ProportionPolicy {
    std::vector<Ratio> ratios;  // Tried in listed order; earlier wins ties
    double aspectMin = 0.5;
    double aspectMax = 1.5;
    int minWallCm = 120;

    // Aspect is always measured as long side over short side
    bool acceptsAspect(double aspect) const {
        return aspect >= aspectMin && aspect <= aspectMax;
    }

    // Bounds contain 1 and every listed ratio
    bool isConsistent() const;
};

// Normalized aspect of a footprint (>= 1)
inline double footprintAspect(int widthCm, int depthCm) {
    int longSide = widthCm >= depthCm ? widthCm : depthCm;
    int shortSide = widthCm >= depthCm ? depthCm : widthCm;
    return static_cast<double>(longSide) / static_cast<double>(shortSide);
}

class ProportionPolicyTable {
public:
    explicit ProportionPolicyTable(const std::array<ProportionPolicy, kRoomTypeCount>& policies);

    // Built-in residential conventions
    static const ProportionPolicyTable& standard();

    const ProportionPolicy& get(RoomType type) const;

    // Generic policy used for unclassified rooms and degraded fits
    const ProportionPolicy& fallback() const { return get(RoomType::Unclassified); }

private:
    std::array<ProportionPolicy, kRoomTypeCount> policies_;
};

} // namespace massing
