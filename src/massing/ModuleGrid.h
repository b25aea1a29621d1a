#pragma once

// Construction module snapping - all lengths in whole centimeters

#include <cmath>

namespace massing {

constexpr double kCm2PerM2 = 10000.0;

// Nearest module multiple, halves rounded up, never less than one module
inline int snapToModule(double valueCm, int moduleCm) {
    if (moduleCm <= 0) return static_cast<int>(std::lround(valueCm));
    long steps = static_cast<long>(std::floor(valueCm / moduleCm + 0.5));
    if (steps < 1) steps = 1;
    return static_cast<int>(steps * moduleCm);
}

// Smallest module multiple >= value
inline int ceilToModule(int valueCm, int moduleCm) {
    if (moduleCm <= 0) return valueCm;
    int steps = (valueCm + moduleCm - 1) / moduleCm;
    if (steps < 1) steps = 1;
    return steps * moduleCm;
}

inline bool isModuleMultiple(int valueCm, int moduleCm) {
    return moduleCm > 0 && valueCm > 0 && valueCm % moduleCm == 0;
}

} // namespace massing
