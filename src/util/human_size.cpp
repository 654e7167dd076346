#include "util/human_size.hpp"

#include <cmath>
#include <cstdio>

namespace takeout {

std::string HumanReadableSize(std::uint64_t bytes) {
    static constexpr char kUnits[] = {'K', 'M', 'G', 'T', 'P', 'E'};
    static constexpr int kLastUnit = static_cast<int>(sizeof(kUnits)) - 1;

    if (bytes < 1024) return std::to_string(bytes) + "B";

    double v = static_cast<double>(bytes);
    int unit = -1;
    while (v >= 1024.0 && unit < kLastUnit) {
        v /= 1024.0;
        ++unit;
    }

    char buf[32];
    if (v < 10.0) {
        const double tenths = std::ceil(v * 10.0) / 10.0;
        if (tenths < 10.0) {
            std::snprintf(buf, sizeof(buf), "%.1f%c", tenths, kUnits[unit]);
            return buf;
        }
        v = tenths;
    }

    const double whole = std::ceil(v);
    if (whole >= 1024.0 && unit < kLastUnit) {
        std::snprintf(buf, sizeof(buf), "1.0%c", kUnits[unit + 1]);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.0f%c", whole, kUnits[unit]);
    return buf;
}

} // namespace takeout
