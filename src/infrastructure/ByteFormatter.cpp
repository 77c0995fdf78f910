#include "infrastructure/ByteFormatter.hpp"
#include <cmath>
#include <cstdio>

namespace nodewastage::infrastructure {

std::string ByteFormatter::Humanize(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    constexpr int kLastUnit = 6;

    char buf[32];
    if (bytes < 10) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
        return buf;
    }

    int exponent = 0;
    std::uint64_t scale = 1;
    while (exponent < kLastUnit && bytes / scale >= 1000) {
        scale *= 1000;
        ++exponent;
    }

    double value = std::floor(static_cast<double>(bytes) / static_cast<double>(scale) * 10.0 + 0.5) / 10.0;
    const char* format = value < 10.0 ? "%.1f %s" : "%.0f %s";
    std::snprintf(buf, sizeof(buf), format, value, kUnits[exponent]);
    return buf;
}

} // namespace nodewastage::infrastructure
