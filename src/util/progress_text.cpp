#include "util/progress_text.hpp"

#include <array>
#include <cstdio>

namespace otafetch {

std::string FormatBytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 4> kUnits = {"KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
    return buf;
}

std::string FormatProgressText(std::uint64_t done, std::uint64_t total) {
    return FormatBytes(done) + " / " + FormatBytes(total);
}

int ProgressPercent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    if (done >= total) return 100;
    // done < total here, so done * 100 only overflows past 184 PB.
    return static_cast<int>((done * 100ULL) / total);
}

} // namespace otafetch
