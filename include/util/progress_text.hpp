#pragma once

#include <cstdint>
#include <string>

namespace otafetch {

// "1.5 MiB", "512 B".
std::string FormatBytes(std::uint64_t bytes);

// "<done> / <total>", e.g. "512.0 KiB / 1.0 GiB".
std::string FormatProgressText(std::uint64_t done, std::uint64_t total);

// floor(done * 100 / total), clamped to [0, 100]; 0 when total is 0.
int ProgressPercent(std::uint64_t done, std::uint64_t total);

} // namespace otafetch
