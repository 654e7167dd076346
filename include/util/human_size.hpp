#pragma once

#include <cstdint>
#include <string>

namespace takeout {

// Formats a byte count the way `du -h` does: powers of 1024, rounded up,
// one decimal below 10 (e.g. "512B", "1.5K", "23M", "4.0G").
std::string HumanReadableSize(std::uint64_t bytes);

} // namespace takeout
