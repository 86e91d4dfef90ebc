//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/byte_format.hpp"
#include <array>
#include <cstdio>

namespace pixtrim {

std::string format_bytes(const std::uintmax_t bytes) {
    static constexpr std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

} // namespace pixtrim
