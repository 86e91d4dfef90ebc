//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/updater/version.hpp"
#include "../../include/errors.hpp"
#include <array>
#include <charconv>

namespace pixtrim {

Version Version::parse(std::string_view text) {
    const std::string original(text);
    auto bad = [&original](const char* why) {
        return UpdateError(UpdateErrorKind::ParseError, "invalid version '" + original + "': " + why);
    };

    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
        text.remove_prefix(1);
    }
    if (text.empty()) throw bad("empty");

    std::array<std::uint32_t, 3> parts{0, 0, 0};
    std::size_t count = 0;
    while (true) {
        if (count == parts.size()) throw bad("more than three components");
        const auto dot = text.find('.');
        const auto part = text.substr(0, dot);
        if (part.empty()) throw bad("empty component");

        std::uint32_t value = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) throw bad("non-numeric component");
        parts[count++] = value;

        if (dot == std::string_view::npos) break;
        text.remove_prefix(dot + 1);
    }
    return {parts[0], parts[1], parts[2]};
}

std::string Version::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

} // namespace pixtrim
