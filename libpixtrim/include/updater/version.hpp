//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_VERSION_HPP
#define PIXTRIM_VERSION_HPP

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace pixtrim {

/**
 * @brief Semantic version triple with a total order.
 */
struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    /**
     * @brief Parse "1", "1.2", "1.2.3", optionally prefixed by 'v' or 'V'.
     *
     * Missing trailing components are zero ("1.2" == "1.2.0").
     * @throws UpdateError(ParseError) on anything else, including empty
     * components, signs, suffixes and more than three components.
     */
    static Version parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const Version&) const = default;
};

} // namespace pixtrim

#endif // PIXTRIM_VERSION_HPP
