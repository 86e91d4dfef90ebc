//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_RELEASE_INFO_HPP
#define PIXTRIM_RELEASE_INFO_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pixtrim {

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

struct ReleaseInfo {
    std::string version_tag;
    std::vector<ReleaseAsset> assets;
};

/**
 * @brief Parse a GitHub "latest release" document.
 *
 * Reads `tag_name` and `assets[].name` / `assets[].browser_download_url`;
 * everything else is ignored.
 * @throws UpdateError(ParseError) on malformed JSON or missing fields.
 */
[[nodiscard]] ReleaseInfo parse_release_json(std::string_view json);

/**
 * @brief The asset built for `target` (e.g. "linux-x86_64").
 *
 * An exact `<name>-<target>` or `<name>-<target>.exe` wins over any other
 * asset mentioning `target`; checksum and signature sidecars are never picked.
 * @throws UpdateError(NoMatchingAsset) listing the available asset names.
 */
[[nodiscard]] const ReleaseAsset& select_asset(const ReleaseInfo& release, std::string_view target);

} // namespace pixtrim

#endif // PIXTRIM_RELEASE_INFO_HPP
