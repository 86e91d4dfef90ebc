//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/updater/release_info.hpp"
#include "../../include/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <string_view>

namespace pixtrim {

ReleaseInfo parse_release_json(const std::string_view json) {
    try {
        const auto doc = nlohmann::json::parse(json);
        ReleaseInfo info;
        info.version_tag = doc.at("tag_name").get<std::string>();
        for (const auto& asset : doc.at("assets")) {
            info.assets.push_back({asset.at("name").get<std::string>(),
                                   asset.at("browser_download_url").get<std::string>()});
        }
        return info;
    } catch (const nlohmann::json::exception& e) {
        throw UpdateError(UpdateErrorKind::ParseError, std::string("malformed release information: ") + e.what());
    }
}

namespace {

    // "<name>-<target>" or "<name>-<target>.exe"
    bool is_binary_for(const std::string& name, const std::string_view target) {
        std::string_view stem = name;
        if (stem.ends_with(".exe")) stem.remove_suffix(4);
        if (stem == target) return true;
        return stem.size() > target.size() && stem.ends_with(target)
               && stem[stem.size() - target.size() - 1] == '-';
    }

    bool is_sidecar(const std::string& name) {
        for (const std::string_view ext : {".sha256", ".sha512", ".sig", ".asc", ".txt"}) {
            if (name.ends_with(ext)) return true;
        }
        return false;
    }

} // namespace

const ReleaseAsset& select_asset(const ReleaseInfo& release, const std::string_view target) {
    auto it = std::ranges::find_if(release.assets, [target](const ReleaseAsset& a) {
        return is_binary_for(a.name, target);
    });
    if (it == release.assets.end()) {
        it = std::ranges::find_if(release.assets, [target](const ReleaseAsset& a) {
            return a.name.find(target) != std::string::npos && !is_sidecar(a.name);
        });
    }
    if (it != release.assets.end()) {
        return *it;
    }

    std::string available;
    for (const auto& a : release.assets) {
        if (!available.empty()) available += ", ";
        available += a.name;
    }
    throw UpdateError(UpdateErrorKind::NoMatchingAsset,
                      "no release asset for " + std::string(target) + " in " + release.version_tag
                      + " (available: " + (available.empty() ? "none" : available) + ")");
}

} // namespace pixtrim
