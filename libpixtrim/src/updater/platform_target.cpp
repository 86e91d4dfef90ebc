//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/updater/platform_target.hpp"
#include "../../include/errors.hpp"

namespace pixtrim {

std::string platform_target() {
#if defined(_WIN32)
    constexpr const char* os = "windows";
#elif defined(__APPLE__)
    constexpr const char* os = "macos";
#elif defined(__linux__)
    constexpr const char* os = "linux";
#else
    constexpr const char* os = "unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
    constexpr const char* arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    constexpr const char* arch = "aarch64";
#else
    constexpr const char* arch = "unknown";
#endif

    const std::string target = std::string(os) + "-" + arch;
    if (target == "linux-x86_64" || target == "linux-aarch64" ||
        target == "macos-x86_64" || target == "macos-aarch64" ||
        target == "windows-x86_64") {
        return target;
    }
    throw UpdateError(UpdateErrorKind::NoMatchingAsset, "self-update is not available for " + target);
}

} // namespace pixtrim
