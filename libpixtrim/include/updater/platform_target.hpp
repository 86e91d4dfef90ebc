//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_PLATFORM_TARGET_HPP
#define PIXTRIM_PLATFORM_TARGET_HPP

#include <string>

namespace pixtrim {

    /**
     * @brief Identifier of the running platform as used in release asset names:
     * linux-x86_64, linux-aarch64, macos-x86_64, macos-aarch64 or windows-x86_64.
     * @throws UpdateError(NoMatchingAsset) on any other OS/architecture.
     */
    [[nodiscard]] std::string platform_target();

} // namespace pixtrim

#endif // PIXTRIM_PLATFORM_TARGET_HPP
