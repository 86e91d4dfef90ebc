//
// Created by Giuseppe Francione on 06/12/25.
//

/**
 * @file self_updater.hpp
 * @brief Check-download-verify-swap cycle for the pixtrim executable.
 */

#ifndef PIXTRIM_SELF_UPDATER_HPP
#define PIXTRIM_SELF_UPDATER_HPP

#include "../event_bus.hpp"
#include "executable_replacer.hpp"
#include "release_source.hpp"
#include "update_state.hpp"
#include "version.hpp"
#include <filesystem>
#include <string>

namespace pixtrim {

enum class UpdateResult {
    UpToDate, ///< Remote version is not newer; nothing was downloaded
    Updated   ///< The executable was replaced
};

struct UpdateOutcome {
    UpdateResult result = UpdateResult::UpToDate;
    Version current;
    Version latest;
    std::string asset_name; ///< Empty when up to date
};

/**
 * @brief Drives the update state machine.
 *
 * @details Idle → Checking → Comparing → Downloading → Verifying → Swapping
 * → Done. An up-to-date check stops in Comparing. Any error moves to Failed,
 * removes the staged download and is rethrown. Every transition is
 * published as an UpdateStateChangedEvent.
 *
 * Single-threaded; the release source and the replacer are injected so the
 * whole cycle can run against fakes.
 */
class SelfUpdater {
public:
    /**
     * @param current Version of the running binary.
     * @param target Platform identifier matched against asset names.
     * @param executable Path of the binary to replace; the download is staged beside it.
     */
    SelfUpdater(Version current,
                std::string target,
                std::filesystem::path executable,
                IReleaseSource& source,
                IExecutableReplacer& replacer,
                EventBus& bus);

    /**
     * @brief Run one full cycle from Idle.
     * @throws UpdateError
     */
    UpdateOutcome run();

    [[nodiscard]] UpdateState state() const noexcept { return state_; }

    /// `<exe>.download`
    [[nodiscard]] std::filesystem::path staging_path() const;

private:
    void transition(UpdateState next, const std::string& detail = {});

    void verify_staged(const std::filesystem::path& staged) const;

    Version current_;
    std::string target_;
    std::filesystem::path executable_;
    IReleaseSource& source_;
    IExecutableReplacer& replacer_;
    EventBus& bus_;
    UpdateState state_ = UpdateState::Idle;
};

} // namespace pixtrim

#endif // PIXTRIM_SELF_UPDATER_HPP
