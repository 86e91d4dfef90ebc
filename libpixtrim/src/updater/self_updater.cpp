//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/updater/self_updater.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/updater/release_info.hpp"
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pixtrim {

SelfUpdater::SelfUpdater(Version current,
                         std::string target,
                         fs::path executable,
                         IReleaseSource& source,
                         IExecutableReplacer& replacer,
                         EventBus& bus)
    : current_(current),
      target_(std::move(target)),
      executable_(std::move(executable)),
      source_(source),
      replacer_(replacer),
      bus_(bus) {}

fs::path SelfUpdater::staging_path() const {
    fs::path staged = executable_;
    staged += ".download";
    return staged;
}

void SelfUpdater::transition(const UpdateState next, const std::string& detail) {
    state_ = next;
    Logger::log(next == UpdateState::Failed ? LogLevel::Error : LogLevel::Debug,
                std::string("Update state ") + to_string(next) + (detail.empty() ? "" : ": " + detail),
                "updater");
    bus_.publish(UpdateStateChangedEvent{next, detail});
}

void SelfUpdater::verify_staged(const fs::path& staged) const {
    std::error_code ec;
    const auto size = fs::file_size(staged, ec);
    if (ec || size == 0) {
        throw UpdateError(UpdateErrorKind::CorruptArtifact, "downloaded file is empty: " + staged.string());
    }
#ifndef _WIN32
    fs::permissions(staged,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw UpdateError(UpdateErrorKind::CorruptArtifact,
                          "cannot mark " + staged.string() + " executable: " + ec.message());
    }
    const auto perms = fs::status(staged, ec).permissions();
    if (ec || (perms & fs::perms::owner_exec) == fs::perms::none) {
        throw UpdateError(UpdateErrorKind::CorruptArtifact, "downloaded file is not executable: " + staged.string());
    }
#endif
}

UpdateOutcome SelfUpdater::run() {
    state_ = UpdateState::Idle;
    UpdateOutcome outcome;
    outcome.current = current_;
    const fs::path staged = staging_path();

    try {
        transition(UpdateState::Checking);
        const ReleaseInfo release = parse_release_json(source_.fetch_latest());

        transition(UpdateState::Comparing, release.version_tag);
        outcome.latest = Version::parse(release.version_tag);
        if (outcome.latest <= current_) {
            Logger::log(LogLevel::Info,
                        "Already up to date (" + current_.to_string() + ", latest " + outcome.latest.to_string() + ")",
                        "updater");
            outcome.result = UpdateResult::UpToDate;
            return outcome;
        }

        const ReleaseAsset& asset = select_asset(release, target_);
        outcome.asset_name = asset.name;
        transition(UpdateState::Downloading, asset.name);
        source_.download(asset.download_url, staged);

        transition(UpdateState::Verifying, staged.string());
        verify_staged(staged);

        transition(UpdateState::Swapping, executable_.string());
        replacer_.replace(executable_, staged);

        outcome.result = UpdateResult::Updated;
        transition(UpdateState::Done, outcome.latest.to_string());
        return outcome;
    } catch (const UpdateError& e) {
        std::error_code ec;
        fs::remove(staged, ec);
        transition(UpdateState::Failed, e.what());
        throw;
    }
}

} // namespace pixtrim
