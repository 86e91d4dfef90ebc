//
// Created by Giuseppe Francione on 13/12/25.
//

#include <gtest/gtest.h>
#include "errors.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "updater/self_updater.hpp"
#include "test_helpers.hpp"
#include <fstream>
#include <string>
#include <vector>

using namespace pixtrim;
namespace fs = std::filesystem;

namespace {

    class FakeReleaseSource final : public IReleaseSource {
    public:
        std::string body;
        std::string payload = "#!/bin/sh\necho new\n";
        std::vector<std::string> downloads;

        std::string fetch_latest() override { return body; }

        void download(const std::string& url, const fs::path& destination) override {
            downloads.push_back(url);
            std::ofstream out(destination, std::ios::binary | std::ios::trunc);
            out << payload;
        }
    };

    class FakeReplacer final : public IExecutableReplacer {
    public:
        int calls = 0;
        bool fail = false;

        void replace(const fs::path& current, const fs::path& staged) override {
            ++calls;
            if (fail) throw UpdateError(UpdateErrorKind::SwapError, "locked");
            fs::rename(staged, current);
        }
    };

    std::string release_json(const std::string& tag) {
        return R"({"tag_name": ")" + tag + R"(", "assets": [
            {"name": "pixtrim-linux-x86_64", "browser_download_url": "https://example.com/linux"},
            {"name": "pixtrim-macos-aarch64", "browser_download_url": "https://example.com/mac"}
        ]})";
    }

} // namespace

class SelfUpdaterTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    FakeReleaseSource source;
    FakeReplacer replacer;
    EventBus bus;
    std::vector<UpdateState> states;
    fs::path exe;

    void SetUp() override {
        exe = tmp.path() / "pixtrim";
        test::write_text(exe, "current build");
        bus.subscribe<UpdateStateChangedEvent>([this](const UpdateStateChangedEvent& e) {
            states.push_back(e.state);
        });
    }

    SelfUpdater make(const std::string& current, const std::string& target = "linux-x86_64") {
        return {Version::parse(current), target, exe, source, replacer, bus};
    }
};

TEST_F(SelfUpdaterTest, NewerLocalVersionStopsAtComparing) {
    source.body = release_json("v1.0.0");
    SelfUpdater updater = make("1.1.0");

    const UpdateOutcome outcome = updater.run();

    EXPECT_EQ(outcome.result, UpdateResult::UpToDate);
    EXPECT_EQ(updater.state(), UpdateState::Comparing);
    EXPECT_TRUE(source.downloads.empty());
    EXPECT_EQ(replacer.calls, 0);
    EXPECT_EQ(states, (std::vector<UpdateState>{UpdateState::Checking, UpdateState::Comparing}));
}

TEST_F(SelfUpdaterTest, EqualVersionIsUpToDate) {
    source.body = release_json("v1.1");
    SelfUpdater updater = make("1.1.0");
    EXPECT_EQ(updater.run().result, UpdateResult::UpToDate);
    EXPECT_TRUE(source.downloads.empty());
}

TEST_F(SelfUpdaterTest, NewerReleaseIsDownloadedAndSwapped) {
    source.body = release_json("v2.0.0");
    SelfUpdater updater = make("1.0.0");

    const UpdateOutcome outcome = updater.run();

    EXPECT_EQ(outcome.result, UpdateResult::Updated);
    EXPECT_EQ(outcome.latest, (Version{2, 0, 0}));
    EXPECT_EQ(outcome.asset_name, "pixtrim-linux-x86_64");
    EXPECT_EQ(source.downloads, (std::vector<std::string>{"https://example.com/linux"}));
    EXPECT_EQ(replacer.calls, 1);
    EXPECT_EQ(test::read_bytes(exe).size(), source.payload.size());
    EXPECT_EQ(updater.state(), UpdateState::Done);
    EXPECT_EQ(states, (std::vector<UpdateState>{UpdateState::Checking, UpdateState::Comparing,
                                                UpdateState::Downloading, UpdateState::Verifying,
                                                UpdateState::Swapping, UpdateState::Done}));
}

TEST_F(SelfUpdaterTest, MissingPlatformAssetFails) {
    source.body = release_json("v2.0.0");
    SelfUpdater updater = make("1.0.0", "windows-x86_64");

    try {
        (void) updater.run();
        FAIL() << "expected NoMatchingAsset";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::NoMatchingAsset);
    }
    EXPECT_EQ(updater.state(), UpdateState::Failed);
    EXPECT_TRUE(source.downloads.empty());
}

TEST_F(SelfUpdaterTest, EmptyDownloadIsCorruptAndCleanedUp) {
    source.body = release_json("v2.0.0");
    source.payload.clear();
    SelfUpdater updater = make("1.0.0");

    try {
        (void) updater.run();
        FAIL() << "expected CorruptArtifact";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::CorruptArtifact);
    }
    EXPECT_EQ(replacer.calls, 0);
    EXPECT_FALSE(fs::exists(updater.staging_path()));
    EXPECT_EQ(test::read_bytes(exe).size(), std::string("current build").size());
}

TEST_F(SelfUpdaterTest, SwapFailureLeavesCurrentBinary) {
    source.body = release_json("v2.0.0");
    replacer.fail = true;
    SelfUpdater updater = make("1.0.0");

    EXPECT_THROW((void) updater.run(), UpdateError);
    EXPECT_EQ(updater.state(), UpdateState::Failed);
    EXPECT_FALSE(fs::exists(updater.staging_path()));
    EXPECT_EQ(test::read_bytes(exe).size(), std::string("current build").size());
}

TEST_F(SelfUpdaterTest, BadReleaseJsonIsParseError) {
    source.body = "<html>rate limited</html>";
    SelfUpdater updater = make("1.0.0");
    try {
        (void) updater.run();
        FAIL() << "expected ParseError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::ParseError);
    }
}
