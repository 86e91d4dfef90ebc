//
// Created by Giuseppe Francione on 12/12/25.
//

#include <gtest/gtest.h>
#include "errors.hpp"
#include "updater/executable_replacer.hpp"
#include "test_helpers.hpp"
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

using namespace pixtrim;
namespace fs = std::filesystem;

namespace {

    // records whether the executable path was populated when the final step ran, then fails it
    class FailingInstallReplacer final : public RenameExecutableReplacer {
    public:
        bool current_present = false;
        bool install_called = false;

    protected:
        void install(const fs::path&, const fs::path& current, std::error_code& ec) override {
            install_called = true;
            current_present = fs::exists(current);
            ec = std::make_error_code(std::errc::io_error);
        }
    };

} // namespace

class ExecutableReplacerTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    RenameExecutableReplacer replacer;

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

TEST_F(ExecutableReplacerTest, SwapsInStagedBinary) {
    const fs::path exe = tmp.path() / "pixtrim";
    const fs::path staged = tmp.path() / "pixtrim.download";
    test::write_text(exe, "old build");
    test::write_text(staged, "new build");

    replacer.replace(exe, staged);

    EXPECT_EQ(slurp(exe), "new build");
    EXPECT_FALSE(fs::exists(staged));
#ifndef _WIN32
    EXPECT_FALSE(fs::exists(old_executable_path(exe)));
#endif
}

TEST_F(ExecutableReplacerTest, MissingStagedFileRestoresOriginal) {
    const fs::path exe = tmp.path() / "pixtrim";
    test::write_text(exe, "old build");

    try {
        replacer.replace(exe, tmp.path() / "nothing.download");
        FAIL() << "expected SwapError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::SwapError);
    }
    EXPECT_EQ(slurp(exe), "old build");
    EXPECT_FALSE(fs::exists(old_executable_path(exe)));
}

TEST_F(ExecutableReplacerTest, MissingCurrentIsSwapError) {
    const fs::path staged = tmp.path() / "pixtrim.download";
    test::write_text(staged, "new build");
    EXPECT_THROW(replacer.replace(tmp.path() / "absent", staged), UpdateError);
    EXPECT_TRUE(fs::exists(staged));
}

TEST_F(ExecutableReplacerTest, CleanupRemovesLeftoverOldBinary) {
    const fs::path exe = tmp.path() / "pixtrim";
    test::write_text(old_executable_path(exe), "leftover");

    EXPECT_TRUE(cleanup_stale_executables(exe));
    EXPECT_FALSE(fs::exists(old_executable_path(exe)));
    EXPECT_FALSE(cleanup_stale_executables(exe));
}

TEST_F(ExecutableReplacerTest, CurrentExecutableExists) {
    EXPECT_TRUE(fs::exists(current_executable_path()));
}

TEST_F(ExecutableReplacerTest, FailedInstallLeavesOriginalInPlace) {
    const fs::path exe = tmp.path() / "pixtrim";
    const fs::path staged = tmp.path() / "pixtrim.download";
    test::write_text(exe, "old build");
    test::write_text(staged, "new build");

    FailingInstallReplacer failing;
    try {
        failing.replace(exe, staged);
        FAIL() << "expected SwapError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), UpdateErrorKind::SwapError);
    }

    EXPECT_TRUE(failing.install_called);
#ifndef _WIN32
    EXPECT_TRUE(failing.current_present);
#endif
    ASSERT_TRUE(fs::exists(exe));
    EXPECT_EQ(slurp(exe), "old build");
    EXPECT_TRUE(fs::exists(staged));
    EXPECT_FALSE(fs::exists(old_executable_path(exe)));
}

#ifndef _WIN32
TEST_F(ExecutableReplacerTest, OldBinaryStaysReachableThroughTheSwap) {
    const fs::path exe = tmp.path() / "pixtrim";
    const fs::path staged = tmp.path() / "pixtrim.download";
    test::write_text(exe, "old build");
    test::write_text(staged, "new build");

    // an open handle keeps reading the old inode after the rename
    std::ifstream running(exe, std::ios::binary);
    ASSERT_TRUE(running.good());

    replacer.replace(exe, staged);

    EXPECT_EQ(slurp(exe), "new build");
    const std::string held{std::istreambuf_iterator<char>(running), std::istreambuf_iterator<char>()};
    EXPECT_EQ(held, "old build");
}
#endif
