//
// Created by Giuseppe Francione on 09/12/25.
//

#include <gtest/gtest.h>
#include "backup_manager.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace pixtrim;
namespace fs = std::filesystem;

class BackupManagerTest : public ::testing::Test {
protected:
    test::TempDir tmp;
};

TEST_F(BackupManagerTest, AppendsBakToFullName) {
    EXPECT_EQ(backup_path_for("dir/a.png"), fs::path("dir/a.png.bak"));
}

TEST_F(BackupManagerTest, WritesOriginalBytes) {
    const std::vector<std::uint8_t> original{1, 2, 3, 4, 5};
    const fs::path dest = tmp.path() / "img.jpg";

    const fs::path bak = create_backup(dest, original);
    EXPECT_EQ(bak, tmp.path() / "img.jpg.bak");
    EXPECT_EQ(test::read_bytes(bak), original);
}

TEST_F(BackupManagerTest, OverwritesOlderBackup) {
    const fs::path dest = tmp.path() / "img.jpg";
    test::write_text(backup_path_for(dest), "stale");

    const std::vector<std::uint8_t> original{9, 9};
    (void) create_backup(dest, original);
    EXPECT_EQ(test::read_bytes(backup_path_for(dest)), original);
}

TEST_F(BackupManagerTest, UnwritableLocationIsBackupFailed) {
    const std::vector<std::uint8_t> original{1};
    try {
        (void) create_backup(tmp.path() / "missing_dir" / "img.jpg", original);
        FAIL() << "expected BackupFailed";
    } catch (const FileError& e) {
        EXPECT_EQ(e.kind(), FileErrorKind::BackupFailed);
    }
}
