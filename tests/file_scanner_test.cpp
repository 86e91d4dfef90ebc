//
// Created by Giuseppe Francione on 09/12/25.
//

#include <gtest/gtest.h>
#include "errors.hpp"
#include "file_scanner.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace pixtrim;
namespace fs = std::filesystem;

class FileScannerTest : public ::testing::Test {
protected:
    test::TempDir tmp;

    void SetUp() override {
        fs::create_directories(tmp.path() / "sub" / "deeper");
        test::write_text(tmp.path() / "a.jpg", "x");
        test::write_text(tmp.path() / "b.PNG", "x");
        test::write_text(tmp.path() / "notes.txt", "x");
        test::write_text(tmp.path() / ".DS_Store", "x");
        test::write_text(tmp.path() / "._a.jpg", "x");
        test::write_text(tmp.path() / "sub" / "c.webp", "x");
        test::write_text(tmp.path() / "sub" / "deeper" / "d.svg", "x");
        test::write_text(tmp.path() / "sub" / "Desktop.ini", "x");
    }

    static std::set<std::string> names(const ImageScanner& scanner) {
        std::set<std::string> out;
        for (const auto& image : scanner) {
            out.insert(image.path.filename().string());
        }
        return out;
    }
};

TEST_F(FileScannerTest, FlatScanOnlySeesTopLevelImages) {
    const ImageScanner scanner(tmp.path(), false);
    EXPECT_EQ(names(scanner), (std::set<std::string>{"a.jpg", "b.PNG"}));
}

TEST_F(FileScannerTest, RecursiveScanDescends) {
    const ImageScanner scanner(tmp.path(), true);
    EXPECT_EQ(names(scanner), (std::set<std::string>{"a.jpg", "b.PNG", "c.webp", "d.svg"}));
}

TEST_F(FileScannerTest, FormatComesFromExtension) {
    const ImageScanner scanner(tmp.path(), true);
    for (const auto& image : scanner) {
        if (image.path.filename() == "c.webp") EXPECT_EQ(image.format, ImageFormat::WebP);
        if (image.path.filename() == "b.PNG") EXPECT_EQ(image.format, ImageFormat::Png);
    }
}

TEST_F(FileScannerTest, ScannerCanBeIteratedTwice) {
    const ImageScanner scanner(tmp.path(), true);
    EXPECT_EQ(names(scanner), names(scanner));
}

TEST_F(FileScannerTest, SingleFileRootYieldsThatFile) {
    const ImageScanner scanner(tmp.path() / "a.jpg", true);
    std::vector<fs::path> seen;
    for (const auto& image : scanner) seen.push_back(image.path);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen.front(), tmp.path() / "a.jpg");
}

TEST_F(FileScannerTest, MissingRootIsScanError) {
    EXPECT_THROW(ImageScanner(tmp.path() / "nope", true), ScanError);
}

TEST_F(FileScannerTest, UnsupportedSingleFileIsScanError) {
    EXPECT_THROW(ImageScanner(tmp.path() / "notes.txt", false), ScanError);
}

TEST_F(FileScannerTest, SymlinksAreNotFollowed) {
    std::error_code ec;
    fs::create_directory_symlink(tmp.path() / "sub", tmp.path() / "link", ec);
    if (ec) GTEST_SKIP() << "symlinks not available: " << ec.message();

    const ImageScanner scanner(tmp.path(), true);
    std::size_t count = 0;
    for (const auto& image : scanner) {
        EXPECT_EQ(image.path.string().find("link"), std::string::npos);
        ++count;
    }
    EXPECT_EQ(count, 4u);
}

TEST_F(FileScannerTest, JunkDetection) {
    EXPECT_TRUE(is_junk("x/.DS_Store"));
    EXPECT_TRUE(is_junk("DESKTOP.INI"));
    EXPECT_TRUE(is_junk("._photo.jpg"));
    EXPECT_FALSE(is_junk("photo.jpg"));
}
