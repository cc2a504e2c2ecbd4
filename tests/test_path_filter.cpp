#include <gtest/gtest.h>
#include <managers/path_filter.hpp>
#include <filesystem>
#include <fstream>
#include <algorithm>

namespace fs = std::filesystem;

class PathFilterTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "expctl_path_filter_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    static bool contains(const std::vector<fs::path>& files, const std::string& name) {
        return std::any_of(files.begin(), files.end(),
                           [&](const fs::path& f) { return f.filename() == name; });
    }
};

TEST_F(PathFilterTest, StateDirectoryAlwaysExcluded) {
    PathFilter filter(test_dir, {"!.expctl/"});

    EXPECT_TRUE(filter.is_excluded(std::string(".expctl")));
    EXPECT_TRUE(filter.is_excluded(std::string(".expctl/transfer_ledger.yaml")));
    EXPECT_FALSE(filter.is_excluded(std::string("behavior.csv")));
}

TEST_F(PathFilterTest, ExcludePatterns) {
    PathFilter filter(test_dir, {"*.tmp", "scratch/"});

    EXPECT_TRUE(filter.is_excluded(std::string("frame.tmp")));
    EXPECT_TRUE(filter.is_excluded(std::string("video/frame.tmp")));
    EXPECT_TRUE(filter.is_excluded(std::string("scratch/notes.txt")));
    EXPECT_FALSE(filter.is_excluded(std::string("frame.tmpl")));
    EXPECT_FALSE(filter.is_excluded(std::string("video/frame.avi")));
}

TEST_F(PathFilterTest, NegationPattern) {
    PathFilter filter(test_dir, {"*.log", "!task.log"});

    EXPECT_TRUE(filter.is_excluded(std::string("debug.log")));
    EXPECT_FALSE(filter.is_excluded(std::string("task.log")));
}

TEST_F(PathFilterTest, IgnoreFileAndComments) {
    write_file(".expctlignore", "# comment\n\n*.bak\n");
    PathFilter filter(test_dir);

    EXPECT_TRUE(filter.is_excluded(std::string("config.bak")));
    EXPECT_FALSE(filter.is_excluded(std::string("config.yaml")));
}

TEST_F(PathFilterTest, CollectFiles) {
    write_file("behavior.csv", "t,x\n");
    write_file("video/cam0.avi", "frames");
    write_file("video/cam0.tmp", "partial");
    write_file(".expctl/session_manifest.yaml", "session: {}");

    PathFilter filter(test_dir, {"*.tmp"});
    auto files = filter.collect_files();

    EXPECT_TRUE(contains(files, "behavior.csv"));
    EXPECT_TRUE(contains(files, "cam0.avi"));
    EXPECT_FALSE(contains(files, "cam0.tmp"));
    EXPECT_FALSE(contains(files, "session_manifest.yaml"));
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(PathFilterTest, CollectFromMissingRoot) {
    PathFilter filter(test_dir / "nope");
    EXPECT_TRUE(filter.collect_files().empty());
}

TEST_F(PathFilterTest, RelativePath) {
    PathFilter filter(test_dir);
    EXPECT_EQ(filter.get_relative_path(test_dir / "video" / "cam0.avi"),
              fs::path("video/cam0.avi"));
}
