#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(ConfigParse, FullDocument) {
    auto r = Config::parse(R"(
rig:
  id: rig-3
  data_root: data
session:
  operator: alice
  subjects: [mouse-07, mouse-08]
repository:
  path: task_repo
  policy: version-only
  version: ">=1.2.0"
task:
  command: ./run_task.sh
  args: ["--out", "{session_dir}"]
  timeout_secs: 3600
resources:
  poll_interval_ms: 250
  run:
    min_free_disk_local_mb: 2048
    max_load: 4.5
  transfer:
    min_free_disk_destination_mb: 100
transfer:
  destination: /mnt/server/behavior
  workers: 8
  fingerprint: md5
  exclude: ["*.tmp", "scratch/"]
  notify: watchdog
  watchdog:
    flag_dir: flags
    project_name: reversal
    executable: bin/watchdog
    start_wait_ms: 500
retry:
  max_attempts: 7
  base_backoff_ms: 100
stages:
  optional: [map_metadata]
mapping:
  on_error: remediate
  max_attempts: 2
picker:
  mode: headless
  defaults:
    confirm_transfer: "yes"
logging:
  debug: true
)", "/srv/rig");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.rig().id, "rig-3");
    EXPECT_EQ(c.rig().data_root, "/srv/rig/data");
    EXPECT_EQ(c.session().operator_name, "alice");
    ASSERT_EQ(c.session().subjects.size(), 2u);
    EXPECT_EQ(c.session().subjects[1], "mouse-08");

    EXPECT_EQ(c.repository().path, "/srv/rig/task_repo");
    EXPECT_EQ(c.repository().policy, GitPolicy::VersionOnly);
    EXPECT_EQ(c.repository().version, ">=1.2.0");

    EXPECT_EQ(c.task().command, "./run_task.sh");
    ASSERT_EQ(c.task().args.size(), 2u);
    EXPECT_EQ(c.task().args[1], "{session_dir}");
    EXPECT_EQ(c.task().timeout_secs, 3600);

    EXPECT_EQ(c.resources().poll_interval_ms, 250);
    EXPECT_EQ(c.resources().run.min_free_disk_local_mb, 2048);
    EXPECT_DOUBLE_EQ(c.resources().run.max_load, 4.5);
    EXPECT_EQ(c.resources().transfer.min_free_disk_destination_mb, 100);
    EXPECT_EQ(c.resources().background.min_free_disk_local_mb, 0);

    EXPECT_EQ(c.transfer().destination, "/mnt/server/behavior");
    EXPECT_EQ(c.transfer().workers, 8);
    EXPECT_EQ(c.transfer().fingerprint, FingerprintMethod::Md5);
    EXPECT_EQ(c.transfer().exclude.size(), 2u);
    EXPECT_EQ(c.transfer().notify, "watchdog");
    EXPECT_EQ(c.transfer().watchdog.flag_dir, "/srv/rig/flags");
    EXPECT_EQ(c.transfer().watchdog.project_name, "reversal");
    EXPECT_EQ(c.transfer().watchdog.executable, "/srv/rig/bin/watchdog");
    EXPECT_EQ(c.transfer().watchdog.start_wait_ms, 500);
    EXPECT_TRUE(c.transfer().watchdog.process_name.empty());

    EXPECT_EQ(c.retry().max_attempts, 7);
    EXPECT_EQ(c.retry().base_backoff_ms, 100);
    EXPECT_TRUE(c.is_optional(Stage::MapMetadata));
    EXPECT_FALSE(c.is_optional(Stage::TransferData));
    EXPECT_EQ(c.mapping().on_error, MappingErrorPolicy::Remediate);
    EXPECT_EQ(c.mapping().max_attempts, 2);
    EXPECT_EQ(c.picker().mode, PickerMode::Headless);
    EXPECT_EQ(c.picker().defaults.at("confirm_transfer"), "yes");
    EXPECT_TRUE(c.logging().debug);
}

TEST(ConfigParse, DefaultsForEmptyDocument) {
    auto r = Config::parse("{}", "/srv/rig");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_FALSE(c.rig().id.empty());
    EXPECT_EQ(c.repository().path, "/srv/rig");
    EXPECT_EQ(c.repository().policy, GitPolicy::Strict);
    EXPECT_EQ(c.transfer().workers, 4);
    EXPECT_EQ(c.transfer().fingerprint, FingerprintMethod::Sha256);
    EXPECT_EQ(c.transfer().notify, "none");
    EXPECT_EQ(c.retry().max_attempts, 5);
    EXPECT_EQ(c.picker().mode, PickerMode::Interactive);
    EXPECT_TRUE(c.optional_stages().empty());
}

TEST(ConfigParse, WatchdogExecutableOnPathStaysBare) {
    auto r = Config::parse("transfer:\n  watchdog:\n    executable: watchdogd\n"
                           "    process_name: wd\n", "/srv/rig");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.transfer().watchdog.executable, "watchdogd");
    EXPECT_EQ(r.value.transfer().watchdog.process_name, "wd");
    EXPECT_EQ(r.value.transfer().watchdog.start_wait_ms, 3000);
}

TEST(ConfigParse, ClampsOutOfRangeValues) {
    auto r = Config::parse(R"(
transfer:
  workers: 1000
retry:
  max_attempts: 0
  base_backoff_ms: 200
  max_backoff_ms: 50
  jitter_min_ms: 30
  jitter_max_ms: 10
)", "/srv/rig");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.transfer().workers, 64);
    EXPECT_EQ(r.value.retry().max_attempts, 1);
    EXPECT_EQ(r.value.retry().max_backoff_ms, 200);
    EXPECT_EQ(r.value.retry().jitter_max_ms, 30);
}

TEST(ConfigParse, RejectsUnknownEnumValues) {
    auto policy = Config::parse("repository:\n  policy: lenient\n");
    ASSERT_TRUE(policy.is_err());
    EXPECT_NE(policy.error.find("lenient"), std::string::npos);

    EXPECT_TRUE(Config::parse("transfer:\n  fingerprint: crc32\n").is_err());
    EXPECT_TRUE(Config::parse("mapping:\n  on_error: ignore\n").is_err());
    EXPECT_TRUE(Config::parse("picker:\n  mode: auto\n").is_err());
}

TEST(ConfigParse, RejectsNonOptionalStages) {
    auto init = Config::parse("stages:\n  optional: [init]\n");
    ASSERT_TRUE(init.is_err());
    EXPECT_NE(init.error.find("init"), std::string::npos);

    EXPECT_TRUE(Config::parse("stages:\n  optional: [done]\n").is_err());
    EXPECT_TRUE(Config::parse("stages:\n  optional: [cleanup]\n").is_err());
}

TEST(ConfigParse, MalformedYamlIsError) {
    auto r = Config::parse("task: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST(ConfigNames, PolicyAndFingerprintNames) {
    EXPECT_EQ(git_policy_name(GitPolicy::VersionOnly), "version-only");
    EXPECT_EQ(git_policy_from_name("version_only").value_or(GitPolicy::Strict), GitPolicy::VersionOnly);
    EXPECT_EQ(fingerprint_method_name(FingerprintMethod::SizeMtime), "size_mtime");
    EXPECT_FALSE(fingerprint_method_from_name("sha1").has_value());
}

TEST(ConfigOverrides, HeadlessAndDebug) {
    auto r = Config::parse("{}", "/srv/rig");
    ASSERT_TRUE(r.is_ok());
    Config c = r.value;
    c.force_headless();
    c.enable_debug();
    EXPECT_EQ(c.picker().mode, PickerMode::Headless);
    EXPECT_TRUE(c.logging().debug);
}

// ── Files: global rig config overlaid with the project file ─────

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path home;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "expctl_config_test";
        fs::remove_all(test_dir);
        home = test_dir / "home";
        fs::create_directories(home);

        const char* h = std::getenv("HOME");
        saved_home = h ? h : "";
        setenv("HOME", home.c_str(), 1);
    }

    void TearDown() override {
        if (saved_home.empty()) {
            unsetenv("HOME");
        } else {
            setenv("HOME", saved_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }
};

TEST_F(ConfigFileTest, GlobalPathUnderHome) {
    EXPECT_EQ(get_global_config_dir(), home / ".expctl");
    EXPECT_EQ(get_global_config_path(), home / ".expctl" / "config.yaml");
    EXPECT_FALSE(global_config_exists());
}

TEST_F(ConfigFileTest, ProjectOverridesGlobal) {
    write(get_global_config_path(),
          "rig:\n  id: rig-1\n  data_root: ~/data\n"
          "transfer:\n  destination: /mnt/a\n  workers: 2\n");
    write(test_dir / "proj" / "expctl.yaml",
          "transfer:\n  destination: /mnt/b\n"
          "task:\n  command: ./task.sh\n");

    auto r = Config::load(test_dir / "proj" / "expctl.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.rig().id, "rig-1");
    EXPECT_EQ(c.rig().data_root, (home / "data").string());
    EXPECT_EQ(c.transfer().destination, "/mnt/b");
    EXPECT_EQ(c.transfer().workers, 2);
    EXPECT_EQ(c.task().command, "./task.sh");
    EXPECT_EQ(c.base_dir(), test_dir / "proj");
    EXPECT_EQ(c.repository().path, (test_dir / "proj").string());
}

TEST_F(ConfigFileTest, ExplicitMissingFileIsError) {
    auto r = Config::load(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("nope.yaml"), std::string::npos);
}

TEST_F(ConfigFileTest, BrokenGlobalIsError) {
    write(get_global_config_path(), "rig: [broken\n");
    write(test_dir / "expctl.yaml", "task:\n  command: x\n");
    auto r = Config::load(test_dir / "expctl.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigFileTest, DefaultTemplateParses) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    ASSERT_TRUE(global_config_exists());

    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.rig().data_root, (home / "data").string());
    EXPECT_EQ(r.value.transfer().notify, "none");
    EXPECT_EQ(r.value.retry().max_attempts, 5);

    // A second call leaves the operator's edits alone
    write(get_global_config_path(), "rig:\n  id: edited\n");
    ASSERT_TRUE(create_default_global_config().is_ok());
    auto again = Config::load_global();
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.rig().id, "edited");
}
