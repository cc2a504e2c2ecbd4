#include <gtest/gtest.h>
#include <managers/task_supervisor.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

class TaskSupervisorTest : public ::testing::Test {
protected:
    fs::path dir;
    ProcessTaskRunner runner;
    AbortToken abort;

    void SetUp() override {
        dir = fs::temp_directory_path() / "expctl_task_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    TaskSpec shell(const std::string& script) {
        TaskSpec spec;
        spec.command = "sh";
        spec.args = {"-c", script};
        spec.working_dir = dir;
        spec.log_path = dir / ".expctl" / "task.log";
        spec.poll_interval_ms = 50;
        return spec;
    }

    std::string log_text() {
        std::ifstream f(dir / ".expctl" / "task.log");
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

TEST_F(TaskSupervisorTest, SuccessfulTaskWritesLog) {
    auto out = runner.run(shell("echo trial 1 done; touch output.yaml"), abort);
    EXPECT_TRUE(out.success()) << out.error;
    EXPECT_TRUE(out.error.empty());
    EXPECT_NE(log_text().find("trial 1 done"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir / "output.yaml"));
}

TEST_F(TaskSupervisorTest, NonZeroExitIsFailure) {
    auto out = runner.run(shell("echo partial > partial.csv; exit 4"), abort);
    EXPECT_FALSE(out.success());
    EXPECT_TRUE(out.spawned);
    EXPECT_EQ(out.status.code, 4);
    EXPECT_NE(out.error.find("code 4"), std::string::npos);
    // Partial output stays on disk
    EXPECT_TRUE(fs::exists(dir / "partial.csv"));
}

TEST_F(TaskSupervisorTest, MissingProgram) {
    TaskSpec spec;
    spec.command = "expctl-no-such-task";
    spec.working_dir = dir;
    spec.log_path = dir / ".expctl" / "task.log";
    spec.poll_interval_ms = 50;

    auto out = runner.run(spec, abort);
    EXPECT_FALSE(out.success());
    EXPECT_NE(out.error.find("could not be executed"), std::string::npos);
}

TEST_F(TaskSupervisorTest, EmptyCommand) {
    TaskSpec spec;
    auto out = runner.run(spec, abort);
    EXPECT_FALSE(out.spawned);
    EXPECT_FALSE(out.error.empty());
}

TEST_F(TaskSupervisorTest, TimeoutTerminatesTask) {
    auto spec = shell("sleep 30");
    spec.timeout_secs = 1;

    auto start = std::chrono::steady_clock::now();
    auto out = runner.run(spec, abort);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(out.timed_out);
    EXPECT_FALSE(out.success());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(TaskSupervisorTest, AbortTerminatesTask) {
    std::thread trigger([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        abort.request("free_disk_local below threshold");
    });

    auto out = runner.run(shell("sleep 30"), abort);
    trigger.join();

    EXPECT_TRUE(out.aborted);
    EXPECT_FALSE(out.success());
    EXPECT_FALSE(out.status.exited);
    EXPECT_NE(out.error.find("free_disk_local"), std::string::npos);
}

TEST(TaskArgs, PlaceholdersSubstituted) {
    TaskVariables vars{"/data/m1/m1_20250301T090000", "m1", "m1_20250301T090000", "rig-2"};
    auto args = substitute_task_args(
        {"--out={session_dir}/raw", "--subject", "{subject}", "{rig_id}:{session_id}", "{other}"},
        vars);

    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], "--out=/data/m1/m1_20250301T090000/raw");
    EXPECT_EQ(args[2], "m1");
    EXPECT_EQ(args[3], "rig-2:m1_20250301T090000");
    EXPECT_EQ(args[4], "{other}");
}

TEST(TaskArgs, SpecFromConfig) {
    TaskConfig tc;
    tc.command = "python3";
    tc.args = {"task.py", "{subject}"};
    tc.timeout_secs = 600;

    auto spec = make_task_spec(tc, "/data/m1/s1", TaskVariables{"/data/m1/s1", "m1", "s1", "rig"});
    EXPECT_EQ(spec.command, "python3");
    EXPECT_EQ(spec.args[1], "m1");
    EXPECT_EQ(spec.working_dir, fs::path("/data/m1/s1"));
    EXPECT_EQ(spec.log_path, fs::path("/data/m1/s1/.expctl/task.log"));
    EXPECT_EQ(spec.timeout_secs, 600);
}
