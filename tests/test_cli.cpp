#include <gtest/gtest.h>
#include <cli/expctl_cli.hpp>
#include <core/constants.hpp>
#include <managers/ledger.hpp>
#include <managers/manifest.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    AbortToken abort;
    std::istringstream in;
    std::ostringstream out;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "expctl_cli_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "home");

        const char* h = std::getenv("HOME");
        saved_home = h ? h : "";
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (saved_home.empty()) {
            unsetenv("HOME");
        } else {
            setenv("HOME", saved_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }

    fs::path write_session(Stage status, bool reached_transfer) {
        fs::path dir = test_dir / "mouse-07" / "mouse-07_20250302T141500";
        fs::create_directories(dir);

        Manifest m;
        auto& s = m.session;
        s.id = "mouse-07_20250302T141500";
        s.subject = "mouse-07";
        s.operator_name = "alice";
        s.rig_id = "rig-3";
        s.start_time = "2025-03-02T14:15:00";
        s.end_time = "2025-03-02T14:45:30";
        s.session_dir = dir.string();
        s.stage = status;
        s.status = status;
        s.history.push_back({Stage::Init, OUTCOME_OK, "2025-03-02T14:15:00", ""});
        s.history.push_back({Stage::ValidateEnv, OUTCOME_OK, "2025-03-02T14:15:01", ""});
        s.history.push_back({Stage::RunTask, OUTCOME_OK, "2025-03-02T14:15:02", ""});
        if (reached_transfer) {
            s.history.push_back({Stage::TransferData, OUTCOME_FAILED, "2025-03-02T14:45:00",
                                 "1 of 2 file(s) not confirmed"});
        }
        s.history.push_back({status, OUTCOME_FINAL, "2025-03-02T14:45:30", ""});

        StageError e;
        e.stage = Stage::TransferData;
        e.kind = ErrorKind::TransferPermanent;
        e.timestamp = "2025-03-02T14:45:00";
        e.cause = "No space left on device";
        e.entity = "video/cam0.avi";
        m.errors.push_back(e);

        EXPECT_TRUE(ManifestStore(dir).save(m).is_ok());
        return dir;
    }

    void write_ledger(const fs::path& dir) {
        Ledger l;
        l.session_id = "mouse-07_20250302T141500";
        l.source_root = dir.string();
        l.destination_root = (test_dir / "server" / "mouse-07").string();

        TransferJob a;
        a.relative_path = "behavior/trials.csv";
        a.state = JobState::Confirmed;
        a.attempts = 1;
        TransferJob b;
        b.relative_path = "video/cam0.avi";
        b.state = JobState::Failed;
        b.attempts = 5;
        b.last_error = "No space left on device";
        l.jobs = {a, b};

        EXPECT_TRUE(LedgerStore(dir).save(l).is_ok());
    }
};

TEST_F(CliTest, UnknownCommand) {
    ExpctlCLI cli(abort, in, out);
    EXPECT_FALSE(cli.has_command("connect"));
    EXPECT_EQ(cli.execute("connect", {}), EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out.str().find("Unknown command: connect"), std::string::npos);
}

TEST_F(CliTest, HelpListsEveryCommand) {
    ExpctlCLI cli(abort, in, out);
    cli.print_help();
    for (const char* cmd : {"run", "resume", "status", "check", "setup"}) {
        EXPECT_TRUE(cli.has_command(cmd)) << cmd;
        EXPECT_NE(out.str().find(std::string("expctl ") + cmd), std::string::npos) << cmd;
    }
    EXPECT_NE(out.str().find("130"), std::string::npos);
}

TEST_F(CliTest, RunRejectsUnknownOption) {
    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("run", {"--fast"}), EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out.str().find("Unknown option: --fast"), std::string::npos);
}

TEST_F(CliTest, RunWithoutConfigFails) {
    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("run", {"--config", (test_dir / "missing.yaml").string()}),
              EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out.str().find("missing.yaml"), std::string::npos);

    std::ostringstream out2;
    ExpctlCLI cli2(abort, in, out2);
    EXPECT_EQ(cli2.execute("run", {"--config"}), EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out2.str().find("needs a file argument"), std::string::npos);
}

TEST_F(CliTest, StatusShowsHistoryErrorsAndLedger) {
    auto dir = write_session(Stage::Partial, true);
    write_ledger(dir);

    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("status", {dir.string()}), EXIT_OK);

    const auto text = out.str();
    EXPECT_NE(text.find("mouse-07_20250302T141500"), std::string::npos);
    EXPECT_NE(text.find("alice"), std::string::npos);
    EXPECT_NE(text.find("validate_env"), std::string::npos);
    EXPECT_NE(text.find("transfer_data"), std::string::npos);
    EXPECT_NE(text.find("partial"), std::string::npos);
    EXPECT_NE(text.find("transfer_permanent"), std::string::npos);
    EXPECT_NE(text.find("1 confirmed / 2 total"), std::string::npos);
    EXPECT_NE(text.find("video/cam0.avi (5 attempts)"), std::string::npos);
}

TEST_F(CliTest, StatusWithoutManifestFails) {
    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("status", {(test_dir / "nowhere").string()}), EXIT_VALIDATION_FAILURE);
    EXPECT_EQ(cli.execute("status", {}), EXIT_VALIDATION_FAILURE);
}

TEST_F(CliTest, ResumeRefusesSessionThatFailedEarly) {
    auto dir = write_session(Stage::Failed, false);
    auto config = test_dir / "expctl.yaml";
    std::ofstream(config) << "transfer:\n  destination: " << (test_dir / "server").string() << "\n";

    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("resume", {dir.string(), "--config", config.string()}),
              EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out.str().find("before its data could be transferred"), std::string::npos);

    // History is untouched
    auto m = ManifestStore(dir).load();
    ASSERT_TRUE(m.is_ok());
    EXPECT_TRUE(m.value.recoveries.empty());
}

TEST_F(CliTest, ResumeRetriesLedgerAndRecordsRecovery) {
    auto dir = write_session(Stage::Partial, true);
    fs::create_directories(dir / "behavior");
    std::ofstream(dir / "behavior" / "trials.csv") << "trial,choice\n1,left\n";
    fs::create_directories(test_dir / "server");

    auto config = test_dir / "expctl.yaml";
    std::ofstream(config) << "transfer:\n  destination: " << (test_dir / "server").string() << "\n"
                          << "retry:\n  base_backoff_ms: 1\n  max_backoff_ms: 1\n  jitter_max_ms: 0\n";

    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("resume", {dir.string(), "--config", config.string()}), EXIT_OK)
        << out.str();
    EXPECT_TRUE(fs::exists(test_dir / "server" / "mouse-07" / "mouse-07_20250302T141500" /
                           "behavior" / "trials.csv"));

    auto m = ManifestStore(dir).load();
    ASSERT_TRUE(m.is_ok());
    ASSERT_EQ(m.value.recoveries.size(), 1u);
    EXPECT_EQ(m.value.recoveries[0].result, Stage::Done);
    EXPECT_EQ(m.value.session.status.value_or(Stage::Init), Stage::Partial);
}

TEST_F(CliTest, CheckReportsReadyConfiguration) {
    fs::create_directories(test_dir / "proj" / ".git");
    fs::create_directories(test_dir / "server");
    auto config = test_dir / "proj" / "expctl.yaml";
    std::ofstream(config) << "rig:\n  data_root: " << (test_dir / "data").string() << "\n"
                          << "task:\n  command: /bin/sh\n"
                          << "transfer:\n  destination: " << (test_dir / "server").string() << "\n";

    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("check", {"--config", config.string()}), EXIT_OK) << out.str();
    EXPECT_NE(out.str().find("Global config not found"), std::string::npos);
}

TEST_F(CliTest, CheckFailsOnBrokenConfiguration) {
    auto config = test_dir / "expctl.yaml";
    std::ofstream(config) << "task:\n  command: ./absent.sh\n";

    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("check", {"--config", config.string()}), EXIT_VALIDATION_FAILURE);
    EXPECT_NE(out.str().find("absent.sh"), std::string::npos);
    EXPECT_NE(out.str().find("transfer.destination"), std::string::npos);
}

TEST_F(CliTest, SetupWritesTemplateAndCredential) {
    in.str("Jane Operator\n");
    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("setup", {}), EXIT_OK) << out.str();

    EXPECT_TRUE(fs::exists(test_dir / "home" / ".expctl" / "config.yaml"));
    FileCredentialProvider store;
    auto user = store.get("user");
    ASSERT_TRUE(user.is_ok()) << user.error;
    EXPECT_EQ(user.value, "Jane Operator");
}

TEST_F(CliTest, SetupInterruptedAtPromptIsAbort) {
    // Input already closed, as after Ctrl-C at the prompt
    abort.request_from_signal();
    ExpctlCLI cli(abort, in, out);
    EXPECT_EQ(cli.execute("setup", {}), EXIT_ABORTED);
    EXPECT_NE(out.str().find("interrupted by operator"), std::string::npos);
}
