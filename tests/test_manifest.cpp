#include <gtest/gtest.h>
#include <managers/manifest.hpp>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

Manifest sample_manifest() {
    Manifest m;
    m.session.id = "m3_20250305T101500";
    m.session.start_time = "2025-03-05T10:15:00";
    m.session.operator_name = "akim";
    m.session.subject = "m3";
    m.session.rig_id = "rig-b";
    m.session.session_dir = "/data/m3/m3_20250305T101500";
    m.session.stage = Stage::TransferData;
    m.session.status = Stage::Partial;
    m.session.history = {
        {Stage::Init, OUTCOME_OK, "2025-03-05T10:15:00", ""},
        {Stage::ValidateEnv, OUTCOME_OK, "2025-03-05T10:15:01", ""},
        {Stage::RunTask, OUTCOME_OK, "2025-03-05T10:15:02", ""},
        {Stage::MapMetadata, OUTCOME_OK, "2025-03-05T10:45:00", ""},
        {Stage::TransferData, OUTCOME_FAILED, "2025-03-05T10:45:01", "1 of 3 file(s) failed"},
        {Stage::Partial, OUTCOME_FINAL, "2025-03-05T10:46:00", ""},
    };

    GitState g;
    g.is_repo = true;
    g.commit = "4f2a9c1";
    g.branch = "main";
    g.tag = "v2.1.0";
    g.dirty = true;
    g.policy = GitPolicy::Force;
    g.version_constraint = "^2.0";
    g.violations = {"working tree has uncommitted changes"};
    m.git = g;

    ResourceSnapshot snap;
    snap.timestamp = "2025-03-05T10:45:01";
    snap.checkpoint = Checkpoint::Transfer;
    snap.free_disk_local_mb = 51200;
    snap.free_disk_destination_mb = 800;
    snap.passed = false;
    snap.failing = {"free_disk_destination"};
    snap.details = {"free_disk_destination 800 MB < 1024 MB"};
    m.snapshots.push_back(snap);

    SchemaRecord rec;
    rec.schema = "behavior_session";
    rec.schema_version = "1.0.0";
    rec.mapped_at = "2025-03-05T10:45:00";
    rec.fields = {{"subject_id", "m3"}, {"experimenter", "akim"}, {"task.trials", "240"}};
    m.record = rec;

    StageError e;
    e.stage = Stage::TransferData;
    e.kind = ErrorKind::TransferPermanent;
    e.timestamp = "2025-03-05T10:46:00";
    e.cause = "permission denied";
    e.entity = "video/cam1.avi";
    m.errors.push_back(e);

    m.ledger_file = ".expctl/transfer_ledger.yaml";
    return m;
}

} // namespace

class ManifestTest : public ::testing::Test {
protected:
    fs::path session_dir;

    void SetUp() override {
        session_dir = fs::temp_directory_path() / "expctl_manifest_test";
        fs::remove_all(session_dir);
        fs::create_directories(session_dir);
    }

    void TearDown() override {
        fs::remove_all(session_dir);
    }
};

TEST_F(ManifestTest, SaveAndLoadEverySection) {
    ManifestStore store(session_dir);
    EXPECT_FALSE(store.exists());
    ASSERT_TRUE(store.save(sample_manifest()).is_ok());
    EXPECT_EQ(store.path(), session_dir / ".expctl" / "session_manifest.yaml");

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    const auto& m = loaded.value;

    EXPECT_EQ(m.session.id, "m3_20250305T101500");
    EXPECT_EQ(m.session.operator_name, "akim");
    ASSERT_TRUE(m.session.status.has_value());
    EXPECT_EQ(*m.session.status, Stage::Partial);
    ASSERT_EQ(m.session.history.size(), 6u);
    EXPECT_EQ(m.session.history[4].stage, Stage::TransferData);
    EXPECT_EQ(m.session.history[4].message, "1 of 3 file(s) failed");

    ASSERT_TRUE(m.git.has_value());
    EXPECT_TRUE(m.git->dirty);
    EXPECT_EQ(m.git->policy, GitPolicy::Force);
    ASSERT_EQ(m.git->violations.size(), 1u);

    ASSERT_EQ(m.snapshots.size(), 1u);
    EXPECT_EQ(m.snapshots[0].checkpoint, Checkpoint::Transfer);
    EXPECT_FALSE(m.snapshots[0].passed);
    EXPECT_EQ(m.snapshots[0].free_disk_destination_mb, 800);
    EXPECT_EQ(m.snapshots[0].failing[0], "free_disk_destination");

    ASSERT_TRUE(m.record.has_value());
    ASSERT_EQ(m.record->fields.size(), 3u);
    EXPECT_EQ(m.record->fields[2].first, "task.trials");
    EXPECT_EQ(m.record->fields[2].second, "240");

    ASSERT_EQ(m.errors.size(), 1u);
    EXPECT_EQ(m.errors[0].kind, ErrorKind::TransferPermanent);
    EXPECT_EQ(m.errors[0].entity, "video/cam1.avi");
    EXPECT_EQ(m.ledger_file, ".expctl/transfer_ledger.yaml");
}

TEST_F(ManifestTest, RecoveriesAppend) {
    ManifestStore store(session_dir);
    auto m = sample_manifest();
    ASSERT_TRUE(store.save(m).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    RecoveryRecord r;
    r.timestamp = "2025-03-06T08:00:00";
    r.result = Stage::Done;
    r.confirmed = 3;
    r.total = 3;
    r.notified = true;
    loaded.value.recoveries.push_back(r);
    ASSERT_TRUE(store.save(loaded.value).is_ok());

    auto again = store.load();
    ASSERT_TRUE(again.is_ok());
    ASSERT_EQ(again.value.recoveries.size(), 1u);
    EXPECT_EQ(again.value.recoveries[0].result, Stage::Done);
    EXPECT_TRUE(again.value.recoveries[0].notified);
    // Original history is untouched
    EXPECT_EQ(again.value.session.history.size(), 6u);
}

TEST_F(ManifestTest, MinimalManifestWithoutOptionalSections) {
    Manifest m;
    m.session.id = "s";
    auto parsed = manifest_from_yaml(manifest_to_yaml(m));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_FALSE(parsed.value.git.has_value());
    EXPECT_FALSE(parsed.value.record.has_value());
    EXPECT_FALSE(parsed.value.session.finished());
}

TEST_F(ManifestTest, LoadErrors) {
    ManifestStore store(session_dir);
    EXPECT_TRUE(store.load().is_err());
    EXPECT_TRUE(manifest_from_yaml("jobs: []\n").is_err());
    EXPECT_TRUE(manifest_from_yaml("session:\n  history:\n    - stage: warmup\n").is_err());
}
