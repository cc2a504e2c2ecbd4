#include <gtest/gtest.h>
#include <managers/data_mapper.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

class DataMapperTest : public ::testing::Test {
protected:
    DataMapper mapper{std::make_shared<SessionSchemaMapper>()};
    RawOutput raw;
    MappingContext ctx;

    void SetUp() override {
        raw = {
            {"subject_id", "mouse-02"},
            {"experimenter", "alice"},
            {"task_name", "foraging"},
            {"session_start", "2025-03-01T09:00:00"},
            {"session_end", "2025-03-01T09:45:00"},
            {"trials.completed", "212"},
        };
        ctx.session_id = "mouse-02_20250301T090000";
        ctx.rig_id = "rig-7";
        ctx.commit = "0123abcd";
        ctx.branch = "main";
        ctx.repo_dirty = true;
        ctx.version = "v1.4.0";
    }
};

TEST_F(DataMapperTest, MapsRequiredProvenanceAndExtras) {
    auto r = mapper.map(raw, ctx);
    ASSERT_TRUE(r.is_ok()) << r.error;

    const auto& rec = r.value;
    EXPECT_EQ(rec.schema, "behavior_session");
    EXPECT_EQ(rec.schema_version, "1.0.0");
    EXPECT_FALSE(rec.mapped_at.empty());
    ASSERT_FALSE(rec.fields.empty());
    EXPECT_EQ(rec.fields.front().first, "subject_id");
    EXPECT_EQ(rec.field("experimenter").value_or(""), "alice");
    EXPECT_EQ(rec.field("rig_id").value_or(""), "rig-7");
    EXPECT_EQ(rec.field("repo_dirty").value_or(""), "true");
    EXPECT_EQ(rec.field("task.trials.completed").value_or(""), "212");
    EXPECT_FALSE(rec.field("trials.completed").has_value());
}

TEST_F(DataMapperTest, IdempotentExceptTimestamp) {
    auto first = mapper.map(raw, ctx);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    auto second = mapper.map(raw, ctx);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_TRUE(same_content(first.value, second.value));
    EXPECT_NE(first.value.mapped_at, second.value.mapped_at);
}

TEST_F(DataMapperTest, NamesEveryMissingField) {
    raw.erase("experimenter");
    raw.erase("task_name");

    auto r = mapper.map(raw, ctx);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("'experimenter'"), std::string::npos);
    EXPECT_NE(r.error.find("'task_name'"), std::string::npos);
    EXPECT_EQ(r.error.find("'subject_id'"), std::string::npos);
}

TEST_F(DataMapperTest, RejectsMalformedTimestamp) {
    raw["session_start"] = "yesterday";

    auto r = mapper.map(raw, ctx);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("invalid field 'session_start'"), std::string::npos);
}

TEST_F(DataMapperTest, RejectsEndBeforeStart) {
    raw["session_end"] = "2025-03-01T08:00:00";

    auto r = mapper.map(raw, ctx);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("session_end"), std::string::npos);
}

TEST_F(DataMapperTest, EmptyValueCountsAsMissing) {
    raw["subject_id"] = "";
    auto r = mapper.map(raw, ctx);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("missing field 'subject_id'"), std::string::npos);
}

class RawOutputTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "expctl_raw_output_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(RawOutputTest, FlattensNestedDocument) {
    std::ofstream(test_dir / "out.yaml") <<
        "subject_id: mouse-02\n"
        "rig:\n"
        "  camera:\n"
        "    fps: 30\n"
        "rewards: [1, 0, 1]\n"
        "notes: ~\n";

    auto r = load_raw_output(test_dir / "out.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.at("subject_id"), "mouse-02");
    EXPECT_EQ(r.value.at("rig.camera.fps"), "30");
    EXPECT_EQ(r.value.at("rewards.1"), "0");
    EXPECT_EQ(r.value.at("notes"), "");
}

TEST_F(RawOutputTest, MissingFile) {
    auto r = load_raw_output(test_dir / "absent.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(RawOutputTest, RejectsNonMapDocument) {
    std::ofstream(test_dir / "list.yaml") << "- a\n- b\n";
    EXPECT_TRUE(load_raw_output(test_dir / "list.yaml").is_err());
}

TEST_F(RawOutputTest, RejectsBrokenYaml) {
    std::ofstream(test_dir / "bad.yaml") << "key: [unclosed\n";
    EXPECT_TRUE(load_raw_output(test_dir / "bad.yaml").is_err());
}
