#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Raw task output flattened to dotted keys ("rig.camera.fps" -> "30").
using RawOutput = std::map<std::string, std::string>;

// Run provenance copied into every record.
struct MappingContext {
    std::string session_id;
    std::string rig_id;
    std::string commit;
    std::string branch;
    bool repo_dirty = false;
    std::string version;
};

struct SchemaRecord {
    std::string schema;
    std::string schema_version;
    std::vector<std::pair<std::string, std::string>> fields;    // ordered
    std::string mapped_at;

    std::optional<std::string> field(const std::string& name) const;
};

// Equal in everything but mapped_at.
bool same_content(const SchemaRecord& a, const SchemaRecord& b);

using FieldValidator = std::function<std::optional<std::string>(const std::string&)>;

struct FieldSpec {
    std::string name;
    FieldValidator validator;       // nullptr accepts any non-empty value
};

// Supplies the target schema: its identity, required fields and rules.
class SchemaMapper {
public:
    virtual ~SchemaMapper() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual std::vector<FieldSpec> required_fields() const = 0;

    // Rules spanning several fields; only run once every field is valid.
    virtual std::vector<std::string> check_record(const RawOutput& raw) const {
        (void)raw;
        return {};
    }
};

// Behavior session record: subject, experimenter, task and its time span.
class SessionSchemaMapper : public SchemaMapper {
public:
    std::string name() const override { return "behavior_session"; }
    std::string version() const override { return "1.0.0"; }
    std::vector<FieldSpec> required_fields() const override;
    std::vector<std::string> check_record(const RawOutput& raw) const override;
};

class DataMapper {
public:
    explicit DataMapper(std::shared_ptr<const SchemaMapper> schema);

    // Required fields first (schema order), then provenance, then any extra
    // raw keys under "task.". The error names every missing or invalid field.
    Result<SchemaRecord> map(const RawOutput& raw, const MappingContext& ctx) const;

    const SchemaMapper& schema() const { return *schema_; }

private:
    std::shared_ptr<const SchemaMapper> schema_;
};

// Read the task's YAML output and flatten nested maps and sequences.
Result<RawOutput> load_raw_output(const fs::path& path);
