#include "data_mapper.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <set>

std::optional<std::string> SchemaRecord::field(const std::string& name) const {
    for (const auto& [key, value] : fields) {
        if (key == name) return value;
    }
    return std::nullopt;
}

bool same_content(const SchemaRecord& a, const SchemaRecord& b) {
    return a.schema == b.schema &&
           a.schema_version == b.schema_version &&
           a.fields == b.fields;
}

// ── SessionSchemaMapper ─────────────────────────────────────

static std::optional<std::string> require_iso(const std::string& value) {
    if (is_iso_timestamp(value)) return std::nullopt;
    return fmt::format("'{}' is not an ISO 8601 timestamp", value);
}

std::vector<FieldSpec> SessionSchemaMapper::required_fields() const {
    return {
        {"subject_id", nullptr},
        {"experimenter", nullptr},
        {"task_name", nullptr},
        {"session_start", require_iso},
        {"session_end", require_iso},
    };
}

std::vector<std::string> SessionSchemaMapper::check_record(const RawOutput& raw) const {
    auto span = seconds_between(raw.at("session_start"), raw.at("session_end"));
    if (span && *span < 0) {
        return {"invalid field 'session_end': ends before session_start"};
    }
    return {};
}

// ── DataMapper ──────────────────────────────────────────────

DataMapper::DataMapper(std::shared_ptr<const SchemaMapper> schema)
    : schema_(std::move(schema)) {}

Result<SchemaRecord> DataMapper::map(const RawOutput& raw, const MappingContext& ctx) const {
    std::vector<std::string> problems;
    auto specs = schema_->required_fields();

    for (const auto& spec : specs) {
        auto it = raw.find(spec.name);
        if (it == raw.end() || it->second.empty()) {
            problems.push_back(fmt::format("missing field '{}'", spec.name));
            continue;
        }
        if (spec.validator) {
            if (auto why = spec.validator(it->second)) {
                problems.push_back(fmt::format("invalid field '{}': {}", spec.name, *why));
            }
        }
    }

    if (problems.empty()) {
        problems = schema_->check_record(raw);
    }

    if (!problems.empty()) {
        std::string msg = fmt::format("{} record rejected: {}", schema_->name(), problems.front());
        for (size_t i = 1; i < problems.size(); ++i) {
            msg += "; " + problems[i];
        }
        return Result<SchemaRecord>::Err(msg);
    }

    SchemaRecord record;
    record.schema = schema_->name();
    record.schema_version = schema_->version();

    std::set<std::string> taken;
    for (const auto& spec : specs) {
        record.fields.emplace_back(spec.name, raw.at(spec.name));
        taken.insert(spec.name);
    }

    record.fields.emplace_back("session_id", ctx.session_id);
    record.fields.emplace_back("rig_id", ctx.rig_id);
    record.fields.emplace_back("commit", ctx.commit);
    record.fields.emplace_back("branch", ctx.branch);
    record.fields.emplace_back("repo_dirty", ctx.repo_dirty ? "true" : "false");
    record.fields.emplace_back("version", ctx.version);

    for (const auto& [key, value] : raw) {
        if (taken.count(key)) continue;
        record.fields.emplace_back("task." + key, value);
    }

    record.mapped_at = now_iso();
    return Result<SchemaRecord>::Ok(record);
}

// ── Raw output loading ──────────────────────────────────────

static void flatten(const YAML::Node& node, const std::string& prefix, RawOutput& out) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& kv : node) {
                std::string key = kv.first.as<std::string>();
                flatten(kv.second, prefix.empty() ? key : prefix + "." + key, out);
            }
            break;
        case YAML::NodeType::Sequence:
            for (size_t i = 0; i < node.size(); ++i) {
                flatten(node[i], fmt::format("{}.{}", prefix, i), out);
            }
            break;
        case YAML::NodeType::Scalar:
            out[prefix] = node.Scalar();
            break;
        default:
            out[prefix] = "";
            break;
    }
}

Result<RawOutput> load_raw_output(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<RawOutput>::Err(fmt::format("task output not found: {}", path.string()));
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<RawOutput>::Err(
                fmt::format("task output {} is not a key/value document", path.string()));
        }
        RawOutput raw;
        flatten(root, "", raw);
        return Result<RawOutput>::Ok(raw);
    } catch (const YAML::Exception& e) {
        return Result<RawOutput>::Err(
            fmt::format("cannot parse task output {}: {}", path.string(), e.what()));
    }
}
