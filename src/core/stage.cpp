#include "stage.hpp"
#include <array>
#include <utility>

static const std::array<std::pair<Stage, const char*>, 9> STAGE_NAMES = {{
    {Stage::Init, "init"},
    {Stage::ValidateEnv, "validate_env"},
    {Stage::RunTask, "run_task"},
    {Stage::MapMetadata, "map_metadata"},
    {Stage::TransferData, "transfer_data"},
    {Stage::Done, "done"},
    {Stage::Failed, "failed"},
    {Stage::Aborted, "aborted"},
    {Stage::Partial, "partial"},
}};

std::string stage_name(Stage s) {
    for (const auto& [stage, name] : STAGE_NAMES) {
        if (stage == s) return name;
    }
    return "unknown";
}

std::optional<Stage> stage_from_name(const std::string& name) {
    for (const auto& [stage, n] : STAGE_NAMES) {
        if (name == n) return stage;
    }
    return std::nullopt;
}

int stage_rank(Stage s) {
    switch (s) {
        case Stage::Init:         return 0;
        case Stage::ValidateEnv:  return 1;
        case Stage::RunTask:      return 2;
        case Stage::MapMetadata:  return 3;
        case Stage::TransferData: return 4;
        case Stage::Done:
        case Stage::Failed:
        case Stage::Aborted:
        case Stage::Partial:      return 5;
    }
    return 5;
}

bool is_terminal(Stage s) {
    return s == Stage::Done || s == Stage::Failed ||
           s == Stage::Aborted || s == Stage::Partial;
}

bool can_transition(Stage from, Stage to) {
    if (is_terminal(from)) return false;
    if (is_terminal(to)) {
        // DONE is only reachable once the whole pipeline has run
        return to != Stage::Done || from == Stage::TransferData;
    }
    return stage_rank(to) >= stage_rank(from);
}
