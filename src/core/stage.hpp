#pragma once

#include <string>
#include <optional>

// Pipeline stages in canonical order, followed by the terminal outcomes.
enum class Stage {
    Init,
    ValidateEnv,
    RunTask,
    MapMetadata,
    TransferData,
    Done,
    Failed,
    Aborted,
    Partial,
};

// "init", "validate_env", ... as written in config and manifest files.
std::string stage_name(Stage s);
std::optional<Stage> stage_from_name(const std::string& name);

// Position in the canonical order. Terminal failure states share the
// highest rank so any stage may jump to them.
int stage_rank(Stage s);

bool is_terminal(Stage s);

// Legal if `to` is terminal, or `to` is not behind `from` in canonical order.
bool can_transition(Stage from, Stage to);
