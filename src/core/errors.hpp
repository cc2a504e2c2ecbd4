#pragma once

#include <string>
#include <stdexcept>
#include <optional>
#include "stage.hpp"

enum class ErrorKind {
    Validation,          // git or resource gate
    Task,                // supervised task crash, non-zero exit, timeout
    Mapping,             // schema validation failure
    TransferTransient,   // retried automatically
    TransferPermanent,   // surfaced immediately
    Abort,               // operator or resource-triggered abort
    Picker,              // no answer available for a decision point
};

std::string error_kind_name(ErrorKind k);
std::optional<ErrorKind> error_kind_from_name(const std::string& name);

// Structured error context written into the session manifest.
struct StageError {
    Stage stage = Stage::Init;
    ErrorKind kind = ErrorKind::Validation;
    std::string timestamp;
    std::string cause;
    std::string entity;     // file, metric, field or command the error concerns
};

// Thrown by a headless picker that has no configured answer.
class PickerError : public std::runtime_error {
public:
    PickerError(const std::string& decision, const std::string& msg)
        : std::runtime_error(msg), decision_(decision) {}

    const std::string& decision() const { return decision_; }

private:
    std::string decision_;
};
