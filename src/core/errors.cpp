#include "errors.hpp"

std::string error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation:        return "validation";
        case ErrorKind::Task:              return "task";
        case ErrorKind::Mapping:           return "mapping";
        case ErrorKind::TransferTransient: return "transfer_transient";
        case ErrorKind::TransferPermanent: return "transfer_permanent";
        case ErrorKind::Abort:             return "abort";
        case ErrorKind::Picker:            return "picker";
    }
    return "unknown";
}

std::optional<ErrorKind> error_kind_from_name(const std::string& name) {
    for (auto k : {ErrorKind::Validation, ErrorKind::Task, ErrorKind::Mapping,
                   ErrorKind::TransferTransient, ErrorKind::TransferPermanent,
                   ErrorKind::Abort, ErrorKind::Picker}) {
        if (error_kind_name(k) == name) return k;
    }
    return std::nullopt;
}
