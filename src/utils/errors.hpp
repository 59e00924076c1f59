#pragma once

#include <string>

namespace runbox {

enum class ErrorKind {
    kValidation,
    kRuntimeCreation,
    kStaging,
    kDispatch,
    kNotFound,
    kReclaim
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidation: return "ValidationError";
        case ErrorKind::kRuntimeCreation: return "RuntimeCreationError";
        case ErrorKind::kStaging: return "StagingError";
        case ErrorKind::kDispatch: return "DispatchError";
        case ErrorKind::kNotFound: return "NotFoundError";
        case ErrorKind::kReclaim: return "ReclaimError";
    }
    return "UnknownError";
}

struct Error {
    ErrorKind kind = ErrorKind::kDispatch;
    std::string message;
};

}  // namespace runbox
