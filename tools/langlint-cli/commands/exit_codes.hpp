#pragma once

#include <langlint/result.hpp>

namespace langlint::cli {

// Standard exit codes for CLI commands
// Named with LANGLINT_ prefix to avoid conflict with system macros
constexpr int LANGLINT_EXIT_SUCCESS = 0;
constexpr int LANGLINT_EXIT_USER_ERROR = 1;     // Invalid arguments, unsupported file or language
constexpr int LANGLINT_EXIT_NOT_FOUND = 2;      // File or directory not found
constexpr int LANGLINT_EXIT_IO_ERROR = 3;       // File/network/translation errors
constexpr int LANGLINT_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return LANGLINT_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::UNSUPPORTED_FORMAT:
        case ErrorCode::UNSUPPORTED_LANGUAGE:
        case ErrorCode::INVALID_INPUT:
            return LANGLINT_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
            return LANGLINT_EXIT_NOT_FOUND;
        case ErrorCode::INTERNAL_ERROR:
            return LANGLINT_EXIT_INTERNAL;
        default:
            return LANGLINT_EXIT_IO_ERROR;
    }
}

}  // namespace langlint::cli
