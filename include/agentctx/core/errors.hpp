#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace agentctx::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    InternalError = 4,
    InvalidState = 5,

    // Input validation errors (100-199)
    InvalidToolResult = 100,
    InvalidTurnSequence = 101,

    // Compaction errors and warnings (200-299)
    InsufficientData = 200,
    AnchorDetectionInconclusive = 201,
    SelectionUnableToFit = 202,
    LowCompressionRatio = 203,
    CompactionInProgress = 204,
    CompactionFailed = 205,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileWriteFailed = 700,
    DirectoryNotFound = 701,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::InvalidToolResult: return "Tool result references an unknown tool call";
        case ErrorCode::InvalidTurnSequence: return "Turn indices are not strictly increasing";

        case ErrorCode::InsufficientData: return "No turns available to compact";
        case ErrorCode::AnchorDetectionInconclusive: return "No natural anchor found";
        case ErrorCode::SelectionUnableToFit: return "Retained turns exceed the token budget";
        case ErrorCode::LowCompressionRatio: return "Compaction was not effective";
        case ErrorCode::CompactionInProgress: return "Compaction already in progress";
        case ErrorCode::CompactionFailed: return "Compaction failed";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileWriteFailed: return "Failed to write file";
        case ErrorCode::DirectoryNotFound: return "Directory not found";
    }
    return "Unknown error code";
}

// Warnings are attached to a result; the operation still produced output
inline bool is_warning(ErrorCode code) {
    switch (code) {
        case ErrorCode::InsufficientData:
        case ErrorCode::AnchorDetectionInconclusive:
        case ErrorCode::SelectionUnableToFit:
        case ErrorCode::LowCompressionRatio:
            return true;
        default:
            return false;
    }
}

// Input that must be rejected before compaction starts
inline bool is_invalid_input(ErrorCode code) {
    return code == ErrorCode::InvalidToolResult || code == ErrorCode::InvalidTurnSequence;
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (turn index, tool call id, path)
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_code(ErrorCode code) {
        return Error{code};
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_warning() const { return agentctx::core::is_warning(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace agentctx::core
