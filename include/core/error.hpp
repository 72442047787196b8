#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace doubleblind {

/**
 * @brief Error codes for scrub failures
 */
enum class ErrorCode {
    NONE,
    UNKNOWN_CATEGORY,
    DUPLICATE_CATEGORY,
    TYPE_MISMATCH,
    SCHEMA_MISMATCH,
    SYNTHESIS_EXHAUSTED,
    MAX_DEPTH_EXCEEDED,
    CYCLIC_GRAPH,
    CANCELLED,
    SNAPSHOT_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                return "none";
        case ErrorCode::UNKNOWN_CATEGORY:    return "unknown_category";
        case ErrorCode::DUPLICATE_CATEGORY:  return "duplicate_category";
        case ErrorCode::TYPE_MISMATCH:       return "type_mismatch";
        case ErrorCode::SCHEMA_MISMATCH:     return "schema_mismatch";
        case ErrorCode::SYNTHESIS_EXHAUSTED: return "synthesis_exhausted";
        case ErrorCode::MAX_DEPTH_EXCEEDED:  return "max_depth_exceeded";
        case ErrorCode::CYCLIC_GRAPH:        return "cyclic_graph";
        case ErrorCode::CANCELLED:           return "cancelled";
        case ErrorCode::SNAPSHOT_ERROR:      return "snapshot_error";
        case ErrorCode::INTERNAL_ERROR:      return "internal_error";
    }
    return "internal_error";
}

// ============================================================================
// Exception taxonomy
// ============================================================================

/**
 * @brief Base of every error raised while scrubbing.
 *
 * A scrub call is all-or-nothing: any of these aborts the call and no
 * partial output is returned.
 */
class ScrubError : public std::runtime_error {
public:
    ScrubError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Category tag not registered
class UnknownCategoryError : public ScrubError {
public:
    explicit UnknownCategoryError(const std::string& message)
        : ScrubError(ErrorCode::UNKNOWN_CATEGORY, message) {}
};

/// Tag or alias registered twice
class DuplicateCategoryError : public ScrubError {
public:
    explicit DuplicateCategoryError(const std::string& message)
        : ScrubError(ErrorCode::DUPLICATE_CATEGORY, message) {}
};

/// Strategy output does not match its declared type
class TypeMismatchError : public ScrubError {
public:
    explicit TypeMismatchError(const std::string& message)
        : ScrubError(ErrorCode::TYPE_MISMATCH, message) {}
};

/// Value shape or type disagrees with the schema
class SchemaMismatchError : public ScrubError {
public:
    explicit SchemaMismatchError(const std::string& message)
        : ScrubError(ErrorCode::SCHEMA_MISMATCH, message) {}
};

/// No unused substitute within the retry budget
class SynthesisExhaustedError : public ScrubError {
public:
    explicit SynthesisExhaustedError(const std::string& message)
        : ScrubError(ErrorCode::SYNTHESIS_EXHAUSTED, message) {}
};

class MaxDepthExceededError : public ScrubError {
public:
    explicit MaxDepthExceededError(const std::string& message)
        : ScrubError(ErrorCode::MAX_DEPTH_EXCEEDED, message) {}
};

class CyclicGraphError : public ScrubError {
public:
    explicit CyclicGraphError(const std::string& message)
        : ScrubError(ErrorCode::CYCLIC_GRAPH, message) {}
};

/// Batch stopped through its stop token
class ScrubCancelledError : public ScrubError {
public:
    explicit ScrubCancelledError(const std::string& message)
        : ScrubError(ErrorCode::CANCELLED, message) {}
};

class SnapshotError : public ScrubError {
public:
    explicit SnapshotError(const std::string& message)
        : ScrubError(ErrorCode::SNAPSHOT_ERROR, message) {}
};

// ============================================================================
// Result type for non-throwing entry points
// ============================================================================

template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace doubleblind
