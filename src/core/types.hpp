#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

// Error taxonomy shared by every engine operation
enum class ErrorKind {
    None,
    InvalidInput,       // bad paths, missing source, bad config values
    InvalidState,       // operation not valid for the job's current status
    IoFailure,          // transient read/write failure, retriable
    IntegrityMismatch,  // digest mismatch after copy, retriable
    Unimplemented,      // e.g. compressed archives
    NotFound,           // unknown job id where existence is required
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap the error of another result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct TransferConfig {
    int max_concurrent_copies = 4;
    std::size_t chunk_size_bytes = 4 * 1024 * 1024;
    int max_attempts = 3;
    int base_delay_ms = 10;
    int workers = 4;
};

struct ProgressConfig {
    int queue_capacity = 256;
};

struct PathsConfig {
    std::string data_dir;       // history logs, project status, job logs
    std::string debug_log;      // "" keeps the default under the temp dir
};

struct HistoryConfig {
    int max_entries = 100;
};
