#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure classes surfaced to the shell. The shell turns each into a message.
enum class ErrorKind {
    NONE,
    PATTERN_SYNTAX,          // bad ignore expression
    ALREADY_EXISTS,          // template name collision
    NOT_FOUND,               // unknown template or missing source
    IO_FAILURE,              // filesystem operation failed (path attached)
    DESTINATION_NOT_EMPTY,   // target holds content and overwrite was not requested
    REGISTRY_CORRUPT,        // registry metadata unreadable or malformed
    INVALID_NAME,
    SYMLINK_CYCLE,
    CANCELLED,
    CONFIG,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;
    std::string path;        // offending path, if any

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::NONE, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err,
                         const std::string& path = "") {
        return {false, T{}, err, kind, path};
    }

    // Re-wrap the failure of another result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.path};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;
    std::string path;

    static Result<void> Ok() {
        return {true, "", ErrorKind::NONE, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err,
                            const std::string& path = "") {
        return {false, err, kind, path};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind, other.path};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How the copier treats symbolic links
enum class SymlinkPolicy {
    COPY,     // recreate the link itself
    FOLLOW,   // copy what it points at (cycles are detected)
    SKIP,
};

// Counters reported by a copy
struct CopyStats {
    int64_t files_copied = 0;
    int64_t bytes_copied = 0;
    int64_t dirs_created = 0;
    int64_t symlinks_copied = 0;
    int64_t entries_skipped = 0;   // excluded entries; a pruned subtree counts once
};

struct Template {
    std::string name;
    std::string description;
    std::string storage_path;      // absolute path of the captured copy
    std::string source_path;       // directory captured from
    std::string created_at;        // ISO timestamp
    std::vector<std::string> ignore;   // patterns applied at capture time
};

// One entry of a template's stored tree
struct TreeEntry {
    std::string path;              // relative, '/'-separated
    enum Kind { FILE, DIRECTORY, SYMLINK } kind = FILE;
    int depth = 0;
    int64_t size = 0;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Returns true when the running operation should stop
using CancelCheck = std::function<bool()>;
