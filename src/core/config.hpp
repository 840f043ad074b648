#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Settings applied when a directory is captured
struct CaptureSettings {
    std::vector<std::string> default_ignore;   // merged with per-capture patterns
    std::string ignore_file;                   // per-directory ignore file name ("" = none)
    bool keep_filtered_empty_dirs = false;
    SymlinkPolicy symlinks = SymlinkPolicy::COPY;
};

class Config {
public:
    // Load <root>/config.yaml. A missing file yields the defaults; a malformed
    // one is an error (ErrorKind::CONFIG).
    static Result<Config> load(const fs::path& root);

    // Load from the resolved root (see resolve_root()).

    // Built-in defaults rooted at `root`
    static Config defaults(const fs::path& root);

    // Accessors
    const fs::path& root() const { return root_; }
    const CaptureSettings& capture() const { return capture_; }

    fs::path registry_path() const;
    fs::path templates_dir() const;

public:
    Config() = default;

private:
    fs::path root_;
    CaptureSettings capture_;
};

// Root directory: $STENCIL_HOME if set, else <platform config dir>/stencil
fs::path resolve_root();

fs::path get_config_path(const fs::path& root);
bool config_exists(const fs::path& root);

// Write a commented default config.yaml unless one already exists
Result<void> create_default_config(const fs::path& root);

Result<SymlinkPolicy> parse_symlink_policy(const std::string& value);
std::string symlink_policy_name(SymlinkPolicy policy);
