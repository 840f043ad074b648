#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "ignore_matcher.hpp"

namespace fs = std::filesystem;

struct CopyOptions {
    // Allow a non-empty destination; colliding files are replaced.
    bool overwrite = false;

    // Create directories whose every child was excluded. Directories that are
    // empty in the source are always reproduced.
    bool keep_filtered_empty_dirs = false;

    SymlinkPolicy symlinks = SymlinkPolicy::COPY;

    // Name of per-directory ignore files honoured during the walk ("" = none).
    std::string ignore_file;

    // Checked between entries; returning true stops the copy with CANCELLED.
    CancelCheck cancel;

    // Called with the relative path of every file or link written.
    StatusCallback progress;

    // Directories never walked into, even when they lie inside the source.
    // The destination itself is always skipped.
    std::vector<fs::path> skip_paths;
};

// Depth-first copy of a directory tree through an IgnoreMatcher.
//
// Excluded directories are never descended into. The first failure aborts the
// copy with the offending path; whatever was already written to the
// destination stays there. Callers that need a clean destination on failure
// remove it themselves.
class TreeCopier {
public:
    explicit TreeCopier(CopyOptions options = CopyOptions());

    Result<CopyStats> copy(const fs::path& source_root,
                           const fs::path& dest_root,
                           const IgnoreMatcher& matcher = IgnoreMatcher()) const;

    const CopyOptions& options() const { return options_; }

private:
    struct Walk {
        fs::path source_root;
        fs::path dest_root;
        std::vector<std::string> skip_rels;    // skipped paths relative to source_root
        std::vector<IgnoreMatcher> matchers;
        std::vector<fs::path> dir_stack;       // canonical directories being walked (FOLLOW)
        CopyStats stats;
    };

    Result<bool> copy_dir(Walk& walk, const fs::path& src_dir,
                          const std::string& rel_dir, const fs::path& dst_dir) const;
    Result<bool> copy_entries(Walk& walk, const fs::path& src_dir,
                              const std::string& rel_dir, const fs::path& dst_dir) const;
    Result<void> load_ignore_file(Walk& walk, const fs::path& src_dir,
                                  const std::string& rel_dir, bool& pushed) const;
    Result<void> ensure_dir(Walk& walk, const fs::path& dir) const;
    bool is_excluded(const Walk& walk, const std::string& rel, bool is_dir) const;

    CopyOptions options_;
};

// Give the owner full access to `root` and every directory below it. Captured
// trees keep their source modes, so read-only directories must be opened up
// before their contents can be deleted.
void make_removable(const fs::path& root, std::error_code& ec);

// fs::remove_all that also deletes trees containing read-only directories.
// A missing `path` is not an error.
void remove_tree(const fs::path& path, std::error_code& ec);
