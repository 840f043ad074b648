#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>
#include "tree_copier.hpp"

namespace fs = std::filesystem;

struct RegistryConfig {
    fs::path root;          // owns <root>/registry and <root>/templates/
    CopyOptions capture;    // applied to captures; cancel/progress also reach instantiate
};

struct CaptureReport {
    Template tmpl;
    CopyStats stats;
};

// Disagreements between the registry file and the template store
struct RegistryHealth {
    std::vector<std::string> dangling_entries;   // registered, storage missing
    std::vector<std::string> orphan_storage;     // directories under templates/ with no entry

    bool healthy() const { return dangling_entries.empty() && orphan_storage.empty(); }
};

// Durable name -> Template index backed by a single root directory.
//
// Layout:
//   <root>/registry             YAML document, replaced atomically on save
//   <root>/registry.lock        advisory lock held across read-modify-write
//   <root>/templates/<name>/    captured copy
//
// Captures are staged under templates/.incoming-<name> and renamed into place
// only after the copy succeeds, so a failed capture never leaves an entry. On
// removal the entry goes first and the storage second; a crash in between
// leaves storage without an entry, which check() reports and prune() clears.
class TemplateRegistry {
public:
    explicit TemplateRegistry(RegistryConfig config);

    // Read the registry file. Missing file -> empty registry. Anything
    // unreadable or malformed -> ErrorKind::REGISTRY_CORRUPT.
    Result<void> load();

    Result<CaptureReport> add(const std::string& name,
                              const fs::path& source_path,
                              const std::vector<std::string>& ignore_patterns,
                              const std::string& description = "",
                              bool replace = false);

    // Templates whose storage exists, sorted by name.
    std::vector<Template> list() const;

    Result<Template> get(const std::string& name) const;
    bool contains(const std::string& name) const { return entries_.count(name) > 0; }

    Result<void> remove(const std::string& name);

    Result<CopyStats> instantiate(const std::string& name,
                                  const fs::path& dest_path,
                                  bool overwrite = false) const;

    Result<Template> rename(const std::string& from, const std::string& to);
    Result<Template> describe(const std::string& name, const std::string& description);

    // Everything stored for a template, depth-first, children sorted by name.
    Result<std::vector<TreeEntry>> tree(const std::string& name) const;

    RegistryHealth check() const;

    // Delete orphaned storage. Returns the number of directories removed.
    Result<int> prune();

    const fs::path& root() const { return config_.root; }
    fs::path storage_path(const std::string& name) const;
    CopyOptions& capture_options() { return config_.capture; }

private:
    Result<void> read_file();
    Result<void> write_file() const;
    Result<void> prepare();
    fs::path lock_path() const;
    fs::path templates_dir() const;

    RegistryConfig config_;
    std::map<std::string, Template> entries_;
};

// Names are single path components: non-empty, no '/', '\\' or control
// characters, not starting with '.'.
Result<void> validate_template_name(const std::string& name);
