#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include "template_registry.hpp"

// Pure data struct for UI consumption.
struct TemplateSummary {
    std::string name;
    std::string description;
    std::string created;      // "3d ago"
    std::string source;
};

// Headless service facade: owns the config and the registry, can be used by
// any frontend.
class TemplateService {
public:
    // Uses the resolved root (see resolve_root()).
    TemplateService();
    explicit TemplateService(const fs::path& root);

    // Create the root layout and default config if needed, load the config
    // and the registry. Must succeed before any other call.
    Result<void> open();
    bool is_open() const { return registry_ != nullptr; }

    // Re-read the registry file (picks up changes made by other processes).
    Result<void> reload();

    // ── Templates ────────────────────────────────────────────

    // Capture `source` as `name`. The configured default ignore patterns are
    // applied in addition to `ignore`.
    Result<CaptureReport> capture(const std::string& name,
                                  const fs::path& source,
                                  const std::vector<std::string>& ignore = {},
                                  const std::string& description = "",
                                  bool replace = false);

    // Copy template `name` to `dest`. When `dest` did not exist beforehand, a
    // failed copy removes it again, together with any parent directories
    // created for it. An existing destination keeps whatever was written.
    Result<CopyStats> instantiate(const std::string& name, const fs::path& dest,
                                  bool overwrite = false);

    std::vector<Template> list() const;
    std::vector<TemplateSummary> list_summaries() const;
    Result<Template> get(const std::string& name) const;

    Result<void> remove(const std::string& name);
    Result<Template> rename(const std::string& from, const std::string& to);
    Result<Template> describe(const std::string& name, const std::string& text);
    Result<std::vector<TreeEntry>> tree(const std::string& name) const;

    // ── Maintenance ──────────────────────────────────────────

    RegistryHealth check() const;
    Result<int> prune();

    // ── Hooks ────────────────────────────────────────────────

    void set_cancel_check(CancelCheck cancel);
    void set_progress(StatusCallback progress);

    const fs::path& root() const { return root_; }
    const Config& config() const { return config_; }

private:
    Result<void> require_open() const;

    fs::path root_;
    Config config_;
    CancelCheck cancel_;
    StatusCallback progress_;
    std::unique_ptr<TemplateRegistry> registry_;
};

// One-line headline for an error class, e.g. "Template not found".
std::string describe_error(ErrorKind kind);

// Headline plus detail, suitable for theme::fail().
std::string error_message(ErrorKind kind, const std::string& detail);

template <typename T>
std::string error_message(const Result<T>& result) {
    return error_message(result.kind, result.error);
}
