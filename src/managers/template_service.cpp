#include "template_service.hpp"
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>

TemplateService::TemplateService() : root_(resolve_root()) {}

TemplateService::TemplateService(const fs::path& root) : root_(root) {}

Result<void> TemplateService::open() {
    auto dirs = ensure_stencil_directory_structure(root_);
    if (dirs.is_err()) return dirs;

    auto created = create_default_config(root_);
    if (created.is_err()) return created;

    auto loaded = Config::load(root_);
    if (loaded.is_err()) return Result<void>::Err(loaded);
    config_ = loaded.value;

    RegistryConfig rc;
    rc.root = root_;
    rc.capture.keep_filtered_empty_dirs = config_.capture().keep_filtered_empty_dirs;
    rc.capture.symlinks = config_.capture().symlinks;
    rc.capture.ignore_file = config_.capture().ignore_file;
    rc.capture.cancel = cancel_;
    rc.capture.progress = progress_;

    auto registry = std::make_unique<TemplateRegistry>(rc);
    auto reg = registry->load();
    if (reg.is_err()) return reg;

    registry_ = std::move(registry);
    stencil_log("opened " + root_.string());
    return Result<void>::Ok();
}

Result<void> TemplateService::require_open() const {
    if (!registry_) {
        return Result<void>::Err(ErrorKind::REGISTRY_CORRUPT,
            "Template store at " + root_.string() + " is not open");
    }
    return Result<void>::Ok();
}

Result<void> TemplateService::reload() {
    auto ready = require_open();
    if (ready.is_err()) return ready;
    return registry_->load();
}

void TemplateService::set_cancel_check(CancelCheck cancel) {
    cancel_ = std::move(cancel);
    if (registry_) registry_->capture_options().cancel = cancel_;
}

void TemplateService::set_progress(StatusCallback progress) {
    progress_ = std::move(progress);
    if (registry_) registry_->capture_options().progress = progress_;
}

// ── Templates ─────────────────────────────────────────────────

Result<CaptureReport> TemplateService::capture(const std::string& name,
                                               const fs::path& source,
                                               const std::vector<std::string>& ignore,
                                               const std::string& description,
                                               bool replace) {
    auto ready = require_open();
    if (ready.is_err()) return Result<CaptureReport>::Err(ready);

    std::vector<std::string> patterns = config_.capture().default_ignore;
    for (const auto& p : ignore) {
        if (std::find(patterns.begin(), patterns.end(), p) == patterns.end()) {
            patterns.push_back(p);
        }
    }
    return registry_->add(name, source, patterns, description, replace);
}

Result<CopyStats> TemplateService::instantiate(const std::string& name, const fs::path& dest,
                                               bool overwrite) {
    auto ready = require_open();
    if (ready.is_err()) return Result<CopyStats>::Err(ready);

    // Outermost directory this call is about to create, if any
    std::error_code ec;
    fs::path created;
    fs::path p = fs::absolute(dest, ec);
    while (!ec && !p.empty()) {
        std::error_code probe;
        if (fs::exists(fs::symlink_status(p, probe))) break;
        created = p;
        if (p == p.parent_path()) break;
        p = p.parent_path();
    }

    auto result = registry_->instantiate(name, dest, overwrite);
    if (result.is_err() && !created.empty()) {
        remove_tree(created, ec);
        if (ec) {
            stencil_log("failed to clean up " + created.string() + ": " + ec.message());
        }
    }
    return result;
}

std::vector<Template> TemplateService::list() const {
    if (!registry_) return {};
    return registry_->list();
}

std::vector<TemplateSummary> TemplateService::list_summaries() const {
    std::vector<TemplateSummary> out;
    for (const auto& t : list()) {
        TemplateSummary s;
        s.name = t.name;
        s.description = t.description.empty() ? "-" : t.description;
        s.created = format_age(t.created_at);
        s.source = t.source_path.empty() ? "-" : t.source_path;
        out.push_back(s);
    }
    return out;
}

Result<Template> TemplateService::get(const std::string& name) const {
    auto ready = require_open();
    if (ready.is_err()) return Result<Template>::Err(ready);
    return registry_->get(name);
}

Result<void> TemplateService::remove(const std::string& name) {
    auto ready = require_open();
    if (ready.is_err()) return ready;
    return registry_->remove(name);
}

Result<Template> TemplateService::rename(const std::string& from, const std::string& to) {
    auto ready = require_open();
    if (ready.is_err()) return Result<Template>::Err(ready);
    return registry_->rename(from, to);
}

Result<Template> TemplateService::describe(const std::string& name, const std::string& text) {
    auto ready = require_open();
    if (ready.is_err()) return Result<Template>::Err(ready);
    return registry_->describe(name, text);
}

Result<std::vector<TreeEntry>> TemplateService::tree(const std::string& name) const {
    auto ready = require_open();
    if (ready.is_err()) return Result<std::vector<TreeEntry>>::Err(ready);
    return registry_->tree(name);
}

// ── Maintenance ───────────────────────────────────────────────

RegistryHealth TemplateService::check() const {
    if (!registry_) return RegistryHealth();
    return registry_->check();
}

Result<int> TemplateService::prune() {
    auto ready = require_open();
    if (ready.is_err()) return Result<int>::Err(ready);
    return registry_->prune();
}

// ── Messages ──────────────────────────────────────────────────

std::string describe_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                  return "No error";
        case ErrorKind::PATTERN_SYNTAX:        return "Invalid ignore pattern";
        case ErrorKind::ALREADY_EXISTS:        return "Template already exists";
        case ErrorKind::NOT_FOUND:             return "Not found";
        case ErrorKind::IO_FAILURE:            return "Filesystem error";
        case ErrorKind::DESTINATION_NOT_EMPTY: return "Destination is not empty";
        case ErrorKind::REGISTRY_CORRUPT:      return "Template registry is unreadable";
        case ErrorKind::INVALID_NAME:          return "Invalid template name";
        case ErrorKind::SYMLINK_CYCLE:         return "Symbolic link cycle";
        case ErrorKind::CANCELLED:             return "Cancelled";
        case ErrorKind::CONFIG:                return "Invalid configuration";
    }
    return "Error";
}

std::string error_message(ErrorKind kind, const std::string& detail) {
    if (detail.empty()) return describe_error(kind);
    return fmt::format("{}: {}", describe_error(kind), detail);
}
