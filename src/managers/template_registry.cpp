#include "template_registry.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/file_lock.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <set>

Result<void> validate_template_name(const std::string& name) {
    if (name.empty()) {
        return Result<void>::Err(ErrorKind::INVALID_NAME, "Template name is empty");
    }
    if (name.size() > 255) {
        return Result<void>::Err(ErrorKind::INVALID_NAME, "Template name is too long");
    }
    if (name[0] == '.') {
        return Result<void>::Err(ErrorKind::INVALID_NAME,
            "Template name '" + name + "' may not start with '.'");
    }
    for (char c : name) {
        if (c == '/' || c == '\\') {
            return Result<void>::Err(ErrorKind::INVALID_NAME,
                "Template name '" + name + "' may not contain path separators");
        }
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return Result<void>::Err(ErrorKind::INVALID_NAME,
                "Template name contains control characters");
        }
    }
    return Result<void>::Ok();
}

TemplateRegistry::TemplateRegistry(RegistryConfig config)
    : config_(std::move(config)) {}

fs::path TemplateRegistry::templates_dir() const {
    return config_.root / TEMPLATES_DIR;
}

fs::path TemplateRegistry::lock_path() const {
    return config_.root / REGISTRY_LOCK;
}

fs::path TemplateRegistry::storage_path(const std::string& name) const {
    return templates_dir() / name;
}

Result<void> TemplateRegistry::prepare() {
    return ensure_stencil_directory_structure(config_.root);
}

// ── Persistence ─────────────────────────────────────────────

Result<void> TemplateRegistry::load() {
    return read_file();
}

Result<void> TemplateRegistry::read_file() {
    fs::path path = config_.root / REGISTRY_FILE;
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        entries_.clear();
        return Result<void>::Ok();
    }

    auto corrupt = [&](const std::string& why) {
        stencil_log("registry corrupt: " + why);
        return Result<void>::Err(ErrorKind::REGISTRY_CORRUPT,
            fmt::format("{}: {}", path.string(), why), path.string());
    };

    if (!fs::is_regular_file(path, ec)) {
        return corrupt("exists but is not a regular file");
    }

    std::map<std::string, Template> loaded;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return corrupt("expected a mapping at the top level");
        }

        int version = root["version"].as<int>(0);
        if (version != REGISTRY_FORMAT_VERSION) {
            return corrupt(fmt::format("unsupported format version {}", version));
        }

        YAML::Node templates = root["templates"];
        if (!templates || !templates.IsSequence()) {
            return corrupt("'templates' must be a list");
        }

        for (const auto& n : templates) {
            if (!n.IsMap()) {
                return corrupt("template entry is not a mapping");
            }

            Template t;
            t.name = n["name"].as<std::string>("");
            if (validate_template_name(t.name).is_err()) {
                return corrupt(fmt::format("invalid template name '{}'", t.name));
            }
            if (loaded.count(t.name)) {
                return corrupt(fmt::format("duplicate template '{}'", t.name));
            }

            // Storage is recorded relative to the root: templates/<dir>
            fs::path storage = fs::path(n["storage"].as<std::string>("")).lexically_normal();
            std::vector<std::string> parts;
            for (const auto& p : storage) parts.push_back(p.string());
            if (storage.is_absolute() || parts.size() != 2 || parts[0] != TEMPLATES_DIR ||
                validate_template_name(parts[1]).is_err()) {
                return corrupt(fmt::format("template '{}' has invalid storage '{}'",
                                           t.name, storage.string()));
            }

            t.storage_path = (config_.root / storage).string();
            t.description = n["description"].as<std::string>("");
            t.source_path = n["source"].as<std::string>("");
            t.created_at = n["created_at"].as<std::string>("");
            if (n["ignore"] && n["ignore"].IsSequence()) {
                t.ignore = n["ignore"].as<std::vector<std::string>>();
            }
            loaded[t.name] = t;
        }
    } catch (const std::exception& e) {
        return corrupt(e.what());
    }

    entries_ = std::move(loaded);
    return Result<void>::Ok();
}

Result<void> TemplateRegistry::write_file() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << REGISTRY_FORMAT_VERSION;

    out << YAML::Key << "templates" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, t] : entries_) {
        fs::path storage = fs::path(t.storage_path).lexically_relative(config_.root);
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << t.name;
        out << YAML::Key << "description" << YAML::Value << t.description;
        out << YAML::Key << "storage" << YAML::Value << storage.generic_string();
        out << YAML::Key << "source" << YAML::Value << t.source_path;
        out << YAML::Key << "created_at" << YAML::Value << t.created_at;
        out << YAML::Key << "ignore" << YAML::Value << YAML::Flow << t.ignore;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    fs::path tmp = config_.root / REGISTRY_TMP_FILE;
    fs::path path = config_.root / REGISTRY_FILE;
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorKind::IO_FAILURE,
                "Failed to open " + tmp.string() + " for writing", tmp.string());
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            return Result<void>::Err(ErrorKind::IO_FAILURE,
                "Failed to write " + tmp.string(), tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to replace " + path.string() + ": " + ec.message(), path.string());
    }
    return Result<void>::Ok();
}

// ── Mutations ───────────────────────────────────────────────

Result<CaptureReport> TemplateRegistry::add(const std::string& name,
                                            const fs::path& source_path,
                                            const std::vector<std::string>& ignore_patterns,
                                            const std::string& description,
                                            bool replace) {
    auto valid = validate_template_name(name);
    if (valid.is_err()) return Result<CaptureReport>::Err(valid);

    std::error_code ec;
    if (!fs::is_directory(source_path, ec)) {
        return Result<CaptureReport>::Err(ErrorKind::NOT_FOUND,
            "Source is not a directory: " + source_path.string(), source_path.string());
    }
    fs::path source = fs::canonical(source_path, ec);
    if (ec) {
        return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE,
            "Failed to resolve " + source_path.string() + ": " + ec.message(),
            source_path.string());
    }

    // Bad patterns fail before anything touches the store
    auto matcher = IgnoreMatcher::compile(ignore_patterns);
    if (matcher.is_err()) return Result<CaptureReport>::Err(matcher);

    auto prepared = prepare();
    if (prepared.is_err()) return Result<CaptureReport>::Err(prepared);

    FileLock lock(lock_path().string());
    if (!lock.held()) {
        return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE,
            "Failed to lock " + lock_path().string(), lock_path().string());
    }

    auto loaded = read_file();
    if (loaded.is_err()) return Result<CaptureReport>::Err(loaded);

    bool existed = entries_.count(name) > 0;
    if (existed && !replace) {
        return Result<CaptureReport>::Err(ErrorKind::ALREADY_EXISTS,
            "A template named '" + name + "' already exists");
    }

    fs::path final_dir = storage_path(name);
    if (!existed && fs::exists(fs::symlink_status(final_dir, ec))) {
        if (!replace) {
            return Result<CaptureReport>::Err(ErrorKind::DESTINATION_NOT_EMPTY,
                "Storage for '" + name + "' already exists without a registry entry "
                "(left by an interrupted operation)", final_dir.string());
        }
        remove_tree(final_dir, ec);
        if (ec) {
            return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE,
                "Failed to clear " + final_dir.string() + ": " + ec.message(),
                final_dir.string());
        }
    }

    fs::path staging = templates_dir() / (std::string(STAGING_PREFIX) + name);
    remove_tree(staging, ec);
    if (ec) {
        return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE,
            "Failed to clear " + staging.string() + ": " + ec.message(), staging.string());
    }

    CopyOptions opts = config_.capture;
    opts.overwrite = false;
    opts.skip_paths.push_back(config_.root);
    TreeCopier copier(opts);

    stencil_log(fmt::format("capture '{}' from {}", name, source.string()));
    auto copied = copier.copy(source, staging, matcher.value);
    if (copied.is_err()) {
        // Staging belongs to the registry; nothing of the failed capture survives
        std::error_code cleanup_ec;
        remove_tree(staging, cleanup_ec);
        if (cleanup_ec) {
            stencil_log("failed to remove staging " + staging.string() + ": " + cleanup_ec.message());
        }
        return Result<CaptureReport>::Err(copied);
    }

    fs::path retired = templates_dir() / (std::string(RETIRED_PREFIX) + name);
    bool retire = existed && fs::exists(fs::symlink_status(final_dir, ec));
    if (retire) {
        remove_tree(retired, ec);
        fs::rename(final_dir, retired, ec);
        if (ec) {
            remove_tree(staging, ec);
            return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE,
                "Failed to retire previous storage " + final_dir.string(), final_dir.string());
        }
    }

    fs::rename(staging, final_dir, ec);
    if (ec) {
        std::string msg = "Failed to move capture into " + final_dir.string() + ": " + ec.message();
        if (retire) fs::rename(retired, final_dir, ec);
        remove_tree(staging, ec);
        return Result<CaptureReport>::Err(ErrorKind::IO_FAILURE, msg, final_dir.string());
    }

    auto previous = entries_;
    Template t;
    t.name = name;
    t.description = description;
    t.storage_path = final_dir.string();
    t.source_path = source.string();
    t.created_at = now_iso();
    t.ignore = matcher.value.patterns();
    entries_[name] = t;

    auto saved = write_file();
    if (saved.is_err()) {
        entries_ = previous;
        // The registry still describes the old capture; put its storage back
        std::error_code undo_ec;
        fs::rename(final_dir, staging, undo_ec);
        if (!undo_ec && retire) fs::rename(retired, final_dir, undo_ec);
        if (!undo_ec) remove_tree(staging, undo_ec);
        if (undo_ec) {
            stencil_log(fmt::format("capture '{}': failed to restore storage: {}",
                                    name, undo_ec.message()));
        }
        return Result<CaptureReport>::Err(saved);
    }

    if (retire) {
        remove_tree(retired, ec);
        if (ec) stencil_log("failed to remove " + retired.string() + ": " + ec.message());
    }

    CaptureReport report;
    report.tmpl = t;
    report.stats = copied.value;
    return Result<CaptureReport>::Ok(report);
}

Result<void> TemplateRegistry::remove(const std::string& name) {
    auto prepared = prepare();
    if (prepared.is_err()) return prepared;

    FileLock lock(lock_path().string());
    if (!lock.held()) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to lock " + lock_path().string(), lock_path().string());
    }

    auto loaded = read_file();
    if (loaded.is_err()) return loaded;

    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return Result<void>::Err(ErrorKind::NOT_FOUND,
            "No template named '" + name + "'");
    }

    fs::path storage = it->second.storage_path;
    auto previous = entries_;
    entries_.erase(it);

    // Entry first: a crash after this point leaves storage without an entry
    auto saved = write_file();
    if (saved.is_err()) {
        entries_ = previous;
        return saved;
    }

    std::error_code ec;
    remove_tree(storage, ec);
    if (ec) {
        stencil_log(fmt::format("remove '{}': storage left at {}: {}",
                                name, storage.string(), ec.message()));
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            fmt::format("Template '{}' was unregistered but {} could not be deleted: {}",
                        name, storage.string(), ec.message()),
            storage.string());
    }

    stencil_log("removed template '" + name + "'");
    return Result<void>::Ok();
}

Result<Template> TemplateRegistry::rename(const std::string& from, const std::string& to) {
    auto valid = validate_template_name(to);
    if (valid.is_err()) return Result<Template>::Err(valid);

    auto prepared = prepare();
    if (prepared.is_err()) return Result<Template>::Err(prepared);

    FileLock lock(lock_path().string());
    if (!lock.held()) {
        return Result<Template>::Err(ErrorKind::IO_FAILURE,
            "Failed to lock " + lock_path().string(), lock_path().string());
    }

    auto loaded = read_file();
    if (loaded.is_err()) return Result<Template>::Err(loaded);

    auto it = entries_.find(from);
    if (it == entries_.end()) {
        return Result<Template>::Err(ErrorKind::NOT_FOUND, "No template named '" + from + "'");
    }
    if (from == to) {
        return Result<Template>::Ok(it->second);
    }
    if (entries_.count(to)) {
        return Result<Template>::Err(ErrorKind::ALREADY_EXISTS,
            "A template named '" + to + "' already exists");
    }

    std::error_code ec;
    fs::path new_storage = storage_path(to);
    if (fs::exists(fs::symlink_status(new_storage, ec))) {
        return Result<Template>::Err(ErrorKind::DESTINATION_NOT_EMPTY,
            "Storage for '" + to + "' already exists without a registry entry",
            new_storage.string());
    }

    Template t = it->second;
    fs::path old_storage = t.storage_path;
    auto previous = entries_;

    // Unregister, move, re-register: every intermediate state is at worst
    // storage without an entry.
    entries_.erase(from);
    auto saved = write_file();
    if (saved.is_err()) {
        entries_ = previous;
        return Result<Template>::Err(saved);
    }

    fs::rename(old_storage, new_storage, ec);
    if (ec) {
        std::string msg = fmt::format("Failed to move {} to {}: {}",
                                      old_storage.string(), new_storage.string(), ec.message());
        entries_ = previous;
        auto restored = write_file();
        if (restored.is_err()) {
            stencil_log("rename: failed to restore entry for '" + from + "': " + restored.error);
        }
        return Result<Template>::Err(ErrorKind::IO_FAILURE, msg, old_storage.string());
    }

    t.name = to;
    t.storage_path = new_storage.string();
    entries_[to] = t;
    saved = write_file();
    if (saved.is_err()) {
        entries_.erase(to);
        return Result<Template>::Err(saved);
    }

    stencil_log(fmt::format("renamed template '{}' to '{}'", from, to));
    return Result<Template>::Ok(t);
}

Result<Template> TemplateRegistry::describe(const std::string& name,
                                            const std::string& description) {
    auto prepared = prepare();
    if (prepared.is_err()) return Result<Template>::Err(prepared);

    FileLock lock(lock_path().string());
    if (!lock.held()) {
        return Result<Template>::Err(ErrorKind::IO_FAILURE,
            "Failed to lock " + lock_path().string(), lock_path().string());
    }

    auto loaded = read_file();
    if (loaded.is_err()) return Result<Template>::Err(loaded);

    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return Result<Template>::Err(ErrorKind::NOT_FOUND, "No template named '" + name + "'");
    }

    std::string previous = it->second.description;
    it->second.description = description;
    auto saved = write_file();
    if (saved.is_err()) {
        it->second.description = previous;
        return Result<Template>::Err(saved);
    }
    return Result<Template>::Ok(it->second);
}

Result<int> TemplateRegistry::prune() {
    auto prepared = prepare();
    if (prepared.is_err()) return Result<int>::Err(prepared);

    FileLock lock(lock_path().string());
    if (!lock.held()) {
        return Result<int>::Err(ErrorKind::IO_FAILURE,
            "Failed to lock " + lock_path().string(), lock_path().string());
    }

    auto loaded = read_file();
    if (loaded.is_err()) return Result<int>::Err(loaded);

    int removed = 0;
    for (const auto& orphan : check().orphan_storage) {
        fs::path path = templates_dir() / orphan;
        std::error_code ec;
        remove_tree(path, ec);
        if (ec) {
            return Result<int>::Err(ErrorKind::IO_FAILURE,
                "Failed to remove " + path.string() + ": " + ec.message(), path.string());
        }
        stencil_log("pruned orphan storage " + path.string());
        removed++;
    }
    return Result<int>::Ok(removed);
}

// ── Queries ─────────────────────────────────────────────────

std::vector<Template> TemplateRegistry::list() const {
    std::vector<Template> out;
    out.reserve(entries_.size());
    for (const auto& [name, t] : entries_) {
        std::error_code ec;
        if (!fs::is_directory(t.storage_path, ec)) {
            stencil_log("list: '" + name + "' has no storage at " + t.storage_path);
            continue;
        }
        out.push_back(t);
    }
    // std::map already iterates in name order
    return out;
}

Result<Template> TemplateRegistry::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return Result<Template>::Err(ErrorKind::NOT_FOUND, "No template named '" + name + "'");
    }
    return Result<Template>::Ok(it->second);
}

Result<CopyStats> TemplateRegistry::instantiate(const std::string& name,
                                                const fs::path& dest_path,
                                                bool overwrite) const {
    auto found = get(name);
    if (found.is_err()) return Result<CopyStats>::Err(found);

    std::error_code ec;
    fs::path storage = found.value.storage_path;
    if (!fs::is_directory(storage, ec)) {
        return Result<CopyStats>::Err(ErrorKind::NOT_FOUND,
            "Storage for '" + name + "' is missing: " + storage.string(), storage.string());
    }

    // Storage was filtered at capture time; reproduce it exactly
    CopyOptions opts;
    opts.overwrite = overwrite;
    opts.keep_filtered_empty_dirs = true;
    opts.symlinks = SymlinkPolicy::COPY;
    opts.cancel = config_.capture.cancel;
    opts.progress = config_.capture.progress;

    stencil_log(fmt::format("instantiate '{}' into {}", name, dest_path.string()));
    return TreeCopier(opts).copy(storage, dest_path);
}

static void collect_tree(const fs::path& dir, const std::string& rel_dir, int depth,
                         std::vector<TreeEntry>& out, std::error_code& ec) {
    std::vector<fs::directory_entry> children;
    for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) return;

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        TreeEntry e;
        std::string name = child.path().filename().string();
        e.path = rel_dir.empty() ? name : rel_dir + "/" + name;
        e.depth = depth;

        auto st = child.symlink_status(ec);
        if (ec) return;
        if (fs::is_symlink(st)) {
            e.kind = TreeEntry::SYMLINK;
            out.push_back(e);
        } else if (fs::is_directory(st)) {
            e.kind = TreeEntry::DIRECTORY;
            out.push_back(e);
            collect_tree(child.path(), e.path, depth + 1, out, ec);
            if (ec) return;
        } else {
            e.kind = TreeEntry::FILE;
            auto size = child.file_size(ec);
            e.size = ec ? 0 : static_cast<int64_t>(size);
            ec.clear();
            out.push_back(e);
        }
    }
}

Result<std::vector<TreeEntry>> TemplateRegistry::tree(const std::string& name) const {
    auto found = get(name);
    if (found.is_err()) return Result<std::vector<TreeEntry>>::Err(found);

    std::error_code ec;
    fs::path storage = found.value.storage_path;
    if (!fs::is_directory(storage, ec)) {
        return Result<std::vector<TreeEntry>>::Err(ErrorKind::NOT_FOUND,
            "Storage for '" + name + "' is missing: " + storage.string(), storage.string());
    }

    std::vector<TreeEntry> entries;
    collect_tree(storage, "", 0, entries, ec);
    if (ec) {
        return Result<std::vector<TreeEntry>>::Err(ErrorKind::IO_FAILURE,
            "Failed to read " + storage.string() + ": " + ec.message(), storage.string());
    }
    return Result<std::vector<TreeEntry>>::Ok(entries);
}

RegistryHealth TemplateRegistry::check() const {
    RegistryHealth health;
    std::set<std::string> referenced;

    for (const auto& [name, t] : entries_) {
        std::error_code ec;
        if (!fs::is_directory(t.storage_path, ec)) {
            health.dangling_entries.push_back(name);
        }
        referenced.insert(fs::path(t.storage_path).filename().string());
    }

    std::error_code ec;
    if (!fs::is_directory(templates_dir(), ec)) return health;

    for (fs::directory_iterator it(templates_dir(), ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::string dir = it->path().filename().string();
        if (!referenced.count(dir)) {
            health.orphan_storage.push_back(dir);
        }
    }
    std::sort(health.orphan_storage.begin(), health.orphan_storage.end());
    return health;
}
