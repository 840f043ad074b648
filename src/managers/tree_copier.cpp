#include "tree_copier.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

TreeCopier::TreeCopier(CopyOptions options)
    : options_(std::move(options)) {}

static std::string io_message(const std::string& what, const fs::path& path,
                              const std::error_code& ec) {
    return fmt::format("{} {}: {}", what, path.string(), ec.message());
}

Result<CopyStats> TreeCopier::copy(const fs::path& source_root,
                                   const fs::path& dest_root,
                                   const IgnoreMatcher& matcher) const {
    std::error_code ec;

    if (!fs::is_directory(source_root, ec)) {
        return Result<CopyStats>::Err(ErrorKind::NOT_FOUND,
            "Source is not a directory: " + source_root.string(), source_root.string());
    }

    auto dest_status = fs::status(dest_root, ec);
    if (fs::exists(dest_status)) {
        if (!fs::is_directory(dest_status)) {
            return Result<CopyStats>::Err(ErrorKind::DESTINATION_NOT_EMPTY,
                dest_root.string() + " exists and is not a directory", dest_root.string());
        }
        if (!options_.overwrite && !fs::is_empty(dest_root, ec)) {
            return Result<CopyStats>::Err(ErrorKind::DESTINATION_NOT_EMPTY,
                dest_root.string() + " already exists and is not empty", dest_root.string());
        }
    }

    Walk walk;
    walk.source_root = source_root;
    walk.dest_root = dest_root;
    if (!matcher.empty()) walk.matchers.push_back(matcher);

    // Never walk into our own output
    fs::path src_canon = fs::weakly_canonical(source_root, ec);
    if (ec) src_canon = fs::absolute(source_root);
    fs::path dst_canon = fs::weakly_canonical(dest_root, ec);
    if (ec) dst_canon = fs::absolute(dest_root);
    if (dst_canon == src_canon) {
        return Result<CopyStats>::Err(ErrorKind::DESTINATION_NOT_EMPTY,
            "Source and destination are the same directory: " + source_root.string(),
            dest_root.string());
    }

    std::vector<fs::path> skips = options_.skip_paths;
    skips.push_back(dest_root);
    for (const auto& skip : skips) {
        fs::path canon = fs::weakly_canonical(skip, ec);
        if (ec) continue;
        auto rel = canon.lexically_relative(src_canon);
        if (!rel.empty() && *rel.begin() != ".." && rel != ".") {
            walk.skip_rels.push_back(rel.generic_string());
        }
    }
    walk.dir_stack.push_back(src_canon);

    auto root = ensure_dir(walk, dest_root);
    if (root.is_err()) return Result<CopyStats>::Err(root);

    auto result = copy_dir(walk, source_root, "", dest_root);
    if (result.is_err()) {
        stencil_log(fmt::format("copy {} -> {} aborted: {}",
                                source_root.string(), dest_root.string(), result.error));
        return Result<CopyStats>::Err(result);
    }

    stencil_log(fmt::format("copy {} -> {}: {} files, {} bytes, {} skipped",
                            source_root.string(), dest_root.string(),
                            walk.stats.files_copied, walk.stats.bytes_copied,
                            walk.stats.entries_skipped));
    return Result<CopyStats>::Ok(walk.stats);
}

bool TreeCopier::is_excluded(const Walk& walk, const std::string& rel, bool is_dir) const {
    for (const auto& m : walk.matchers) {
        if (m.matches_entry(rel, is_dir)) return true;
    }
    return false;
}

Result<void> TreeCopier::ensure_dir(Walk& walk, const fs::path& dir) const {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return Result<void>::Ok();

    if (dir.has_parent_path() && dir.parent_path() != dir) {
        auto parent = ensure_dir(walk, dir.parent_path());
        if (parent.is_err()) return parent;
    }

    if (!fs::create_directory(dir, ec) && ec) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            io_message("Failed to create directory", dir, ec), dir.string());
    }
    walk.stats.dirs_created++;
    return Result<void>::Ok();
}

Result<void> TreeCopier::load_ignore_file(Walk& walk, const fs::path& src_dir,
                                          const std::string& rel_dir, bool& pushed) const {
    pushed = false;
    if (options_.ignore_file.empty()) return Result<void>::Ok();

    fs::path file = src_dir / options_.ignore_file;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return Result<void>::Ok();

    std::ifstream in(file);
    if (!in) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to read ignore file " + file.string(), file.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    auto compiled = IgnoreMatcher::compile(lines, rel_dir);
    if (compiled.is_err()) {
        return Result<void>::Err(ErrorKind::PATTERN_SYNTAX,
            fmt::format("{}: {}", file.string(), compiled.error), file.string());
    }
    if (!compiled.value.empty()) {
        walk.matchers.push_back(std::move(compiled.value));
        pushed = true;
    }
    return Result<void>::Ok();
}

Result<bool> TreeCopier::copy_dir(Walk& walk, const fs::path& src_dir,
                                  const std::string& rel_dir, const fs::path& dst_dir) const {
    bool pushed = false;
    auto loaded = load_ignore_file(walk, src_dir, rel_dir, pushed);
    if (loaded.is_err()) return Result<bool>::Err(loaded);

    auto result = copy_entries(walk, src_dir, rel_dir, dst_dir);

    if (pushed) walk.matchers.pop_back();
    return result;
}

Result<bool> TreeCopier::copy_entries(Walk& walk, const fs::path& src_dir,
                                      const std::string& rel_dir, const fs::path& dst_dir) const {
    std::error_code ec;

    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(src_dir, ec);
    if (ec) {
        return Result<bool>::Err(ErrorKind::IO_FAILURE,
            io_message("Failed to read directory", src_dir, ec), src_dir.string());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    if (ec) {
        return Result<bool>::Err(ErrorKind::IO_FAILURE,
            io_message("Failed to read directory", src_dir, ec), src_dir.string());
    }

    // Sort for consistent ordering
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    bool wrote = false;

    for (const auto& entry : entries) {
        if (options_.cancel && options_.cancel()) {
            return Result<bool>::Err(ErrorKind::CANCELLED,
                "Copy cancelled at " + entry.path().string(), entry.path().string());
        }

        const fs::path& src = entry.path();
        std::string name = src.filename().string();
        std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;
        fs::path dst = dst_dir / name;

        if (std::find(walk.skip_rels.begin(), walk.skip_rels.end(), rel)
                != walk.skip_rels.end()) {
            continue;
        }

        auto st = fs::symlink_status(src, ec);
        if (ec) {
            return Result<bool>::Err(ErrorKind::IO_FAILURE,
                io_message("Failed to stat", src, ec), src.string());
        }

        bool link = fs::is_symlink(st);
        if (link) {
            if (options_.symlinks == SymlinkPolicy::SKIP) {
                walk.stats.entries_skipped++;
                continue;
            }
            if (options_.symlinks == SymlinkPolicy::FOLLOW) {
                st = fs::status(src, ec);
                if (ec) {
                    return Result<bool>::Err(ErrorKind::IO_FAILURE,
                        io_message("Broken symbolic link", src, ec), src.string());
                }
                link = false;
            }
        }

        bool is_dir = !link && fs::is_directory(st);
        if (is_excluded(walk, rel, is_dir)) {
            walk.stats.entries_skipped++;
            continue;
        }

        if (link) {
            fs::path target = fs::read_symlink(src, ec);
            if (ec) {
                return Result<bool>::Err(ErrorKind::IO_FAILURE,
                    io_message("Failed to read symbolic link", src, ec), src.string());
            }
            auto made = ensure_dir(walk, dst_dir);
            if (made.is_err()) return Result<bool>::Err(made);

            if (options_.overwrite && fs::exists(fs::symlink_status(dst, ec))) {
                fs::remove(dst, ec);
                if (ec) {
                    return Result<bool>::Err(ErrorKind::IO_FAILURE,
                        io_message("Failed to replace", dst, ec), dst.string());
                }
            }
            fs::create_symlink(target, dst, ec);
            if (ec) {
                return Result<bool>::Err(ErrorKind::IO_FAILURE,
                    io_message("Failed to create symbolic link", dst, ec), src.string());
            }
            walk.stats.symlinks_copied++;
            if (options_.progress) options_.progress(rel);
            wrote = true;
        } else if (is_dir) {
            bool followed = options_.symlinks == SymlinkPolicy::FOLLOW;
            if (followed) {
                fs::path canon = fs::canonical(src, ec);
                if (ec) {
                    return Result<bool>::Err(ErrorKind::IO_FAILURE,
                        io_message("Failed to resolve", src, ec), src.string());
                }
                if (std::find(walk.dir_stack.begin(), walk.dir_stack.end(), canon)
                        != walk.dir_stack.end()) {
                    return Result<bool>::Err(ErrorKind::SYMLINK_CYCLE,
                        fmt::format("Symbolic link cycle: {} leads back to {}",
                                    src.string(), canon.string()),
                        src.string());
                }
                walk.dir_stack.push_back(canon);
            }

            auto sub = copy_dir(walk, src, rel, dst);
            if (followed) walk.dir_stack.pop_back();
            if (sub.is_err()) return sub;

            if (sub.value) {
                fs::permissions(dst, st.permissions(), ec);
                if (ec) {
                    return Result<bool>::Err(ErrorKind::IO_FAILURE,
                        io_message("Failed to set permissions on", dst, ec), dst.string());
                }
                wrote = true;
            }
        } else if (fs::is_regular_file(st)) {
            auto made = ensure_dir(walk, dst_dir);
            if (made.is_err()) return Result<bool>::Err(made);

            auto opts = options_.overwrite ? fs::copy_options::overwrite_existing
                                           : fs::copy_options::none;
            fs::copy_file(src, dst, opts, ec);
            if (ec) {
                return Result<bool>::Err(ErrorKind::IO_FAILURE,
                    io_message("Failed to copy", src, ec), src.string());
            }
            fs::permissions(dst, st.permissions(), ec);
            if (ec) {
                return Result<bool>::Err(ErrorKind::IO_FAILURE,
                    io_message("Failed to set permissions on", dst, ec), dst.string());
            }

            auto size = fs::file_size(dst, ec);
            if (!ec) walk.stats.bytes_copied += static_cast<int64_t>(size);
            walk.stats.files_copied++;
            if (options_.progress) options_.progress(rel);
            wrote = true;
        } else {
            // Sockets, fifos and devices have no meaningful copy
            stencil_log("skipping special file " + src.string());
            walk.stats.entries_skipped++;
        }
    }

    if (!wrote && (entries.empty() || options_.keep_filtered_empty_dirs)) {
        auto made = ensure_dir(walk, dst_dir);
        if (made.is_err()) return Result<bool>::Err(made);
        wrote = true;
    }

    return Result<bool>::Ok(wrote);
}

void make_removable(const fs::path& root, std::error_code& ec) {
    auto st = fs::symlink_status(root, ec);
    if (ec || !fs::is_directory(st)) return;

    if ((st.permissions() & fs::perms::owner_all) != fs::perms::owner_all) {
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        if (ec) return;
    }

    for (fs::directory_iterator it(root, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        make_removable(it->path(), ec);
        if (ec) return;
    }
}

void remove_tree(const fs::path& path, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(fs::symlink_status(path, ec))) {
        ec.clear();
        return;
    }

    std::error_code perm_ec;
    make_removable(path, perm_ec);
    if (perm_ec) {
        stencil_log("could not open up " + path.string() + ": " + perm_ec.message());
    }
    fs::remove_all(path, ec);
}
