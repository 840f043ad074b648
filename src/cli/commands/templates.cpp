#include "../base_cli.hpp"
#include "../theme.hpp"
#include "../prompts.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <map>
#include <set>
#include <algorithm>
#include <fmt/format.h>

using Args = BaseCLI::Args;

// ── Argument parsing ────────────────────────────────────

struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::vector<std::string>> values;
    std::set<std::string> flags;

    bool flag(const std::string& name) const { return flags.count(name) > 0; }

    std::string value(const std::string& name, const std::string& def = "") const {
        auto it = values.find(name);
        if (it == values.end() || it->second.empty()) return def;
        return it->second.back();
    }

    std::vector<std::string> all(const std::string& name) const {
        auto it = values.find(name);
        return it == values.end() ? std::vector<std::string>() : it->second;
    }
};

// Options map long spellings to their short form; the bool says whether the
// option takes a value.
using OptionTable = std::map<std::string, std::pair<std::string, bool>>;

static bool parse_args(BaseCLI& cli, const std::string& command, const Args& args,
                       const OptionTable& options, size_t min_positional,
                       size_t max_positional, ParsedArgs& out) {
    bool options_done = false;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (!options_done && a == "--") {
            options_done = true;
            continue;
        }
        if (options_done || a.size() < 2 || a[0] != '-') {
            out.positional.push_back(a);
            continue;
        }

        auto it = options.find(a);
        if (it == options.end()) {
            std::cout << theme::fail("Unknown option: " + a);
            cli.print_usage(command);
            return false;
        }
        const std::string& key = it->second.first;
        if (!it->second.second) {
            out.flags.insert(key);
            continue;
        }
        if (i + 1 >= args.size()) {
            std::cout << theme::fail("Option " + a + " needs a value");
            cli.print_usage(command);
            return false;
        }
        out.values[key].push_back(args[++i]);
    }

    if (out.positional.size() < min_positional || out.positional.size() > max_positional) {
        std::cout << theme::fail(out.positional.size() < min_positional
                                 ? "Missing argument."
                                 : "Too many arguments.");
        cli.print_usage(command);
        return false;
    }
    return true;
}

// Absolute form of a user-supplied directory, relative to the working directory
static fs::path resolve_dir(const std::string& arg) {
    fs::path p = arg.empty() ? fs::current_path() : fs::path(arg);
    if (p.is_relative()) p = fs::current_path() / p;
    return p.lexically_normal();
}

// Failure line plus a hint for the kinds a user can act on
static void report_error(ErrorKind kind, const std::string& error, const std::string& path,
                         const std::string& hint = "") {
    std::cout << theme::fail(error_message(kind, error));
    if (kind == ErrorKind::IO_FAILURE && !path.empty() &&
        error.find(path) == std::string::npos) {
        std::cout << theme::kv("Path", path);
    }
    if (!hint.empty()) {
        std::cout << theme::step(hint);
    }
}

template <typename T>
static void report(const Result<T>& r, const std::string& hint = "") {
    report_error(r.kind, r.error, r.path, hint);
}

// Single status line rewritten in place while a copy runs
class ProgressLine {
public:
    explicit ProgressLine(BaseCLI& cli) : cli_(cli), active_(platform::stdout_is_terminal()) {
        if (!active_) return;
        int width = std::min(PROGRESS_PATH_MAX, platform::term_width() - 8);
        cli_.service.set_progress([width](const std::string& rel) {
            std::string shown = rel;
            if (width > 3 && static_cast<int>(shown.size()) > width) {
                shown = "..." + shown.substr(shown.size() - (width - 3));
            }
            std::cout << "\r\033[K" << theme::dim("    " + shown) << std::flush;
        });
    }

    ~ProgressLine() {
        if (!active_) return;
        cli_.service.set_progress(nullptr);
        std::cout << "\r\033[K" << std::flush;
    }

    ProgressLine(const ProgressLine&) = delete;
    ProgressLine& operator=(const ProgressLine&) = delete;

private:
    BaseCLI& cli_;
    bool active_;
};

static std::string stats_line(const CopyStats& s) {
    std::string line = fmt::format("{} file{}, {}", s.files_copied,
                                   s.files_copied == 1 ? "" : "s", format_bytes(s.bytes_copied));
    if (s.symlinks_copied > 0) {
        line += fmt::format(", {} link{}", s.symlinks_copied, s.symlinks_copied == 1 ? "" : "s");
    }
    if (s.entries_skipped > 0) {
        line += fmt::format(", {} ignored", s.entries_skipped);
    }
    return line;
}

// ── Commands ────────────────────────────────────────────

static bool do_list(BaseCLI& cli, const Args& args) {
    ParsedArgs parsed;
    if (!parse_args(cli, "list", args, {}, 0, 0, parsed)) return false;
    if (!cli.require_store()) return false;

    auto rows = cli.service.list_summaries();
    if (rows.empty()) {
        std::cout << theme::dim("    No templates. Capture one with 'make <name>'.") << "\n";
    } else {
        // Column widths from headers and data
        size_t w0 = 4, w1 = 7;
        for (const auto& r : rows) {
            w0 = std::max(w0, r.name.size());
            w1 = std::max(w1, r.created.size());
        }

        std::string rfmt = fmt::format("  {{:<{}}} {{:<{}}} {{}}\n", w0 + 2, w1 + 2);

        std::cout << "\n";
        std::cout << theme::color::DIM
                  << fmt::format(fmt::runtime(rfmt), "NAME", "CREATED", "DESCRIPTION")
                  << theme::color::RESET;
        for (const auto& r : rows) {
            // Pad manually for the name since it carries ANSI codes
            std::cout << "  " << theme::slate(r.name)
                      << std::string(w0 + 3 - r.name.size(), ' ')
                      << fmt::format("{:<{}} ", r.created, w1 + 2)
                      << r.description << "\n";
        }
        std::cout << "\n";
    }

    auto health = cli.service.check();
    if (!health.dangling_entries.empty()) {
        std::cout << theme::warn(fmt::format("{} template(s) have missing storage. Run 'check'.",
                                             health.dangling_entries.size()));
    }
    return true;
}

static bool do_make(BaseCLI& cli, const Args& args) {
    static const OptionTable options = {
        {"-l", {"-l", true}}, {"--location", {"-l", true}},
        {"-d", {"-d", true}}, {"--description", {"-d", true}},
        {"-i", {"-i", true}}, {"--ignore", {"-i", true}},
        {"-f", {"-f", false}}, {"--force", {"-f", false}},
    };
    ParsedArgs parsed;
    if (!parse_args(cli, "make", args, options, 1, 1, parsed)) return false;
    if (!cli.require_store()) return false;

    const std::string& name = parsed.positional[0];
    fs::path source = resolve_dir(parsed.value("-l"));
    bool force = parsed.flag("-f");

    std::cout << theme::step(fmt::format("Capturing {} as '{}'", source.string(), name));

    Result<CaptureReport> captured = [&]() {
        ProgressLine progress(cli);
        return cli.service.capture(name, source, parsed.all("-i"), parsed.value("-d"), force);
    }();

    if (captured.is_err()) {
        std::string hint;
        if (captured.kind == ErrorKind::ALREADY_EXISTS) {
            hint = "Use --force to replace it, or pick another name.";
        } else if (captured.kind == ErrorKind::DESTINATION_NOT_EMPTY) {
            hint = "Run 'check --prune' to clear leftovers, or use --force.";
        } else if (captured.kind == ErrorKind::CANCELLED) {
            hint = "Nothing was stored.";
        }
        report(captured, hint);
        return false;
    }

    const auto& t = captured.value.tmpl;
    std::cout << theme::ok(fmt::format("Captured '{}' ({})", t.name,
                                       stats_line(captured.value.stats)));
    return true;
}

static bool do_new(BaseCLI& cli, const Args& args) {
    static const OptionTable options = {
        {"-n", {"-n", true}}, {"--name", {"-n", true}},
        {"-l", {"-l", true}}, {"--location", {"-l", true}},
        {"-f", {"-f", false}}, {"--force", {"-f", false}},
    };
    ParsedArgs parsed;
    if (!parse_args(cli, "new", args, options, 1, 1, parsed)) return false;
    if (!cli.require_store()) return false;

    const std::string& tmpl = parsed.positional[0];
    std::string dir_name = parsed.value("-n", tmpl);
    if (dir_name.empty() || dir_name == "." || dir_name == ".." ||
        dir_name.find('/') != std::string::npos) {
        std::cout << theme::fail("Invalid directory name: '" + dir_name + "'");
        return false;
    }
    fs::path dest = resolve_dir(parsed.value("-l")) / dir_name;

    Result<CopyStats> copied = [&]() {
        ProgressLine progress(cli);
        return cli.service.instantiate(tmpl, dest, parsed.flag("-f"));
    }();

    if (copied.is_err()) {
        std::string hint;
        if (copied.kind == ErrorKind::NOT_FOUND && copied.path.empty()) {
            hint = "Run 'list' to see available templates.";
        } else if (copied.kind == ErrorKind::DESTINATION_NOT_EMPTY) {
            hint = "Use --force to copy over existing files, or choose another name.";
        }
        report(copied, hint);
        return false;
    }

    std::cout << theme::ok(fmt::format("Created {} from '{}' ({})", dest.string(), tmpl,
                                       stats_line(copied.value)));
    return true;
}

static bool do_tree(BaseCLI& cli, const Args& args) {
    ParsedArgs parsed;
    if (!parse_args(cli, "tree", args, {}, 1, 1, parsed)) return false;
    if (!cli.require_store()) return false;

    const std::string& name = parsed.positional[0];
    auto found = cli.service.get(name);
    if (found.is_err()) {
        report(found, "Run 'list' to see available templates.");
        return false;
    }
    auto entries = cli.service.tree(name);
    if (entries.is_err()) {
        report(entries);
        return false;
    }

    const Template& t = found.value;
    std::cout << theme::section(t.name);
    if (!t.description.empty()) std::cout << theme::kv("Description", t.description);
    std::cout << theme::kv("Created", format_date(t.created_at) + "  " +
                                      theme::dim("(" + format_age(t.created_at) + ")"));
    std::cout << theme::kv("Source", t.source_path.empty() ? "-" : t.source_path);
    std::cout << theme::kv("Stored at", t.storage_path);
    if (!t.ignore.empty()) {
        std::string joined;
        for (size_t i = 0; i < t.ignore.size(); i++) {
            if (i > 0) joined += " ";
            joined += t.ignore[i];
        }
        std::cout << theme::kv("Ignored", theme::dim(joined));
    }
    std::cout << "\n";

    if (entries.value.empty()) {
        std::cout << theme::dim("    (empty)") << "\n\n";
        return true;
    }

    int64_t total = 0;
    for (const auto& e : entries.value) {
        std::string indent(4 + 2 * e.depth, ' ');
        std::string leaf = fs::path(e.path).filename().string();
        switch (e.kind) {
            case TreeEntry::DIRECTORY:
                std::cout << indent << theme::slate(leaf + "/") << "\n";
                break;
            case TreeEntry::SYMLINK:
                std::cout << indent << theme::ochre(leaf) << theme::dim(" @") << "\n";
                break;
            case TreeEntry::FILE:
                total += e.size;
                std::cout << indent << leaf << "  " << theme::dim(format_bytes(e.size)) << "\n";
                break;
        }
    }
    std::cout << "\n" << theme::dim(fmt::format("    {} entries, {}",
                                                 entries.value.size(), format_bytes(total)))
              << "\n\n";
    return true;
}

static bool do_remove(BaseCLI& cli, const Args& args) {
    static const OptionTable options = {
        {"-y", {"-y", false}}, {"--yes", {"-y", false}},
    };
    ParsedArgs parsed;
    if (!parse_args(cli, "remove", args, options, 1, 1, parsed)) return false;
    if (!cli.require_store()) return false;

    const std::string& name = parsed.positional[0];
    auto found = cli.service.get(name);
    if (found.is_err()) {
        report(found, "Run 'list' to see available templates.");
        return false;
    }

    if (!parsed.flag("-y")) {
        if (!platform::stdin_is_terminal()) {
            std::cout << theme::fail("Refusing to remove '" + name + "' without confirmation.");
            std::cout << theme::step("Pass -y to remove non-interactively.");
            return false;
        }
        if (!prompt_yes_no("Remove template '" + name + "'?", false)) {
            std::cout << theme::info("Kept '" + name + "'.");
            return true;
        }
    }

    auto removed = cli.service.remove(name);
    if (removed.is_err()) {
        std::string hint;
        if (removed.kind == ErrorKind::IO_FAILURE) {
            hint = "Run 'check --prune' to delete the leftover storage.";
        }
        report(removed, hint);
        return false;
    }
    std::cout << theme::ok("Removed '" + name + "'");
    return true;
}

static bool do_rename(BaseCLI& cli, const Args& args) {
    ParsedArgs parsed;
    if (!parse_args(cli, "rename", args, {}, 2, 2, parsed)) return false;
    if (!cli.require_store()) return false;

    auto renamed = cli.service.rename(parsed.positional[0], parsed.positional[1]);
    if (renamed.is_err()) {
        report(renamed);
        return false;
    }
    std::cout << theme::ok(fmt::format("Renamed '{}' to '{}'",
                                       parsed.positional[0], renamed.value.name));
    return true;
}

static bool do_describe(BaseCLI& cli, const Args& args) {
    if (args.empty()) {
        std::cout << theme::fail("Missing argument.");
        cli.print_usage("describe");
        return false;
    }
    if (!cli.require_store()) return false;

    // Everything after the name is the description; none clears it
    std::string text = StringUtils::join(args, 1);
    trim(text);

    auto described = cli.service.describe(args[0], text);
    if (described.is_err()) {
        report(described);
        return false;
    }
    if (text.empty()) {
        std::cout << theme::ok("Cleared description of '" + args[0] + "'");
    } else {
        std::cout << theme::ok("Updated description of '" + args[0] + "'");
    }
    return true;
}

static bool do_check(BaseCLI& cli, const Args& args) {
    static const OptionTable options = {
        {"--prune", {"--prune", false}},
    };
    ParsedArgs parsed;
    if (!parse_args(cli, "check", args, options, 0, 0, parsed)) return false;
    if (!cli.require_store()) return false;

    auto health = cli.service.check();
    if (health.healthy()) {
        std::cout << theme::ok(fmt::format("Registry consistent ({} templates)",
                                           cli.service.list().size()));
        return true;
    }

    for (const auto& name : health.dangling_entries) {
        std::cout << theme::fail("'" + name + "' is registered but its storage is missing");
        std::cout << theme::step("Run 'remove " + name + "' to drop the entry.");
    }
    for (const auto& dir : health.orphan_storage) {
        std::cout << theme::warn("Unregistered storage: " +
                                 (cli.service.config().templates_dir() / dir).string());
    }

    if (!health.orphan_storage.empty()) {
        if (!parsed.flag("--prune")) {
            std::cout << theme::step("Run 'check --prune' to delete unregistered storage.");
        } else {
            auto pruned = cli.service.prune();
            if (pruned.is_err()) {
                report(pruned);
                return false;
            }
            std::cout << theme::ok(fmt::format("Deleted {} unregistered director{}",
                                               pruned.value, pruned.value == 1 ? "y" : "ies"));
            return health.dangling_entries.empty();
        }
    }
    return false;
}

void register_template_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "list", "List stored templates");
    cli.add_command("make", do_make,
                    "make <name> [-l dir] [-d text] [-i pattern]... [--force]",
                    "Capture a directory as a template");
    cli.add_command("new", do_new, "new <template> [-n name] [-l dir] [--force]",
                    "Create a directory from a template");
    cli.add_command("tree", do_tree, "tree <template>", "Show a template's contents");
    cli.add_command("remove", do_remove, "remove <template> [-y]", "Delete a template");
    cli.add_command("rename", do_rename, "rename <old> <new>", "Rename a template");
    cli.add_command("describe", do_describe, "describe <template> [text]",
                    "Set or clear a template's description");
    cli.add_command("check", do_check, "check [--prune]",
                    "Find registry entries and storage that disagree");
}
