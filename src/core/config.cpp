#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

static std::vector<std::string> builtin_ignore() {
    return {
        ".git/",
        ".hg/",
        ".svn/",
        DEFAULT_IGNORE_FILE,
        "node_modules/",
        "__pycache__/",
        ".DS_Store",
        "*.swp",
        "*.swo",
        "*~",
    };
}

fs::path resolve_root() {
    std::string env = platform::get_env(ENV_STENCIL_HOME);
    if (!env.empty()) {
        return fs::absolute(fs::path(env));
    }
    return platform::config_dir() / "stencil";
}

fs::path get_config_path(const fs::path& root) {
    return root / CONFIG_FILE;
}

bool config_exists(const fs::path& root) {
    std::error_code ec;
    return fs::exists(get_config_path(root), ec);
}

Result<SymlinkPolicy> parse_symlink_policy(const std::string& value) {
    if (value == "copy") return Result<SymlinkPolicy>::Ok(SymlinkPolicy::COPY);
    if (value == "follow") return Result<SymlinkPolicy>::Ok(SymlinkPolicy::FOLLOW);
    if (value == "skip") return Result<SymlinkPolicy>::Ok(SymlinkPolicy::SKIP);
    return Result<SymlinkPolicy>::Err(ErrorKind::CONFIG,
        "Unknown symlink policy '" + value + "' (expected copy, follow or skip)");
}

std::string symlink_policy_name(SymlinkPolicy policy) {
    switch (policy) {
        case SymlinkPolicy::COPY:   return "copy";
        case SymlinkPolicy::FOLLOW: return "follow";
        case SymlinkPolicy::SKIP:   return "skip";
    }
    return "copy";
}

Config Config::defaults(const fs::path& root) {
    Config config;
    config.root_ = root;
    config.capture_.default_ignore = builtin_ignore();
    config.capture_.ignore_file = DEFAULT_IGNORE_FILE;
    config.capture_.keep_filtered_empty_dirs = false;
    config.capture_.symlinks = SymlinkPolicy::COPY;
    return config;
}

fs::path Config::registry_path() const {
    return root_ / REGISTRY_FILE;
}

fs::path Config::templates_dir() const {
    return root_ / TEMPLATES_DIR;
}

Result<void> create_default_config(const fs::path& root) {
    fs::path config_path = get_config_path(root);

    // Don't overwrite existing config
    if (config_exists(root)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to create " + root.string() + ": " + ec.message(), root.string());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "default_ignore" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : builtin_ignore()) out << p;
    out << YAML::EndSeq;
    out << YAML::Key << "ignore_file" << YAML::Value << DEFAULT_IGNORE_FILE;
    out << YAML::Key << "keep_filtered_empty_dirs" << YAML::Value << false;
    out << YAML::Key << "symlinks" << YAML::Value << "copy";
    out << YAML::EndMap;

    std::ofstream file(config_path);
    if (!file) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to create config file at " + config_path.string(), config_path.string());
    }
    file << "# stencil configuration\n"
         << "# default_ignore: patterns excluded from every capture\n"
         << "# ignore_file: per-directory ignore file read during capture (\"\" disables)\n"
         << "# keep_filtered_empty_dirs: keep directories whose contents were all ignored\n"
         << "# symlinks: copy | follow | skip\n\n"
         << out.c_str() << "\n";
    if (!file) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to write config file at " + config_path.string(), config_path.string());
    }
    return Result<void>::Ok();
}

Result<Config> Config::load(const fs::path& root) {
    Config config = defaults(root);
    if (!config_exists(root)) {
        return Result<Config>::Ok(config);
    }

    fs::path path = get_config_path(root);
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        if (node.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!node.IsMap()) {
            return Result<Config>::Err(ErrorKind::CONFIG,
                path.string() + ": expected a mapping at the top level", path.string());
        }

        if (node["default_ignore"]) {
            if (node["default_ignore"].IsSequence()) {
                config.capture_.default_ignore = node["default_ignore"].as<std::vector<std::string>>();
            } else if (node["default_ignore"].IsNull()) {
                config.capture_.default_ignore.clear();
            } else {
                return Result<Config>::Err(ErrorKind::CONFIG,
                    path.string() + ": default_ignore must be a list", path.string());
            }
        }

        if (node["ignore_file"]) {
            config.capture_.ignore_file = node["ignore_file"].IsNull()
                ? std::string() : node["ignore_file"].as<std::string>();
        }
        if (node["keep_filtered_empty_dirs"]) {
            if (!node["keep_filtered_empty_dirs"].IsScalar()) {
                return Result<Config>::Err(ErrorKind::CONFIG,
                    path.string() + ": keep_filtered_empty_dirs must be true or false",
                    path.string());
            }
            // Throws on anything that is not a YAML boolean
            config.capture_.keep_filtered_empty_dirs =
                node["keep_filtered_empty_dirs"].as<bool>();
        }

        if (node["symlinks"]) {
            auto policy = parse_symlink_policy(node["symlinks"].as<std::string>());
            if (policy.is_err()) {
                return Result<Config>::Err(ErrorKind::CONFIG,
                    path.string() + ": " + policy.error, path.string());
            }
            config.capture_.symlinks = policy.value;
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::CONFIG,
            std::string("Failed to parse config: ") + e.what(), path.string());
    }
}
