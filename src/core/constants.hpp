#pragma once

constexpr const char* STENCIL_VERSION = "0.4.0";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_STENCIL_HOME = "STENCIL_HOME";   // overrides the root directory

// ── Root layout ─────────────────────────────────────────────
// Everything below the root is owned by TemplateRegistry.
constexpr const char* REGISTRY_FILE     = "registry";
constexpr const char* REGISTRY_TMP_FILE = "registry.tmp";
constexpr const char* REGISTRY_LOCK     = "registry.lock";
constexpr const char* TEMPLATES_DIR     = "templates";
constexpr const char* CONFIG_FILE       = "config.yaml";

// Scratch names inside TEMPLATES_DIR; a leading '.' keeps them out of the
// template namespace (template names may not start with '.').
constexpr const char* STAGING_PREFIX = ".incoming-";
constexpr const char* RETIRED_PREFIX = ".retired-";

constexpr int REGISTRY_FORMAT_VERSION = 1;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_IGNORE_FILE = ".stencilignore";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROGRESS_PATH_MAX = 60;   // columns of a path shown in the progress line
