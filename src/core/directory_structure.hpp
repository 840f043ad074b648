#pragma once

#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Ensures <root> and <root>/templates exist.
// Creates directories as needed but does not touch existing files.
Result<void> ensure_stencil_directory_structure(const fs::path& root);
