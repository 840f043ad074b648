#pragma once

#include <string>

// ── Interactive prompt helpers ──────────────────────────

// Read one line. Returns default_val on empty input or EOF.
std::string prompt_line(const std::string& label, const std::string& default_val = "");

// Ask a y/n question. Empty, unrecognised input or EOF yields default_yes.
bool prompt_yes_no(const std::string& label, bool default_yes = false);
