#pragma once

namespace platform {

// Get terminal width in columns (80 when stdout is not a terminal).
int term_width();

bool stdin_is_terminal();
bool stdout_is_terminal();

// Ctrl-C handling for long copies. While installed, SIGINT only raises a
// flag that the running operation polls between entries.
void install_interrupt_handler();
void remove_interrupt_handler();
bool interrupted();
void clear_interrupted();

} // namespace platform
