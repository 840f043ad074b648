#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_template_commands(BaseCLI& cli);

class StencilCLI : public BaseCLI {
public:
    StencilCLI();

    // Interactive prompt. Returns when the user quits or stdin closes.
    void run_repl();

    // One-shot command from argv. Returns the process exit status.
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();

    // Runs a command with Ctrl-C routed to the cancel check.
    bool run_interruptible(const std::string& command, const std::vector<std::string>& args);
};
