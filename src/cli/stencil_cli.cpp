#include "stencil_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <cstdlib>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <util/string_utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

StencilCLI::StencilCLI() : BaseCLI() {
    service.set_cancel_check([]() { return platform::interrupted(); });
    register_all_commands();
}

void StencilCLI::register_all_commands() {
    add_command("help", [](BaseCLI& cli, const Args&) {
        cli.print_help();
        return true;
    }, "help", "Show this help message");

    add_command("quit", [](BaseCLI& cli, const Args&) {
        cli.quit_requested = true;
        return true;
    }, "quit", "Exit stencil");

    add_command("exit", [](BaseCLI& cli, const Args&) {
        cli.quit_requested = true;
        return true;
    }, "exit", "Exit stencil");

    add_command("clear", [](BaseCLI& cli, const Args&) {
        std::cout << "\033[2J\033[H" << std::flush;
        return true;
    }, "clear", "Clear the screen");

    register_template_commands(*this);
}

bool StencilCLI::run_interruptible(const std::string& command,
                                   const std::vector<std::string>& args) {
    platform::install_interrupt_handler();
    bool ok = execute_command(command, args);
    if (platform::interrupted()) {
        stencil_log("interrupted during '" + command + "'");
    }
    platform::remove_interrupt_handler();
    platform::clear_interrupted();
    return ok;
}

int StencilCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (!has_command(command) || command == "quit" || command == "exit" || command == "clear") {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'stencil --help' for usage.");
        return 1;
    }
    stencil_log("command: " + command + " " + StringUtils::join(args));
    return run_interruptible(command, args) ? 0 : 1;
}

void StencilCLI::run_repl() {
    std::cout << theme::banner();

    if (!require_store()) {
        std::cout << "\n";
        return;
    }

    std::cout << theme::section("Template store");
    std::cout << theme::kv("Root", service.root().string());
    std::cout << theme::kv("Templates", std::to_string(service.list().size()));
    auto health = service.check();
    if (!health.healthy()) {
        std::cout << theme::warn("Registry and storage disagree. Run 'check' for details.");
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        std::vector<std::string> words;
        if (!StringUtils::split_args(line, words)) {
            std::cout << theme::fail("Unterminated quote.");
            continue;
        }
        if (words.empty()) {
            continue;
        }

        add_history(line.c_str());

        // Another process may have changed the registry since the last command
        auto reloaded = service.reload();
        if (reloaded.is_err()) {
            std::cout << theme::fail(error_message(reloaded));
            continue;
        }

        std::string command = words[0];
        words.erase(words.begin());
        stencil_log("repl: " + line);
        run_interruptible(command, words);
    }
}
