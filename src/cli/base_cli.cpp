#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = {handler, usage, help};
}

bool BaseCLI::require_store() {
    if (service.is_open()) {
        return true;
    }
    auto opened = service.open();
    if (opened.is_err()) {
        std::cout << theme::fail(error_message(opened));
        if (opened.kind == ErrorKind::REGISTRY_CORRUPT) {
            std::cout << theme::step("Inspect or move aside " +
                                     service.config().registry_path().string());
        } else if (opened.kind == ErrorKind::CONFIG) {
            std::cout << theme::step("Fix or delete " + get_config_path(service.root()).string());
        }
        return false;
    }
    return true;
}

bool BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return false;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return false;
    }
}

void BaseCLI::print_usage(const std::string& command) const {
    auto it = commands_.find(command);
    if (it == commands_.end()) return;
    std::cout << theme::step("Usage: " + it->second.usage);
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Templates", {"list", "make", "new", "tree"}},
        {"Manage",    {"rename", "describe", "remove", "check"}},
        {"General",   {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::OCHRE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::SLATE
                          << fmt::format("    {:<34}", it->second.usage)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.help
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (!service.is_open()) {
        return rl_esc(theme::color::OCHRE) + "stencil"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::OCHRE) + "stencil"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::SLATE) + std::to_string(service.list().size())
         + rl_esc(theme::color::RESET) + "> ";
}
