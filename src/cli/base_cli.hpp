#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <managers/template_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Handlers return false when the command failed (exit status 1)
    using Args = std::vector<std::string>;
    using CommandHandler = std::function<bool(BaseCLI&, const Args&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Opens the template store on first use; prints the failure otherwise.
    bool require_store();

    bool execute_command(const std::string& command, const Args& args);
    void print_help() const;
    void print_usage(const std::string& command) const;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    TemplateService service;
    bool quit_requested = false;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
