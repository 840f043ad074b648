#include <iostream>
#include <vector>
#include <string>
#include "cli/stencil_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

static void usage_row(const std::string& cmd, const std::string& args, const std::string& help) {
    std::string padded = cmd + (args.empty() ? "" : " " + args);
    int pad = 36 - static_cast<int>(padded.size());
    std::cout << theme::color::SLATE << "    " << cmd << theme::color::RESET;
    if (!args.empty()) {
        std::cout << " " << theme::color::OCHRE << args << theme::color::RESET;
    }
    std::cout << std::string(pad > 1 ? pad : 1, ' ')
              << theme::color::DIM << help << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("stencil", "", "Interactive prompt");
    usage_row("stencil list", "", "List stored templates");
    usage_row("stencil make", "<name>", "Capture the current directory");
    std::cout << theme::dim("      -l <dir>  capture <dir> instead    -d <text>  description") << "\n"
              << theme::dim("      -i <pat>  extra ignore pattern     --force    replace existing") << "\n";
    usage_row("stencil new", "<template>", "Create ./<template> from a template");
    std::cout << theme::dim("      -n <name> directory name           -l <dir>   parent directory") << "\n"
              << theme::dim("      --force   copy into a non-empty directory") << "\n";
    usage_row("stencil tree", "<template>", "Show a template's contents");
    usage_row("stencil remove", "<template> [-y]", "Delete a template");
    usage_row("stencil rename", "<old> <new>", "Rename a template");
    usage_row("stencil describe", "<template> [text]", "Set or clear a description");
    usage_row("stencil check", "[--prune]", "Verify registry against storage");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    stencil --version                   Show version\n"
              << "    stencil --help                      Show this help\n\n"
              << "    Templates live in $" << ENV_STENCIL_HOME
              << " (default ~/.config/stencil)."
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::OCHRE << theme::color::BOLD << "stencil"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << STENCIL_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help" || cmd == "-h" || cmd == "help") {
                print_usage();
                return 0;
            }
        }

        StencilCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(argv[1], args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
