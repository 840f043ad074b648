#include "prompts.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>

std::string prompt_line(const std::string& label, const std::string& default_val) {
    std::string suffix = default_val.empty() ? ": " : " [" + default_val + "]: ";
    std::cout << theme::color::OCHRE << "    " << label << suffix << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        // Interrupted or closed: later prompts must still read
        std::cin.clear();
        return default_val;
    }
    if (answer.empty()) return default_val;
    return answer;
}

bool prompt_yes_no(const std::string& label, bool default_yes) {
    std::string answer = prompt_line(label + (default_yes ? " [Y/n]" : " [y/N]"));
    return parse_yes_no(answer, default_yes);
}
