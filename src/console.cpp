#include "console.hpp"
#include <cstdlib>
#include <unistd.h>

namespace mllm {

Console::Console() : colors_enabled_(true) {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !isatty(STDOUT_FILENO)) {
        colors_enabled_ = false;
    }
}

void Console::print_raw(const std::string& text) const {
    std::cout << text;
    std::cout.flush();
}

void Console::print_reasoning(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::DIM << text << ansi::RESET;
    } else {
        std::cout << text;
    }
    std::cout.flush();
}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::print_status(const char* color, const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << color << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_status(ansi::RED, text);
}

void Console::print_warning(const std::string& text) const {
    print_status(ansi::YELLOW, text);
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cerr << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    print_status(ansi::CYAN, text);
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

bool Console::read_line(const std::string& prompt, std::string& line) const {
    if (colors_enabled_) {
        std::cout << ansi::BOLD << ansi::GREEN << prompt << ansi::RESET;
    } else {
        std::cout << prompt;
    }
    std::cout.flush();
    return static_cast<bool>(std::getline(std::cin, line));
}

} // namespace mllm
