#pragma once

#include <string>
#include <iostream>

namespace mllm {

// ========== ANSI Escape Codes ==========

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output for the chat front end.
 *
 * Colors are used only when stdout is a terminal and TERM is not "dumb".
 * Streamed answer text goes to stdout; status lines go to stderr so that
 * non-interactive output stays clean.
 */
class Console {
public:
    Console();

    // Streams answer text without a trailing newline.
    void print_raw(const std::string& text) const;

    // Streams reasoning text, dimmed.
    void print_reasoning(const std::string& text) const;

    void println(const std::string& text = "") const;

    // ========== Status (stderr) ==========

    void print_error(const std::string& text) const;
    void print_warning(const std::string& text) const;
    void print_success(const std::string& text) const;
    void print_info(const std::string& text) const;
    void print_header(const std::string& text) const;

    // Prints a prompt marker and reads one line. Returns false on EOF.
    bool read_line(const std::string& prompt, std::string& line) const;

    bool colors_enabled() const { return colors_enabled_; }

private:
    bool colors_enabled_;

    void print_status(const char* color, const std::string& text) const;
};

} // namespace mllm
