#pragma once

/**
 * Verbose logging for mllm-chat.
 *
 * Diagnostic output for HTTP traffic, SSE decoding and the tool loop when the
 * -v/--verbose flag is enabled. Streams run on a background thread, so the
 * flag is atomic and every line is written under a mutex.
 */

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace mllm {

inline std::atomic<bool> g_verbose{false};
inline std::mutex g_log_mutex;

inline void set_verbose(bool enabled) {
    g_verbose.store(enabled);
}

inline bool is_verbose() {
    return g_verbose.load();
}

/**
 * Wall-clock time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace detail {

inline void write_log_line(const char* color, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
              << message << std::endl;
}

} // namespace detail

inline void verbose_log(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    detail::write_log_line("\033[36m", category, message);
}

// Outgoing data (requests).
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    detail::write_log_line("\033[33m", category + " >>>", message);
}

// Incoming data (responses, stream lines).
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    detail::write_log_line("\033[32m", category + " <<<", message);
}

inline void verbose_err(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    detail::write_log_line("\033[31m", category + " ERR", message);
}

inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

/**
 * Hides an API key except for its first four characters.
 */
inline std::string mask_secret(const std::string& secret) {
    if (secret.empty()) return "(empty)";
    if (secret.size() <= 8) return "****";
    return secret.substr(0, 4) + "****";
}

/**
 * Collapses whitespace outside of string literals and truncates, so a JSON
 * body fits on one log line.
 */
inline std::string format_json_compact(const std::string& json_str, size_t max_len = 500) {
    std::string compact;
    compact.reserve(json_str.size());
    bool in_string = false;
    bool escaped = false;
    bool last_was_space = false;

    for (char c : json_str) {
        if (in_string) {
            compact += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            compact += c;
            last_was_space = false;
        } else if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            if (!last_was_space) {
                compact += ' ';
                last_was_space = true;
            }
        } else {
            compact += c;
            last_was_space = false;
        }
    }

    return truncate(compact, max_len);
}

} // namespace mllm
