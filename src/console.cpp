#include "console.hpp"

#include <iostream>

namespace vidcount {

namespace {

std::string format_line(const char* level, const std::string& tag, const std::string& message) {
    std::string line;
    line.reserve(tag.size() + message.size() + 16);
    if (level[0] != '\0') {
        line += level;
        line += ' ';
    }
    line += '[';
    line += tag;
    line += "] ";
    line += message;
    line += '\n';
    return line;
}

} // namespace

void log_info(const std::string& tag, const std::string& message) {
    std::cout << format_line("", tag, message) << std::flush;
}

void log_warn(const std::string& tag, const std::string& message) {
    std::cerr << format_line("Warning:", tag, message);
}

void log_error(const std::string& tag, const std::string& message) {
    std::cerr << format_line("Error:", tag, message);
}

} // namespace vidcount
