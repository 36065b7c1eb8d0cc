#pragma once

#include <string>

namespace vidcount {

// Console output shared by dispatch tasks. Each call writes one whole line
// with a single stream insertion so lines from different threads never mix.
void log_info(const std::string& tag, const std::string& message);
void log_warn(const std::string& tag, const std::string& message);
void log_error(const std::string& tag, const std::string& message);

} // namespace vidcount
