#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vidcount {

// Standard alphabet with '=' padding (RFC 4648).
std::string base64_encode(const unsigned char* data, size_t size);
std::string base64_encode(const std::vector<unsigned char>& data);

// Empty on any character outside the alphabet or bad padding. Whitespace is
// skipped.
std::optional<std::vector<unsigned char>> base64_decode(const std::string& text);

} // namespace vidcount
