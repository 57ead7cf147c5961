#pragma once
#include <string>
#include <string_view>

namespace code_facts {

// Lowercase hex SHA-1 of `data`, truncated to `hex_chars` (0 = full 40).
std::string sha1_hex(std::string_view data, size_t hex_chars = 0);

} // namespace code_facts
