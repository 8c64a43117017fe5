#pragma once

#include <string>

namespace cataphract {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Writes go through a temporary sibling file and a rename so a crash never
// leaves a truncated audit export behind.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace cataphract
