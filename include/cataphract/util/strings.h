#pragma once

#include <string>
#include <vector>

namespace cataphract {

std::string to_lower(std::string s);

// Escape a field for RFC-4180 style CSV output (quotes only when needed).
std::string csv_escape(const std::string& s);

// Join with a separator, e.g. join_strings({"a","b"}, ", ") -> "a, b".
std::string join_strings(const std::vector<std::string>& parts, const std::string& sep);

} // namespace cataphract
