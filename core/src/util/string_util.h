#pragma once

#include <string>
#include <vector>

namespace qplan::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep type names deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Prefixes every non-empty line of `text` with `width` spaces.
std::string indent_lines(const std::string& text, size_t width);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
/// Escapes quotes, backslashes and control characters for a double-quoted literal.
std::string escape_quoted(const std::string& s);

}  // namespace qplan::util
