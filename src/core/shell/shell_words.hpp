#pragma once

#include <optional>
#include <string>
#include <vector>

namespace drift::core::shell {

// POSIX-style word splitting: single quotes are literal, double quotes honour
// backslash escapes of " \ $ and `, a bare backslash escapes the next char.
// Returns nullopt for unbalanced quotes or a trailing backslash.
std::optional<std::vector<std::string>> split_words(const std::string& text);

// Splits on ; && || | & and newlines outside quotes. Redirection forms such as
// 2>&1 and &> are not separators. Segments are trimmed and empty ones dropped.
// Returns nullopt for unbalanced quotes.
std::optional<std::vector<std::string>> split_compound(const std::string& text);

// True when the text needs a shell to run: pipes, redirects, chaining,
// substitution, globs, or home/variable expansion outside single quotes.
bool has_shell_metacharacters(const std::string& text);

// Collapses every whitespace run to a single space and trims both ends.
std::string normalize_whitespace(const std::string& text);

}  // namespace drift::core::shell
