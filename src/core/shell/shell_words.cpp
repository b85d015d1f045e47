#include "core/shell/shell_words.hpp"

#include <cctype>
#include <string_view>

namespace drift::core::shell {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(value[begin])) {
        ++begin;
    }
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

char last_non_space(const std::string& value) {
    for (auto it = value.rbegin(); it != value.rend(); ++it) {
        if (!is_space(*it)) {
            return *it;
        }
    }
    return '\0';
}

void flush_segment(std::string& current, std::vector<std::string>& segments) {
    std::string segment = trim(current);
    if (!segment.empty()) {
        segments.push_back(std::move(segment));
    }
    current.clear();
}

}  // namespace

std::optional<std::vector<std::string>> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    bool in_single = false;
    bool in_double = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_single) {
            if (c == '\'') {
                in_single = false;
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (in_double) {
            if (c == '"') {
                in_double = false;
                continue;
            }
            if (c == '\\' && i + 1 < text.size()) {
                const char next = text[i + 1];
                if (next == '"' || next == '\\' || next == '$' || next == '`') {
                    current.push_back(next);
                    ++i;
                    continue;
                }
            }
            current.push_back(c);
            continue;
        }

        if (is_space(c)) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'') {
            in_single = true;
        } else if (c == '"') {
            in_double = true;
        } else if (c == '\\') {
            if (i + 1 >= text.size()) {
                return std::nullopt;
            }
            current.push_back(text[++i]);
        } else {
            current.push_back(c);
        }
    }

    if (in_single || in_double) {
        return std::nullopt;
    }
    if (in_word) {
        words.push_back(current);
    }
    return words;
}

std::optional<std::vector<std::string>> split_compound(const std::string& text) {
    std::vector<std::string> segments;
    std::string current;
    bool in_single = false;
    bool in_double = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (in_single) {
            in_single = c != '\'';
            current.push_back(c);
            continue;
        }
        if (in_double) {
            if (c == '\\' && next != '\0') {
                current.push_back(c);
                current.push_back(next);
                ++i;
                continue;
            }
            in_double = c != '"';
            current.push_back(c);
            continue;
        }

        switch (c) {
            case '\'':
                in_single = true;
                current.push_back(c);
                break;
            case '"':
                in_double = true;
                current.push_back(c);
                break;
            case '\\':
                current.push_back(c);
                if (next != '\0') {
                    current.push_back(next);
                    ++i;
                }
                break;
            case ';':
            case '\n':
                flush_segment(current, segments);
                break;
            case '|':
                if (last_non_space(current) == '>') {
                    current.push_back(c);  // >| clobber redirect
                    break;
                }
                flush_segment(current, segments);
                if (next == '|' || next == '&') {
                    ++i;
                }
                break;
            case '&': {
                const char prev = current.empty() ? '\0' : current.back();
                if (prev == '>' || prev == '<' || next == '>') {
                    current.push_back(c);  // 2>&1, <&3, &>file
                    break;
                }
                flush_segment(current, segments);
                if (next == '&') {
                    ++i;
                }
                break;
            }
            default:
                current.push_back(c);
                break;
        }
    }

    if (in_single || in_double) {
        return std::nullopt;
    }
    flush_segment(current, segments);
    return segments;
}

bool has_shell_metacharacters(const std::string& text) {
    constexpr std::string_view kUnquotedMeta = "|&;<>()$`*?[]{}~#\n";
    bool in_single = false;
    bool in_double = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_single) {
            in_single = c != '\'';
            continue;
        }
        if (in_double) {
            if (c == '\\') {
                ++i;
                continue;
            }
            if (c == '$' || c == '`') {
                return true;
            }
            in_double = c != '"';
            continue;
        }
        if (c == '\'') {
            in_single = true;
        } else if (c == '"') {
            in_double = true;
        } else if (c == '\\') {
            ++i;
        } else if (kUnquotedMeta.find(c) != std::string_view::npos) {
            return true;
        }
    }
    if (in_single || in_double) {
        return true;
    }

    // Leading VAR=value assignments only mean something to a shell.
    const auto words = split_words(text);
    if (!words.has_value()) {
        return true;
    }
    return !words->empty() && words->front().find('=') != std::string::npos;
}

std::string normalize_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

}  // namespace drift::core::shell
