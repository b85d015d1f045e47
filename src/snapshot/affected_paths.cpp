#include "snapshot/affected_paths.hpp"

#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include "core/shell/shell_words.hpp"

namespace drift::snapshot {

namespace {

bool is_file_mutating(const std::string& program) {
    static const std::unordered_set<std::string> kPrograms = {
        "mv", "cp", "rm", "rmdir", "unlink", "touch", "mkdir", "ln",
        "truncate", "tee", "chmod", "chown", "sed", "install"};
    return kPrograms.count(program) > 0;
}

// chmod 644 f / chown user f: the first operand is not a path.
bool takes_leading_spec(const std::string& program) {
    return program == "chmod" || program == "chown";
}

// Options whose value is a path the program writes to.
struct TargetOptions {
    std::string short_names;              // Letters, also found inside clusters (-xzf)
    std::vector<std::string> long_names;  // Accepted as "--name value" and "--name=value"
};

const TargetOptions* target_options(const std::string& program) {
    static const std::unordered_map<std::string, TargetOptions> kOptions = {
        {"cp", {"t", {"--target-directory"}}},
        {"mv", {"t", {"--target-directory"}}},
        {"ln", {"t", {"--target-directory"}}},
        {"install", {"t", {"--target-directory"}}},
        {"curl", {"o", {"--output", "--output-dir"}}},
        {"wget", {"oOP", {"--output-document", "--output-file", "--directory-prefix"}}},
        {"tar", {"Cf", {"--directory", "--file"}}},
        {"unzip", {"d", {}}}};
    const auto it = kOptions.find(program);
    return it == kOptions.end() ? nullptr : &it->second;
}

// Value carried by a target option word: the inline part ("--output=f",
// "-t/dir", "-czf" -> ""), an empty string when the value is the next word,
// nullopt when the word is some other option.
std::optional<std::string> match_target_option(const TargetOptions& options,
                                               const std::string& word) {
    if (word.rfind("--", 0) == 0) {
        for (const auto& name : options.long_names) {
            if (word == name) {
                return std::string();
            }
            if (word.rfind(name + "=", 0) == 0) {
                return word.substr(name.size() + 1);
            }
        }
        return std::nullopt;
    }
    for (std::size_t i = 1; i < word.size(); ++i) {
        if (options.short_names.find(word[i]) != std::string::npos) {
            return word.substr(i + 1);
        }
    }
    return std::nullopt;
}

// tar names its archive with -f; only -c, -r and -u write to it.
bool tar_writes_archive(const std::vector<std::string>& words, std::size_t start) {
    for (std::size_t i = start + 1; i < words.size(); ++i) {
        const std::string& word = words[i];
        if (word == "--create" || word == "--append" || word == "--update") {
            return true;
        }
        const bool cluster = word.size() > 1 && word[0] == '-' && word[1] != '-';
        if (cluster && word.find_first_of("cru") != std::string::npos) {
            return true;
        }
    }
    return false;
}

// install -m 755 / -o root: values that are not paths.
bool takes_plain_value(const std::string& program, const std::string& word) {
    return program == "install" &&
           (word == "-m" || word == "-o" || word == "-g" || word == "-S");
}

std::string basename_of(const std::string& program) {
    const auto slash = program.rfind('/');
    return slash == std::string::npos ? program : program.substr(slash + 1);
}

// Returns the target of a redirection word (">out", "2>>log", "&>all"), or
// an empty string when the word is not one. A bare ">" yields ">".
std::string redirect_target(const std::string& word) {
    std::size_t pos = 0;
    while (pos < word.size() && std::isdigit(static_cast<unsigned char>(word[pos])) != 0) {
        ++pos;
    }
    if (pos < word.size() && word[pos] == '&') {
        ++pos;
    }
    if (pos >= word.size() || word[pos] != '>') {
        return "";
    }
    while (pos < word.size() && (word[pos] == '>' || word[pos] == '|')) {
        ++pos;
    }
    if (pos < word.size() && word[pos] == '&') {
        return "";  // 2>&1 duplicates a descriptor
    }
    return pos < word.size() ? word.substr(pos) : ">";
}

}  // namespace

std::vector<std::string> mutated_operands(const std::string& command) {
    std::vector<std::string> operands;
    const auto segments = core::shell::split_compound(command);
    if (!segments.has_value()) {
        return operands;
    }

    for (const auto& segment : segments.value()) {
        const auto parsed = core::shell::split_words(segment);
        if (!parsed.has_value() || parsed->empty()) {
            continue;
        }
        std::vector<std::string> words;

        // Redirection targets first; they are stripped from the argument list.
        for (std::size_t i = 0; i < parsed->size(); ++i) {
            const std::string& word = (*parsed)[i];
            const std::string target = redirect_target(word);
            if (target.empty()) {
                words.push_back(word);
                continue;
            }
            if (target == ">") {
                if (i + 1 < parsed->size()) {
                    const std::string& next = (*parsed)[++i];
                    if (next != "/dev/null") {
                        operands.push_back(next);
                    }
                }
                continue;
            }
            if (target != "/dev/null") {
                operands.push_back(target);
            }
        }

        std::size_t start = 0;
        while (start < words.size() &&
               (words[start] == "sudo" || words[start].find('=') != std::string::npos)) {
            ++start;
        }
        if (start >= words.size()) {
            continue;
        }
        const std::string program = basename_of(words[start]);
        const bool positional = is_file_mutating(program);
        const TargetOptions* options = target_options(program);
        if (!positional && options == nullptr && program != "dd") {
            continue;
        }
        const TargetOptions extract_options{"C", {"--directory"}};
        if (program == "tar") {
            if (start + 1 < words.size() && !words[start + 1].empty() &&
                words[start + 1][0] != '-') {
                words[start + 1].insert(0, "-");  // tar czf: old-style key letters
            }
            if (!tar_writes_archive(words, start)) {
                options = &extract_options;
            }
        }
        if (program == "sed") {
            bool in_place = false;
            for (std::size_t i = start + 1; i < words.size(); ++i) {
                in_place = in_place || words[i].rfind("-i", 0) == 0;
            }
            if (!in_place) {
                continue;
            }
        }

        bool skipped_spec = !takes_leading_spec(program);
        bool skipped_script = program != "sed";
        bool options_done = false;
        for (std::size_t i = start + 1; i < words.size(); ++i) {
            const std::string& word = words[i];
            if (program == "dd") {
                if (word.rfind("of=", 0) == 0 && word.size() > 3) {
                    operands.push_back(word.substr(3));
                }
                continue;
            }
            if (!options_done && word == "--") {
                options_done = true;
                continue;
            }
            if (!options_done && word.size() > 1 && word.front() == '-') {
                std::optional<std::string> value;
                if (options != nullptr) {
                    value = match_target_option(*options, word);
                }
                if (value.has_value()) {
                    if (value->empty() && i + 1 < words.size()) {
                        value = words[++i];
                    }
                    if (!value->empty() && value.value() != "-") {  // "-" is stdout
                        operands.push_back(value.value());
                    }
                    continue;
                }
                if (program == "sed" && (word == "-e" || word == "-f") && i + 1 < words.size()) {
                    ++i;
                    skipped_script = true;
                } else if (takes_plain_value(program, word) && i + 1 < words.size()) {
                    ++i;
                }
                continue;
            }
            if (!positional) {
                continue;  // curl URLs, tar members: read, not written
            }
            if (!skipped_spec) {
                skipped_spec = true;
                continue;
            }
            if (!skipped_script) {
                skipped_script = true;
                continue;
            }
            operands.push_back(word);
        }
    }
    return operands;
}

std::vector<std::filesystem::path> collect_snapshot_paths(
    const protocol::Plan& plan, const std::filesystem::path& base,
    const policy::PathGuard& guard) {
    std::vector<std::filesystem::path> paths;
    std::unordered_set<std::string> seen;

    auto absolute_of = [&base](const std::string& raw) {
        std::filesystem::path path = policy::PathGuard::expand_home(raw);
        if (path.is_relative()) {
            path = base / path;
        }
        path = path.lexically_normal();
        if (path.filename().empty() && path.has_relative_path()) {
            path = path.parent_path();  // "build/" -> "build"
        }
        return path;
    };

    for (const auto& declared : plan.affected_files) {
        if (declared.empty()) {
            continue;
        }
        const auto path = absolute_of(declared);
        if (seen.insert(path.string()).second) {
            paths.push_back(path);
        }
    }

    for (const auto& command : plan.commands) {
        for (const auto& operand : mutated_operands(command.command)) {
            if (operand.find_first_of("*?[$`") != std::string::npos) {
                continue;  // Unexpanded globs and variables name no single path
            }
            const auto path = absolute_of(operand);
            if (!guard.contains(path)) {
                continue;
            }
            if (seen.insert(path.string()).second) {
                paths.push_back(path);
            }
        }
    }
    return paths;
}

}  // namespace drift::snapshot
