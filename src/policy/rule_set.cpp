#include "policy/rule_set.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace drift::policy {

using core::errors::DriftError;
using core::errors::ErrorCategory;
using protocol::RiskLevel;

namespace {

// Leading option words of rm, e.g. "-rf", "-r -f", "--no-preserve-root".
constexpr const char* kRecursiveRm =
    R"re(\brm\s+(-\S+\s+)*-[a-zA-Z]*[rR][a-zA-Z]*\s+(-\S+\s+)*)re";

const char* const kSystemDirs =
    "(bin|boot|dev|etc|lib|lib32|lib64|opt|proc|root|run|sbin|srv|sys|usr|var|"
    "home|Users|System|Library|Applications|Volumes)";

}  // namespace

std::vector<RuleSpec> default_rule_specs() {
    const std::string rm = kRecursiveRm;
    const std::string sys = kSystemDirs;

    return {
        // --- Hard blocklist -------------------------------------------------
        {"recursive-root-deletion", rm + R"re(/\*?(\s|$))re", RiskLevel::Blocked,
         "Recursive deletion of the filesystem root"},
        {"recursive-system-dir-deletion", rm + "/" + sys + R"re(/?\*?(\s|$))re",
         RiskLevel::Blocked, "Recursive deletion of a system directory"},
        {"recursive-home-deletion", rm + R"re((~|\$HOME|\$\{HOME\})/?\*?(\s|$))re",
         RiskLevel::Blocked, "Recursive deletion of the home directory"},
        {"recursive-wildcard-deletion", rm + R"re(\*(\s|$))re", RiskLevel::Blocked,
         "Recursive deletion of everything in the working directory"},
        {"privileged-recursive-deletion", R"re(\bsudo\s+(-\S+\s+)*rm\s+-[a-zA-Z]*[rR])re",
         RiskLevel::Blocked, "Recursive deletion as root"},
        {"disk-format", R"re(\bmkfs(\.\w+)?\b)re", RiskLevel::Blocked,
         "Filesystem creation on a device"},
        {"raw-device-overwrite", R"re(\bdd\s+.*\bof=/dev/)re", RiskLevel::Blocked,
         "dd writing to a device node"},
        {"raw-device-redirect", R"re(>\s*/dev/(sd|hd|nvme|disk|mmcblk|xvd|vd))re",
         RiskLevel::Blocked, "Redirecting output onto a disk device"},
        {"move-onto-device", R"re(\bmv\s+.*\s/dev/(sd|hd|nvme|null))re", RiskLevel::Blocked,
         "Moving files onto a device node"},
        {"partition-tool", R"re(\b(fdisk|sfdisk|parted|wipefs)\s)re", RiskLevel::Blocked,
         "Partition table manipulation"},
        {"diskutil-erase", R"re(\bdiskutil\s+(eraseDisk|eraseVolume|partitionDisk))re",
         RiskLevel::Blocked, "Disk erase through diskutil"},
        {"fork-bomb", R"re(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)re",
         RiskLevel::Blocked, "Shell fork bomb"},
        {"pipe-to-shell-download",
         R"re(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?(sh|bash|zsh|dash|ksh|python[23]?|ruby|perl|node)\b)re",
         RiskLevel::Blocked, "Downloaded content piped into an interpreter"},
        {"process-substitution-download", R"re(<\(\s*(curl|wget)\b)re", RiskLevel::Blocked,
         "Downloaded content executed through process substitution"},
        {"world-writable-root", R"re(\bchmod\s+(-R\s+)?777\s+/)re", RiskLevel::Blocked,
         "Making system paths world-writable"},
        {"recursive-chmod-root", R"re(\bchmod\s+(-\S+\s+)*-R\s+(-\S+\s+)*\S+\s+/(\s|$))re",
         RiskLevel::Blocked, "Recursive permission change on the filesystem root"},
        {"recursive-chown-system",
         R"re(\bchown\s+(-\S+\s+)*-R\s+.*\s/()re" + sys + R"re(/?)?(\s|$))re",
         RiskLevel::Blocked, "Recursive ownership change on system paths"},
        {"setuid-chmod", R"re(\bchmod\s+(-\S+\s+)*([ugoa]*\+s|[0-7]?[4-7][0-7]{3})(\s|$))re",
         RiskLevel::Blocked, "Setting the setuid/setgid bit"},
        {"inline-python-exec", R"re(\bpython[23]?\s+-c\s+.*\b(exec|eval)\s*\()re",
         RiskLevel::Blocked, "Inline python executing dynamic code"},
        {"inline-perl", R"re(\bperl\s+-e\s)re", RiskLevel::Blocked, "Inline perl program"},
        {"inline-ruby", R"re(\bruby\s+-e\s)re", RiskLevel::Blocked, "Inline ruby program"},
        {"inline-node", R"re(\bnode\s+-e\s)re", RiskLevel::Blocked, "Inline node program"},
        {"inline-php", R"re(\bphp\s+-r\s)re", RiskLevel::Blocked, "Inline php program"},
        {"shell-command-substitution", R"re(\bbash\s+-c\s+.*\$\()re", RiskLevel::Blocked,
         "bash -c wrapping a command substitution"},
        {"shell-backtick-substitution", R"re(\bsh\s+-c\s+.*`)re", RiskLevel::Blocked,
         "sh -c wrapping a backtick substitution"},
        {"eval-variable", R"re(\beval\s+"?\$)re", RiskLevel::Blocked,
         "eval of a variable expansion"},
        {"netcat-exec", R"re(\b(nc|ncat|netcat)\b.*\s-[a-zA-Z]*[ec]\s)re", RiskLevel::Blocked,
         "Netcat attaching a program to a socket"},
        {"dev-tcp-socket", R"re(/dev/(tcp|udp)/)re", RiskLevel::Blocked,
         "Bash network redirection (reverse shell)"},
        {"socat-exec", R"re(\bsocat\b.*\b(exec|system):)re", RiskLevel::Blocked,
         "socat spawning a program"},
        {"credential-exfiltration",
         R"re(\b(curl|wget)\b.*(--data(-binary|-raw)?|-d|-F|--form|-T|--upload-file|--post-file)[=\s]*@?\S*(/etc/(passwd|shadow)|\.ssh/|\.aws/|\.gnupg/|\.netrc))re",
         RiskLevel::Blocked, "Uploading credentials or system secrets"},
        {"ssh-key-copy-out", R"re(\b(scp|rsync)\b.*(\.ssh/id_|/etc/shadow))re",
         RiskLevel::Blocked, "Copying private keys off the machine"},
        {"crypto-miner", R"re(\b(xmrig|minerd|cpuminer|cryptonight)\b|stratum\+tcp://)re",
         RiskLevel::Blocked, "Cryptocurrency miner"},
        {"base64-decoded-execution",
         R"re(\bbase64\s+(-\S+\s+)*(-d|--decode|-D)(\s|$).*\|\s*(sudo\s+)?(sh|bash|zsh|dash|python[23]?|perl|ruby)\b)re",
         RiskLevel::Blocked, "Executing base64-obfuscated content"},
        {"base64-perl-exec", R"re(base64.*perl.*exec)re", RiskLevel::Blocked,
         "Executing base64-obfuscated perl"},

        // --- High risk ------------------------------------------------------
        {"sudo", R"re(\b(sudo|doas)\s)re", RiskLevel::High, "Privilege elevation"},
        {"recursive-delete", R"re(\brm\s+(-\S+\s+)*-[a-zA-Z]*[rR])re", RiskLevel::High,
         "Recursive deletion"},
        {"chmod-777", R"re(\bchmod\s+(-\S+\s+)*777\b)re", RiskLevel::High,
         "World-writable permissions"},
        {"chmod-recursive", R"re(\bchmod\s+(-\S+\s+)*-R\b)re", RiskLevel::High,
         "Recursive permission change"},
        {"chown-recursive", R"re(\bchown\s+(-\S+\s+)*-R\b)re", RiskLevel::High,
         "Recursive ownership change"},
        {"device-write", R"re(>\s*/dev/(?!(null|stdout|stderr|tty)\b))re", RiskLevel::High,
         "Writing to a device node"},
        {"dd", R"re(\bdd\s)re", RiskLevel::High, "Raw block copy"},
        {"kill-9", R"re(\bkill\s+-(9|KILL|SIGKILL)\b)re", RiskLevel::High,
         "Forced process kill"},
        {"pkill", R"re(\b(pkill|killall)\s)re", RiskLevel::High, "Killing processes by name"},
        {"power-state", R"re(\b(shutdown|reboot|halt|poweroff)\b)re", RiskLevel::High,
         "Changing machine power state"},
        {"service-disable", R"re(\bsystemctl\s+(disable|stop|mask)\b|\blaunchctl\s+unload\b)re",
         RiskLevel::High, "Stopping or disabling system services"},
        {"directory-service", R"re(\bdscl\s)re", RiskLevel::High,
         "Directory service modification"},
        {"git-force-push", R"re(\bgit\s+push\s+(.*\s)?(-f|--force|--force-with-lease)(\s|$|=))re",
         RiskLevel::High, "Rewriting remote history"},
        {"git-reset-hard", R"re(\bgit\s+reset\s+(.*\s)?--hard\b)re", RiskLevel::High,
         "Discarding local changes"},
        {"git-clean-force", R"re(\bgit\s+clean\s+(-\S+\s+)*-[a-zA-Z]*f)re", RiskLevel::High,
         "Deleting untracked files"},
        {"docker-prune-all", R"re(\bdocker\s+system\s+prune\s+(.*\s)?(-a|--all)\b)re",
         RiskLevel::High, "Removing all docker data"},
        {"global-uninstall",
         R"re(\bnpm\s+(uninstall|rm|remove)\s+(.*\s)?-g\b|\bbrew\s+uninstall\b|\bpip3?\s+uninstall\b)re",
         RiskLevel::High, "Removing globally installed packages"},
        {"system-package-removal", R"re(\b(apt|apt-get|yum|dnf)\s+(remove|purge|autoremove|erase)\b)re",
         RiskLevel::High, "Removing system packages"},

        // --- Medium risk ----------------------------------------------------
        {"delete", R"re(\b(rm|rmdir|unlink)\s)re", RiskLevel::Medium, "File deletion"},
        {"move", R"re(\bmv\s)re", RiskLevel::Medium, "Moving or renaming files"},
        {"copy", R"re(\bcp\s)re", RiskLevel::Medium, "Copying over files"},
        {"chmod", R"re(\bchmod\s)re", RiskLevel::Medium, "Permission change"},
        {"chown", R"re(\bchown\s)re", RiskLevel::Medium, "Ownership change"},
        {"create-file", R"re(\b(touch|mkdir|ln|truncate)\s)re", RiskLevel::Medium,
         "Creating files, directories or links"},
        {"in-place-edit", R"re(\bsed\s+(-\S+\s+)*-i|\bperl\s+-pi\b)re", RiskLevel::Medium,
         "Editing files in place"},
        {"tee", R"re(\btee\s)re", RiskLevel::Medium, "Writing output to files"},
        {"git-push", R"re(\bgit\s+push\b)re", RiskLevel::Medium, "Publishing commits"},
        {"git-amend", R"re(\bgit\s+commit\s+(.*\s)?--amend\b)re", RiskLevel::Medium,
         "Rewriting the last commit"},
        {"package-install",
         R"re(\bnpm\s+install\s+(.*\s)?-g\b|\b(pip3?|pipx)\s+install\b|\bbrew\s+install\b|\b(apt|apt-get|yum|dnf)\s+install\b)re",
         RiskLevel::Medium, "Installing packages"},
        {"docker-run", R"re(\bdocker\s+(run|exec)\b)re", RiskLevel::Medium,
         "Running containers"},
        {"append-redirect", R"re(>>)re", RiskLevel::Medium, "Appending to a file"},
        {"redirect", R"re(>\s*(?!/dev/null\b)[^&\s>])re", RiskLevel::Medium,
         "Redirecting output into a file"},
    };
}

core::errors::Result<std::shared_ptr<const RuleSet>> RuleSet::compile(
    const std::vector<RuleSpec>& specs) {
    auto rules = std::make_shared<RuleSet>(Token{});
    for (const auto& spec : specs) {
        if (spec.id.empty()) {
            return DriftError{ErrorCategory::Internal, "Policy rule is missing an id.",
                              "invalid_rule"};
        }

        Rule rule{spec.id, spec.pattern, spec.severity, spec.description, std::regex()};
        try {
            rule.compiled = std::regex(spec.pattern, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            return DriftError{ErrorCategory::Internal,
                              "Policy rule " + spec.id + " has an invalid pattern: " + e.what(),
                              "invalid_rule", "", spec.id};
        }

        switch (spec.severity) {
            case RiskLevel::Blocked:
                rules->blocked_.push_back(std::move(rule));
                break;
            case RiskLevel::High:
                rules->high_.push_back(std::move(rule));
                break;
            case RiskLevel::Medium:
                rules->medium_.push_back(std::move(rule));
                break;
            default:
                return DriftError{ErrorCategory::Internal,
                                  "Policy rule " + spec.id + " cannot have severity low.",
                                  "invalid_rule", "", spec.id};
        }
    }
    return std::shared_ptr<const RuleSet>(std::move(rules));
}

const std::vector<Rule>& RuleSet::tier(const RiskLevel severity) const {
    switch (severity) {
        case RiskLevel::Blocked:
            return blocked_;
        case RiskLevel::High:
            return high_;
        case RiskLevel::Medium:
            return medium_;
        default:
            return empty_;
    }
}

std::size_t RuleSet::size() const {
    return blocked_.size() + high_.size() + medium_.size();
}

std::shared_ptr<const RuleSet> default_rule_set() {
    static const std::shared_ptr<const RuleSet> instance = []() {
        auto compiled = RuleSet::compile(default_rule_specs());
        if (!core::errors::is_error(compiled)) {
            return core::errors::get_value(compiled);
        }

        // Fail closed: with a broken table every command is refused.
        DRIFT_LOG_ERROR("Default policy table failed to compile: " +
                        core::errors::get_error(compiled).message);
        auto fallback = RuleSet::compile(
            {{"policy-table-unavailable", ".*", RiskLevel::Blocked,
              "Policy table failed to load"}});
        return core::errors::get_value(fallback);
    }();
    return instance;
}

}  // namespace drift::policy
