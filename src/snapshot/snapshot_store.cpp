#include "snapshot/snapshot_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/time/clock.hpp"

namespace drift::snapshot {

using core::errors::DriftError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kMetadataFile = "metadata.json";
constexpr const char* kFilesDir = "files";

DriftError storage_failure(const std::string& message) {
    return DriftError{ErrorCategory::Storage, message, "storage_failure",
                      "Check free disk space and permissions of the snapshot directory."};
}

DriftError corrupt_snapshot(const std::string& snapshot_id, const std::string& message) {
    return DriftError{ErrorCategory::Storage,
                      "Snapshot " + snapshot_id + " is corrupt: " + message,
                      "corrupt_snapshot"};
}

std::optional<EntryKind> parse_kind(const std::string& text) {
    if (text == "file") return EntryKind::File;
    if (text == "directory") return EntryKind::Directory;
    if (text == "missing") return EntryKind::Missing;
    return std::nullopt;
}

json snapshot_to_json(const Snapshot& snapshot) {
    json entries = json::array();
    for (const auto& entry : snapshot.entries) {
        json item;
        item["original"] = entry.original.string();
        item["existed"] = entry.existed;
        item["kind"] = to_string(entry.kind);
        item["backup"] = entry.backup_key;
        item["size_bytes"] = entry.size_bytes;
        entries.push_back(item);
    }

    json payload;
    payload["id"] = snapshot.id;
    payload["timestamp"] = snapshot.timestamp;
    payload["created_unix_ms"] = snapshot.created_unix_ms;
    payload["size_bytes"] = snapshot.size_bytes;
    payload["entries"] = entries;
    return payload;
}

core::errors::Result<Snapshot> read_metadata(const fs::path& snapshot_dir,
                                             const std::string& snapshot_id) {
    std::ifstream in(snapshot_dir / kMetadataFile);
    if (!in.is_open()) {
        return corrupt_snapshot(snapshot_id, "metadata is unreadable");
    }

    const json payload = json::parse(in, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return corrupt_snapshot(snapshot_id, "metadata is not valid JSON");
    }

    Snapshot snapshot;
    try {
        snapshot.id = payload.at("id").get<std::string>();
        snapshot.timestamp = payload.value("timestamp", std::string());
        snapshot.created_unix_ms = payload.at("created_unix_ms").get<std::int64_t>();
        snapshot.size_bytes = payload.value("size_bytes", static_cast<std::uintmax_t>(0));
        for (const auto& item : payload.at("entries")) {
            SnapshotEntry entry;
            entry.original = item.at("original").get<std::string>();
            entry.existed = item.at("existed").get<bool>();
            const auto kind = parse_kind(item.at("kind").get<std::string>());
            if (!kind.has_value()) {
                return corrupt_snapshot(snapshot_id, "unknown entry kind");
            }
            entry.kind = kind.value();
            entry.backup_key = item.value("backup", std::string());
            entry.size_bytes = item.value("size_bytes", static_cast<std::uintmax_t>(0));
            snapshot.entries.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        return corrupt_snapshot(snapshot_id, e.what());
    }

    if (snapshot.id != snapshot_id) {
        return corrupt_snapshot(snapshot_id, "metadata id does not match its directory");
    }
    return snapshot;
}

std::uintmax_t tree_size(const fs::path& dir) {
    std::uintmax_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec) && !size_ec) {
            const auto size = it->file_size(size_ec);
            if (!size_ec) {
                total += size;
            }
        }
    }
    return total;
}

bool same_content(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    const auto size_a = fs::file_size(a, ec);
    if (ec) {
        return false;
    }
    const auto size_b = fs::file_size(b, ec);
    if (ec || size_a != size_b) {
        return false;
    }

    std::ifstream in_a(a, std::ios::binary);
    std::ifstream in_b(b, std::ios::binary);
    if (!in_a.is_open() || !in_b.is_open()) {
        return false;
    }
    return std::equal(std::istreambuf_iterator<char>(in_a), std::istreambuf_iterator<char>(),
                      std::istreambuf_iterator<char>(in_b));
}

// Copies over target through a sibling temp file so a crash never leaves a
// half-written original behind.
bool replace_file(const fs::path& backup, const fs::path& target, std::error_code& ec) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return false;
    }
    if (fs::is_directory(fs::symlink_status(target, ec))) {
        fs::remove_all(target, ec);
        if (ec) {
            return false;
        }
    }
    ec.clear();

    const fs::path temp = target.parent_path() / ("." + target.filename().string() + ".drift-restore");
    fs::copy_file(backup, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return false;
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return false;
    }
    return true;
}

bool replace_directory(const fs::path& backup, const fs::path& target, std::error_code& ec) {
    if (fs::exists(fs::symlink_status(target, ec))) {
        fs::remove_all(target, ec);
        if (ec) {
            return false;
        }
    }
    ec.clear();
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return false;
    }
    fs::copy(backup, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    return !ec;
}

struct RestoreAction {
    const SnapshotEntry* entry;
    fs::path target;
    fs::path backup;
};

}  // namespace

std::string to_string(const EntryKind kind) {
    switch (kind) {
        case EntryKind::File:
            return "file";
        case EntryKind::Directory:
            return "directory";
        case EntryKind::Missing:
            return "missing";
        default:
            return "unknown";
    }
}

SnapshotStore::SnapshotStore(fs::path root, policy::PathGuard guard)
    : root_(std::move(root)), guard_(std::move(guard)) {}

bool SnapshotStore::is_valid_id(const std::string& snapshot_id) {
    if (snapshot_id.empty() || snapshot_id.size() > 64 || snapshot_id.front() == '.') {
        return false;
    }
    return std::all_of(snapshot_id.begin(), snapshot_id.end(), [](const char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-';
    });
}

core::errors::Result<fs::path> SnapshotStore::ensure_root() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return storage_failure("Unable to create snapshot directory " + root_.string() +
                               ": " + ec.message());
    }
    return root_;
}

std::int64_t SnapshotStore::next_timestamp_locked() {
    if (!last_created_ms_.has_value()) {
        std::int64_t newest = 0;
        auto existing = list();
        if (!core::errors::is_error(existing)) {
            for (const auto& snapshot : core::errors::get_value(existing)) {
                newest = std::max(newest, snapshot.created_unix_ms);
            }
        }
        last_created_ms_ = newest;
    }
    // Strictly increasing so newest-first ordering is total.
    const std::int64_t stamp = std::max(core::time::now_unix_ms(), last_created_ms_.value() + 1);
    last_created_ms_ = stamp;
    return stamp;
}

core::errors::Result<Snapshot> SnapshotStore::create(const std::vector<fs::path>& paths) {
    std::vector<fs::path> targets;
    std::unordered_set<std::string> seen;
    for (const auto& path : paths) {
        if (!path.is_absolute()) {
            return DriftError{ErrorCategory::Input,
                              "Snapshot paths must be absolute: " + path.string(),
                              "invalid_path"};
        }
        auto resolved = guard_.resolve_within(path);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        fs::path target = core::errors::get_value(resolved);
        if (target.filename().empty() && target.has_relative_path()) {
            target = target.parent_path();
        }
        if (seen.insert(target.string()).second) {
            targets.push_back(target);
        }
    }

    auto root = ensure_root();
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string snapshot_id;
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts && snapshot_id.empty(); ++attempt) {
        const std::string candidate = core::config::generate_snapshot_id();
        std::error_code ec;
        if (!fs::exists(root_ / candidate, ec) &&
            !fs::exists(root_ / ("." + candidate + ".staging"), ec)) {
            snapshot_id = candidate;
        }
    }
    if (snapshot_id.empty()) {
        return DriftError{ErrorCategory::Internal, "Unable to allocate unique snapshot ID.",
                          "snapshot_id_generation_failed"};
    }

    const fs::path staging = root_ / ("." + snapshot_id + ".staging");
    const fs::path final_dir = root_ / snapshot_id;
    auto discard = [&staging]() {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
    };

    std::error_code ec;
    fs::create_directories(staging / kFilesDir, ec);
    if (ec) {
        discard();
        return storage_failure("Unable to create staging directory " + staging.string() +
                               ": " + ec.message());
    }

    Snapshot snapshot;
    snapshot.id = snapshot_id;
    snapshot.created_unix_ms = next_timestamp_locked();
    snapshot.timestamp = core::time::format_iso8601(snapshot.created_unix_ms);

    for (std::size_t i = 0; i < targets.size(); ++i) {
        const fs::path& target = targets[i];
        SnapshotEntry entry;
        entry.original = target;

        const auto status = fs::symlink_status(target, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            discard();
            return storage_failure("Unable to inspect " + target.string() + ": " + ec.message());
        }
        ec.clear();

        if (!fs::exists(status)) {
            entry.existed = false;
            entry.kind = EntryKind::Missing;
            snapshot.entries.push_back(std::move(entry));
            continue;
        }

        entry.existed = true;
        entry.backup_key = std::string(kFilesDir) + "/" + std::to_string(i);
        const fs::path backup = staging / entry.backup_key;

        if (fs::is_regular_file(status)) {
            entry.kind = EntryKind::File;
            fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
            if (!ec) {
                entry.size_bytes = fs::file_size(backup, ec);
            }
        } else if (fs::is_directory(status)) {
            entry.kind = EntryKind::Directory;
            fs::copy(target, backup,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (!ec) {
                entry.size_bytes = tree_size(backup);
            }
        } else {
            discard();
            return storage_failure("Unsupported file type for snapshot: " + target.string());
        }

        if (ec) {
            discard();
            return storage_failure("Unable to back up " + target.string() + ": " + ec.message());
        }
        snapshot.size_bytes += entry.size_bytes;
        snapshot.entries.push_back(std::move(entry));
    }

    {
        std::ofstream out(staging / kMetadataFile);
        if (!out.is_open()) {
            discard();
            return storage_failure("Unable to open snapshot metadata in " + staging.string());
        }
        out << snapshot_to_json(snapshot).dump(2);
        out.flush();
        if (!out.good()) {
            discard();
            return storage_failure("Unable to write snapshot metadata in " + staging.string());
        }
    }

    fs::rename(staging, final_dir, ec);
    if (ec) {
        discard();
        return storage_failure("Unable to promote snapshot " + snapshot_id + ": " + ec.message());
    }

    DRIFT_LOG_INFO("SnapshotStore: created snapshot " + snapshot_id + " with " +
                   std::to_string(snapshot.entries.size()) + " entries (" +
                   std::to_string(snapshot.size_bytes) + " bytes)");
    return snapshot;
}

core::errors::Result<Snapshot> SnapshotStore::get(const std::string& snapshot_id) const {
    if (!is_valid_id(snapshot_id)) {
        return DriftError{ErrorCategory::Input, "Invalid snapshot ID: " + snapshot_id,
                          "invalid_snapshot_id"};
    }

    const fs::path dir = root_ / snapshot_id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) {
        return DriftError{ErrorCategory::Input, "Snapshot not found: " + snapshot_id,
                          "snapshot_not_found",
                          "It may have been pruned by cleanup or consumed by undo."};
    }
    return read_metadata(dir, snapshot_id);
}

core::errors::Result<RestoreReport> SnapshotStore::restore(const std::string& snapshot_id) const {
    auto loaded = get(snapshot_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const Snapshot& snapshot = core::errors::get_value(loaded);

    std::error_code ec;
    const fs::path snapshot_dir = fs::weakly_canonical(root_ / snapshot_id, ec);
    if (ec) {
        return corrupt_snapshot(snapshot_id, "snapshot directory cannot be resolved");
    }

    // Phase 1: every entry is checked before anything is written.
    std::vector<RestoreAction> actions;
    actions.reserve(snapshot.entries.size());
    for (const auto& entry : snapshot.entries) {
        if (!entry.original.is_absolute()) {
            return DriftError{ErrorCategory::Policy,
                              "Snapshot entry is not an absolute path: " + entry.original.string(),
                              "path_violation"};
        }
        auto resolved = guard_.resolve_within(entry.original);
        if (core::errors::is_error(resolved)) {
            auto error = core::errors::get_error(resolved);
            error.message = "Refusing to restore snapshot " + snapshot_id + ": " + error.message;
            DRIFT_LOG_ERROR("SnapshotStore: " + error.message);
            return error;
        }

        RestoreAction action{&entry, core::errors::get_value(resolved), {}};
        if (entry.existed) {
            const fs::path key(entry.backup_key);
            if (entry.backup_key.empty() || key.is_absolute()) {
                return corrupt_snapshot(snapshot_id, "entry has no valid backup key");
            }
            action.backup = fs::weakly_canonical(snapshot_dir / key, ec);
            if (ec || !policy::PathGuard::is_within_root(snapshot_dir, action.backup) ||
                action.backup == snapshot_dir) {
                return DriftError{ErrorCategory::Policy,
                                  "Backup key escapes the snapshot directory: " + entry.backup_key,
                                  "path_violation"};
            }
            const bool present = entry.kind == EntryKind::Directory
                                     ? fs::is_directory(action.backup, ec)
                                     : fs::is_regular_file(action.backup, ec);
            if (!present) {
                return corrupt_snapshot(snapshot_id, "backup missing for " + entry.original.string());
            }
        }
        actions.push_back(std::move(action));
    }

    // Phase 2: apply.
    RestoreReport report;
    report.snapshot_id = snapshot_id;
    for (const auto& action : actions) {
        ec.clear();
        const SnapshotEntry& entry = *action.entry;

        if (!entry.existed) {
            if (fs::exists(fs::symlink_status(action.target, ec))) {
                fs::remove_all(action.target, ec);
                if (ec) {
                    return DriftError{ErrorCategory::Storage,
                                      "Unable to remove " + action.target.string() + ": " +
                                          ec.message(),
                                      "restore_failed"};
                }
                ++report.removed;
            } else {
                ++report.unchanged;
            }
            continue;
        }

        if (entry.kind == EntryKind::File && fs::is_regular_file(action.target, ec) &&
            same_content(action.backup, action.target)) {
            ++report.unchanged;
            continue;
        }

        const bool ok = entry.kind == EntryKind::Directory
                            ? replace_directory(action.backup, action.target, ec)
                            : replace_file(action.backup, action.target, ec);
        if (!ok) {
            return DriftError{ErrorCategory::Storage,
                              "Unable to restore " + action.target.string() + ": " + ec.message(),
                              "restore_failed"};
        }
        ++report.restored;
    }

    DRIFT_LOG_INFO("SnapshotStore: restored snapshot " + snapshot_id + " (restored=" +
                   std::to_string(report.restored) + ", removed=" +
                   std::to_string(report.removed) + ", unchanged=" +
                   std::to_string(report.unchanged) + ")");
    return report;
}

core::errors::Result<std::vector<Snapshot>> SnapshotStore::list() const {
    std::vector<Snapshot> snapshots;
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return snapshots;
    }

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec || !is_valid_id(name)) {
            continue;
        }
        auto loaded = read_metadata(it->path(), name);
        if (core::errors::is_error(loaded)) {
            DRIFT_LOG_DEBUG("SnapshotStore: skipping " + name + ": " +
                            core::errors::get_error(loaded).message);
            continue;
        }
        snapshots.push_back(core::errors::get_value(loaded));
    }
    if (ec) {
        return storage_failure("Unable to list snapshots in " + root_.string() + ": " +
                               ec.message());
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const Snapshot& a, const Snapshot& b) {
        if (a.created_unix_ms != b.created_unix_ms) {
            return a.created_unix_ms > b.created_unix_ms;
        }
        return a.id > b.id;
    });
    return snapshots;
}

core::errors::Result<bool> SnapshotStore::remove(const std::string& snapshot_id) {
    if (!is_valid_id(snapshot_id)) {
        return DriftError{ErrorCategory::Input, "Invalid snapshot ID: " + snapshot_id,
                          "invalid_snapshot_id"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const auto removed = fs::remove_all(root_ / snapshot_id, ec);
    if (ec) {
        return storage_failure("Unable to delete snapshot " + snapshot_id + ": " + ec.message());
    }
    return removed > 0;
}

core::errors::Result<std::size_t> SnapshotStore::prune(
    const std::size_t keep_newest, const int older_than_days,
    const std::chrono::system_clock::time_point now) {
    auto listed = list();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const auto& snapshots = core::errors::get_value(listed);

    const std::int64_t cutoff_ms =
        core::time::to_unix_ms(now - std::chrono::hours(24) * older_than_days);

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t deleted = 0;
    for (std::size_t idx = keep_newest; idx < snapshots.size(); ++idx) {
        const Snapshot& snapshot = snapshots[idx];
        if (snapshot.created_unix_ms >= cutoff_ms) {
            continue;
        }
        std::error_code ec;
        fs::remove_all(root_ / snapshot.id, ec);
        if (ec) {
            return storage_failure("Unable to delete snapshot " + snapshot.id + ": " +
                                   ec.message());
        }
        DRIFT_LOG_INFO("SnapshotStore: pruned snapshot " + snapshot.id);
        ++deleted;
    }

    // Staging directories only survive a crash mid-create.
    std::vector<fs::path> stale;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() > 9 && name.front() == '.' &&
            name.compare(name.size() - 8, 8, ".staging") == 0) {
            stale.push_back(it->path());
        }
    }
    for (const auto& dir : stale) {
        std::error_code remove_ec;
        fs::remove_all(dir, remove_ec);
        if (remove_ec) {
            DRIFT_LOG_WARN("SnapshotStore: unable to remove staging directory " +
                           dir.string() + ": " + remove_ec.message());
        } else {
            DRIFT_LOG_DEBUG("SnapshotStore: removed stale staging directory " + dir.string());
        }
    }
    return deleted;
}

}  // namespace drift::snapshot
