#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"
#include "policy/path_guard.hpp"

namespace drift::snapshot {

enum class EntryKind {
    File,
    Directory,
    Missing   // Did not exist at snapshot time; restore deletes it
};

struct SnapshotEntry {
    std::filesystem::path original;
    bool existed = false;
    EntryKind kind = EntryKind::Missing;
    std::string backup_key;   // Relative to the snapshot directory, e.g. "files/0"
    std::uintmax_t size_bytes = 0;
};

struct Snapshot {
    std::string id;
    std::string timestamp;
    std::int64_t created_unix_ms = 0;
    std::vector<SnapshotEntry> entries;
    std::uintmax_t size_bytes = 0;
};

struct RestoreReport {
    std::string snapshot_id;
    std::size_t restored = 0;
    std::size_t removed = 0;
    std::size_t unchanged = 0;
};

// Owns <root>/<id>/{metadata.json,files/<n>}. Snapshots are staged under
// <root>/.<id>.staging and renamed into place once complete.
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path root, policy::PathGuard guard);

    core::errors::Result<Snapshot> create(const std::vector<std::filesystem::path>& paths);

    core::errors::Result<RestoreReport> restore(const std::string& snapshot_id) const;

    // Deletes snapshots that are both beyond the keep_newest newest and older
    // than older_than_days. Returns the number deleted.
    core::errors::Result<std::size_t> prune(
        std::size_t keep_newest, int older_than_days,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Newest first.
    core::errors::Result<std::vector<Snapshot>> list() const;

    core::errors::Result<Snapshot> get(const std::string& snapshot_id) const;

    core::errors::Result<bool> remove(const std::string& snapshot_id);

    const std::filesystem::path& root() const { return root_; }
    const policy::PathGuard& guard() const { return guard_; }

    static bool is_valid_id(const std::string& snapshot_id);

private:
    core::errors::Result<std::filesystem::path> ensure_root() const;
    std::int64_t next_timestamp_locked();

    std::filesystem::path root_;
    policy::PathGuard guard_;
    std::mutex mutex_;
    std::optional<std::int64_t> last_created_ms_;
};

std::string to_string(EntryKind kind);

}  // namespace drift::snapshot
