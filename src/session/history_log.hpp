#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace drift::session {

// Append-only record of every plan that was executed, blocked, or dry-run.
class HistoryLog {
public:
    virtual ~HistoryLog() = default;

    virtual core::errors::Result<bool> append(const protocol::HistoryRecord& record) = 0;

    // Newest first. limit == 0 returns everything.
    virtual core::errors::Result<std::vector<protocol::HistoryRecord>> recent(
        std::size_t limit) const = 0;

    core::errors::Result<std::optional<protocol::HistoryRecord>> last() const;
};

// One JSON object per line. When the file grows past max_bytes the older half
// of its lines moves to history.<YYYYmmdd_HHMMSS>.jsonl beside it.
class JsonlHistoryLog : public HistoryLog {
public:
    explicit JsonlHistoryLog(std::filesystem::path file,
                             std::uintmax_t max_bytes = 10u * 1024u * 1024u);

    core::errors::Result<bool> append(const protocol::HistoryRecord& record) override;

    core::errors::Result<std::vector<protocol::HistoryRecord>> recent(
        std::size_t limit) const override;

    const std::filesystem::path& path() const { return file_; }

    // Returns the archive path, or nullopt when no rotation was needed.
    core::errors::Result<std::optional<std::filesystem::path>> rotate_if_needed();

private:
    core::errors::Result<std::vector<std::string>> read_lines() const;

    std::filesystem::path file_;
    std::uintmax_t max_bytes_;
    mutable std::mutex mutex_;
};

class InMemoryHistoryLog : public HistoryLog {
public:
    core::errors::Result<bool> append(const protocol::HistoryRecord& record) override;

    core::errors::Result<std::vector<protocol::HistoryRecord>> recent(
        std::size_t limit) const override;

    std::size_t size() const;

private:
    std::vector<protocol::HistoryRecord> records_;
    mutable std::mutex mutex_;
};

}  // namespace drift::session
