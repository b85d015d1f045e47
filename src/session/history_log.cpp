#include "session/history_log.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/time/clock.hpp"
#include "protocol/json_codec.hpp"

namespace drift::session {

using core::errors::DriftError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

DriftError write_failed(const std::string& message) {
    return DriftError{ErrorCategory::Internal, message, "history_write_failed"};
}

core::errors::Result<bool> write_lines(const std::filesystem::path& path,
                                       const std::vector<std::string>& lines,
                                       const std::size_t begin, const std::size_t end) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return write_failed("Unable to open history file: " + path.string());
    }
    for (std::size_t i = begin; i < end; ++i) {
        out << lines[i] << "\n";
    }
    out.flush();
    if (!out.good()) {
        return write_failed("Unable to write history file: " + path.string());
    }
    return true;
}

std::filesystem::path archive_path_for(const std::filesystem::path& file) {
    const auto dir = file.parent_path();
    const std::string stem = file.stem().string();
    const std::string stamp = core::time::format_file_stamp(core::time::now_unix_ms());

    std::filesystem::path candidate = dir / (stem + "." + stamp + ".jsonl");
    std::error_code ec;
    for (int suffix = 1; std::filesystem::exists(candidate, ec); ++suffix) {
        candidate = dir / (stem + "." + stamp + "_" + std::to_string(suffix) + ".jsonl");
    }
    return candidate;
}

}  // namespace

core::errors::Result<std::optional<protocol::HistoryRecord>> HistoryLog::last() const {
    auto records = recent(1);
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }
    const auto& values = core::errors::get_value(records);
    if (values.empty()) {
        return std::optional<protocol::HistoryRecord>{};
    }
    return std::optional<protocol::HistoryRecord>{values.front()};
}

JsonlHistoryLog::JsonlHistoryLog(std::filesystem::path file, const std::uintmax_t max_bytes)
    : file_(std::move(file)), max_bytes_(max_bytes) {}

core::errors::Result<std::vector<std::string>> JsonlHistoryLog::read_lines() const {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec) || ec) {
        return lines;
    }

    std::ifstream in(file_);
    if (!in.is_open()) {
        return DriftError{ErrorCategory::Internal,
                          "Unable to open history file: " + file_.string(),
                          "history_read_failed"};
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

core::errors::Result<std::optional<std::filesystem::path>> JsonlHistoryLog::rotate_if_needed() {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file_, ec);
    if (ec || size <= max_bytes_) {
        return std::optional<std::filesystem::path>{};
    }

    auto lines_result = read_lines();
    if (core::errors::is_error(lines_result)) {
        return core::errors::get_error(lines_result);
    }
    const auto& lines = core::errors::get_value(lines_result);
    const std::size_t split = lines.size() / 2;
    if (split == 0) {
        return std::optional<std::filesystem::path>{};
    }

    const auto archive = archive_path_for(file_);
    auto archived = write_lines(archive, lines, 0, split);
    if (core::errors::is_error(archived)) {
        return core::errors::get_error(archived);
    }

    auto tmp = file_;
    tmp += ".tmp";
    auto kept = write_lines(tmp, lines, split, lines.size());
    if (core::errors::is_error(kept)) {
        return core::errors::get_error(kept);
    }
    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        return write_failed("Unable to replace history file: " + ec.message());
    }

    DRIFT_LOG_INFO("Rotated " + std::to_string(split) + " history entries to " +
                   archive.string());
    return std::optional<std::filesystem::path>{archive};
}

core::errors::Result<bool> JsonlHistoryLog::append(const protocol::HistoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(file_.parent_path(), ec);
    if (ec) {
        return write_failed("Unable to create history directory: " +
                            file_.parent_path().string());
    }

    auto rotated = rotate_if_needed();
    if (core::errors::is_error(rotated)) {
        // Appending still matters more than keeping the file small.
        DRIFT_LOG_WARN("History rotation failed: " + core::errors::get_error(rotated).message);
    }

    std::ofstream out(file_, std::ios::app);
    if (!out.is_open()) {
        return write_failed("Unable to open history file: " + file_.string());
    }
    out << protocol::to_json(record).dump() << "\n";
    out.flush();
    if (!out.good()) {
        return write_failed("Unable to append history record: " + file_.string());
    }
    return true;
}

core::errors::Result<std::vector<protocol::HistoryRecord>> JsonlHistoryLog::recent(
    const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto lines_result = read_lines();
    if (core::errors::is_error(lines_result)) {
        return core::errors::get_error(lines_result);
    }
    const auto& lines = core::errors::get_value(lines_result);

    std::vector<protocol::HistoryRecord> records;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (limit > 0 && records.size() >= limit) {
            break;
        }
        const json payload = json::parse(*it, nullptr, false);
        if (payload.is_discarded()) {
            DRIFT_LOG_WARN("Skipping malformed history line in " + file_.string());
            continue;
        }
        auto record = protocol::record_from_json(payload);
        if (core::errors::is_error(record)) {
            DRIFT_LOG_WARN("Skipping history entry: " + core::errors::get_error(record).message);
            continue;
        }
        records.push_back(core::errors::get_value(record));
    }
    return records;
}

core::errors::Result<bool> InMemoryHistoryLog::append(const protocol::HistoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    return true;
}

core::errors::Result<std::vector<protocol::HistoryRecord>> InMemoryHistoryLog::recent(
    const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::HistoryRecord> records;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (limit > 0 && records.size() >= limit) {
            break;
        }
        records.push_back(*it);
    }
    return records;
}

std::size_t InMemoryHistoryLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace drift::session
