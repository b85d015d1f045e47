#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace drift::core::time {

    inline std::int64_t to_unix_ms(const std::chrono::system_clock::time_point tp) {
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
                .count());
    }

    inline std::int64_t now_unix_ms() {
        return to_unix_ms(std::chrono::system_clock::now());
    }

    // Local time, second precision plus milliseconds: 2024-05-01T13:37:00.123
    inline std::string format_iso8601(const std::int64_t unix_ms) {
        const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);

        char millis[8];
        std::snprintf(millis, sizeof(millis), ".%03d", static_cast<int>(unix_ms % 1000));
        return std::string(buffer) + millis;
    }

    // Compact stamp for archive file names: 20240501_133700
    inline std::string format_file_stamp(const std::int64_t unix_ms) {
        const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
        return buffer;
    }

} // namespace drift::core::time
