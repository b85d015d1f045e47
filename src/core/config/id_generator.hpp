#pragma once
#include <random>
#include <sstream>
#include <string>

namespace drift::core::config {

    // Random lowercase hex string of the given length.
    inline std::string random_hex(int length) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // UUID-shaped identifier (8-4-4-4-12 hex groups) for snapshots.
    inline std::string generate_snapshot_id() {
        return random_hex(8) + "-" + random_hex(4) + "-" + random_hex(4) + "-" +
               random_hex(4) + "-" + random_hex(12);
    }

    // Short "run-" prefixed tag used as the logging context of one orchestrated run.
    inline std::string generate_run_id() {
        return "run-" + random_hex(8);
    }

} // namespace drift::core::config
