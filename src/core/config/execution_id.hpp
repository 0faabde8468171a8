#pragma once
#include <random>
#include <sstream>
#include <string>

namespace warden::core::config {

    // Generates a simple 8-character hex ID prefixed with "exec-".
    // Names scratch directories and containers, and tags log lines.
    inline std::string generate_execution_id() {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "exec-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace warden::core::config
