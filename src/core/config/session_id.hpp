#pragma once
#include <cstddef>
#include <random>
#include <string>

namespace taskrun::core::config {

    // Returns "<prefix>-" followed by `digits` random lowercase hex digits.
    // The session journal names its file after this ID, so it stays
    // filename-safe. An empty prefix yields the bare hex digits.
    inline std::string generate_session_id(const std::string& prefix = "session",
                                           std::size_t digits = 8) {
        static const char kHex[] = "0123456789abcdef";
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dis(0, 15);

        std::string id = prefix.empty() ? std::string() : prefix + "-";
        id.reserve(id.size() + digits);
        for (std::size_t i = 0; i < digits; ++i) {
            id.push_back(kHex[dis(gen)]);
        }
        return id;
    }

} // namespace taskrun::core::config
