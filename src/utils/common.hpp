#pragma once

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace warden::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline bool StartsWith(std::string_view value, std::string_view prefix) {
    return !prefix.empty() && value.substr(0, prefix.size()) == prefix;
}

inline std::chrono::steady_clock::time_point SteadyNow() {
    return std::chrono::steady_clock::now();
}

inline std::int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyNow() - since).count();
}

}  // namespace warden::utils
