#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

// ==================== env helpers ====================
// KIOKUN_* knobs. Unset, empty or unparsable values fall back to the default.

inline std::string_view env_raw(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string_view(v) : std::string_view();
}

inline int env_int(const char* name, int defv) {
    const std::string_view v = env_raw(name);
    if (v.empty()) return defv;

    int x = 0;
    const auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
    if (ec == std::errc::result_out_of_range) {
        return v.front() == '-' ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
    }
    if (ec != std::errc() || end != v.data() + v.size()) return defv;
    return x;
}

inline bool env_bool(const char* name, bool defv) {
    std::string v(env_raw(name));
    if (v.empty()) return defv;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "1" || v == "true" || v == "yes" || v == "on")  return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defv;
}

inline std::string env_str(const char* name, const std::string& defv) {
    const std::string_view v = env_raw(name);
    return v.empty() ? defv : std::string(v);
}
