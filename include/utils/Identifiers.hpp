#pragma once
#include <string>
#include <random>
#include <cstdint>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <unistd.h>

namespace evalbox {

inline std::string make_uuid4() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    std::ostringstream hex;
    hex << std::hex << std::setfill('0') << std::setw(16) << hi << std::setw(16) << lo;
    std::string s = hex.str();
    return s.substr(0, 8) + "-" + s.substr(8, 4) + "-" + s.substr(12, 4) + "-" +
           s.substr(16, 4) + "-" + s.substr(20, 12);
}

// Ten hex characters derived from pid, wall clock and a random salt.
inline std::string unique_suffix() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    std::string unique = std::to_string(now) + std::to_string(getpid()) + std::to_string(rng());

    std::ostringstream hex;
    hex << std::hex << std::setfill('0') << std::setw(16) << std::hash<std::string>{}(unique);
    return hex.str().substr(0, 10);
}

inline std::string sanitize_image_name(std::string image) {
    std::replace(image.begin(), image.end(), '/', '-');
    std::replace(image.begin(), image.end(), ':', '-');
    return image;
}

inline std::string make_session_name(const std::string& image) {
    return sanitize_image_name(image) + "-" + unique_suffix();
}

// Single-quotes a string for /bin/sh.
inline std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

}
