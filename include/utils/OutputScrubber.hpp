#pragma once
#include <string>

namespace evalbox {

// Removes ANSI CSI sequences (ESC '[' params intermediates final) and carriage
// returns. A sequence truncated at the end of the buffer is dropped as well.
inline std::string strip_ansi(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    const size_t n = str.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c == '\r') {
            ++i;
            continue;
        }
        if (c == 0x1B && i + 1 < n && str[i + 1] == '[') {
            size_t j = i + 2;
            // parameter bytes 0x30-0x3F, intermediate bytes 0x20-0x2F
            while (j < n && static_cast<unsigned char>(str[j]) >= 0x20 &&
                   static_cast<unsigned char>(str[j]) <= 0x3F) {
                ++j;
            }
            // final byte 0x40-0x7E
            if (j < n && static_cast<unsigned char>(str[j]) >= 0x40 &&
                static_cast<unsigned char>(str[j]) <= 0x7E) {
                ++j;
            }
            i = j;
            continue;
        }
        out += static_cast<char>(c);
        ++i;
    }
    return out;
}

inline bool contains_ansi(const std::string& str) {
    for (size_t i = 0; i + 1 < str.size(); ++i) {
        if (str[i] == '\x1B' && str[i + 1] == '[') return true;
    }
    return str.find('\r') != std::string::npos;
}

}
