#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace clerk::utils {

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

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Keeps at most max_size bytes without splitting a UTF-8 sequence.
inline std::string Truncate(const std::string& value, std::size_t max_size) {
    if (value.size() <= max_size) {
        return value;
    }
    std::size_t cut = max_size;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

// Replaces every non-overlapping occurrence, scanning left to right.
inline std::size_t ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return 0;
    }
    std::size_t count = 0;
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
        ++count;
    }
    return count;
}

// Returns the byte offset of the first invalid sequence, or npos.
inline std::size_t FindInvalidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
        } else {
            return i;
        }
        if (i + length > text.size()) {
            return i;
        }
        for (std::size_t k = 1; k < length; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                return i;
            }
        }
        if (length == 3) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if ((lead == 0xE0 && next < 0xA0) || (lead == 0xED && next > 0x9F)) {
                return i;
            }
        } else if (length == 4) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if ((lead == 0xF0 && next < 0x90) || (lead == 0xF4 && next > 0x8F)) {
                return i;
            }
        }
        i += length;
    }
    return std::string::npos;
}

}  // namespace clerk::utils
