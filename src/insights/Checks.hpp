#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "insights/Errors.hpp"

namespace insights::detail {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
inline bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + len >= n) return false;
        for (std::size_t k = 1; k <= len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) return false;
        }
        i += len + 1;
    }
    return true;
}

inline void require_utf8(const std::string& value, const char* field) {
    if (!is_valid_utf8(value)) {
        throw ValidationError(field, "must be valid UTF-8");
    }
}

inline void require_utf8(const std::optional<std::string>& value, const char* field) {
    if (value) require_utf8(*value, field);
}

inline void require_non_empty(const std::string& value, const char* field) {
    if (value.empty()) {
        throw ValidationError(field, "must not be empty");
    }
}

inline void require_max_length(const std::string& value, std::size_t limit, const char* field) {
    if (value.size() > limit) {
        throw ValidationError(field, "length " + std::to_string(value.size()) +
                                         " exceeds the allowed limit " + std::to_string(limit));
    }
}

inline void require_max_length(const std::optional<std::string>& value, std::size_t limit, const char* field) {
    if (value) require_max_length(*value, limit, field);
}

}  // namespace insights::detail
