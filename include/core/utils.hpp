#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <vector>

namespace shelter::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

[[nodiscard]] inline constexpr bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t';
}

inline std::string_view trim_right(std::string_view sv) {
    const auto end = sv.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) {
        return {};
    }
    return sv.substr(0, end + 1);
}

// Base name of a path ("/a/b/.env.local" -> ".env.local")
inline std::string_view basename(std::string_view path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// UTF-8 Utilities
// ============================================================================

namespace detail {
    [[nodiscard]] inline constexpr bool is_cont(unsigned char c) noexcept {
        return (c & 0xC0u) == 0x80u;
    }
} // namespace detail

/**
 * @brief Validate UTF-8 (rejects overlongs, surrogates and code points > U+10FFFF)
 * @return Offset of the first invalid byte, or nullopt if the text is valid
 */
[[nodiscard]] inline std::optional<size_t> find_invalid_utf8(std::string_view s) noexcept {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        const unsigned char c = p[i];
        if (c < 0x80u) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c >> 5) == 0x6) {
            len = 2;
            cp = c & 0x1Fu;
        } else if ((c >> 4) == 0xE) {
            len = 3;
            cp = c & 0x0Fu;
        } else if ((c >> 3) == 0x1E) {
            len = 4;
            cp = c & 0x07u;
        } else {
            return i;
        }

        if (n - i < len) return i;
        for (size_t k = 1; k < len; ++k) {
            if (!detail::is_cont(p[i + k])) return i;
            cp = (cp << 6) | (p[i + k] & 0x3Fu);
        }

        static constexpr uint32_t kMinForLength[5] = {0, 0, 0x80u, 0x800u, 0x10000u};
        if (cp < kMinForLength[len]) return i;              // overlong
        if (cp >= 0xD800u && cp <= 0xDFFFu) return i;       // surrogate
        if (cp > 0x10FFFFu) return i;

        i += len;
    }
    return std::nullopt;
}

// Byte length of the sequence introduced by lead byte c (1 for stray bytes)
[[nodiscard]] inline constexpr size_t utf8_sequence_length(unsigned char c) noexcept {
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

/**
 * @brief Byte offsets of every character start, plus a final entry at s.size()
 *
 * boundaries[i] is where character i begins; boundaries.size() - 1 is the
 * character count.
 */
inline std::vector<size_t> utf8_boundaries(std::string_view s) {
    std::vector<size_t> boundaries;
    boundaries.reserve(s.size() + 1);
    size_t i = 0;
    while (i < s.size()) {
        boundaries.push_back(i);
        i += utf8_sequence_length(static_cast<unsigned char>(s[i]));
    }
    boundaries.push_back(s.size());
    return boundaries;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline void write(Level level, const std::string& msg) {
        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] shelter: {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace shelter::utils
