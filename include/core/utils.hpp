#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard::utils {

// ============================================================================
// Identifiers & Time
// ============================================================================

/**
 * @brief Random RFC 4122 version-4 UUID, lowercase hex
 */
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        const uint64_t word = engine();
        for (size_t b = 0; b < 8; ++b) {
            bytes[i + b] = static_cast<uint8_t>(word >> (b * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief ISO-8601 UTC with milliseconds: 2024-05-01T12:00:00.123Z
 */
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();

    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm utc{};
    ::gmtime_r(&t, &utc);

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
}

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Text (ASCII case folding; offsets are byte offsets)
// ============================================================================

inline char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline std::string to_lower(std::string_view str) {
    std::string out(str.size(), '\0');
    std::transform(str.begin(), str.end(), out.begin(), fold);
    return out;
}

/**
 * @brief Split on '\n'; a trailing newline yields a final empty line
 */
inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    for (size_t begin = 0;;) {
        const size_t end = text.find('\n', begin);
        lines.push_back(text.substr(begin, end == std::string_view::npos ? end : end - begin));
        if (end == std::string_view::npos) return lines;
        begin = end + 1;
    }
}

[[nodiscard]] inline size_t find_ci(std::string_view haystack, std::string_view needle,
                                    size_t from = 0) {
    if (needle.empty() || from > haystack.size()) return std::string_view::npos;
    const auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from),
                                haystack.end(), needle.begin(), needle.end(),
                                [](char a, char b) { return fold(a) == fold(b); });
    return it == haystack.end() ? std::string_view::npos
                                : static_cast<size_t>(it - haystack.begin());
}

[[nodiscard]] inline bool contains_ci(std::string_view haystack, std::string_view needle) {
    return find_ci(haystack, needle) != std::string_view::npos;
}

/**
 * @brief Replace every non-overlapping case-insensitive occurrence, left to right
 */
[[nodiscard]] inline std::string replace_all_ci(std::string_view text, std::string_view needle,
                                                std::string_view replacement) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (size_t hit; (hit = find_ci(text, needle, pos)) != std::string_view::npos;
         pos = hit + needle.size()) {
        out.append(text.substr(pos, hit - pos)).append(replacement);
    }
    out.append(text.substr(pos));
    return out;
}

/**
 * @brief "..." + text around the first occurrence of match + "...", or "" if absent
 */
[[nodiscard]] inline std::string context_excerpt(std::string_view text, std::string_view match,
                                                 size_t radius) {
    const size_t at = find_ci(text, match);
    if (at == std::string_view::npos) return {};

    const size_t first = at > radius ? at - radius : 0;
    const size_t last = std::min(text.size(), at + match.size() + radius);
    return std::format("...{}...", text.substr(first, last - first));
}

// ============================================================================
// Logging (stderr, serialized, minimum level)
// ============================================================================

namespace log {

enum class Level { INFO = 0, WARN = 1, ERROR = 2 };

namespace detail {

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

inline void emit(Level level, std::string_view msg) {
    if (level < threshold().load(std::memory_order_relaxed)) return;

    static constexpr std::array<std::string_view, 3> kTags = {"INFO ", "WARN ", "ERROR"};
    const auto line = std::format("{} [{}] {}\n",
        format_timestamp(now()), kTags[static_cast<size_t>(level)], msg);

    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << line;
}

} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

/**
 * @brief "info" | "warn" | "warning" | "error", any case
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string key = to_lower(name);
    if (key == "info") return Level::INFO;
    if (key == "warn" || key == "warning") return Level::WARN;
    if (key == "error") return Level::ERROR;
    return std::nullopt;
}

inline void info(std::string_view msg)  { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace promptguard::utils
