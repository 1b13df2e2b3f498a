#pragma once

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string_view>

namespace promptguard {

/**
 * @brief Bounded regex scanning
 *
 * libstdc++ std::regex matches by recursive backtracking, so stack depth
 * grows with the length of the range it searches. Every detector regex runs
 * through these helpers, which never hand the engine more than kScanWindow
 * bytes at once.
 *
 * Windows overlap by kScanOverlap bytes. A match is owned by the window in
 * which it starts before the overlap; matches shorter than kScanOverlap are
 * therefore found exactly once, wherever they sit in the text.
 */
inline constexpr size_t kScanWindow = 2048;
inline constexpr size_t kScanOverlap = 256;

struct ScanWindow {
    size_t begin;   // absolute offsets into the scanned text
    size_t end;
    size_t commit;  // matches starting here or later belong to the next window
};

/**
 * @brief Call fn(ScanWindow) for each window until it returns false
 */
template<typename Fn>
void for_each_window(std::string_view text, Fn&& fn) {
    size_t begin = 0;
    for (;;) {
        const size_t end = std::min(text.size(), begin + kScanWindow);
        const size_t commit = end == text.size() ? end : end - kScanOverlap;
        if (!fn(ScanWindow{begin, end, commit}) || end == text.size()) return;
        begin = commit;
    }
}

inline std::regex_constants::match_flag_type window_flags(const ScanWindow& window) {
    // Let \b and friends see the byte before the window.
    return window.begin > 0 ? std::regex_constants::match_prev_avail
                            : std::regex_constants::match_default;
}

/**
 * @brief fn(start, length) for each non-overlapping match, leftmost first
 */
template<typename Fn>
void for_each_match(std::string_view text, const std::regex& re, Fn&& fn) {
    using Iterator = std::regex_iterator<std::string_view::const_iterator>;

    size_t resume = 0;  // end of the last reported match
    for_each_window(text, [&](const ScanWindow& window) {
        const auto first = text.begin() + static_cast<std::ptrdiff_t>(window.begin);
        const auto last = text.begin() + static_cast<std::ptrdiff_t>(window.end);
        for (Iterator it(first, last, re, window_flags(window)), end; it != end; ++it) {
            const size_t start = window.begin + static_cast<size_t>(it->position(0));
            if (start >= window.commit) break;
            if (start < resume) continue;
            const auto length = static_cast<size_t>(it->length(0));
            fn(start, length);
            resume = start + length;
        }
        return true;
    });
}

[[nodiscard]] inline bool search_windowed(std::string_view text, const std::regex& re) {
    bool found = false;
    for_each_window(text, [&](const ScanWindow& window) {
        const auto first = text.begin() + static_cast<std::ptrdiff_t>(window.begin);
        const auto last = text.begin() + static_cast<std::ptrdiff_t>(window.end);
        found = std::regex_search(first, last, re, window_flags(window));
        return !found;
    });
    return found;
}

} // namespace promptguard
