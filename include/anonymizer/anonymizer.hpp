#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Offset-based text anonymization
 *
 * Findings are applied rightmost-first (stable sort on offset_start,
 * descending) so offsets of not-yet-processed findings stay valid.
 * Each span is replaced by its category placeholder ("[EMAIL]", "[SSN]",
 * "[API_KEY]", ...); one space is appended when the next character exists
 * and is not whitespace.
 *
 * Report-only categories (BULK_DATA, SQL/XSS/jailbreak, EXFIL_ATTEMPT) are
 * never substituted. Overlapping spans are not merged: a span processed
 * later may land on text already rewritten by an overlapping one.
 *
 * Offsets are clamped to the current buffer, so malformed findings never
 * throw and never read past the end.
 */
class Anonymizer {
public:
    static constexpr size_t kBulkRowThreshold = 10;
    static constexpr std::string_view kBulkBlockedNotice =
        "[BULK DATA BLOCKED - Use Document Wizard for safe processing]";

    enum class MinimizeMethod { NONE, BLOCK };

    struct MinimizeResult {
        std::string minimized_text;
        bool changed = false;
        MinimizeMethod method = MinimizeMethod::NONE;
    };

    [[nodiscard]] static AnonymizationResult anonymize(
        std::string_view text,
        const std::vector<Finding>& findings);

    /**
     * @brief Replace a large record dump with a fixed notice
     * @return BLOCK + notice when row_count > 10, otherwise the text unchanged
     */
    [[nodiscard]] static MinimizeResult minimize_bulk_data(std::string_view text,
                                                           size_t row_count);

private:
    static void replace_span(std::string& buffer, size_t start, size_t end,
                             std::string_view replacement);
};

[[nodiscard]] const char* minimize_method_to_string(Anonymizer::MinimizeMethod method);

} // namespace promptguard
