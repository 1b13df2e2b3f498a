#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace promptguard {

/**
 * @brief Heuristic for record dumps pasted into a prompt
 *
 * Input is bulk when:
 * 1. more than row_threshold lines look like delimited rows
 *    (comma, tab or multi-space separated, more than min_fields fields);
 *    row_count = number of such lines, or
 * 2. an explicit bulk phrase appears ("list of", "full list", ...), or
 * 3. the text has more than line_limit lines.
 * In cases 2 and 3 row_count is the total line count.
 */
class BulkDataDetector {
public:
    struct Config {
        size_t row_threshold = 10;
        size_t min_fields = 3;
        size_t line_limit = 50;
    };

    struct Result {
        bool is_bulk = false;
        size_t row_count = 0;
    };

    BulkDataDetector() : BulkDataDetector(Config{}) {}
    explicit BulkDataDetector(const Config& config);

    [[nodiscard]] Result analyze(std::string_view text) const;

    /**
     * @brief BULK_DATA finding spanning the whole text, or nullopt
     */
    [[nodiscard]] std::optional<Finding> detect(std::string_view text) const;

    [[nodiscard]] bool is_table_row(std::string_view line) const;

private:
    Config config_;
};

} // namespace promptguard
