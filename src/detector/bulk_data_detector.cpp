#include "detector/bulk_data_detector.hpp"
#include "detector/pattern_library.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace promptguard {

namespace {

size_t count_char(std::string_view line, char c) {
    return static_cast<size_t>(std::count(line.begin(), line.end(), c));
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Number of maximal whitespace runs of length >= 2
size_t count_wide_gaps(std::string_view line) {
    size_t gaps = 0;
    size_t i = 0;
    while (i < line.size()) {
        if (!is_space(line[i])) {
            ++i;
            continue;
        }
        size_t run = 0;
        while (i < line.size() && is_space(line[i])) {
            ++run;
            ++i;
        }
        if (run >= 2) ++gaps;
    }
    return gaps;
}

} // anonymous namespace

BulkDataDetector::BulkDataDetector(const Config& config)
    : config_(config) {}

bool BulkDataDetector::is_table_row(std::string_view line) const {
    // N separators produce N + 1 fields
    if (count_char(line, ',') >= config_.min_fields) {
        return true;
    }
    if (count_char(line, '\t') >= config_.min_fields) {
        return true;
    }
    return count_wide_gaps(line) >= config_.min_fields;
}

BulkDataDetector::Result BulkDataDetector::analyze(std::string_view text) const {
    const auto lines = utils::split_lines(text);

    size_t table_rows = 0;
    for (const auto line : lines) {
        if (is_table_row(line)) ++table_rows;
    }

    if (table_rows > config_.row_threshold) {
        return {true, table_rows};
    }

    bool has_indicator = false;
    for (const auto indicator : PatternLibrary::bulk_indicators()) {
        if (utils::contains_ci(text, indicator)) {
            has_indicator = true;
            break;
        }
    }

    return {has_indicator || lines.size() > config_.line_limit, lines.size()};
}

std::optional<Finding> BulkDataDetector::detect(std::string_view text) const {
    const auto result = analyze(text);
    if (!result.is_bulk) {
        return std::nullopt;
    }
    Finding finding(Category::BULK_DATA, 0, text.size());
    finding.details.row_count = result.row_count;
    return finding;
}

} // namespace promptguard
