#include <catch2/catch_test_macros.hpp>
#include "detector/bulk_data_detector.hpp"

#include <string>

using namespace promptguard;

namespace {

std::string repeat_lines(const std::string& line, int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) text += '\n';
        text += line;
    }
    return text;
}

} // anonymous namespace

TEST_CASE("Row shapes", "[bulk]") {
    const BulkDataDetector detector;

    CHECK(detector.is_table_row("a,b,c,d"));
    CHECK(detector.is_table_row("a\tb\tc\td"));
    CHECK(detector.is_table_row("alpha  beta  gamma  delta"));

    CHECK_FALSE(detector.is_table_row("a,b,c"));
    CHECK_FALSE(detector.is_table_row("a sentence with single spaces only"));
}

TEST_CASE("More than ten rows is bulk with row count", "[bulk]") {
    const BulkDataDetector detector;

    const auto result = detector.analyze(repeat_lines("id,name,city,zip", 11));
    CHECK(result.is_bulk);
    CHECK(result.row_count == 11);

    const auto finding = detector.detect(repeat_lines("id,name,city,zip", 11));
    REQUIRE(finding.has_value());
    CHECK(finding->category == Category::BULK_DATA);
    CHECK(finding->details.row_count == 11u);
}

TEST_CASE("Ten rows alone is not bulk", "[bulk]") {
    const BulkDataDetector detector;
    CHECK_FALSE(detector.analyze(repeat_lines("id,name,city,zip", 10)).is_bulk);
    CHECK_FALSE(detector.detect(repeat_lines("id,name,city,zip", 10)).has_value());
}

TEST_CASE("Bulk phrasing uses total line count", "[bulk]") {
    const BulkDataDetector detector;
    const auto result = detector.analyze("Send me the FULL LIST\nof accounts");

    CHECK(result.is_bulk);
    CHECK(result.row_count == 2);
}

TEST_CASE("Long text is bulk past the line limit", "[bulk]") {
    const BulkDataDetector detector;

    CHECK_FALSE(detector.analyze(repeat_lines("just prose", 50)).is_bulk);

    const auto result = detector.analyze(repeat_lines("just prose", 51));
    CHECK(result.is_bulk);
    CHECK(result.row_count == 51);
}

TEST_CASE("Thresholds are configurable", "[bulk]") {
    BulkDataDetector::Config config;
    config.row_threshold = 2;
    const BulkDataDetector detector(config);

    const auto result = detector.analyze(repeat_lines("a,b,c,d", 3));
    CHECK(result.is_bulk);
    CHECK(result.row_count == 3);
}
