#include <catch2/catch_test_macros.hpp>
#include "report/json_report.hpp"
#include "detector/detector.hpp"

using namespace promptguard;

TEST_CASE("Analysis JSON", "[report]") {
    const auto analysis = Detector().analyze("My email is jane@firm.com and SSN 123-45-6789");
    const auto j = report::to_json(analysis);

    CHECK(j["risk_level"] == "MEDIUM");
    CHECK(j["anomaly_score"] == 35);
    REQUIRE(j["findings"].size() == 2);
    CHECK(j["findings"][0]["category"] == "EMAIL");
    CHECK(j["findings"][0]["value"] == "jane@firm.com");
    CHECK(j["findings"][0]["offset_start"] == 12);
}

TEST_CASE("Output scan JSON omits detected values", "[report]") {
    const Detector detector;
    const OutputFilter filter(detector);
    const auto scan = filter.scan_output("Contact john@example.com", EntityMap{});
    const auto j = report::to_json(scan);

    CHECK(j["safe"] == false);
    CHECK(j["masked_text"] == "Contact [REDACTED]");
    CHECK_FALSE(j.contains("text"));
    CHECK(j.dump().find("john@example.com") == std::string::npos);
}

TEST_CASE("Entity map round trip keeps order", "[report]") {
    EntityMap map;
    map.add("z@y.io", Category::EMAIL);
    map.add("Acme", Category::PII_ORG);

    const auto parsed = report::entity_map_from_json(report::to_json(map).dump());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().size() == 2);
    CHECK(parsed.value().entries()[0].placeholder == "EMAIL_1");
    CHECK(parsed.value().entries()[1].placeholder == "COMPANY_1");
    CHECK(parsed.value().entries()[1].category == Category::PII_ORG);
}

TEST_CASE("Flat entity map objects keep key order", "[report]") {
    const auto parsed = report::entity_map_from_json(
        R"({"EMAIL_2": "b@c.io", "CLIENT_1": "Jo Bloggs"})");
    REQUIRE(parsed.is_ok());

    auto map = parsed.value();
    CHECK(map.entries()[0].placeholder == "EMAIL_2");
    CHECK(map.entries()[1].original_value == "Jo Bloggs");
    CHECK(map.add("new@c.io", Category::EMAIL) == "EMAIL_3");
}

TEST_CASE("Entity map objects may carry records", "[report]") {
    SECTION("originalValue only") {
        const auto parsed = report::entity_map_from_json(
            R"({"EMAIL_1":{"originalValue":"john@example.com"}})");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().size() == 1);
        const auto& entry = parsed.value().entries()[0];
        CHECK(entry.placeholder == "EMAIL_1");
        CHECK(entry.original_value == "john@example.com");
        CHECK(entry.category == Category::CUSTOM);
    }

    SECTION("with category, mixed with plain strings") {
        const auto parsed = report::entity_map_from_json(
            R"({"EMAIL_1": {"originalValue": "john@example.com", "category": "EMAIL"},
                "CLIENT_1": "Jo Bloggs"})");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().size() == 2);
        CHECK(parsed.value().entries()[0].category == Category::EMAIL);
        CHECK(parsed.value().entries()[1].original_value == "Jo Bloggs");
    }

    SECTION("record without originalValue") {
        CHECK(report::entity_map_from_json(R"({"EMAIL_1": {"category": "EMAIL"}})").is_error());
        CHECK(report::entity_map_from_json(R"({"EMAIL_1": {"originalValue": 7}})").is_error());
    }
}

TEST_CASE("Serialized reports survive invalid UTF-8", "[report]") {
    const std::string text = "Contact \xff\xfe jane@firm.com \xc3";
    const auto analysis = Detector().analyze(text);
    REQUIRE(analysis.has(Category::EMAIL));

    std::string out;
    REQUIRE_NOTHROW(out = report::serialize(report::to_json(analysis)));
    CHECK(out.find("jane@firm.com") != std::string::npos);

    const Detector detector;
    const OutputFilter filter(detector);
    const auto scan = filter.scan_output("ok \xff\xfe", EntityMap{});
    REQUIRE_NOTHROW(out = report::serialize(report::to_json(scan), 0));
    const auto reparsed = nlohmann::json::parse(out);
    CHECK(reparsed["text"].get<std::string>().starts_with("ok \xef\xbf\xbd"));
}

TEST_CASE("Entity map parse errors", "[report]") {
    CHECK(report::entity_map_from_json("{not json").error_category() == ErrorCategory::INPUT_ERROR);
    CHECK(report::entity_map_from_json("42").is_error());
    CHECK(report::entity_map_from_json(R"([{"placeholder": "EMAIL_1"}])").is_error());
    CHECK(report::entity_map_from_json(R"({"EMAIL_1": 5})").is_error());
    CHECK(report::entity_map_from_json(R"({"EMAIL_1": ["a@b.io"]})").is_error());
    CHECK(report::entity_map_from_json(R"({"EMAIL_1": "a@b.io", "EMAIL_2": "a@b.io"})").is_error());
}
