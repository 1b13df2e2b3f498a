#include <catch2/catch_test_macros.hpp>
#include "anonymizer/entity_mapper.hpp"

#include <string>

using namespace promptguard;

TEST_CASE("Identical values share one placeholder", "[entity_map]") {
    const std::vector<Finding> findings{
        Finding(Category::EMAIL, 0, 10, "jane@firm.com"),
        Finding(Category::EMAIL, 20, 30, "bob@firm.com"),
        Finding(Category::EMAIL, 40, 50, "jane@firm.com"),
    };

    const auto map = build_entity_map(findings);
    REQUIRE(map.size() == 2);
    CHECK(map.lookup_placeholder("jane@firm.com") == "EMAIL_1");
    CHECK(map.lookup_placeholder("bob@firm.com") == "EMAIL_2");
}

TEST_CASE("Prefixes by category", "[entity_map]") {
    const std::vector<Finding> findings{
        Finding(Category::SSN, 0, 1, "123-45-6789"),
        Finding(Category::CREDIT_CARD, 0, 1, "4111 1111 1111 1111"),
        Finding(Category::PII_PERSON, 0, 1, "John Doe"),
        Finding(Category::PII_ORG, 0, 1, "Acme Corp"),
        Finding(Category::IBAN, 0, 1, "DE89370400440532013000"),
        Finding(Category::FINANCIAL, 0, 1, "acct 991"),
        Finding(Category::PHONE, 0, 1, "555-123-4567"),
        Finding(Category::ADDRESS, 0, 1, "12 Main Street"),
        Finding(Category::PASSPORT, 0, 1, "X1234567"),
        Finding(Category::TAX_ID, 0, 1, "12-3456789"),
    };

    const auto map = build_entity_map(findings);
    CHECK(map.lookup_placeholder("123-45-6789") == "ID_1");
    CHECK(map.lookup_placeholder("4111 1111 1111 1111") == "CC_1");
    CHECK(map.lookup_placeholder("John Doe") == "CLIENT_1");
    CHECK(map.lookup_placeholder("Acme Corp") == "COMPANY_1");
    CHECK(map.lookup_placeholder("DE89370400440532013000") == "ACCOUNT_1");
    CHECK(map.lookup_placeholder("acct 991") == "ACCOUNT_2");
    CHECK(map.lookup_placeholder("555-123-4567") == "PHONE_1");
    CHECK(map.lookup_placeholder("12 Main Street") == "ADDRESS_1");
    CHECK(map.lookup_placeholder("X1234567") == "PASSPORT_1");
    CHECK(map.lookup_placeholder("12-3456789") == "DATA_1");
}

TEST_CASE("Valueless and report-only findings are skipped", "[entity_map]") {
    const std::vector<Finding> findings{
        Finding(Category::EMAIL, 0, 5),
        Finding(Category::JAILBREAK_PATTERN, 0, 5, "ignore previous instructions"),
        Finding(Category::BULK_DATA, 0, 5, "a,b,c,d"),
    };
    CHECK(build_entity_map(findings).empty());
}

TEST_CASE("Entries keep insertion order", "[entity_map]") {
    const auto map = build_entity_map({
        Finding(Category::PHONE, 0, 1, "555-000-1111"),
        Finding(Category::EMAIL, 0, 1, "a@b.io"),
    });

    REQUIRE(map.entries().size() == 2);
    CHECK(map.entries()[0].placeholder == "PHONE_1");
    CHECK(map.entries()[1].placeholder == "EMAIL_1");

    const auto* entry = map.find("EMAIL_1");
    REQUIRE(entry != nullptr);
    CHECK(entry->original_value == "a@b.io");
    CHECK(entry->category == Category::EMAIL);
    CHECK(map.find("EMAIL_9") == nullptr);
}

TEST_CASE("extend keeps counters across requests", "[entity_map]") {
    auto map = build_entity_map({Finding(Category::EMAIL, 0, 1, "a@b.io")});

    extend(map, {
        Finding(Category::EMAIL, 0, 1, "c@d.io"),
        Finding(Category::EMAIL, 0, 1, "a@b.io"),
    });

    CHECK(map.size() == 2);
    CHECK(map.lookup_placeholder("a@b.io") == "EMAIL_1");
    CHECK(map.lookup_placeholder("c@d.io") == "EMAIL_2");
}

TEST_CASE("restore advances counters past persisted entries", "[entity_map]") {
    EntityMap map;
    CHECK(map.restore({"EMAIL_7", "x@y.io", Category::EMAIL}));
    CHECK_FALSE(map.restore({"EMAIL_7", "other@y.io", Category::EMAIL}));
    CHECK_FALSE(map.restore({"EMAIL_8", "x@y.io", Category::EMAIL}));

    CHECK(map.add("z@y.io", Category::EMAIL) == "EMAIL_8");
}

TEST_CASE("rehydrate restores original values", "[entity_map]") {
    EntityMap map;
    for (int i = 1; i <= 12; ++i) {
        map.add("user" + std::to_string(i) + "@corp.io", Category::EMAIL);
    }

    CHECK(map.rehydrate("Reply to EMAIL_1 and EMAIL_12.") ==
          "Reply to user1@corp.io and user12@corp.io.");
    CHECK(map.rehydrate("nothing to do") == "nothing to do");
}
