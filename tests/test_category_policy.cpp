#include <catch2/catch_test_macros.hpp>
#include "policy/category_policy.hpp"
#include "policy/policy_engine.hpp"
#include "detector/detector.hpp"

#include <string>

using namespace promptguard;

namespace {

PolicyDecision baseline(Decision d) {
    PolicyDecision decision;
    decision.decision = d;
    return decision;
}

Analysis with_findings(std::initializer_list<Category> categories) {
    Analysis analysis;
    analysis.risk_level = RiskLevel::MEDIUM;
    for (auto c : categories) analysis.findings.emplace_back(c, 0, 1);
    return analysis;
}

} // anonymous namespace

TEST_CASE("Tenant HEALTH=BLOCK blocks medical records", "[category_policy]") {
    const CategoryPolicyTable table({{"acme", "HEALTH", CategoryAction::BLOCK}});

    const auto analysis = Detector().analyze("Patient MRN: 12345678 needs follow-up");
    const auto base = PolicyEngine::decide(analysis);
    REQUIRE(base.decision == Decision::WARN_AND_ALLOW);

    const auto decision = table.apply(base, analysis, "acme");
    CHECK(decision.decision == Decision::BLOCK);
    CHECK(decision.reason_codes == std::vector<std::string>{"MEDIUM_RISK", "CATEGORY_BLOCKED"});

    SECTION("Other tenants are unaffected") {
        CHECK(table.apply(base, analysis, "globex").decision == Decision::WARN_AND_ALLOW);
    }
}

TEST_CASE("Unconfigured groups default to WARN", "[category_policy]") {
    const CategoryPolicyTable table;

    const auto decision = table.apply(baseline(Decision::ALLOW),
                                      with_findings({Category::KEYWORDS}), "acme");
    CHECK(decision.decision == Decision::WARN_AND_ALLOW);
    CHECK(decision.reason_codes == std::vector<std::string>{"CATEGORY_WARN"});
}

TEST_CASE("ALLOW never relaxes the baseline", "[category_policy]") {
    const CategoryPolicyTable table({{"acme", "PII_BASIC", CategoryAction::ALLOW}});
    const auto analysis = with_findings({Category::EMAIL});

    CHECK(table.apply(baseline(Decision::WARN_AND_SANITIZE), analysis, "acme").decision ==
          Decision::WARN_AND_SANITIZE);
    CHECK(table.apply(baseline(Decision::ALLOW), analysis, "acme").decision == Decision::ALLOW);
    CHECK(table.apply(baseline(Decision::BLOCK), analysis, "acme").decision == Decision::BLOCK);
}

TEST_CASE("Any BLOCK group wins over WARN and ALLOW groups", "[category_policy]") {
    const CategoryPolicyTable table({
        {"acme", "PII_BASIC", CategoryAction::ALLOW},
        {"acme", "SECRETS", CategoryAction::BLOCK},
    });

    const auto decision = table.apply(baseline(Decision::WARN_AND_ALLOW),
        with_findings({Category::EMAIL, Category::KEYWORDS, Category::API_KEY_GENERIC}), "acme");
    CHECK(decision.decision == Decision::BLOCK);
}

TEST_CASE("No findings keeps the baseline", "[category_policy]") {
    const CategoryPolicyTable table;
    CHECK(table.apply(baseline(Decision::ALLOW), Analysis{}, "acme").decision == Decision::ALLOW);
}

TEST_CASE("reload swaps the rule set", "[category_policy]") {
    CategoryPolicyTable table({{"acme", "HEALTH", CategoryAction::BLOCK}});
    CHECK(table.policy_count() == 1);
    CHECK(table.lookup("acme", "HEALTH") == CategoryAction::BLOCK);

    table.reload({
        {"acme", "HEALTH", CategoryAction::ALLOW},
        {"acme", "SECRETS", CategoryAction::WARN},
    });
    CHECK(table.policy_count() == 2);
    CHECK(table.lookup("acme", "HEALTH") == CategoryAction::ALLOW);
    CHECK_FALSE(table.lookup("acme", "FINANCIAL").has_value());
    CHECK_FALSE(table.lookup("globex", "HEALTH").has_value());
}
