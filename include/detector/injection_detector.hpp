#pragma once

#include "core/types.hpp"
#include "detector/pattern_library.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Injection / exfiltration family scanner
 *
 * Families: SQL syntax, script/XSS payloads, prompt jailbreak phrasing.
 * Each family yields at most one finding: rules are tried in order and the
 * first match wins. The finding spans the whole text and records the rule
 * name in details.matched_rule. This caps the severity signal to one per
 * family; anomaly scoring depends on it.
 */
class InjectionDetector {
public:
    InjectionDetector() : InjectionDetector(PatternLibrary::instance()) {}
    explicit InjectionDetector(const PatternLibrary& library);

    [[nodiscard]] std::optional<Finding> check_sql(std::string_view text) const;
    [[nodiscard]] std::optional<Finding> check_xss(std::string_view text) const;
    [[nodiscard]] std::optional<Finding> check_jailbreak(std::string_view text) const;

    /**
     * @brief All three families in scan order (SQL, XSS, jailbreak)
     */
    [[nodiscard]] std::vector<Finding> analyze(std::string_view text) const;

private:
    [[nodiscard]] static std::optional<Finding> first_match(
        std::string_view text,
        const std::vector<PatternLibrary::FamilyRule>& rules,
        Category category);

    [[nodiscard]] static bool rule_matches(std::string_view text,
                                           const PatternLibrary::FamilyRule& rule);

    const PatternLibrary& library_;
};

} // namespace promptguard
