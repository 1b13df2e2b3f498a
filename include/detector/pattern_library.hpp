#pragma once

#include "core/types.hpp"

#include <regex>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Compiled pattern tables shared by every Detector
 *
 * Built once on first use and never mutated afterwards, so concurrent
 * readers need no synchronization.
 *
 * - PII/secret patterns are scanned in table order and report every match.
 * - Injection families (SQL, XSS, jailbreak) are ordered rule lists; the
 *   first rule that matches decides the family's single finding.
 */
class PatternLibrary {
public:
    struct PiiPattern {
        Category category;
        std::regex regex;
    };

    struct FamilyRule {
        std::string_view name;
        std::regex regex;
        bool line_scoped;   // rule contains no line-crossing constructs
    };

    [[nodiscard]] static const PatternLibrary& instance();

    [[nodiscard]] const std::vector<PiiPattern>& pii_patterns() const { return pii_; }
    [[nodiscard]] const std::vector<FamilyRule>& sql_rules() const { return sql_; }
    [[nodiscard]] const std::vector<FamilyRule>& xss_rules() const { return xss_; }
    [[nodiscard]] const std::vector<FamilyRule>& jailbreak_rules() const { return jailbreak_; }

    /**
     * @brief Phrases that mark a request for a whole record set
     */
    [[nodiscard]] static const std::vector<std::string_view>& bulk_indicators();

    PatternLibrary(const PatternLibrary&) = delete;
    PatternLibrary& operator=(const PatternLibrary&) = delete;

private:
    PatternLibrary();

    std::vector<PiiPattern> pii_;
    std::vector<FamilyRule> sql_;
    std::vector<FamilyRule> xss_;
    std::vector<FamilyRule> jailbreak_;
};

} // namespace promptguard
