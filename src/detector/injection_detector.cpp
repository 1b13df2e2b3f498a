#include "detector/injection_detector.hpp"
#include "detector/scan_window.hpp"
#include "core/utils.hpp"

namespace promptguard {

InjectionDetector::InjectionDetector(const PatternLibrary& library)
    : library_(library) {}

bool InjectionDetector::rule_matches(std::string_view text,
                                     const PatternLibrary::FamilyRule& rule) {
    if (!rule.line_scoped) {
        return search_windowed(text, rule.regex);
    }

    // Line-scoped rules cannot match across '\n'; long lines are still windowed.
    for (const auto line : utils::split_lines(text)) {
        if (search_windowed(line, rule.regex)) {
            return true;
        }
    }
    return false;
}

std::optional<Finding> InjectionDetector::first_match(
    std::string_view text,
    const std::vector<PatternLibrary::FamilyRule>& rules,
    Category category) {

    for (const auto& rule : rules) {
        if (rule_matches(text, rule)) {
            Finding finding(category, 0, text.size());
            finding.details.matched_rule = std::string(rule.name);
            return finding;
        }
    }
    return std::nullopt;
}

std::optional<Finding> InjectionDetector::check_sql(std::string_view text) const {
    return first_match(text, library_.sql_rules(), Category::SQL_INJECTION);
}

std::optional<Finding> InjectionDetector::check_xss(std::string_view text) const {
    return first_match(text, library_.xss_rules(), Category::XSS_ATTEMPT);
}

std::optional<Finding> InjectionDetector::check_jailbreak(std::string_view text) const {
    return first_match(text, library_.jailbreak_rules(), Category::JAILBREAK_PATTERN);
}

std::vector<Finding> InjectionDetector::analyze(std::string_view text) const {
    std::vector<Finding> findings;
    if (auto f = check_sql(text)) findings.push_back(std::move(*f));
    if (auto f = check_xss(text)) findings.push_back(std::move(*f));
    if (auto f = check_jailbreak(text)) findings.push_back(std::move(*f));
    return findings;
}

} // namespace promptguard
