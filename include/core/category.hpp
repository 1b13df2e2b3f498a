#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Static properties of a finding category
 *
 * One row per Category value, indexed by the enum's underlying value.
 * - placeholder:    literal substituted by the Anonymizer (empty = "[<name>]")
 * - removed_tag:    tag reported in AnonymizationSummary::removed_categories
 * - entity_prefix:  prefix of session placeholders (EMAIL_1, CC_2, ...)
 * - policy_group:   bucket addressed by tenant category policies
 * - high_risk:      adds 25 to the anomaly score
 * - counts_as_pii:  triggers the PII rules of the policy cascade
 * - report_only:    never substituted, never entity-mapped
 * - secret:         key/secret material, forces HIGH risk
 * - injection:      SQL/XSS/jailbreak family, forces HIGH risk
 */
struct CategoryInfo {
    Category category;
    std::string_view name;
    std::string_view placeholder;
    std::string_view removed_tag;
    std::string_view entity_prefix;
    std::string_view policy_group;
    bool high_risk;
    bool counts_as_pii;
    bool report_only;
    bool secret;
    bool injection;
};

namespace policy_group {
inline constexpr std::string_view kPiiBasic = "PII_BASIC";
inline constexpr std::string_view kFinancial = "FINANCIAL";
inline constexpr std::string_view kHealth = "HEALTH";
inline constexpr std::string_view kInternal = "INTERNAL";
inline constexpr std::string_view kSecrets = "SECRETS";
inline constexpr std::string_view kSecurity = "SECURITY";
inline constexpr std::string_view kBulkData = "BULK_DATA";

inline constexpr std::array<std::string_view, 7> kAll = {
    kPiiBasic, kFinancial, kHealth, kInternal, kSecrets, kSecurity, kBulkData};

[[nodiscard]] constexpr bool is_known(std::string_view group) noexcept {
    for (const auto g : kAll) {
        if (g == group) return true;
    }
    return false;
}
} // namespace policy_group

inline constexpr size_t kCategoryCount = static_cast<size_t>(Category::CUSTOM) + 1;

// clang-format off
inline constexpr std::array<CategoryInfo, kCategoryCount> kCategoryTable = {{
    // category                    name                 placeholder       removed_tag        prefix      group                        hi     pii    rpt    sec    inj
    {Category::EMAIL,              "EMAIL",             "[EMAIL]",        "EMAIL",           "EMAIL",    policy_group::kPiiBasic,  false, true,  false, false, false},
    {Category::PHONE,              "PHONE",             "[PHONE_NUMBER]", "PHONE",           "PHONE",    policy_group::kPiiBasic,  false, true,  false, false, false},
    {Category::SSN,                "SSN",               "[SSN]",          "SSN",             "ID",       policy_group::kPiiBasic,  true,  true,  false, false, false},
    {Category::CREDIT_CARD,        "CREDIT_CARD",       "[CREDIT_CARD]",  "CREDIT_CARD",     "CC",       policy_group::kFinancial, true,  true,  false, false, false},
    {Category::ID_NUMBER,          "ID_NUMBER",         "[ID_NUMBER]",    "ID_NUMBER",       "DATA",     policy_group::kPiiBasic,  false, true,  false, false, false},
    {Category::IBAN,               "IBAN",              "[IBAN]",         "IBAN",            "ACCOUNT",  policy_group::kFinancial, true,  true,  false, false, false},
    {Category::ADDRESS,            "ADDRESS",           "[ADDRESS]",      "ADDRESS",         "ADDRESS",  policy_group::kPiiBasic,  false, true,  false, false, false},
    {Category::PASSPORT,           "PASSPORT",          "[PASSPORT]",     "PASSPORT",        "PASSPORT", policy_group::kPiiBasic,  true,  false, false, false, false},
    {Category::DRIVERS_LICENSE,    "DRIVERS_LICENSE",   "[DL]",           "DRIVERS_LICENSE", "DATA",     policy_group::kPiiBasic,  true,  false, false, false, false},
    {Category::MEDICAL_ID,         "MEDICAL_ID",        "[MEDICAL_ID]",   "MEDICAL_ID",      "DATA",     policy_group::kHealth,    true,  false, false, false, false},
    {Category::TAX_ID,             "TAX_ID",            "[TAX_ID]",       "TAX_ID",          "DATA",     policy_group::kFinancial, false, false, false, false, false},
    {Category::VAT_NUMBER,         "VAT_NUMBER",        "[VAT]",          "VAT_NUMBER",      "DATA",     policy_group::kFinancial, false, false, false, false, false},
    {Category::API_KEY_OPENAI,     "API_KEY_OPENAI",    "[API_KEY]",      "API_KEY",         "DATA",     policy_group::kSecrets,   true,  false, false, true,  false},
    {Category::API_KEY_AWS,        "API_KEY_AWS",       "[API_KEY]",      "API_KEY",         "DATA",     policy_group::kSecrets,   true,  false, false, true,  false},
    {Category::API_KEY_GENERIC,    "API_KEY_GENERIC",   "[API_KEY]",      "API_KEY",         "DATA",     policy_group::kSecrets,   false, false, false, true,  false},
    {Category::SECRET_KEY,         "SECRET_KEY",        "[API_KEY]",      "API_KEY",         "DATA",     policy_group::kSecrets,   false, false, false, true,  false},
    {Category::KEYWORDS,           "KEYWORDS",          "",               "KEYWORDS",        "DATA",     policy_group::kInternal,  false, false, false, false, false},
    {Category::SQL_INJECTION,      "SQL_INJECTION",     "",               "SQL_INJECTION",   "DATA",     policy_group::kSecurity,  true,  false, true,  false, true },
    {Category::XSS_ATTEMPT,        "XSS_ATTEMPT",       "",               "XSS_ATTEMPT",     "DATA",     policy_group::kSecurity,  true,  false, true,  false, true },
    {Category::JAILBREAK_PATTERN,  "JAILBREAK_PATTERN", "",               "JAILBREAK_PATTERN","DATA",    policy_group::kSecurity,  true,  false, true,  false, true },
    {Category::EXFIL_ATTEMPT,      "EXFIL_ATTEMPT",     "",               "EXFIL_ATTEMPT",   "DATA",     policy_group::kSecurity,  false, false, true,  false, false},
    {Category::BULK_DATA,          "BULK_DATA",         "",               "BULK_DATA",       "DATA",     policy_group::kBulkData,  false, false, true,  false, false},
    {Category::PII_PERSON,         "PII_PERSON",        "",               "PII_PERSON",      "CLIENT",   policy_group::kPiiBasic,  false, false, false, false, false},
    {Category::PII_ORG,            "PII_ORG",           "",               "PII_ORG",         "COMPANY",  policy_group::kInternal,  false, false, false, false, false},
    {Category::FINANCIAL,          "FINANCIAL",         "",               "FINANCIAL",       "ACCOUNT",  policy_group::kFinancial, false, false, false, false, false},
    {Category::CUSTOM,             "CUSTOM",            "",               "CUSTOM",          "DATA",     policy_group::kPiiBasic,  false, false, false, false, false},
}};
// clang-format on

[[nodiscard]] constexpr const CategoryInfo& category_info(Category c) noexcept {
    return kCategoryTable[static_cast<size_t>(c)];
}

/**
 * @brief Display name; CUSTOM findings report their own name
 */
[[nodiscard]] std::string category_name(const Finding& finding);

[[nodiscard]] inline std::string_view category_name(Category c) noexcept {
    return category_info(c).name;
}

/**
 * @brief Anonymizer placeholder: table literal, or "[<NAME>]"
 */
[[nodiscard]] std::string category_placeholder(const Finding& finding);

[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

} // namespace promptguard
