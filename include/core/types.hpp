#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Finding categories (closed set, see core/category.hpp for the table)
 *
 * Order matters: the PII/secret entries up to KEYWORDS are scanned in this
 * order by the Detector, and findings are appended in that order.
 */
enum class Category : uint8_t {
    EMAIL,
    PHONE,
    SSN,
    CREDIT_CARD,
    ID_NUMBER,
    IBAN,
    ADDRESS,
    PASSPORT,
    DRIVERS_LICENSE,
    MEDICAL_ID,
    TAX_ID,
    VAT_NUMBER,
    API_KEY_OPENAI,
    API_KEY_AWS,
    API_KEY_GENERIC,
    SECRET_KEY,
    KEYWORDS,
    SQL_INJECTION,
    XSS_ATTEMPT,
    JAILBREAK_PATTERN,
    EXFIL_ATTEMPT,
    BULK_DATA,
    PII_PERSON,     // supplied by external NER collaborators
    PII_ORG,
    FINANCIAL,
    CUSTOM          // name carried in Finding::custom_category
};

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH
};

/**
 * @brief Severity of an output-filter finding
 */
enum class ThreatLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class Decision {
    ALLOW,
    WARN_AND_ALLOW,
    WARN_AND_SANITIZE,
    BLOCK
};

/**
 * @brief Tenant-level verdict for a policy group (persisted externally)
 */
enum class CategoryAction {
    ALLOW,
    WARN,
    BLOCK
};

// ============================================================================
// Detection Types
// ============================================================================

struct FindingDetails {
    std::optional<size_t> row_count;    // BULK_DATA
    std::string matched_rule;           // injection families: first rule that matched
};

/**
 * @brief One detected occurrence of a sensitive or risky pattern
 *
 * [offset_start, offset_end) is a half-open byte span over the analyzed text.
 */
struct Finding {
    Category category = Category::CUSTOM;
    size_t offset_start = 0;
    size_t offset_end = 0;
    std::optional<std::string> value;
    FindingDetails details;
    std::string custom_category;        // only for Category::CUSTOM

    Finding() = default;
    Finding(Category c, size_t start, size_t end)
        : category(c), offset_start(start), offset_end(end) {}
    Finding(Category c, size_t start, size_t end, std::string v)
        : category(c), offset_start(start), offset_end(end), value(std::move(v)) {}
};

struct Analysis {
    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<Finding> findings;      // detection order, never sorted
    int anomaly_score = 0;              // 0-100
    bool scan_aborted = false;          // matcher gave up; findings incomplete

    [[nodiscard]] bool has(Category c) const {
        for (const auto& f : findings) {
            if (f.category == c) return true;
        }
        return false;
    }

    [[nodiscard]] const Finding* first(Category c) const {
        for (const auto& f : findings) {
            if (f.category == c) return &f;
        }
        return nullptr;
    }
};

// ============================================================================
// Anonymization Types
// ============================================================================

struct AnonymizationSummary {
    std::set<std::string> removed_categories;
    bool bulk_data_handled = false;
};

struct AnonymizationResult {
    std::string sanitized_text;
    bool changed = false;
    AnonymizationSummary summary;
};

// ============================================================================
// Policy Types
// ============================================================================

struct DecisionContext {
    std::string user_role = "employee";
};

struct PolicyDecision {
    Decision decision = Decision::ALLOW;
    std::vector<std::string> reason_codes;
    std::string user_message;

    [[nodiscard]] bool is_blocked() const { return decision == Decision::BLOCK; }
};

// ============================================================================
// String conversions
// ============================================================================

[[nodiscard]] const char* risk_level_to_string(RiskLevel level);
[[nodiscard]] const char* threat_level_to_string(ThreatLevel level);
[[nodiscard]] const char* decision_to_string(Decision decision);
[[nodiscard]] const char* category_action_to_string(CategoryAction action);
[[nodiscard]] std::optional<CategoryAction> parse_category_action(const std::string& str);

} // namespace promptguard
