#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Privacy-safe record of one guard evaluation
 *
 * Carries category tags and counts only. Never holds Finding::value, the
 * analyzed text or raw tenant/user identifiers: those are replaced by
 * salted SHA-256 pseudonyms ("tenant_<16 hex>", "user_<16 hex>").
 */
struct TelemetryEvent {
    std::string event_id;
    std::chrono::system_clock::time_point timestamp;
    std::string tenant_id;
    std::string user_id;
    std::string action_type;                    // ANALYSIS, BLOCK, WARN, OUTPUT_SCAN
    std::string tool;
    RiskLevel risk_level = RiskLevel::LOW;
    Decision decision = Decision::ALLOW;
    std::vector<std::string> reason_codes;
    size_t findings_count = 0;
    std::map<std::string, size_t> category_counts;
    std::vector<std::string> removed_categories;
    bool changed = false;
    int anomaly_score = 0;
    std::optional<int64_t> latency_ms;

    struct Identity {
        std::string tenant;
        std::string user;
        std::string tool = "CLI";
        std::string salt;
    };

    [[nodiscard]] static TelemetryEvent from(const Identity& identity,
                                             const Analysis& analysis,
                                             const PolicyDecision& decision,
                                             const AnonymizationResult* anonymization = nullptr);

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief "<prefix>_" + first 8 bytes of SHA-256(salt + ":" + id) as hex
     */
    [[nodiscard]] static std::string pseudonymize(std::string_view prefix,
                                                  std::string_view id,
                                                  std::string_view salt);
};

} // namespace promptguard
