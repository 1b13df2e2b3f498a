#include "telemetry/telemetry_event.hpp"
#include "core/category.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <format>

namespace promptguard {

namespace {

std::string action_type_for(Decision decision) {
    switch (decision) {
        case Decision::BLOCK:             return "BLOCK";
        case Decision::WARN_AND_ALLOW:
        case Decision::WARN_AND_SANITIZE: return "WARN";
        case Decision::ALLOW:             return "ANALYSIS";
    }
    return "ANALYSIS";
}

} // anonymous namespace

std::string TelemetryEvent::pseudonymize(std::string_view prefix, std::string_view id,
                                         std::string_view salt) {
    const std::string material = std::format("{}:{}", salt, id);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(material.data()),
           material.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result(prefix);
    result += '_';
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

TelemetryEvent TelemetryEvent::from(const Identity& identity,
                                    const Analysis& analysis,
                                    const PolicyDecision& decision,
                                    const AnonymizationResult* anonymization) {
    TelemetryEvent event;
    event.event_id = utils::generate_uuid();
    event.timestamp = utils::now();
    event.tenant_id = pseudonymize("tenant", identity.tenant, identity.salt);
    event.user_id = pseudonymize("user", identity.user, identity.salt);
    event.action_type = action_type_for(decision.decision);
    event.tool = identity.tool;
    event.risk_level = analysis.risk_level;
    event.decision = decision.decision;
    event.reason_codes = decision.reason_codes;
    event.findings_count = analysis.findings.size();
    event.anomaly_score = analysis.anomaly_score;

    for (const auto& finding : analysis.findings) {
        ++event.category_counts[category_name(finding)];
    }

    if (anonymization) {
        event.changed = anonymization->changed;
        event.removed_categories.assign(anonymization->summary.removed_categories.begin(),
                                        anonymization->summary.removed_categories.end());
    }
    return event;
}

nlohmann::json TelemetryEvent::to_json() const {
    nlohmann::json j;
    j["event_id"] = event_id;
    j["timestamp"] = utils::format_timestamp(timestamp);
    j["tenant_id"] = tenant_id;
    j["user_id"] = user_id;
    j["action_type"] = action_type;
    j["tool"] = tool;
    j["risk_level"] = risk_level_to_string(risk_level);
    j["decision"] = decision_to_string(decision);
    j["reason_codes"] = reason_codes;
    j["findings_count"] = findings_count;
    j["category_counts"] = category_counts;
    j["removed_categories"] = removed_categories;
    j["changed"] = changed;
    j["anomaly_score"] = anomaly_score;
    if (latency_ms) {
        j["latency_ms"] = *latency_ms;
    } else {
        j["latency_ms"] = nullptr;
    }
    return j;
}

} // namespace promptguard
