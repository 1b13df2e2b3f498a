#include "core/types.hpp"
#include "core/utils.hpp"

namespace promptguard {

const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:    return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH:   return "HIGH";
    }
    return "UNKNOWN";
}

const char* threat_level_to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::NONE:     return "NONE";
        case ThreatLevel::LOW:      return "LOW";
        case ThreatLevel::MEDIUM:   return "MEDIUM";
        case ThreatLevel::HIGH:     return "HIGH";
        case ThreatLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::ALLOW:             return "ALLOW";
        case Decision::WARN_AND_ALLOW:    return "WARN_AND_ALLOW";
        case Decision::WARN_AND_SANITIZE: return "WARN_AND_SANITIZE";
        case Decision::BLOCK:             return "BLOCK";
    }
    return "UNKNOWN";
}

const char* category_action_to_string(CategoryAction action) {
    switch (action) {
        case CategoryAction::ALLOW: return "ALLOW";
        case CategoryAction::WARN:  return "WARN";
        case CategoryAction::BLOCK: return "BLOCK";
    }
    return "UNKNOWN";
}

std::optional<CategoryAction> parse_category_action(const std::string& str) {
    const std::string lower = utils::to_lower(str);
    if (lower == "allow") return CategoryAction::ALLOW;
    if (lower == "warn")  return CategoryAction::WARN;
    if (lower == "block") return CategoryAction::BLOCK;
    return std::nullopt;
}

} // namespace promptguard
