#include "policy/policy_engine.hpp"
#include "policy/policy_constants.hpp"
#include "core/category.hpp"

#include <algorithm>

namespace promptguard {

namespace {

PolicyDecision make_decision(Decision decision, std::string_view reason,
                             std::string_view message) {
    PolicyDecision result;
    result.decision = decision;
    result.reason_codes.emplace_back(reason);
    result.user_message = std::string(message);
    return result;
}

PolicyDecision allow() {
    PolicyDecision result;
    result.decision = Decision::ALLOW;
    result.user_message = std::string(policy::kMsgApproved);
    return result;
}

} // anonymous namespace

bool PolicyEngine::has_pii(const Analysis& analysis) {
    return std::any_of(analysis.findings.begin(), analysis.findings.end(),
        [](const Finding& f) { return category_info(f.category).counts_as_pii; });
}

PolicyDecision PolicyEngine::pii_decision(const DecisionContext& context) {
    if (context.user_role == policy::kDefaultRole) {
        return make_decision(Decision::WARN_AND_SANITIZE, policy::kReasonPiiDetected,
                             policy::kMsgSanitize);
    }
    return make_decision(Decision::WARN_AND_ALLOW, policy::kReasonPiiDetected,
                         policy::kMsgSanitize);
}

PolicyDecision PolicyEngine::decide(const Analysis& analysis, const DecisionContext& context) {
    const bool exfil = analysis.has(Category::EXFIL_ATTEMPT);
    const bool jailbreak = analysis.has(Category::JAILBREAK_PATTERN);

    // 1. Security threats
    if (analysis.risk_level == RiskLevel::HIGH || exfil || jailbreak) {
        if (exfil) {
            return make_decision(Decision::BLOCK, policy::kReasonExfilAttempt, policy::kMsgExfil);
        }
        if (jailbreak) {
            return make_decision(Decision::BLOCK, policy::kReasonJailbreak, policy::kMsgJailbreak);
        }
        return make_decision(Decision::BLOCK, policy::kReasonHighRisk, policy::kMsgHighRisk);
    }

    const Finding* bulk = analysis.first(Category::BULK_DATA);
    const bool pii = has_pii(analysis);

    if (bulk) {
        // 2. Large dumps
        if (bulk->details.row_count.value_or(0) > policy::kBulkRowThreshold) {
            return make_decision(Decision::BLOCK, policy::kReasonBulkData, policy::kMsgBulkData);
        }
        // 3. Small bulk with PII
        if (pii) {
            return pii_decision(context);
        }
    } else if (pii) {
        // 4. PII alone
        return pii_decision(context);
    }

    // 5. Low risk
    if (analysis.risk_level == RiskLevel::LOW) {
        return allow();
    }

    // 6. Residual medium risk
    if (!bulk && !pii) {
        return make_decision(Decision::WARN_AND_ALLOW, policy::kReasonMediumRisk,
                             policy::kMsgMediumRisk);
    }

    return allow();
}

} // namespace promptguard
