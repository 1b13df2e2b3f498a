#pragma once

#include "core/types.hpp"

namespace promptguard {

/**
 * @brief Policy Engine - baseline decision gate
 *
 * Priority cascade, first matching rule wins:
 * 1. HIGH risk, EXFIL_ATTEMPT or JAILBREAK_PATTERN -> BLOCK
 *    (reason: EXFIL_ATTEMPT > JAILBREAK_PATTERN > HIGH_RISK)
 * 2. BULK_DATA with more than 10 rows               -> BLOCK (BULK_DATA)
 * 3. BULK_DATA (<= 10 rows) with PII                -> role split (PII_DETECTED)
 * 4. PII without bulk                               -> role split (PII_DETECTED)
 * 5. LOW risk                                       -> ALLOW
 * 6. MEDIUM risk without PII or bulk                -> WARN_AND_ALLOW (MEDIUM_RISK)
 *
 * Role split: "employee" gets WARN_AND_SANITIZE, every other role
 * WARN_AND_ALLOW. A small bulk finding without PII matches none of 3-6
 * and is allowed.
 *
 * Stateless; safe to call concurrently.
 */
class PolicyEngine {
public:
    [[nodiscard]] static PolicyDecision decide(const Analysis& analysis,
                                               const DecisionContext& context = {});

    /**
     * @brief EMAIL, PHONE, SSN, ID_NUMBER, CREDIT_CARD, IBAN, ADDRESS
     */
    [[nodiscard]] static bool has_pii(const Analysis& analysis);

private:
    static PolicyDecision pii_decision(const DecisionContext& context);
};

} // namespace promptguard
