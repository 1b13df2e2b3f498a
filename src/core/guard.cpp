#include "core/guard.hpp"
#include "anonymizer/anonymizer.hpp"
#include "policy/policy_constants.hpp"
#include "policy/policy_engine.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace promptguard {

namespace {

PolicyDecision sanitization_failed() {
    PolicyDecision decision;
    decision.decision = Decision::BLOCK;
    decision.reason_codes.emplace_back(policy::kReasonSanitizationFailed);
    decision.user_message = std::string(policy::kMsgSanitizationFailed);
    return decision;
}

} // anonymous namespace

Guard::Guard(GuardConfig config)
    : Guard(std::move(config), &Anonymizer::anonymize) {}

Guard::Guard(GuardConfig config, Sanitizer sanitizer)
    : config_(std::move(config)),
      detector_(config_.detector),
      output_filter_(detector_),
      category_policies_(config_.category_policies),
      sanitizer_(std::move(sanitizer)) {}

Guard::Inspection Guard::inspect(std::string_view text, const Request& request,
                                 EntityMap* session) const {
    utils::Timer timer;
    Inspection result;
    result.analysis = detector_.analyze(text);

    DecisionContext context;
    context.user_role = request.role.value_or(config_.policy.default_role);

    const auto baseline = PolicyEngine::decide(result.analysis, context);
    result.decision = category_policies_.apply(baseline, result.analysis, request.tenant);

    if (!result.decision.is_blocked()) {
        try {
            if (!sanitizer_) {
                throw std::runtime_error("no sanitizer configured");
            }
            result.anonymization = sanitizer_(text, result.analysis.findings);
            result.outbound_text = result.anonymization->sanitized_text;
            if (session) {
                extend(*session, result.analysis.findings);
            }
        } catch (const std::exception& e) {
            utils::log::error(std::format("Sanitization failed, blocking request: {}", e.what()));
            result.anonymization.reset();
            result.outbound_text.clear();
            result.decision = sanitization_failed();
        }
    }

    utils::log::info(std::format("inspect: {} finding(s), risk={}, decision={}",
        result.analysis.findings.size(),
        risk_level_to_string(result.analysis.risk_level),
        decision_to_string(result.decision.decision)));

    if (config_.telemetry.enabled) {
        TelemetryEvent::Identity identity{request.tenant, request.user,
                                          config_.telemetry.tool, config_.telemetry.salt};
        auto event = TelemetryEvent::from(identity, result.analysis, result.decision,
            result.anonymization ? &*result.anonymization : nullptr);
        event.latency_ms = timer.elapsed_ms().count();
        result.telemetry = std::move(event);
    }

    return result;
}

OutputScanResult Guard::scan_output(std::string_view text, const EntityMap& session) const {
    return output_filter_.scan_output(text, session);
}

} // namespace promptguard
