#pragma once

#include "core/types.hpp"
#include "config/config_types.hpp"
#include "anonymizer/entity_mapper.hpp"
#include "detector/detector.hpp"
#include "output/output_filter.hpp"
#include "policy/category_policy.hpp"
#include "telemetry/telemetry_event.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Request pipeline: Detector -> PolicyEngine -> tenant overrides -> Anonymizer
 *
 * Fail-closed: if sanitization cannot be computed the request is blocked
 * with SANITIZATION_FAILED, never forwarded unsanitized.
 *
 * Holds only immutable configuration; inspect() and scan_output() may run
 * concurrently. The caller owns the session EntityMap.
 */
class Guard {
public:
    using Sanitizer = std::function<AnonymizationResult(std::string_view,
                                                        const std::vector<Finding>&)>;

    struct Request {
        std::string tenant;
        std::string user;
        std::optional<std::string> role;    // falls back to policy.default_role
    };

    struct Inspection {
        Analysis analysis;
        PolicyDecision decision;
        std::optional<AnonymizationResult> anonymization;
        std::string outbound_text;          // empty when blocked
        std::optional<TelemetryEvent> telemetry;
    };

    explicit Guard(GuardConfig config);
    Guard(GuardConfig config, Sanitizer sanitizer);

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    /**
     * @brief Analyze, decide and (unless blocked) sanitize one prompt
     * @param session When given, extended with this prompt's values for rehydration
     */
    [[nodiscard]] Inspection inspect(std::string_view text, const Request& request,
                                     EntityMap* session = nullptr) const;

    [[nodiscard]] OutputScanResult scan_output(std::string_view text,
                                               const EntityMap& session) const;

    [[nodiscard]] const Detector& detector() const { return detector_; }
    [[nodiscard]] const GuardConfig& config() const { return config_; }

private:
    GuardConfig config_;
    Detector detector_;
    OutputFilter output_filter_;
    CategoryPolicyTable category_policies_;
    Sanitizer sanitizer_;
};

} // namespace promptguard
