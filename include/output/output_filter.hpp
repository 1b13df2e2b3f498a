#pragma once

#include "core/types.hpp"
#include "anonymizer/entity_mapper.hpp"
#include "detector/detector.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

enum class OutputFindingType {
    SENSITIVE_IN_OUTPUT,
    REVERSAL_ATTEMPT,
    SUSPICIOUS_PATTERN
};

[[nodiscard]] const char* output_finding_type_to_string(OutputFindingType type);

/**
 * @brief An original value (or a fragment of it) reappearing in model output
 */
struct ReversalAttempt {
    std::string placeholder;
    std::string original;
    std::optional<std::string> partial;     // set for fragment matches
    std::string context;
};

struct SuspiciousMatch {
    std::string keyword;
    std::string context;
    std::string reason;
};

struct OutputFinding {
    OutputFindingType type;
    ThreatLevel severity;
    std::string message;
    std::vector<Finding> patterns;              // SENSITIVE_IN_OUTPUT
    std::vector<ReversalAttempt> attempts;      // REVERSAL_ATTEMPT
    std::vector<SuspiciousMatch> suspicious;    // SUSPICIOUS_PATTERN
};

struct OutputScanResult {
    bool safe = true;
    std::vector<OutputFinding> findings;
    std::string text;                           // input as received
    std::optional<std::string> masked_text;     // only when unsafe

    /**
     * @brief Text the caller should forward: original when safe, masked otherwise
     */
    [[nodiscard]] const std::string& deliverable() const {
        return masked_text ? *masked_text : text;
    }
};

/**
 * @brief Model-response scanner
 *
 * Three checks run and accumulate:
 * 1. Detector re-run on the output              -> SENSITIVE_IN_OUTPUT (HIGH)
 * 2. Entity map values (full or fragments > 3)  -> REVERSAL_ATTEMPT (CRITICAL)
 * 3. Anonymization vocabulary / EMAIL_1 tokens  -> SUSPICIOUS_PATTERN (MEDIUM)
 *
 * Any finding makes the result unsafe. Masking walks findings in
 * accumulation order with case-insensitive literal replacement: detected
 * values and fragments become [REDACTED], full reversals go back to their
 * placeholder. A response the detector could not finish scanning is
 * reported as SENSITIVE_IN_OUTPUT with no patterns and masked whole.
 */
class OutputFilter {
public:
    static constexpr size_t kMinPartialLength = 4;
    static constexpr size_t kReversalContextRadius = 50;
    static constexpr size_t kSuspiciousContextRadius = 30;
    static constexpr std::string_view kRedacted = "[REDACTED]";
    static constexpr std::string_view kUnscannedMessage =
        "Model response could not be fully scanned";

    explicit OutputFilter(const Detector& detector);

    [[nodiscard]] OutputScanResult scan_output(std::string_view text,
                                               const EntityMap& entity_map) const;

    [[nodiscard]] static std::vector<ReversalAttempt> detect_reversal_attempts(
        std::string_view text, const EntityMap& entity_map);

    [[nodiscard]] static std::vector<SuspiciousMatch> detect_suspicious_patterns(
        std::string_view text);

    [[nodiscard]] static std::string mask(std::string_view text,
                                          const std::vector<OutputFinding>& findings);

private:
    const Detector& detector_;
};

} // namespace promptguard
