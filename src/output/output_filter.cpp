#include "output/output_filter.hpp"
#include "detector/scan_window.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <regex>

namespace promptguard {

namespace {

constexpr std::array<std::string_view, 4> kAnonymizationVocabulary = {
    "anonymized", "placeholder", "redacted", "masked"
};

constexpr std::string_view kDiscussionReason = "Response discusses the anonymization process";

const std::regex& placeholder_token_regex() {
    static const std::regex re(
        R"(\b(?:EMAIL|PHONE|ID|SSN|CC|PASSPORT|CLIENT|COMPANY|ACCOUNT|ADDRESS|DATA)_\d+\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

bool is_fragment_delimiter(char c) {
    return c == '@' || c == '.' || c == '_' || c == '-' ||
           std::isspace(static_cast<unsigned char>(c));
}

std::vector<std::string_view> fragments(std::string_view value) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    for (size_t i = 0; i <= value.size(); ++i) {
        if (i == value.size() || is_fragment_delimiter(value[i])) {
            if (i > start) parts.push_back(value.substr(start, i - start));
            start = i + 1;
        }
    }
    return parts;
}

} // anonymous namespace

const char* output_finding_type_to_string(OutputFindingType type) {
    switch (type) {
        case OutputFindingType::SENSITIVE_IN_OUTPUT: return "SENSITIVE_IN_OUTPUT";
        case OutputFindingType::REVERSAL_ATTEMPT:    return "REVERSAL_ATTEMPT";
        case OutputFindingType::SUSPICIOUS_PATTERN:  return "SUSPICIOUS_PATTERN";
    }
    return "UNKNOWN";
}

OutputFilter::OutputFilter(const Detector& detector)
    : detector_(detector) {}

std::vector<ReversalAttempt> OutputFilter::detect_reversal_attempts(
    std::string_view text, const EntityMap& entity_map) {
    std::vector<ReversalAttempt> attempts;

    for (const auto& entry : entity_map.entries()) {
        if (entry.original_value.empty()) continue;

        if (utils::contains_ci(text, entry.original_value)) {
            attempts.push_back(ReversalAttempt{
                entry.placeholder,
                entry.original_value,
                std::nullopt,
                utils::context_excerpt(text, entry.original_value, kReversalContextRadius)});
        }

        for (const auto part : fragments(entry.original_value)) {
            if (part.size() < kMinPartialLength || !utils::contains_ci(text, part)) continue;
            attempts.push_back(ReversalAttempt{
                entry.placeholder,
                entry.original_value,
                std::string(part),
                utils::context_excerpt(text, part, kReversalContextRadius)});
        }
    }
    return attempts;
}

std::vector<SuspiciousMatch> OutputFilter::detect_suspicious_patterns(std::string_view text) {
    std::vector<SuspiciousMatch> matches;

    for (const auto keyword : kAnonymizationVocabulary) {
        if (utils::contains_ci(text, keyword)) {
            matches.push_back(SuspiciousMatch{
                std::string(keyword),
                utils::context_excerpt(text, keyword, kSuspiciousContextRadius),
                std::string(kDiscussionReason)});
        }
    }

    for_each_match(text, placeholder_token_regex(), [&](size_t start, size_t length) {
        const std::string token(text.substr(start, length));
        const bool seen = std::any_of(matches.begin(), matches.end(),
            [&](const SuspiciousMatch& m) { return m.keyword == token; });
        if (seen) return;
        matches.push_back(SuspiciousMatch{
            token,
            utils::context_excerpt(text, token, kSuspiciousContextRadius),
            std::string(kDiscussionReason)});
    });
    return matches;
}

std::string OutputFilter::mask(std::string_view text, const std::vector<OutputFinding>& findings) {
    std::string masked(text);

    for (const auto& finding : findings) {
        switch (finding.type) {
            case OutputFindingType::SENSITIVE_IN_OUTPUT:
                for (const auto& pattern : finding.patterns) {
                    if (pattern.value && !pattern.value->empty()) {
                        masked = utils::replace_all_ci(masked, *pattern.value, kRedacted);
                    }
                }
                break;
            case OutputFindingType::REVERSAL_ATTEMPT:
                for (const auto& attempt : finding.attempts) {
                    masked = utils::replace_all_ci(masked, attempt.original, attempt.placeholder);
                    if (attempt.partial) {
                        masked = utils::replace_all_ci(masked, *attempt.partial, kRedacted);
                    }
                }
                break;
            case OutputFindingType::SUSPICIOUS_PATTERN:
                break;
        }
    }
    return masked;
}

OutputScanResult OutputFilter::scan_output(std::string_view text,
                                           const EntityMap& entity_map) const {
    OutputScanResult result;
    result.text = std::string(text);

    // 1. New sensitive content in the response
    auto analysis = detector_.analyze(text);
    if (analysis.scan_aborted) {
        result.findings.push_back(OutputFinding{
            OutputFindingType::SENSITIVE_IN_OUTPUT, ThreatLevel::HIGH,
            std::string(kUnscannedMessage), {}, {}, {}});
    } else if (!analysis.findings.empty()) {
        OutputFinding finding{OutputFindingType::SENSITIVE_IN_OUTPUT, ThreatLevel::HIGH,
                              "Model response contains sensitive information", {}, {}, {}};
        finding.patterns = std::move(analysis.findings);
        result.findings.push_back(std::move(finding));
    }

    // 2. Original values reconstructed from placeholders
    auto attempts = detect_reversal_attempts(text, entity_map);
    if (!attempts.empty()) {
        OutputFinding finding{OutputFindingType::REVERSAL_ATTEMPT, ThreatLevel::CRITICAL,
                              "Model response attempts to reveal original sensitive values",
                              {}, {}, {}};
        finding.attempts = std::move(attempts);
        result.findings.push_back(std::move(finding));
    }

    // 3. Meta-disclosure
    auto suspicious = detect_suspicious_patterns(text);
    if (!suspicious.empty()) {
        OutputFinding finding{OutputFindingType::SUSPICIOUS_PATTERN, ThreatLevel::MEDIUM,
                              "Suspicious patterns detected in model response", {}, {}, {}};
        finding.suspicious = std::move(suspicious);
        result.findings.push_back(std::move(finding));
    }

    if (!result.findings.empty()) {
        result.safe = false;
        // Nothing is known about an unscanned response, so none of it is released.
        result.masked_text = analysis.scan_aborted ? std::string(kRedacted)
                                                   : mask(text, result.findings);
        utils::log::warn(std::format("Output scan flagged {} finding group(s)",
                                     result.findings.size()));
    }
    return result;
}

} // namespace promptguard
