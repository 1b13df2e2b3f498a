#include "detector/detector.hpp"
#include "detector/risk_scorer.hpp"
#include "detector/scan_window.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace promptguard {

Detector::Detector(const Config& config)
    : config_(config),
      library_(PatternLibrary::instance()),
      injection_(library_),
      bulk_(config.bulk) {}

std::vector<Finding> Detector::detect_pii(std::string_view text) const {
    std::vector<Finding> findings;
    for (const auto& pattern : library_.pii_patterns()) {
        if (pattern.category == Category::KEYWORDS && !config_.keywords_enabled) {
            continue;
        }
        for_each_match(text, pattern.regex, [&](size_t start, size_t length) {
            findings.emplace_back(pattern.category, start, start + length,
                                  std::string(text.substr(start, length)));
        });
    }
    return findings;
}

Analysis Detector::analyze(std::string_view text) const {
    Analysis analysis;
    try {
        analysis.findings = detect_pii(text);

        for (auto& finding : injection_.analyze(text)) {
            analysis.findings.push_back(std::move(finding));
        }
        if (auto bulk = bulk_.detect(text)) {
            analysis.findings.push_back(std::move(*bulk));
        }
    } catch (const std::regex_error& e) {
        // Matcher gave up on this input (complexity / stack limit).
        // Fail closed: a text we could not scan is treated as HIGH risk.
        utils::log::error(std::format(
            "Detector: pattern scan aborted on {} byte input: {}", text.size(), e.what()));
        analysis.findings.clear();
        analysis.scan_aborted = true;
        analysis.anomaly_score = RiskScorer::kMaxScore;
        analysis.risk_level = RiskLevel::HIGH;
        return analysis;
    }

    analysis.anomaly_score = RiskScorer::anomaly_score(analysis.findings, text.size());
    analysis.risk_level = RiskScorer::risk_level(analysis.findings, analysis.anomaly_score);
    return analysis;
}

} // namespace promptguard
