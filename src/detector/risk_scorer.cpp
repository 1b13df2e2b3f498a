#include "detector/risk_scorer.hpp"
#include "core/category.hpp"

#include <algorithm>
#include <unordered_set>

namespace promptguard {

int RiskScorer::anomaly_score(const std::vector<Finding>& findings, size_t text_length) {
    int score = kPerFindingPoints *
        static_cast<int>(std::min(findings.size(), kMaxCountedFindings));

    std::unordered_set<std::string> distinct;
    for (const auto& f : findings) {
        if (category_info(f.category).high_risk) {
            score += kHighRiskPoints;
        }
        distinct.insert(category_name(f));
    }

    if (distinct.size() > kCategorySpreadThreshold) {
        score += kCategorySpreadPoints;
    }
    if (text_length > kLongTextBytes && findings.size() > kLongTextFindings) {
        score += kLongTextPoints;
    }

    return std::min(score, kMaxScore);
}

RiskLevel RiskScorer::risk_level(const std::vector<Finding>& findings, int anomaly_score) {
    const bool forces_high = std::any_of(findings.begin(), findings.end(),
        [](const Finding& f) {
            const auto& info = category_info(f.category);
            return info.injection || info.secret;
        });

    if (forces_high || anomaly_score >= kHighScore) {
        return RiskLevel::HIGH;
    }
    // BULK_DATA is itself a finding, so a bulk verdict always lands here
    if (!findings.empty() || anomaly_score >= kMediumScore) {
        return RiskLevel::MEDIUM;
    }
    return RiskLevel::LOW;
}

} // namespace promptguard
