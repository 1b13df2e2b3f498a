#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <vector>

namespace promptguard {

/**
 * @brief Anomaly score and risk level for a set of findings
 *
 * score = min(100,
 *     5 * min(findings, 6)
 *   + 25 * high-risk findings
 *   + 15 if more than 3 distinct categories
 *   + 10 if text longer than 1000 bytes and more than 5 findings)
 *
 * HIGH:   any injection-family or key/secret finding, or score >= 70
 * MEDIUM: any finding, or score >= 40
 * LOW:    otherwise
 */
class RiskScorer {
public:
    static constexpr int kPerFindingPoints = 5;
    static constexpr size_t kMaxCountedFindings = 6;
    static constexpr int kHighRiskPoints = 25;
    static constexpr int kCategorySpreadPoints = 15;
    static constexpr size_t kCategorySpreadThreshold = 3;
    static constexpr int kLongTextPoints = 10;
    static constexpr size_t kLongTextBytes = 1000;
    static constexpr size_t kLongTextFindings = 5;
    static constexpr int kHighScore = 70;
    static constexpr int kMediumScore = 40;
    static constexpr int kMaxScore = 100;

    [[nodiscard]] static int anomaly_score(const std::vector<Finding>& findings,
                                           size_t text_length);

    [[nodiscard]] static RiskLevel risk_level(const std::vector<Finding>& findings,
                                              int anomaly_score);
};

} // namespace promptguard
