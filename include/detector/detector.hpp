#pragma once

#include "core/types.hpp"
#include "detector/bulk_data_detector.hpp"
#include "detector/injection_detector.hpp"
#include "detector/pattern_library.hpp"

#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Sensitive-content detector
 *
 * Scan order (findings are appended, never sorted or deduplicated):
 * 1. PII / secret / keyword patterns, in PatternLibrary table order
 * 2. SQL syntax family       (at most one finding)
 * 3. Script / XSS family     (at most one finding)
 * 4. Jailbreak family        (at most one finding)
 * 5. Bulk-data heuristic     (at most one finding)
 *
 * analyze() is a pure function of its input and never throws on text
 * content; an empty string yields an empty LOW analysis. Patterns run over
 * bounded windows (scan_window.hpp), so input length does not bound the
 * matcher's stack. If the matcher still gives up, the result is HIGH with
 * scan_aborted set and no findings.
 */
class Detector {
public:
    struct Config {
        bool keywords_enabled = true;
        BulkDataDetector::Config bulk;
    };

    Detector() : Detector(Config{}) {}
    explicit Detector(const Config& config);
    virtual ~Detector() = default;

    [[nodiscard]] virtual Analysis analyze(std::string_view text) const;

    /**
     * @brief Stage 1 only: every PII / secret / keyword match with its value
     */
    [[nodiscard]] std::vector<Finding> detect_pii(std::string_view text) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    const PatternLibrary& library_;
    InjectionDetector injection_;
    BulkDataDetector bulk_;
};

} // namespace promptguard
