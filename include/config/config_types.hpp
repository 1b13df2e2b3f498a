#pragma once

#include "detector/detector.hpp"
#include "policy/category_policy.hpp"

#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Configuration Types (mirror the promptguard.toml sections)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct PolicyConfig {
    std::string default_role = "employee";
};

struct TelemetryConfig {
    bool enabled = false;
    std::string salt;
    std::string tool = "CLI";
};

/**
 * @brief Complete parsed configuration; loaded once at startup, then immutable
 */
struct GuardConfig {
    LoggingConfig logging;
    Detector::Config detector;
    PolicyConfig policy;
    TelemetryConfig telemetry;
    std::vector<CategoryPolicy> category_policies;
};

} // namespace promptguard
