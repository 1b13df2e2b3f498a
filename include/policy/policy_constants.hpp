#pragma once

#include <cstddef>
#include <string_view>

namespace promptguard::policy {

// Reason codes (stable, consumed by telemetry and callers)
inline constexpr std::string_view kReasonExfilAttempt = "EXFIL_ATTEMPT";
inline constexpr std::string_view kReasonJailbreak = "JAILBREAK_PATTERN";
inline constexpr std::string_view kReasonHighRisk = "HIGH_RISK";
inline constexpr std::string_view kReasonBulkData = "BULK_DATA";
inline constexpr std::string_view kReasonPiiDetected = "PII_DETECTED";
inline constexpr std::string_view kReasonMediumRisk = "MEDIUM_RISK";
inline constexpr std::string_view kReasonCategoryBlocked = "CATEGORY_BLOCKED";
inline constexpr std::string_view kReasonCategoryWarn = "CATEGORY_WARN";
inline constexpr std::string_view kReasonSanitizationFailed = "SANITIZATION_FAILED";

inline constexpr std::string_view kDefaultRole = "employee";
inline constexpr size_t kBulkRowThreshold = 10;

// User-facing messages
inline constexpr std::string_view kMsgExfil =
    "This prompt appears to be attempting data extraction and has been blocked.";
inline constexpr std::string_view kMsgJailbreak =
    "This prompt contains instructions that attempt to bypass safety measures and has been blocked.";
inline constexpr std::string_view kMsgHighRisk =
    "This content has been blocked due to high security risk.";
inline constexpr std::string_view kMsgBulkData =
    "Large data sets have been blocked for security. Please use the Document Wizard for safe processing.";
inline constexpr std::string_view kMsgSanitize =
    "Sensitive information detected. Content will be sanitized before sending.";
inline constexpr std::string_view kMsgApproved =
    "Content approved for sending.";
inline constexpr std::string_view kMsgMediumRisk =
    "Content has medium risk factors. Please review before sending.";
inline constexpr std::string_view kMsgCategoryBlocked =
    "This content contains data categories your organization does not allow to be sent.";
inline constexpr std::string_view kMsgCategoryWarn =
    "This content contains data categories your organization has flagged for review.";
inline constexpr std::string_view kMsgSanitizationFailed =
    "Content could not be safely sanitized and has been blocked.";

} // namespace promptguard::policy
