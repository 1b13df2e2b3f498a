#include "report/json_report.hpp"
#include "core/category.hpp"

#include <format>

namespace promptguard::report {

nlohmann::json to_json(const Finding& finding) {
    nlohmann::json j;
    j["category"] = category_name(finding);
    j["offset_start"] = finding.offset_start;
    j["offset_end"] = finding.offset_end;
    if (finding.value) {
        j["value"] = *finding.value;
    }
    if (finding.details.row_count) {
        j["row_count"] = *finding.details.row_count;
    }
    if (!finding.details.matched_rule.empty()) {
        j["matched_rule"] = finding.details.matched_rule;
    }
    return j;
}

nlohmann::json to_json(const Analysis& analysis) {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& f : analysis.findings) {
        findings.push_back(to_json(f));
    }
    return {
        {"risk_level", risk_level_to_string(analysis.risk_level)},
        {"anomaly_score", analysis.anomaly_score},
        {"findings", std::move(findings)},
    };
}

nlohmann::json to_json(const PolicyDecision& decision) {
    return {
        {"decision", decision_to_string(decision.decision)},
        {"reason_codes", decision.reason_codes},
        {"user_message", decision.user_message},
    };
}

nlohmann::json to_json(const AnonymizationResult& result) {
    return {
        {"sanitized_text", result.sanitized_text},
        {"changed", result.changed},
        {"summary", {
            {"removed_categories", result.summary.removed_categories},
            {"bulk_data_handled", result.summary.bulk_data_handled},
        }},
    };
}

nlohmann::json to_json(const OutputScanResult& result) {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& f : result.findings) {
        nlohmann::json j;
        j["type"] = output_finding_type_to_string(f.type);
        j["severity"] = threat_level_to_string(f.severity);
        j["message"] = f.message;

        switch (f.type) {
            case OutputFindingType::SENSITIVE_IN_OUTPUT: {
                // Categories only: the values are what is being withheld
                nlohmann::json categories = nlohmann::json::array();
                for (const auto& p : f.patterns) categories.push_back(category_name(p));
                j["categories"] = std::move(categories);
                break;
            }
            case OutputFindingType::REVERSAL_ATTEMPT: {
                nlohmann::json attempts = nlohmann::json::array();
                for (const auto& a : f.attempts) {
                    attempts.push_back({
                        {"placeholder", a.placeholder},
                        {"partial", a.partial.has_value()},
                    });
                }
                j["attempts"] = std::move(attempts);
                break;
            }
            case OutputFindingType::SUSPICIOUS_PATTERN: {
                nlohmann::json matches = nlohmann::json::array();
                for (const auto& m : f.suspicious) {
                    matches.push_back({
                        {"keyword", m.keyword},
                        {"context", m.context},
                        {"reason", m.reason},
                    });
                }
                j["patterns"] = std::move(matches);
                break;
            }
        }
        findings.push_back(std::move(j));
    }

    nlohmann::json out;
    out["safe"] = result.safe;
    out["findings"] = std::move(findings);
    if (result.masked_text) {
        out["masked_text"] = *result.masked_text;
    } else {
        out["text"] = result.text;
    }
    return out;
}

nlohmann::json to_json(const EntityMap& map) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : map.entries()) {
        entries.push_back({
            {"placeholder", e.placeholder},
            {"original_value", e.original_value},
            {"category", category_name(e.category)},
        });
    }
    return entries;
}

namespace {

// Unknown or missing category names fall back to CUSTOM.
Category entry_category(const nlohmann::ordered_json& item) {
    if (const auto it = item.find("category"); it != item.end() && it->is_string()) {
        return parse_category(it->get<std::string>()).value_or(Category::CUSTOM);
    }
    return Category::CUSTOM;
}

} // anonymous namespace

std::string serialize(const nlohmann::json& doc, int indent) {
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<EntityMap> entity_map_from_json(const std::string& content) {
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                                        std::format("Invalid entity map JSON: {}", e.what()));
    }

    EntityMap map;

    if (doc.is_object()) {
        for (const auto& [placeholder, value] : doc.items()) {
            EntityMap::Entry entry{placeholder, {}, Category::CUSTOM};
            if (value.is_string()) {
                entry.original_value = value.get<std::string>();
            } else if (value.is_object() && value.contains("originalValue") &&
                       value["originalValue"].is_string()) {
                // {"EMAIL_1": {"originalValue": "...", "category": "EMAIL"}}
                entry.original_value = value["originalValue"].get<std::string>();
                entry.category = entry_category(value);
            } else {
                return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                    std::format("Entity '{}': value must be a string or an object "
                                "with an originalValue string", placeholder));
            }
            if (!map.restore(entry)) {
                return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                    std::format("Entity '{}': duplicate placeholder or value", placeholder));
            }
        }
        return Result<EntityMap>::ok(std::move(map));
    }

    if (!doc.is_array()) {
        return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                                        "Entity map must be a JSON array or object");
    }

    size_t index = 0;
    for (const auto& item : doc) {
        ++index;
        if (!item.is_object() || !item.contains("placeholder") || !item.contains("original_value") ||
            !item["placeholder"].is_string() || !item["original_value"].is_string()) {
            return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                std::format("Entity map entry {}: expected placeholder and original_value strings",
                            index));
        }

        EntityMap::Entry entry{item["placeholder"].get<std::string>(),
                               item["original_value"].get<std::string>(), entry_category(item)};
        if (!map.restore(entry)) {
            return Result<EntityMap>::error(ErrorCategory::INPUT_ERROR,
                std::format("Entity map entry {}: duplicate placeholder or value", index));
        }
    }
    return Result<EntityMap>::ok(std::move(map));
}

} // namespace promptguard::report
