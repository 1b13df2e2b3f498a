#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "anonymizer/entity_mapper.hpp"
#include "output/output_filter.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace promptguard::report {

// JSON renderings of pipeline results for the CLI and callers.

[[nodiscard]] nlohmann::json to_json(const Finding& finding);
[[nodiscard]] nlohmann::json to_json(const Analysis& analysis);
[[nodiscard]] nlohmann::json to_json(const PolicyDecision& decision);
[[nodiscard]] nlohmann::json to_json(const AnonymizationResult& result);
[[nodiscard]] nlohmann::json to_json(const OutputScanResult& result);

/**
 * @brief Ordered array of {placeholder, original_value, category}
 */
[[nodiscard]] nlohmann::json to_json(const EntityMap& map);

/**
 * @brief Text rendering for output; invalid UTF-8 in strings becomes U+FFFD
 */
[[nodiscard]] std::string serialize(const nlohmann::json& doc, int indent = 2);

/**
 * @brief Parse an entity map document
 *
 * Accepts the array form produced by to_json(EntityMap), or an object
 * keyed by placeholder whose key order is preserved. Object values are
 * either the original string, {"EMAIL_1": "jane@firm.com"}, or a record
 * {"EMAIL_1": {"originalValue": "jane@firm.com", "category": "EMAIL"}}
 * with an optional category.
 */
[[nodiscard]] Result<EntityMap> entity_map_from_json(const std::string& content);

} // namespace promptguard::report
