#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptguard {

/**
 * @brief Session-scoped placeholder table (EMAIL_1 -> "jane@firm.com")
 *
 * Invariants:
 * - one placeholder per distinct original value
 * - per-prefix counters only increase for the lifetime of the map
 * - entries() iterates in insertion order
 *
 * Owned by the calling session; nothing here persists it.
 */
class EntityMap {
public:
    struct Entry {
        std::string placeholder;
        std::string original_value;
        Category category;
    };

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] std::optional<std::string> lookup_placeholder(std::string_view value) const;
    [[nodiscard]] const Entry* find(std::string_view placeholder) const;

    /**
     * @brief Register a value, returning its (possibly pre-existing) placeholder
     */
    const std::string& add(std::string_view value, Category category);

    /**
     * @brief Re-insert a persisted entry verbatim (session reload)
     *
     * Counters advance past the entry's numeric suffix so later add() calls
     * never reuse it.
     * @return false if the placeholder or the value is already mapped
     */
    bool restore(const Entry& entry);

    /**
     * @brief Replace every placeholder in text with its original value
     *
     * Longer placeholders are substituted first so EMAIL_1 never clobbers EMAIL_12.
     */
    [[nodiscard]] std::string rehydrate(std::string_view text) const;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> by_value_;
    std::unordered_map<std::string, size_t> by_placeholder_;
    std::unordered_map<std::string, size_t> counters_;
};

/**
 * @brief Build a fresh map from findings in scan order
 *
 * Findings without a value and report-only findings are skipped.
 */
[[nodiscard]] EntityMap build_entity_map(const std::vector<Finding>& findings);

/**
 * @brief Add a later request's findings without resetting counters
 */
void extend(EntityMap& map, const std::vector<Finding>& findings);

} // namespace promptguard
