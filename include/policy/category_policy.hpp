#pragma once

#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptguard {

/**
 * @brief One persisted tenant rule: (tenant, policy group) -> action
 */
struct CategoryPolicy {
    std::string tenant;
    std::string category;       // policy group, e.g. "HEALTH"
    CategoryAction action = CategoryAction::WARN;
};

/**
 * @brief Tenant category overrides layered on the baseline decision
 *
 * Each finding's category maps to a policy group; a group the tenant has
 * not configured is treated as WARN. Merge is strictest-wins:
 * - any BLOCK group                 -> BLOCK (CATEGORY_BLOCKED)
 * - any WARN group, baseline ALLOW  -> WARN_AND_ALLOW (CATEGORY_WARN)
 * - ALLOW never relaxes the baseline
 *
 * Thread-safety: reload() swaps the rule set atomically (RCU); apply() reads
 * a snapshot and never blocks.
 */
class CategoryPolicyTable {
public:
    CategoryPolicyTable();
    explicit CategoryPolicyTable(const std::vector<CategoryPolicy>& policies);

    void reload(const std::vector<CategoryPolicy>& policies);

    [[nodiscard]] PolicyDecision apply(const PolicyDecision& baseline,
                                       const Analysis& analysis,
                                       const std::string& tenant) const;

    /**
     * @brief Configured action for a group, nullopt when the tenant has no rule
     */
    [[nodiscard]] std::optional<CategoryAction> lookup(const std::string& tenant,
                                                       std::string_view group) const;

    [[nodiscard]] size_t policy_count() const;

private:
    // tenant -> (group -> action)
    using Store = std::unordered_map<std::string, std::unordered_map<std::string, CategoryAction>>;

    static std::shared_ptr<const Store> build_store(const std::vector<CategoryPolicy>& policies);

    std::atomic<std::shared_ptr<const Store>> store_;
    std::atomic<size_t> count_{0};
    mutable std::mutex reload_mutex_;
};

} // namespace promptguard
