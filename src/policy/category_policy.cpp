#include "policy/category_policy.hpp"
#include "policy/policy_constants.hpp"
#include "core/category.hpp"


namespace promptguard {

CategoryPolicyTable::CategoryPolicyTable()
    : store_(std::make_shared<const Store>()) {}

CategoryPolicyTable::CategoryPolicyTable(const std::vector<CategoryPolicy>& policies)
    : store_(build_store(policies)), count_(policies.size()) {}

std::shared_ptr<const CategoryPolicyTable::Store> CategoryPolicyTable::build_store(
    const std::vector<CategoryPolicy>& policies) {
    auto store = std::make_shared<Store>();
    for (const auto& p : policies) {
        // Later entries for the same (tenant, group) win
        (*store)[p.tenant][p.category] = p.action;
    }
    return store;
}

void CategoryPolicyTable::reload(const std::vector<CategoryPolicy>& policies) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    store_.store(build_store(policies), std::memory_order_release);
    count_.store(policies.size(), std::memory_order_relaxed);
}

size_t CategoryPolicyTable::policy_count() const {
    return count_.load(std::memory_order_relaxed);
}

std::optional<CategoryAction> CategoryPolicyTable::lookup(const std::string& tenant,
                                                          std::string_view group) const {
    const auto store = store_.load(std::memory_order_acquire);
    const auto tenant_it = store->find(tenant);
    if (tenant_it == store->end()) {
        return std::nullopt;
    }
    const auto group_it = tenant_it->second.find(std::string(group));
    if (group_it == tenant_it->second.end()) {
        return std::nullopt;
    }
    return group_it->second;
}

PolicyDecision CategoryPolicyTable::apply(const PolicyDecision& baseline,
                                          const Analysis& analysis,
                                          const std::string& tenant) const {
    if (baseline.is_blocked() || analysis.findings.empty()) {
        return baseline;
    }

    bool any_block = false;
    bool any_warn = false;
    for (const auto& finding : analysis.findings) {
        const auto group = category_info(finding.category).policy_group;
        switch (lookup(tenant, group).value_or(CategoryAction::WARN)) {
            case CategoryAction::BLOCK: any_block = true; break;
            case CategoryAction::WARN:  any_warn = true;  break;
            case CategoryAction::ALLOW: break;
        }
    }

    if (any_block) {
        PolicyDecision result;
        result.decision = Decision::BLOCK;
        result.reason_codes = baseline.reason_codes;
        result.reason_codes.emplace_back(policy::kReasonCategoryBlocked);
        result.user_message = std::string(policy::kMsgCategoryBlocked);
        return result;
    }

    if (any_warn && baseline.decision == Decision::ALLOW) {
        PolicyDecision result;
        result.decision = Decision::WARN_AND_ALLOW;
        result.reason_codes = baseline.reason_codes;
        result.reason_codes.emplace_back(policy::kReasonCategoryWarn);
        result.user_message = std::string(policy::kMsgCategoryWarn);
        return result;
    }

    return baseline;
}

} // namespace promptguard
