#include "policy/policy_loader.hpp"
#include "core/category.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>

using namespace std::string_literals;

namespace promptguard {

static constexpr std::string_view kCategoryPolicies = "category_policies";

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }
    return load_from_string(std::string(std::istreambuf_iterator<char>(in), {}));
}

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    try {
        return load_from_table(toml::parse(toml_content));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

PolicyLoader::LoadResult PolicyLoader::load_from_table(const toml::table& root) {
    std::vector<CategoryPolicy> policies;

    const auto* node = root[kCategoryPolicies].node();
    if (!node) {
        return LoadResult::ok({});
    }
    const auto* policies_array = node->as_array();
    if (!policies_array) {
        return LoadResult::error("category_policies must be an array of tables");
    }

    size_t index = 0;
    for (const auto& elem : *policies_array) {
        ++index;
        const auto* entry = elem.as_table();
        if (!entry) {
            return LoadResult::error(
                std::format("category_policies[{}]: expected a table", index));
        }
        const auto& tbl = *entry;

        CategoryPolicy policy;

        policy.tenant = tbl["tenant"].value_or(""s);
        if (policy.tenant.empty()) {
            return LoadResult::error(
                std::format("category_policies[{}]: missing tenant", index));
        }

        const std::string category = tbl["category"].value_or(""s);
        std::string group = category;
        std::transform(group.begin(), group.end(), group.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!policy_group::is_known(group)) {
            return LoadResult::error(std::format(
                "category_policies[{}]: tenant '{}': unknown category '{}'",
                index, policy.tenant, category));
        }
        policy.category = std::move(group);

        const std::string decision = tbl["decision"].value_or(""s);
        const auto action = parse_category_action(decision);
        if (!action) {
            return LoadResult::error(std::format(
                "category_policies[{}]: tenant '{}': invalid decision '{}'",
                index, policy.tenant, decision));
        }
        policy.action = *action;

        policies.emplace_back(std::move(policy));
    }

    return LoadResult::ok(std::move(policies));
}

} // namespace promptguard
