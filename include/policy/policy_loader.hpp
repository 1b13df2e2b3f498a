#pragma once

#include "policy/category_policy.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Reads tenant category rules from TOML
 *
 *   [[category_policies]]
 *   tenant   = "acme"
 *   category = "HEALTH"      # policy group, any case
 *   decision = "BLOCK"       # ALLOW | WARN | BLOCK
 *
 * The first invalid entry fails the whole load. A document without
 * `category_policies` is an empty rule set.
 */
class PolicyLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<CategoryPolicy> policies;

        static LoadResult ok(std::vector<CategoryPolicy> rules) {
            return {true, {}, std::move(rules)};
        }
        static LoadResult error(std::string message) {
            return {false, std::move(message), {}};
        }
    };

    static LoadResult load_from_file(const std::string& config_path);
    static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Rules from a document already parsed (and env-expanded) by ConfigLoader
     */
    static LoadResult load_from_table(const toml::table& root);
};

} // namespace promptguard
