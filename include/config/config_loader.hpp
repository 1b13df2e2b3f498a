#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Builds a GuardConfig from promptguard.toml
 *
 * Sections: [logging], [detector], [policy], [telemetry], [[category_policies]].
 * Every string value may use ${VAR} or ${VAR:-fallback}. File loads also honour
 * a top-level `include = "base.toml"` (or an array of paths): included files
 * are merged underneath, the including file wins on scalars and
 * [[category_policies]] entries accumulate.
 *
 * Missing keys keep the GuardConfig defaults. All validation problems are
 * reported in one error.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) { return {true, {}, std::move(cfg)}; }
        static LoadResult error(std::string message) { return {false, std::move(message), {}}; }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem found, empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);
};

} // namespace promptguard
