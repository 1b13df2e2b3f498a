#include "config/config_loader.hpp"
#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace promptguard {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxIncludeDepth = 8;

// ----------------------------------------------------------------------------
// ${VAR} / ${VAR:-fallback} substitution
// ----------------------------------------------------------------------------

std::string substitute_env(const std::string& input) {
    if (!input.contains("${")) return input;

    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            out.append(input, pos);
            break;
        }
        out.append(input, pos, open - pos);

        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unterminated ${{...}} starting at offset {}", open));
        }

        std::string name = input.substr(open + 2, close - open - 2);
        std::optional<std::string> fallback;
        if (const size_t sep = name.find(":-"); sep != std::string::npos) {
            fallback = name.substr(sep + 2);
            name.resize(sep);
        }

        const char* env = std::getenv(name.c_str());
        if (env && *env) {
            out += env;
        } else if (fallback) {
            out += *fallback;
        }
        pos = close + 1;
    }
    return out;
}

void substitute_env(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = substitute_env(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env(child);
    }
}

// ----------------------------------------------------------------------------
// Includes
// ----------------------------------------------------------------------------

/**
 * @brief Lay `top` over `base`: nested tables merge, arrays of tables
 *        ([[category_policies]]) append, anything else is replaced.
 */
void overlay(toml::table& base, const toml::table& top) {
    for (auto&& [key, node] : top) {
        auto* existing = base.get(key.str());
        if (existing && existing->is_table() && node.is_table()) {
            overlay(*existing->as_table(), *node.as_table());
            continue;
        }
        if (existing && existing->is_array() && node.is_array()) {
            auto& target = *existing->as_array();
            for (const auto& item : *node.as_array()) target.push_back(item);
            continue;
        }
        base.insert_or_assign(key, node);
    }
}

class IncludeResolver {
public:
    explicit IncludeResolver(const fs::path& root_file) {
        seen_.insert(fs::canonical(root_file).string());
    }

    // Included documents form the base; the including document wins.
    void resolve(toml::table& doc, const fs::path& dir, int depth) {
        auto* directive = doc.get("include");
        if (!directive) return;
        if (depth >= kMaxIncludeDepth) {
            throw std::runtime_error(
                std::format("Config includes nested deeper than {}", kMaxIncludeDepth));
        }

        std::vector<std::string> targets;
        if (auto* one = directive->as_string()) {
            targets.push_back(one->get());
        } else if (auto* many = directive->as_array()) {
            for (const auto& item : *many) {
                const auto* s = item.as_string();
                if (!s) throw std::runtime_error("include entries must be strings");
                targets.push_back(s->get());
            }
        } else {
            throw std::runtime_error("include must be a string or an array of strings");
        }
        doc.erase("include");

        for (const auto& target : targets) {
            const fs::path path = fs::canonical(dir / target);
            if (!seen_.insert(path.string()).second) {
                throw std::runtime_error(
                    std::format("Config include cycle through {}", path.string()));
            }

            toml::table base = toml::parse_file(path.string());
            resolve(base, path.parent_path(), depth + 1);
            overlay(base, doc);
            doc = std::move(base);
        }
    }

private:
    std::unordered_set<std::string> seen_;
};

toml::table read_document(const std::string& path) {
    toml::table doc = toml::parse_file(path);
    IncludeResolver(path).resolve(doc, fs::path(path).parent_path(), 0);
    substitute_env(doc);
    return doc;
}

toml::table parse_document(const std::string& content) {
    toml::table doc = toml::parse(content);
    substitute_env(doc);
    return doc;
}

// ----------------------------------------------------------------------------
// Sections
// ----------------------------------------------------------------------------

template<typename T>
T setting(const toml::table* section, std::string_view key, T fallback) {
    if (!section) return fallback;
    return (*section)[key].value_or(std::move(fallback));
}

LoggingConfig read_logging(const toml::table& doc) {
    const auto* section = doc["logging"].as_table();
    LoggingConfig cfg;
    cfg.level = setting(section, "level", cfg.level);
    return cfg;
}

Detector::Config read_detector(const toml::table& doc) {
    const auto* section = doc["detector"].as_table();
    Detector::Config cfg;
    cfg.keywords_enabled = setting(section, "keywords_enabled", cfg.keywords_enabled);
    cfg.bulk.row_threshold = setting(section, "bulk_row_threshold", cfg.bulk.row_threshold);
    cfg.bulk.min_fields = setting(section, "bulk_min_fields", cfg.bulk.min_fields);
    cfg.bulk.line_limit = setting(section, "bulk_line_limit", cfg.bulk.line_limit);
    return cfg;
}

PolicyConfig read_policy(const toml::table& doc) {
    const auto* section = doc["policy"].as_table();
    PolicyConfig cfg;
    cfg.default_role = setting(section, "default_role", cfg.default_role);
    return cfg;
}

TelemetryConfig read_telemetry(const toml::table& doc) {
    const auto* section = doc["telemetry"].as_table();
    TelemetryConfig cfg;
    cfg.enabled = setting(section, "enabled", cfg.enabled);
    cfg.salt = setting(section, "salt", cfg.salt);
    cfg.tool = setting(section, "tool", cfg.tool);
    return cfg;
}

ConfigLoader::LoadResult build_config(const toml::table& doc) {
    GuardConfig config;
    config.logging = read_logging(doc);
    config.detector = read_detector(doc);
    config.policy = read_policy(doc);
    config.telemetry = read_telemetry(doc);

    auto policies = PolicyLoader::load_from_table(doc);
    if (!policies.success) {
        return ConfigLoader::LoadResult::error(std::move(policies.error_message));
    }
    config.category_policies = std::move(policies.policies);

    const auto problems = ConfigLoader::validate_config(config);
    if (!problems.empty()) {
        std::string message = "Config validation failed:";
        for (const auto& problem : problems) {
            message += std::format("\n  - {}", problem);
        }
        return ConfigLoader::LoadResult::error(std::move(message));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return build_config(read_document(config_path));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return build_config(parse_document(toml_content));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> problems;

    if (!utils::log::parse_level(config.logging.level)) {
        problems.push_back(std::format(
            "logging.level must be info, warn or error (got '{}')", config.logging.level));
    }

    const auto& bulk = config.detector.bulk;
    if (bulk.row_threshold == 0) problems.emplace_back("detector.bulk_row_threshold must be > 0");
    if (bulk.min_fields == 0) problems.emplace_back("detector.bulk_min_fields must be > 0");
    if (bulk.line_limit == 0) problems.emplace_back("detector.bulk_line_limit must be > 0");

    if (config.policy.default_role.empty()) {
        problems.emplace_back("policy.default_role must not be empty");
    }

    if (config.telemetry.enabled) {
        if (config.telemetry.salt.empty()) {
            problems.emplace_back("telemetry.salt required when telemetry is enabled");
        }
        if (config.telemetry.tool.empty()) {
            problems.emplace_back("telemetry.tool must not be empty");
        }
    }

    return problems;
}

} // namespace promptguard
