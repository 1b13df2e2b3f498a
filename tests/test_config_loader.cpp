#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace promptguard;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "promptguard_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("Config: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.policy.default_role == "employee");
    CHECK(result.config.detector.keywords_enabled);
    CHECK(result.config.detector.bulk.row_threshold == 10);
    CHECK_FALSE(result.config.telemetry.enabled);
    CHECK(result.config.category_policies.empty());
}

TEST_CASE("Config: all sections", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "warn"

[detector]
keywords_enabled = false
bulk_row_threshold = 20
bulk_min_fields = 4
bulk_line_limit = 100

[policy]
default_role = "analyst"

[telemetry]
enabled = true
salt = "pepper"
tool = "EXTENSION"

[[category_policies]]
tenant = "acme"
category = "SECRETS"
decision = "BLOCK"
)");

    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "warn");
    CHECK_FALSE(cfg.detector.keywords_enabled);
    CHECK(cfg.detector.bulk.row_threshold == 20);
    CHECK(cfg.detector.bulk.min_fields == 4);
    CHECK(cfg.detector.bulk.line_limit == 100);
    CHECK(cfg.policy.default_role == "analyst");
    CHECK(cfg.telemetry.enabled);
    CHECK(cfg.telemetry.salt == "pepper");
    CHECK(cfg.telemetry.tool == "EXTENSION");
    REQUIRE(cfg.category_policies.size() == 1);
    CHECK(cfg.category_policies[0].action == CategoryAction::BLOCK);
}

TEST_CASE("Config: env var expansion", "[config][env]") {
    ::setenv("PROMPTGUARD_TEST_SALT", "s3cret", 1);

    const auto result = ConfigLoader::load_from_string(R"(
[telemetry]
enabled = true
salt = "${PROMPTGUARD_TEST_SALT}-v1"
)");
    REQUIRE(result.success);
    CHECK(result.config.telemetry.salt == "s3cret-v1");

    ::unsetenv("PROMPTGUARD_TEST_SALT");
}

TEST_CASE("Config: validation errors are collected", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "verbose"

[detector]
bulk_row_threshold = 0

[telemetry]
enabled = true
)");

    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("detector.bulk_row_threshold") != std::string::npos);
    CHECK(result.error_message.find("telemetry.salt") != std::string::npos);
}

TEST_CASE("Config: malformed TOML is a load error", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config: bad category policy fails the whole load", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[category_policies]]
tenant = "acme"
category = "HEALTH"
decision = "MAYBE"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("MAYBE") != std::string::npos);
}

TEST_CASE("Config: include merges policies from another file", "[config][include]") {
    TmpDir tmp;

    tmp.file("tenants.toml", R"(
[[category_policies]]
tenant = "acme"
category = "HEALTH"
decision = "BLOCK"
)");

    const auto main_path = tmp.file("promptguard.toml", R"(
include = "tenants.toml"

[policy]
default_role = "employee"

[[category_policies]]
tenant = "globex"
category = "SECRETS"
decision = "WARN"
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    REQUIRE(result.config.category_policies.size() == 2);
    CHECK(result.config.category_policies[0].tenant == "acme");
    CHECK(result.config.category_policies[1].tenant == "globex");
}

TEST_CASE("Config: missing file", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/promptguard.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("Config: env var fallback", "[config][env]") {
    ::unsetenv("PROMPTGUARD_TEST_UNSET");
    ::setenv("PROMPTGUARD_TEST_ROLE", "manager", 1);

    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "${PROMPTGUARD_TEST_UNSET:-error}"

[policy]
default_role = "${PROMPTGUARD_TEST_ROLE:-employee}"
)");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "error");
    CHECK(result.config.policy.default_role == "manager");

    ::unsetenv("PROMPTGUARD_TEST_ROLE");
}

TEST_CASE("Config: unterminated substitution is a load error", "[config][env]") {
    const auto result = ConfigLoader::load_from_string(R"(
[telemetry]
salt = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unterminated") != std::string::npos);
}

TEST_CASE("Config: including file wins on scalars", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[logging]
level = "error"

[policy]
default_role = "contractor"
)");
    const auto main_path = tmp.file("promptguard.toml", R"(
include = ["base.toml"]

[logging]
level = "warn"
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");
    CHECK(result.config.policy.default_role == "contractor");
}

TEST_CASE("Config: include cycles are rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    const auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("cycle") != std::string::npos);
}

TEST_CASE("Config: validate_config on a built config", "[config][validation]") {
    GuardConfig config;
    CHECK(ConfigLoader::validate_config(config).empty());

    config.telemetry.enabled = true;
    config.telemetry.salt = "pepper";
    config.telemetry.tool = "";
    config.policy.default_role = "";

    const auto problems = ConfigLoader::validate_config(config);
    REQUIRE(problems.size() == 2);
    CHECK(problems[0] == "policy.default_role must not be empty");
    CHECK(problems[1] == "telemetry.tool must not be empty");
}
