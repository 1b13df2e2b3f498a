#include "core/guard.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "report/json_report.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace promptguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitBlocked = 2;

struct CliOptions {
    std::optional<std::string> config_file;
    std::string tenant = "default";
    std::string user = "anonymous";
    std::optional<std::string> role;
    std::string command;
    std::optional<std::string> entity_map_file;
};

void print_usage() {
    std::cerr <<
        "Usage: promptguard [--config FILE] [--tenant ID] [--user ID] [--role ROLE] <command>\n"
        "\n"
        "Commands (text is read from stdin, JSON is written to stdout):\n"
        "  analyze                      detect findings and score risk\n"
        "  inspect                      analyze, decide and sanitize a prompt\n"
        "  scan-output [--entity-map F] scan a model response for leaks\n"
        "\n"
        "Exit status: 0 ok, 1 usage or config error, 2 blocked or unsafe output\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        std::optional<std::string>* target = nullptr;
        std::optional<std::string> value;
        if (arg == "--config") {
            target = &opts.config_file;
        } else if (arg == "--role") {
            target = &opts.role;
        } else if (arg == "--entity-map") {
            target = &opts.entity_map_file;
        } else if (arg == "--tenant" || arg == "--user") {
            value = next();
            if (!value) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            (arg == "--tenant" ? opts.tenant : opts.user) = *value;
            continue;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.starts_with("-") && opts.command.empty()) {
            opts.command = arg;
            continue;
        } else {
            std::cerr << std::format("Unknown argument: {}\n", arg);
            return std::nullopt;
        }

        value = next();
        if (!value) {
            std::cerr << std::format("Missing value for {}\n", arg);
            return std::nullopt;
        }
        *target = std::move(value);
    }

    if (opts.command != "analyze" && opts.command != "inspect" && opts.command != "scan-output") {
        if (!opts.command.empty()) {
            std::cerr << std::format("Unknown command: {}\n", opts.command);
        }
        return std::nullopt;
    }
    if (opts.entity_map_file && opts.command != "scan-output") {
        std::cerr << "--entity-map only applies to scan-output\n";
        return std::nullopt;
    }
    return opts;
}

std::string read_stdin() {
    return std::string((std::istreambuf_iterator<char>(std::cin)),
                       std::istreambuf_iterator<char>());
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage();
            return kExitUsage;
        }

        // Configuration
        GuardConfig config;
        if (opts->config_file) {
            auto config_result = ConfigLoader::load_from_file(*opts->config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitUsage;
            }
            config = std::move(config_result.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::info(std::format("Config: {} category policies, default role '{}'",
            config.category_policies.size(), config.policy.default_role));

        const Guard guard(std::move(config));
        const std::string text = read_stdin();

        if (opts->command == "analyze") {
            const auto analysis = guard.detector().analyze(text);
            std::cout << report::serialize(report::to_json(analysis)) << '\n';
            return kExitOk;
        }

        if (opts->command == "inspect") {
            EntityMap session;
            const auto inspection = guard.inspect(
                text, Guard::Request{opts->tenant, opts->user, opts->role}, &session);

            nlohmann::json out;
            out["analysis"] = report::to_json(inspection.analysis);
            out["decision"] = report::to_json(inspection.decision);
            if (inspection.anonymization) {
                out["anonymization"] = report::to_json(*inspection.anonymization);
            }
            out["entity_map"] = report::to_json(session);
            if (inspection.telemetry) {
                out["telemetry"] = inspection.telemetry->to_json();
            }
            std::cout << report::serialize(out) << '\n';
            return inspection.decision.is_blocked() ? kExitBlocked : kExitOk;
        }

        // scan-output
        EntityMap session;
        if (opts->entity_map_file) {
            const auto content = read_file(*opts->entity_map_file);
            if (!content) {
                utils::log::error(std::format("Cannot open entity map: {}", *opts->entity_map_file));
                return kExitUsage;
            }
            auto parsed = report::entity_map_from_json(*content);
            if (parsed.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(parsed.error_category()), parsed.error_message()));
                return kExitUsage;
            }
            session = std::move(parsed.value());
        }

        const auto scan = guard.scan_output(text, session);
        std::cout << report::serialize(report::to_json(scan)) << '\n';
        return scan.safe ? kExitOk : kExitBlocked;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitUsage;
    }
}
