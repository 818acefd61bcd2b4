#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/database_context.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "format/result_formatter.hpp"
#include "security/sql_validator.hpp"
#include "service/query_service.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace wpdb;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Wait for in-flight queries at shutdown before dropping them
constexpr std::chrono::milliseconds kShutdownWait{10000};

struct CliOptions {
    std::optional<std::string> config_file;
    OutputFormat format = OutputFormat::JSON;
    std::optional<int> site_id;
    std::optional<size_t> limit;
    std::string command;
    std::vector<std::string> args;
};

void print_usage() {
    std::cerr <<
        "Usage: wpdb-gateway [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  query <sql>          Run a read-only SELECT/SHOW/DESCRIBE/EXPLAIN statement\n"
        "  check <sql>          Validate a statement without connecting\n"
        "  tables [like]        List tables of a site (or matching a LIKE pattern)\n"
        "  describe <table>     Show columns and indexes of a table\n"
        "  sites                List multisite table prefixes\n"
        "\n"
        "Options:\n"
        "  --config <file>      TOML config (default: defaults + WP_* environment)\n"
        "  --format json|csv    Output format (default: json)\n"
        "  --site <id>          Multisite site id (1 = main site)\n"
        "  --limit <n>          Row limit for query (default and ceiling: query.max_rows)\n";
}

// Returns the parsed options, or nullopt after printing what was wrong
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config_file = std::move(*v);
        } else if (arg == "--format") {
            auto v = next();
            if (!v) return std::nullopt;
            const auto format = parse_output_format(*v);
            if (!format) {
                std::cerr << std::format("Unknown format '{}'\n", *v);
                return std::nullopt;
            }
            opts.format = *format;
        } else if (arg == "--site") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.site_id = utils::try_parse_int<int>(*v);
            if (!opts.site_id) {
                std::cerr << std::format("--site expects an integer, got '{}'\n", *v);
                return std::nullopt;
            }
        } else if (arg == "--limit") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.limit = utils::try_parse_int<size_t>(*v);
            if (!opts.limit || *opts.limit == 0) {
                std::cerr << std::format("--limit expects a positive integer, got '{}'\n", *v);
                return std::nullopt;
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return std::nullopt;
    }
    opts.command = positional.front();
    opts.args.assign(positional.begin() + 1, positional.end());

    const bool needs_one = opts.command == "query" || opts.command == "check"
                        || opts.command == "describe";
    const bool takes_optional = opts.command == "tables";
    const bool takes_none = opts.command == "sites";

    if (needs_one && opts.args.size() != 1) {
        std::cerr << std::format("'{}' takes exactly one argument\n", opts.command);
        return std::nullopt;
    }
    if (takes_optional && opts.args.size() > 1) {
        std::cerr << "'tables' takes at most one argument\n";
        return std::nullopt;
    }
    if (takes_none && !opts.args.empty()) {
        std::cerr << "'sites' takes no arguments\n";
        return std::nullopt;
    }
    if (!needs_one && !takes_optional && !takes_none) {
        std::cerr << std::format("Unknown command '{}'\n", opts.command);
        return std::nullopt;
    }
    return opts;
}

int emit(const ServiceResponse& response) {
    std::cout << response.body;
    if (!response.body.empty() && response.body.back() != '\n') {
        std::cout << '\n';
    }
    return response.ok() ? kExitOk : kExitFailure;
}

// Offline validation; never touches the database
int run_check(const std::string& sql) {
    const SqlValidator validator;
    const auto outcome = validator.validate(sql);
    if (outcome.is_rejected()) {
        return emit(ServiceResponse{
            ErrorCode::VALIDATION_REJECTED,
            ResultFormatter::error_response(
                Error{ErrorCode::VALIDATION_REJECTED, outcome.rejection().message()})});
    }
    return emit(ServiceResponse{ErrorCode::NONE, R"({"valid": true})"});
}

ServiceResponse dispatch(const QueryService& service, const CliOptions& opts, size_t default_limit) {
    if (opts.command == "query") {
        return service.run_query(opts.args[0], opts.limit.value_or(default_limit), opts.format);
    }
    if (opts.command == "tables") {
        const std::string filter = opts.args.empty() ? std::string{} : opts.args[0];
        return service.list_tables(opts.site_id, filter, opts.format);
    }
    if (opts.command == "describe") {
        return service.describe_table(opts.site_id, opts.args[0], opts.format);
    }
    return service.list_sites(opts.format);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage();
            return kExitUsage;
        }

        if (opts->command == "check") {
            return run_check(opts->args[0]);
        }

        // [1/3] Configuration
        auto config_result = opts->config_file
            ? ConfigLoader::load_from_file(*opts->config_file)
            : ConfigLoader::load_from_env();
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitFailure;
        }
        const auto& config = config_result.config;
        utils::log::set_level(config.logging.level);

        utils::log::info(std::format("[1/3] Configuration loaded from {}",
                                     opts->config_file.value_or("environment")));

        // [2/3] Database context (pool + prefix)
        utils::log::info("[2/3] Connection pool initializing...");
        ContextSlot slot;
        auto context = DatabaseContext::create(config, std::make_shared<MysqlConnectionFactory>());
        if (context.is_error()) {
            utils::log::error(std::format("Startup failed ({}): {}",
                                          error_code_to_string(context.error_code()),
                                          context.error_message()));
            return kExitFailure;
        }
        slot.set(std::move(context.value()));

        // [3/3] Request
        utils::log::info(std::format("[3/3] Running '{}'", opts->command));
        const QueryService service(slot);
        const int exit_code = emit(dispatch(service, *opts, config.query.max_rows));

        if (!slot.shutdown(kShutdownWait)) {
            utils::log::warn("Shutdown dropped connections that were still in use");
        }
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
