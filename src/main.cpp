#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "querylens/version.hpp"
#include "codegen/header_generator.hpp"
#include "config/dotenv.hpp"
#include "config/resolver_config.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "core/resolve_error.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"
#include "resolver/cache_check.hpp"
#include "resolver/query_resolver.hpp"
#include "sources/query_source.hpp"

using namespace querylens;

namespace {

struct GlobalOptions {
    std::string connection;
    bool offline = false;
    bool online = false;
    std::string offline_dir;
    std::string env_file;
    std::string log_level = "warn";
    std::string log_file;
    bool verbose = false;
};

void setup_logging(const GlobalOptions& opts) {
    auto& logger = core::Logger::instance();

    auto level = core::parse_log_level(opts.log_level);
    if (!level) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            "unknown log level '" + opts.log_level + "'");
    }
    if (opts.verbose && *level > core::LogLevel::DEBUG) {
        level = core::LogLevel::DEBUG;
    }
    logger.set_level(*level);

    // A log file replaces stderr as the destination
    if (!opts.log_file.empty()) {
        logger.set_output(opts.log_file);
        logger.set_console_enabled(false);
    }
}

// Dotenv first (never overriding the environment), then the environment,
// then command-line options on top
config::ResolverConfig build_config(const GlobalOptions& opts) {
    bool explicit_env_file = !opts.env_file.empty();
    auto entries = config::load_dotenv(explicit_env_file ? opts.env_file : ".env",
                                       explicit_env_file);
    size_t applied = config::apply_dotenv(entries);
    LOG_DEBUG("Applied " + std::to_string(applied) + " of " +
              std::to_string(entries.size()) + " dotenv entries");

    auto cfg = config::ResolverConfig::from_environment();

    if (!opts.connection.empty()) {
        cfg.connection_string = opts.connection;
    }
    if (opts.offline) {
        cfg.offline = true;
    } else if (opts.online) {
        cfg.offline = false;
    }
    if (!opts.offline_dir.empty()) {
        cfg.offline_dir = opts.offline_dir;
    }

    return cfg;
}

std::vector<std::filesystem::path> to_paths(const std::vector<std::string>& args) {
    return std::vector<std::filesystem::path>(args.begin(), args.end());
}

int run_describe(const GlobalOptions& opts, const std::vector<std::string>& paths,
                 const std::string& output_format, const std::string& output_file) {
    auto sources = sources::load_query_sources(to_paths(paths));
    resolver::QueryResolver qr(build_config(opts));
    if (qr.mode() == config::ResolveMode::Online) {
        qr.connect();
    }

    std::unique_ptr<reporting::Reporter> reporter;
    if (output_format == "json") {
        reporter = std::make_unique<reporting::JsonReporter>(output_file);
    } else {
        reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, opts.verbose);
    }

    reporter->report_start(qr.mode());

    size_t ok = 0;
    size_t failed = 0;
    auto start = std::chrono::steady_clock::now();

    for (const auto& source : sources) {
        try {
            reporter->report_query(qr.resolve(source));
            ++ok;
        } catch (const core::ResolveError& e) {
            LOG_ERROR(source.name + ": " + e.what());
            reporter->report_failure(source, e.what());
            ++failed;
        } catch (const core::OdbcError& e) {
            LOG_ERROR(source.name + ": " + e.format_diagnostics());
            reporter->report_failure(source, e.summary());
            ++failed;
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    reporter->report_summary(sources.size(), ok, failed, duration);
    reporter->report_end();

    return failed > 0 ? 1 : 0;
}

int run_prepare(const GlobalOptions& opts, const std::vector<std::string>& paths, bool check) {
    auto cfg = build_config(opts);
    if (cfg.offline_forced()) {
        throw core::ResolveError(core::ResolveErrorKind::Configuration,
            "prepare needs a database connection; unset QUERYLENS_OFFLINE or drop --offline");
    }
    cfg.offline = false;
    cfg.save_to_cache = !check;

    auto sources = sources::load_query_sources(to_paths(paths));
    resolver::QueryResolver qr(std::move(cfg));
    qr.connect();

    auto result = check ? resolver::check_cache(qr, sources) : resolver::prepare_cache(qr, sources);

    for (const auto& entry : result.entries) {
        std::string label = resolver::cache_entry_state_to_string(entry.state);
        label.resize(std::max<size_t>(label.size(), 8), ' ');

        if (entry.state == resolver::CacheEntryState::Failed) {
            std::cerr << label << " " << entry.query << " (" << entry.location << "): "
                      << entry.detail << "\n";
        } else if (entry.state == resolver::CacheEntryState::Unused) {
            std::cout << label << " " << entry.entry << "\n";
        } else if (entry.state == resolver::CacheEntryState::Prepared) {
            std::cout << label << " " << entry.query << " -> " << entry.entry << "\n";
        } else if (!entry.detail.empty()) {
            std::cout << label << " " << entry.query << ": " << entry.detail << "\n";
        } else if (entry.state == resolver::CacheEntryState::Current) {
            std::cout << label << " " << entry.query << "\n";
        } else {
            std::cout << label << " " << entry.query << " (" << entry.entry << ")\n";
        }
    }

    if (check) {
        if (result.outdated > 0) {
            std::cout << result.outdated << " cache entries are missing, stale or unused; "
                      << "run `querylens prepare` to update the query cache\n";
        }
    } else if (result.pruned) {
        std::cout << "query cache " << qr.cache().dir().string() << ": "
                  << result.entries.size() << " entries, " << result.removed << " removed\n";
    } else {
        std::cerr << result.failed << " queries failed; cache not pruned\n";
    }

    return result.exit_code();
}

int run_generate(const GlobalOptions& opts, const std::vector<std::string>& paths,
                 const std::string& ns, const std::string& output_file) {
    auto sources = sources::load_query_sources(to_paths(paths));
    resolver::QueryResolver qr(build_config(opts));
    if (qr.mode() == config::ResolveMode::Online) {
        qr.connect();
    }

    std::vector<resolver::ResolvedQuery> resolved;
    size_t failed = 0;

    for (const auto& source : sources) {
        try {
            resolved.push_back(qr.resolve(source));
        } catch (const core::ResolveError& e) {
            std::cerr << source.location() << ": error: " << source.name << ": " << e.what() << "\n";
            ++failed;
        } catch (const core::OdbcError& e) {
            LOG_ERROR(source.name + ": " + e.format_diagnostics());
            std::cerr << source.location() << ": error: " << source.name << ": "
                      << e.summary() << "\n";
            ++failed;
        }
    }

    if (failed > 0) {
        std::cerr << failed << " of " << sources.size() << " queries failed; no header written\n";
        return 1;
    }

    codegen::HeaderOptions options;
    options.namespace_name = ns;
    std::string header = codegen::render_header(resolved, options);

    if (output_file.empty()) {
        std::cout << header;
        return 0;
    }

    std::ofstream out(output_file, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Could not write header to " + output_file);
    }
    out << header;
    LOG_INFO("Wrote " + output_file);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "querylens - build-time SQL query metadata resolver\n"
        "\n"
        "  Prepares queries against a database through ODBC (or reads cached\n"
        "  metadata offline) and reports parameter types and result-column\n"
        "  nullability, or generates typed C++ structs for them.\n"
        "\n"
        "Examples:\n"
        "  querylens --connection \"Driver={PostgreSQL};...\" describe queries/\n"
        "  querylens prepare queries/ && QUERYLENS_OFFLINE=true querylens generate queries/ -f db.hpp\n"
        "  querylens prepare --check queries/\n",
        "querylens"
    };

    app.set_version_flag("--version,-V", QUERYLENS_VERSION);
    app.require_subcommand(1);

    GlobalOptions opts;
    app.add_option("-c,--connection", opts.connection,
                   "ODBC connection string (overrides QUERYLENS_CONNECTION)");
    auto* offline_flag = app.add_flag("--offline", opts.offline,
                                      "Resolve from the query cache only");
    auto* online_flag = app.add_flag("--online", opts.online,
                                     "Always resolve against the database");
    offline_flag->excludes(online_flag);
    app.add_option("--offline-dir", opts.offline_dir,
                   "Query cache directory (overrides QUERYLENS_OFFLINE_DIR, default .querylens)");
    app.add_option("--env-file", opts.env_file,
                   "Read environment defaults from FILE instead of .env");
    app.add_option("--log-level", opts.log_level,
                   "Minimum log level: trace, debug, info, warn (default), error, fatal")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"}, CLI::ignore_case));
    app.add_option("--log-file", opts.log_file, "Write log to FILE instead of stderr");
    app.add_flag("-v,--verbose", opts.verbose, "More detail in reports; log at debug level");

    std::vector<std::string> paths;

    auto* describe_cmd = app.add_subcommand("describe", "Resolve queries and report their metadata");
    describe_cmd->add_option("paths", paths, ".sql files or directories")->required();
    std::string output_format = "console";
    describe_cmd->add_option("-o,--output", output_format,
                             "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));
    std::string report_file;
    describe_cmd->add_option("-f,--file", report_file,
                             "Write JSON output to FILE instead of stdout");

    auto* prepare_cmd = app.add_subcommand("prepare", "Describe queries online and update the query cache");
    prepare_cmd->add_option("paths", paths, ".sql files or directories")->required();
    bool check = false;
    prepare_cmd->add_flag("--check", check,
                          "Write nothing; fail if the cache is missing, stale or has unused entries");

    auto* generate_cmd = app.add_subcommand("generate", "Generate a C++ header with typed structs");
    generate_cmd->add_option("paths", paths, ".sql files or directories")->required();
    std::string ns = "queries";
    generate_cmd->add_option("--namespace", ns, "Namespace of the generated code (default queries)");
    std::string header_file;
    generate_cmd->add_option("-f,--file", header_file, "Write the header to FILE instead of stdout");

    CLI11_PARSE(app, argc, argv);

    try {
        setup_logging(opts);
        LOG_DEBUG(std::string("querylens ") + QUERYLENS_VERSION);

        if (describe_cmd->parsed()) {
            return run_describe(opts, paths, output_format, report_file);
        }
        if (prepare_cmd->parsed()) {
            return run_prepare(opts, paths, check);
        }
        return run_generate(opts, paths, ns, header_file);

    } catch (const core::OdbcError& e) {
        std::cerr << "\nODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const core::ResolveError& e) {
        std::cerr << "\nError (" << core::resolve_error_kind_to_string(e.kind()) << "): "
                  << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 3;
    }
}
