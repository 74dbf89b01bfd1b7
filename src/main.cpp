// main.cpp - daily token total supply from a JSON-RPC node

#include "block_resolver.hpp"
#include "config.hpp"
#include "rpc.hpp"
#include "state_reader.hpp"
#include "supply_history.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace supply;

// CLI11 check for "YYYY-MM-DD" arguments.
static std::string check_date(const std::string& v)
{
    if (!parse_date(v))
        return "expected a date as YYYY-MM-DD, got '" + v + "'";
    return {};
}

// Main entry point
int main(int argc, char* argv[])
{
    CLI::App app {
        "supply_tracker\n"
        "Resolves the block at the start of each day in a date range and prints\n"
        "the totalSupply() of the configured tokens at that block."
    };

    std::filesystem::path config_path;
    app.add_option("-c,--config", config_path,
           "JSON file with the rpc endpoint, batch settings and token table")
        ->check(CLI::ExistingFile);

    std::vector<std::string> token_specs;
    app.add_option("-t,--token", token_specs,
        "Token as NAME:ADDRESS:DECIMALS (repeatable, added to the config tokens)");

    std::optional<std::string> rpc_url;
    app.add_option("-u,--rpc-url", rpc_url,
        "Execution node JSON-RPC URL (default http://localhost:8545)");

    std::optional<int> timeout_ms;
    app.add_option("--timeout", timeout_ms,
           "Per-request timeout in milliseconds")
        ->check(CLI::PositiveNumber);

    std::optional<int> retries;
    app.add_option("-r,--retries", retries,
           "Attempts per RPC call and per batch")
        ->check(CLI::PositiveNumber);

    std::optional<int> retry_delay_ms;
    app.add_option("-d,--retry-delay", retry_delay_ms,
           "Delay in milliseconds before retrying a failed call or batch")
        ->check(CLI::PositiveNumber);

    std::string from_str;
    std::string to_str;
    app.add_option("--from", from_str, "First date (YYYY-MM-DD)")->check(check_date);
    app.add_option("--to", to_str, "Last date (YYYY-MM-DD, default today UTC)")->check(check_date);

    int days = 60;
    app.add_option("--days", days,
           "Number of days before --to when --from is not given")
        ->check(CLI::Range(0, kMaxRangeDays))
        ->default_val(days);

    bool keep_partial = false;
    app.add_flag("--keep-partial", keep_partial,
        "Keep dates where some token values stayed unavailable");

    app.set_version_flag("-v,--version", "supply_tracker 1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    Config cfg;
    try {
        if (!config_path.empty())
            cfg = load_config(config_path);
        for (const auto& spec : token_specs)
            cfg.tokens.push_back(parse_token_spec(spec));
        check_unique_names(cfg.tokens);
    } catch (const std::exception& e) {
        std::cerr << "[main] configuration error: " << e.what() << '\n';
        return 2;
    }
    if (cfg.tokens.empty()) {
        std::cerr << "[main] no tokens configured (use --config or --token)\n";
        return 2;
    }

    // Command line wins over the config file
    if (rpc_url)
        cfg.endpoint.url = *rpc_url;
    if (timeout_ms)
        cfg.endpoint.timeout = std::chrono::milliseconds(*timeout_ms);
    if (retries) {
        cfg.endpoint.max_retries = *retries;
        cfg.batch.max_attempts = *retries;
    }
    if (retry_delay_ms) {
        cfg.endpoint.retry_delay = std::chrono::milliseconds(*retry_delay_ms);
        cfg.batch.delay = std::chrono::milliseconds(*retry_delay_ms);
    }

    const Date to = to_str.empty()
        ? Date { std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()) }
        : *parse_date(to_str);
    const Date from = from_str.empty()
        ? Date { std::chrono::sys_days { to } - std::chrono::days { days } }
        : *parse_date(from_str);
    if (std::chrono::sys_days { from } > std::chrono::sys_days { to }) {
        std::cerr << "[main] --from " << format_date(from) << " is after --to "
                  << format_date(to) << '\n';
        return 2;
    }

    std::unique_ptr<rpc::Client> rpc_client;
    std::unique_ptr<StateReader> reader;
    try {
        rpc_client = std::make_unique<rpc::Client>(cfg.endpoint);
        reader = std::make_unique<StateReader>(*rpc_client, cfg.batch);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] configuration error: " << e.what() << '\n';
        return 2;
    }
    BlockResolver resolver(*rpc_client);
    SupplyHistory history(resolver, *reader, cfg.tokens, !keep_partial);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    std::cout << "[main] " << cfg.endpoint.url << ": " << cfg.tokens.size()
              << " token(s), " << format_date(from) << " .. " << format_date(to) << '\n';

    Report report = history.collect(from, to);

    curl_global_cleanup();

    if (report.rows.empty()) {
        std::cerr << "[main] no data was fetched\n";
        return 1;
    }

    std::cout << '\n'
              << render_table(report, cfg.tokens);
    if (!report.skipped.empty()) {
        std::cout << '\n'
                  << report.skipped.size() << " date(s) skipped:\n";
        for (const auto& s : report.skipped)
            std::cout << "  " << format_date(s.date) << ": " << s.reason << '\n';
    }
    return EXIT_SUCCESS;
}
