// config.hpp - JSON configuration: endpoint, batch retries and token table

#pragma once

#include "rpc.hpp"
#include "state_reader.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace supply {

struct Config {
    rpc::Endpoint endpoint;
    BatchRetry batch;
    std::vector<Query> tokens;
};

// Returns the address in lowercase if it is 0x + 40 hex digits, otherwise throws.
std::string validate_and_normalize_address(const std::string& raw);

// Parse the "NAME:ADDRESS:DECIMALS" form used on the command line.
Query parse_token_spec(const std::string& spec);

// Build a Config from a parsed document. Missing keys keep their defaults;
// invalid values throw std::runtime_error naming the offending key.
Config config_from_json(const rpc::json& doc);

Config load_config(const std::filesystem::path& path);

// Reject empty names and names used twice.
void check_unique_names(const std::vector<Query>& tokens);

} // namespace supply
