// config.cpp - configuration loading and validation

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace supply {

std::string validate_and_normalize_address(const std::string& raw)
{
    // Must start with "0x" (case-insensitive) and be exactly 42 characters long.
    if (raw.size() != 42 || raw[0] != '0' || (raw[1] != 'x' && raw[1] != 'X')) {
        throw std::runtime_error(
            "address must be a 0x-prefixed hex string of 40 characters: " + raw);
    }

    for (size_t i = 2; i < raw.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(raw[i]))) {
            throw std::runtime_error(
                "address contains non-hex character at position " + std::to_string(i) + ": " + raw);
        }
    }

    std::string lowered = raw;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

Query parse_token_spec(const std::string& spec)
{
    const auto first = spec.find(':');
    const auto second = first == std::string::npos ? std::string::npos : spec.find(':', first + 1);
    if (second == std::string::npos)
        throw std::runtime_error("token must look like NAME:ADDRESS:DECIMALS, got '" + spec + "'");

    Query q;
    q.name = spec.substr(0, first);
    q.contract = validate_and_normalize_address(spec.substr(first + 1, second - first - 1));

    const std::string dec = spec.substr(second + 1);
    if (dec.empty() || dec.size() > 3 || !std::all_of(dec.begin(), dec.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw std::runtime_error("invalid decimals in token '" + spec + "'");
    q.decimals = static_cast<unsigned>(std::stoul(dec));
    if (q.decimals > 255)
        throw std::runtime_error("decimals out of range in token '" + spec + "'");
    if (q.name.empty())
        throw std::runtime_error("empty token name in '" + spec + "'");
    return q;
}

void check_unique_names(const std::vector<Query>& tokens)
{
    std::set<std::string> names;
    for (const auto& t : tokens) {
        if (t.name.empty())
            throw std::runtime_error("token name must not be empty");
        if (!names.insert(t.name).second)
            throw std::runtime_error("duplicate token name: " + t.name);
    }
}

// Positive integer member `key` of `obj` that fits an int, or `fallback` when absent.
static int positive_int(const rpc::json& obj, const char* key, int fallback)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return fallback;
    if (!it->is_number_integer() || it->get<int64_t>() < 1
        || it->get<int64_t>() > std::numeric_limits<int>::max())
        throw std::runtime_error(std::string("'") + key + "' must be a positive integer no larger than "
            + std::to_string(std::numeric_limits<int>::max()));
    return static_cast<int>(it->get<int64_t>());
}

Config config_from_json(const rpc::json& doc)
{
    if (!doc.is_object())
        throw std::runtime_error("configuration must be a JSON object");

    Config cfg;

    if (auto rpc_it = doc.find("rpc"); rpc_it != doc.end()) {
        const rpc::json& r = *rpc_it;
        if (!r.is_object())
            throw std::runtime_error("'rpc' must be an object");
        if (auto url = r.find("url"); url != r.end()) {
            if (!url->is_string() || url->get<std::string>().empty())
                throw std::runtime_error("'rpc.url' must be a non-empty string");
            cfg.endpoint.url = url->get<std::string>();
        }
        cfg.endpoint.timeout = std::chrono::milliseconds(positive_int(r, "timeout_ms", static_cast<int>(cfg.endpoint.timeout.count())));
        cfg.endpoint.max_retries = positive_int(r, "max_retries", cfg.endpoint.max_retries);
        cfg.endpoint.retry_delay = std::chrono::milliseconds(positive_int(r, "retry_delay_ms", static_cast<int>(cfg.endpoint.retry_delay.count())));
    }

    if (auto batch_it = doc.find("batch"); batch_it != doc.end()) {
        const rpc::json& b = *batch_it;
        if (!b.is_object())
            throw std::runtime_error("'batch' must be an object");
        cfg.batch.max_attempts = positive_int(b, "max_attempts", cfg.batch.max_attempts);
        cfg.batch.delay = std::chrono::milliseconds(positive_int(b, "retry_delay_ms", static_cast<int>(cfg.batch.delay.count())));
    }

    if (auto tokens_it = doc.find("tokens"); tokens_it != doc.end()) {
        if (!tokens_it->is_array())
            throw std::runtime_error("'tokens' must be an array");
        for (const auto& t : *tokens_it) {
            try {
                Query q;
                q.name = t.at("name").get<std::string>();
                q.contract = validate_and_normalize_address(t.at("contract").get<std::string>());
                const rpc::json& dec = t.at("decimals");
                if (!dec.is_number_unsigned() || dec.get<uint64_t>() > 255)
                    throw std::runtime_error("'decimals' must be an integer in [0, 255] for token " + q.name);
                q.decimals = dec.get<unsigned>();
                if (auto cd = t.find("call_data"); cd != t.end())
                    q.call_data = cd->get<std::string>();
                cfg.tokens.push_back(std::move(q));
            } catch (const rpc::json::exception& e) {
                throw std::runtime_error("invalid token entry " + t.dump() + ": " + e.what());
            }
        }
    }

    check_unique_names(cfg.tokens);
    return cfg;
}

Config load_config(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open config file '" + path.string() + "'");

    rpc::json doc;
    try {
        doc = rpc::json::parse(in);
    } catch (const rpc::json::parse_error& e) {
        throw std::runtime_error("cannot parse config file '" + path.string() + "': " + e.what());
    }
    return config_from_json(doc);
}

} // namespace supply
