// state_reader.cpp - id-correlated eth_call batches with whole-batch retries

#include "state_reader.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace supply {

Value decode_call_result(const rpc::json& result)
{
    if (result.is_null())
        return Amount(0);
    if (!result.is_string())
        return std::nullopt;
    return parse_hex_amount(result.get<std::string>());
}

StateReader::StateReader(rpc::Transport& rpc, BatchRetry retry, rpc::Sleeper sleeper)
    : rpc_(rpc)
    , retry_(retry)
    , sleeper_(std::move(sleeper))
{
    if (retry_.max_attempts < 1)
        throw std::invalid_argument("batch max_attempts must be at least 1");
    if (!sleeper_)
        sleeper_ = rpc::default_sleeper();
}

QueryResult StateReader::read_once(uint64_t block, const std::vector<Query>& queries) const
{
    std::vector<rpc::Request> batch;
    batch.reserve(queries.size());
    const std::string block_tag = rpc::u64_to_hex(block);
    for (size_t i = 0; i < queries.size(); ++i) {
        const Query& q = queries[i];
        batch.push_back(rpc::Request {
            static_cast<int64_t>(i),
            "eth_call",
            rpc::json::array({ { { "to", q.contract }, { "data", q.call_data } }, block_tag }) });
    }

    QueryResult out;
    for (const auto& q : queries)
        out[q.name] = std::nullopt;

    auto responses = rpc_.execute_batch(batch);
    if (!responses) {
        std::cerr << "[reader] batch at block " << block << " unavailable\n";
        return out;
    }

    // Responses arrive in any order; index them by id.
    std::vector<Value> decoded(queries.size());
    std::vector<int> seen(queries.size(), 0);
    for (const auto& resp : *responses) {
        if (!resp.id || *resp.id < 0 || static_cast<uint64_t>(*resp.id) >= queries.size()) {
            std::cerr << "[reader] block " << block << ": response with unknown id ("
                      << rpc::describe(resp) << ") ignored\n";
            continue;
        }
        const size_t idx = static_cast<size_t>(*resp.id);
        const std::string& name = queries[idx].name;
        if (++seen[idx] > 1) {
            std::cerr << "[reader] block " << block << ": duplicate response for "
                      << name << '\n';
            continue;
        }

        if (const rpc::json* result = resp.result()) {
            decoded[idx] = decode_call_result(*result);
            if (!decoded[idx])
                std::cerr << "[reader] block " << block << ": cannot decode "
                          << name << " result " << result->dump() << '\n';
        } else {
            std::cerr << "[reader] block " << block << ": " << name << ' '
                      << rpc::describe(resp) << '\n';
        }
    }

    for (size_t i = 0; i < queries.size(); ++i) {
        if (seen[i] == 0)
            std::cerr << "[reader] block " << block << ": no response for "
                      << queries[i].name << '\n';
        // an id answered twice is ambiguous
        if (seen[i] == 1)
            out[queries[i].name] = std::move(decoded[i]);
    }
    return out;
}

QueryResult StateReader::read_all(uint64_t block, const std::vector<Query>& queries) const
{
    std::set<std::string> names;
    for (const auto& q : queries) {
        if (!names.insert(q.name).second)
            throw std::invalid_argument("duplicate query name: " + q.name);
    }
    if (queries.empty())
        return {};

    QueryResult result;
    for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        result = read_once(block, queries);

        const bool complete = std::all_of(result.begin(), result.end(),
            [](const auto& kv) { return kv.second.has_value(); });
        if (complete)
            return result;

        std::cerr << "[reader] block " << block << ": incomplete batch (attempt "
                  << attempt << '/' << retry_.max_attempts << ")\n";
        if (attempt < retry_.max_attempts)
            sleeper_(retry_.delay);
    }
    return result;
}

} // namespace supply
