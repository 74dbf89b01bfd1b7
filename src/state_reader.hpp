// state_reader.hpp - batched eth_call reads at a historical block

#pragma once

#include "amount.hpp"
#include "rpc.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace supply {

// totalSupply()
inline constexpr const char* kTotalSupplySelector = "0x18160ddd";

struct Query {
    // unique within one read_all() call
    std::string name;
    std::string contract;
    std::string call_data { kTotalSupplySelector };
    // applied by the presentation layer, not here
    unsigned decimals { 0 };
};

// nullopt marks an entry that stayed unavailable after all attempts.
using Value = std::optional<Amount>;
using QueryResult = std::map<std::string, Value>;

// Whole-batch retry budget, independent of the transport's own retries.
struct BatchRetry {
    int max_attempts { 3 };
    std::chrono::milliseconds delay { 1'000 };
};

// Decode one eth_call result value. null, "0x" and "0x0" are zero.
Value decode_call_result(const rpc::json& result);

class StateReader {
public:
    explicit StateReader(rpc::Transport& rpc,
        BatchRetry retry = {},
        rpc::Sleeper sleeper = rpc::default_sleeper());

    // Evaluate every query at `block` in one batch per attempt. The batch is
    // resubmitted as a whole while any entry is unavailable; the last decoded
    // mapping is returned once the attempts run out.
    [[nodiscard]] QueryResult read_all(uint64_t block, const std::vector<Query>& queries) const;

private:
    QueryResult read_once(uint64_t block, const std::vector<Query>& queries) const;

    rpc::Transport& rpc_;
    BatchRetry retry_;
    rpc::Sleeper sleeper_;
};

} // namespace supply
