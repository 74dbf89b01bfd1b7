// fake_transport.hpp - scripted rpc::Transport for unit tests

#pragma once

#include "rpc.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

using ExecuteFn = std::function<std::optional<rpc::Response>(const rpc::Request&)>;
using BatchFn = std::function<std::optional<std::vector<rpc::Response>>(const std::vector<rpc::Request>&)>;

class FakeTransport : public rpc::Transport {
public:
    std::optional<rpc::Response> execute(const rpc::Request& req) override
    {
        ++execute_calls;
        methods.push_back(req.method);
        if (!on_execute)
            return std::nullopt;
        return on_execute(req);
    }

    std::optional<std::vector<rpc::Response>> execute_batch(const std::vector<rpc::Request>& reqs) override
    {
        ++batch_calls;
        last_batch = reqs;
        if (!on_batch)
            return std::nullopt;
        return on_batch(reqs);
    }

    ExecuteFn on_execute;
    BatchFn on_batch;
    int execute_calls { 0 };
    int batch_calls { 0 };
    std::vector<std::string> methods;
    std::vector<rpc::Request> last_batch;
};

inline rpc::Response make_result(int64_t id, rpc::json result)
{
    rpc::Response r;
    r.id = id;
    r.outcome.emplace<rpc::json>(std::move(result));
    return r;
}

inline rpc::Response make_error(int64_t id, int64_t code, std::string message)
{
    rpc::Response r;
    r.id = id;
    r.outcome.emplace<rpc::Error>(rpc::Error { code, std::move(message), nullptr });
    return r;
}

// Serves eth_blockNumber and eth_getBlockByNumber from a list of block
// timestamps indexed by block number; the head is the last block.
inline ExecuteFn chain_of(std::vector<uint64_t> timestamps)
{
    return [timestamps = std::move(timestamps)](const rpc::Request& req) -> std::optional<rpc::Response> {
        if (req.method == "eth_blockNumber")
            return make_result(req.id, rpc::u64_to_hex(timestamps.size() - 1));
        if (req.method == "eth_getBlockByNumber") {
            auto n = rpc::hex_to_u64(req.params.at(0).get<std::string>());
            if (!n || *n >= timestamps.size())
                return make_result(req.id, nullptr);
            return make_result(req.id, rpc::json { { "number", rpc::u64_to_hex(*n) }, { "timestamp", rpc::u64_to_hex(timestamps[*n]) } });
        }
        return make_error(req.id, -32601, "method not found");
    };
}

// Seconds since epoch of 00:00 UTC on the given day.
inline uint64_t midnight(int y, unsigned m, unsigned d)
{
    using namespace std::chrono;
    const sys_days t { year { y } / month { m } / day { d } };
    return static_cast<uint64_t>(duration_cast<seconds>(t.time_since_epoch()).count());
}

// Records the delays the code under test asked for instead of sleeping.
struct SleepRecorder {
    std::vector<std::chrono::milliseconds> delays;

    rpc::Sleeper sleeper()
    {
        return [this](std::chrono::milliseconds d) { delays.push_back(d); };
    }
};
