// rpc.hpp - JSON-RPC / cURL transport with bounded retries

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {
using json = nlohmann::json;

// Convert a uint64_t block number to the hex string expected by the RPC (e.g. 0x1a3f).
inline std::string u64_to_hex(uint64_t v)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << v;
    return oss.str();
}

// Parse a hex quantity like "0x1a3f" (the prefix is optional).
// Empty, non-hex and overflowing input yields nullopt.
std::optional<uint64_t> hex_to_u64(std::string_view hex);

// Blocks the calling thread between retry attempts. Tests inject a recorder.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper default_sleeper();

// One JSON-RPC target. Plain value, safe to share read-only.
struct Endpoint {
    std::string url { "http://localhost:8545" };
    std::chrono::milliseconds timeout { 10'000 };
    // total attempts per physical call, including the first one
    int max_retries { 3 };
    std::chrono::milliseconds retry_delay { 1'000 };
};

// Raised inside a single attempt; never escapes the retry loop.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Request {
    int64_t id { 0 };
    std::string method;
    json params = json::array();
};

struct Error {
    int64_t code { 0 };
    std::string message;
    json data;
};

// Neither or both of `result`/`error` present, or not an object at all.
struct Malformed {
    std::string reason;
};

struct Response {
    // absent when the node answered with a null or non-integer id
    std::optional<int64_t> id;
    std::variant<json, Error, Malformed> outcome;

    const json* result() const { return std::get_if<json>(&outcome); }
    const Error* error() const { return std::get_if<Error>(&outcome); }
    const Malformed* malformed() const { return std::get_if<Malformed>(&outcome); }
};

// Serialize one request as a JSON-RPC 2.0 object.
json to_json(const Request& req);

// Classify one response object. Never throws.
Response parse_response(const json& j);

// Short human readable description of a response outcome, for logs.
std::string describe(const Response& resp);

// Anything that can carry JSON-RPC calls. rpc::Client talks HTTP; tests
// provide synthetic chains.
class Transport {
public:
    virtual ~Transport() = default;

    // Single call. nullopt means every attempt failed.
    [[nodiscard]] virtual std::optional<Response>
    execute(const Request& req) = 0;

    // One physical call for all requests. The responses come back as an
    // unordered collection: correlate them by id, never by position.
    [[nodiscard]] virtual std::optional<std::vector<Response>>
    execute_batch(const std::vector<Request>& reqs) = 0;

    // Query the node for the current block number (eth_blockNumber).
    [[nodiscard]] std::optional<uint64_t>
    get_latest_block();

    // Timestamp (seconds since epoch) of block `number` (eth_getBlockByNumber).
    [[nodiscard]] std::optional<uint64_t>
    get_block_timestamp(uint64_t number);
};

class Client : public Transport {
public:
    // Construct a client for the given endpoint.
    explicit Client(Endpoint endpoint, Sleeper sleeper = default_sleeper());

    [[nodiscard]] std::optional<Response>
    execute(const Request& req) override;

    [[nodiscard]] std::optional<std::vector<Response>>
    execute_batch(const std::vector<Request>& reqs) override;

    const Endpoint& endpoint() const { return endpoint_; }

protected:
    // Low-level wrapper around libcurl; returns the raw response body of a
    // 2xx reply and throws TransportError otherwise.
    virtual std::string post(std::string_view payload);

private:
    // POST `payload` until a body of the expected JSON shape arrives or the
    // attempts run out.
    std::optional<json> round_trip(const json& payload, bool expect_array,
        std::string_view label);

    Endpoint endpoint_;
    Sleeper sleeper_;
};

} // namespace rpc
