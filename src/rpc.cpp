// rpc.cpp - implementation of the rpc namespace

#include "rpc.hpp"

#include <curl/curl.h>
#include <iostream>
#include <limits>
#include <thread>

namespace rpc {

// cURL write callback - appends received data to a std::string.
static size_t curl_write_cb(void* ptr,
    size_t size,
    size_t nmemb,
    void* userp)
{
    std::string* dst = static_cast<std::string*>(userp);
    dst->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

static int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<uint64_t> hex_to_u64(std::string_view hex)
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex.remove_prefix(2);
    if (hex.empty())
        return std::nullopt;

    uint64_t v = 0;
    for (char c : hex) {
        int d = hex_digit(c);
        if (d < 0)
            return std::nullopt;
        if (v > (std::numeric_limits<uint64_t>::max() >> 4))
            // would overflow
            return std::nullopt;
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    return v;
}

Sleeper default_sleeper()
{
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

json to_json(const Request& req)
{
    return json {
        { "jsonrpc", "2.0" },
        { "id", req.id },
        { "method", req.method },
        { "params", req.params.is_null() ? json::array() : req.params }
    };
}

Response parse_response(const json& j)
{
    Response resp;
    resp.outcome.emplace<Malformed>(Malformed { "response is not an object" });
    if (!j.is_object())
        return resp;

    if (auto it = j.find("id"); it != j.end() && it->is_number_integer())
        resp.id = it->get<int64_t>();

    // "error": null is tolerated as absent
    auto res_it = j.find("result");
    auto err_it = j.find("error");
    const bool has_result = res_it != j.end();
    const bool has_error = err_it != j.end() && !err_it->is_null();

    if (has_result && has_error) {
        resp.outcome.emplace<Malformed>(Malformed { "both result and error present" });
    } else if (has_result) {
        resp.outcome.emplace<json>(*res_it);
    } else if (has_error) {
        Error err;
        if (err_it->is_object()) {
            if (auto c = err_it->find("code"); c != err_it->end() && c->is_number_integer())
                err.code = c->get<int64_t>();
            if (auto m = err_it->find("message"); m != err_it->end() && m->is_string())
                err.message = m->get<std::string>();
            if (auto d = err_it->find("data"); d != err_it->end())
                err.data = *d;
        } else {
            err.message = err_it->dump();
        }
        resp.outcome.emplace<Error>(std::move(err));
    } else {
        resp.outcome.emplace<Malformed>(Malformed { "neither result nor error present" });
    }
    return resp;
}

std::string describe(const Response& resp)
{
    if (const json* r = resp.result())
        return "result " + r->dump();
    if (const Error* e = resp.error())
        return "error " + std::to_string(e->code) + ": " + e->message;
    return "malformed: " + resp.malformed()->reason;
}

// eth_blockNumber RPC call - returns the tip of the chain.
std::optional<uint64_t>
Transport::get_latest_block()
{
    auto resp = execute(Request { 1, "eth_blockNumber", json::array() });
    if (!resp)
        return std::nullopt;

    const json* result = resp->result();
    if (!result || !result->is_string()) {
        std::cerr << "[rpc] eth_blockNumber: unexpected " << describe(*resp) << '\n';
        return std::nullopt;
    }
    // The result is a hex string, e.g. "0x1a3f"
    auto head = hex_to_u64(result->get<std::string>());
    if (!head)
        std::cerr << "[rpc] eth_blockNumber: invalid quantity " << result->dump() << '\n';
    return head;
}

std::optional<uint64_t>
Transport::get_block_timestamp(uint64_t number)
{
    // false => no tx objects needed
    auto resp = execute(Request { 1, "eth_getBlockByNumber", json::array({ u64_to_hex(number), false }) });
    if (!resp)
        return std::nullopt;

    const json* block = resp->result();
    if (!block || !block->is_object()) {
        std::cerr << "[rpc] eth_getBlockByNumber(" << number << "): unexpected "
                  << describe(*resp) << '\n';
        return std::nullopt;
    }
    auto ts_it = block->find("timestamp");
    if (ts_it == block->end() || !ts_it->is_string()) {
        std::cerr << "[rpc] block " << number << " has no timestamp\n";
        return std::nullopt;
    }
    auto ts = hex_to_u64(ts_it->get<std::string>());
    // must fit a signed seconds count
    if (!ts || *ts > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        std::cerr << "[rpc] block " << number << " has invalid timestamp "
                  << ts_it->dump() << '\n';
        return std::nullopt;
    }
    return ts;
}

Client::Client(Endpoint endpoint, Sleeper sleeper)
    : endpoint_(std::move(endpoint))
    , sleeper_(std::move(sleeper))
{
    if (endpoint_.max_retries < 1)
        throw std::invalid_argument("max_retries must be at least 1");
    if (!sleeper_)
        sleeper_ = default_sleeper();
}

// Low-level RPC call (member of Client)
std::string
Client::post(std::string_view payload)
{
    CURL* curl = curl_easy_init();
    if (!curl)
        throw TransportError("curl_easy_init() failed");

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
        static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
        static_cast<long>(endpoint_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers,
        "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK)
        throw TransportError(std::string("curl error: ") + curl_easy_strerror(rc));
    if (status < 200 || status > 299)
        throw TransportError("HTTP status " + std::to_string(status));
    return response;
}

std::optional<json>
Client::round_trip(const json& payload, bool expect_array, std::string_view label)
{
    const std::string body = payload.dump();
    const int attempts = endpoint_.max_retries;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            json reply = json::parse(post(body));
            if (expect_array && !reply.is_array())
                throw TransportError("expected a JSON array, got " + std::string(reply.type_name()));
            if (!expect_array && !reply.is_object())
                throw TransportError("expected a JSON object, got " + std::string(reply.type_name()));
            return reply;
        } catch (const TransportError& e) {
            std::cerr << "[rpc] " << label << " failed (attempt " << attempt
                      << '/' << attempts << "): " << e.what() << '\n';
        } catch (const json::exception& e) {
            std::cerr << "[rpc] " << label << " failed (attempt " << attempt
                      << '/' << attempts << "): JSON error: " << e.what() << '\n';
        }
        if (attempt < attempts)
            sleeper_(endpoint_.retry_delay);
    }
    std::cerr << "[rpc] " << label << " gave up after " << attempts << " attempts\n";
    return std::nullopt;
}

std::optional<Response>
Client::execute(const Request& req)
{
    auto reply = round_trip(to_json(req), false, req.method);
    if (!reply)
        return std::nullopt;
    return parse_response(*reply);
}

std::optional<std::vector<Response>>
Client::execute_batch(const std::vector<Request>& reqs)
{
    json payload = json::array();
    for (const auto& r : reqs)
        payload.push_back(to_json(r));

    const std::string label = "batch of " + std::to_string(reqs.size());
    auto reply = round_trip(payload, true, label);
    if (!reply)
        return std::nullopt;

    std::vector<Response> out;
    out.reserve(reply->size());
    for (const auto& item : *reply)
        out.push_back(parse_response(item));
    return out;
}

} // namespace rpc
