// block_resolver.hpp - calendar date -> block number via binary search

#pragma once

#include "rpc.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace supply {

using Date = std::chrono::year_month_day;

struct BlockRef {
    uint64_t number { 0 };
    std::chrono::sys_seconds timestamp {};
};

// UTC calendar date a block timestamp falls on.
Date date_of(std::chrono::sys_seconds ts);

// "YYYY-MM-DD"
std::string format_date(const Date& d);

// Parse "YYYY-MM-DD"; nullopt on malformed or non-existent dates.
std::optional<Date> parse_date(const std::string& s);

class BlockResolver {
public:
    explicit BlockResolver(rpc::Transport& rpc)
        : rpc_(rpc)
    {
    }

    // Latest block whose UTC date is on or before `target`, found along the
    // binary search path. A block dated exactly `target` is returned as soon
    // as the search lands on one; it is not necessarily the first or last
    // block of that day.
    // nullopt when the head or any probed block cannot be fetched, or when
    // `target` predates genesis.
    [[nodiscard]] std::optional<BlockRef> resolve(const Date& target) const;

private:
    rpc::Transport& rpc_;
};

} // namespace supply
