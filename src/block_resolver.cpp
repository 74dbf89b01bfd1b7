// block_resolver.cpp - date to block resolution over eth_getBlockByNumber

#include "block_resolver.hpp"

#include <cstdio>
#include <iostream>

namespace supply {

Date date_of(std::chrono::sys_seconds ts)
{
    return Date { std::chrono::floor<std::chrono::days>(ts) };
}

std::string format_date(const Date& d)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
        static_cast<int>(d.year()),
        static_cast<unsigned>(d.month()),
        static_cast<unsigned>(d.day()));
    return buf;
}

std::optional<Date> parse_date(const std::string& s)
{
    int y = 0;
    unsigned m = 0, d = 0;
    char tail = 0;
    if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3)
        return std::nullopt;

    Date date { std::chrono::year { y }, std::chrono::month { m }, std::chrono::day { d } };
    if (!date.ok())
        return std::nullopt;
    return date;
}

std::optional<BlockRef> BlockResolver::resolve(const Date& target) const
{
    auto head_opt = rpc_.get_latest_block();
    if (!head_opt) {
        std::cerr << "[resolver] error fetching the latest block number\n";
        return std::nullopt;
    }

    const std::chrono::sys_days target_day { target };
    uint64_t low = 0;
    uint64_t high = *head_opt;
    std::optional<BlockRef> chosen;

    while (low <= high) {
        const uint64_t mid = low + (high - low) / 2;

        auto ts_opt = rpc_.get_block_timestamp(mid);
        if (!ts_opt) {
            // a failed probe invalidates the whole search
            std::cerr << "[resolver] error fetching block " << mid
                      << " while resolving " << format_date(target) << '\n';
            return std::nullopt;
        }

        BlockRef block { mid, std::chrono::sys_seconds { std::chrono::seconds { static_cast<std::chrono::seconds::rep>(*ts_opt) } } };
        const auto block_day = std::chrono::floor<std::chrono::days>(block.timestamp);

        if (block_day == target_day)
            return block;

        if (block_day < target_day) {
            chosen = block;
            if (mid == high)
                break;
            low = mid + 1;
        } else {
            if (mid == 0)
                break;
            high = mid - 1;
        }
    }

    return chosen;
}

} // namespace supply
