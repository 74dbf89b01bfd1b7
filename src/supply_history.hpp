// supply_history.hpp - per-day token supply series over a date range

#pragma once

#include "block_resolver.hpp"
#include "state_reader.hpp"

#include <string>
#include <vector>

namespace supply {

// Longest date range the CLI accepts. Subtracting it from any parseable
// date still gives a valid calendar date.
inline constexpr int kMaxRangeDays = 365 * 1000;

struct Row {
    Date date;
    BlockRef block;
    QueryResult values;
};

struct Skipped {
    Date date;
    std::string reason;
};

struct Report {
    std::vector<Row> rows;
    std::vector<Skipped> skipped;
};

class SupplyHistory {
public:
    SupplyHistory(const BlockResolver& resolver,
        const StateReader& reader,
        std::vector<Query> tokens,
        bool skip_incomplete = true)
        : resolver_(resolver)
        , reader_(reader)
        , tokens_(std::move(tokens))
        , skip_incomplete_(skip_incomplete)
    {
    }

    // Walk [from, to] one day at a time. Dates without a block, and with
    // skip_incomplete dates where some token stayed unavailable, end up in
    // Report::skipped instead of aborting the run.
    Report collect(const Date& from, const Date& to) const;

private:
    const BlockResolver& resolver_;
    const StateReader& reader_;
    std::vector<Query> tokens_;
    bool skip_incomplete_;
};

// Plain-text table: date, block, then one column per token scaled by its
// decimals ("n/a" when unavailable).
std::string render_table(const Report& report, const std::vector<Query>& tokens);

} // namespace supply
