// supply_history.cpp - date iteration and presentation of supply rows

#include "supply_history.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace supply {

Report SupplyHistory::collect(const Date& from, const Date& to) const
{
    Report report;
    const std::chrono::sys_days last { to };

    for (std::chrono::sys_days day { from }; day <= last; day += std::chrono::days { 1 }) {
        const Date date { day };
        std::cout << "[history] fetching data for " << format_date(date) << "...\n";

        auto block = resolver_.resolve(date);
        if (!block) {
            std::cerr << "[history] no block found for " << format_date(date) << ", skipping\n";
            report.skipped.push_back({ date, "no block found" });
            continue;
        }

        QueryResult values = reader_.read_all(block->number, tokens_);
        const auto missing = std::count_if(values.begin(), values.end(),
            [](const auto& kv) { return !kv.second; });
        if (missing > 0 && skip_incomplete_) {
            std::cerr << "[history] skipping " << format_date(date) << ": "
                      << missing << " token value(s) unavailable at block "
                      << block->number << '\n';
            report.skipped.push_back({ date, std::to_string(missing) + " token value(s) unavailable" });
            continue;
        }

        report.rows.push_back({ date, *block, std::move(values) });
    }
    return report;
}

std::string render_table(const Report& report, const std::vector<Query>& tokens)
{
    std::vector<std::string> header { "date", "block" };
    for (const auto& t : tokens)
        header.push_back(t.name);

    std::vector<std::vector<std::string>> cells;
    for (const auto& row : report.rows) {
        std::vector<std::string> line { format_date(row.date), std::to_string(row.block.number) };
        for (const auto& t : tokens) {
            auto it = row.values.find(t.name);
            if (it == row.values.end() || !it->second)
                line.push_back("n/a");
            else
                line.push_back(format_scaled(*it->second, t.decimals));
        }
        cells.push_back(std::move(line));
    }

    std::vector<size_t> widths(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        widths[c] = header[c].size();
        for (const auto& line : cells)
            widths[c] = std::max(widths[c], line[c].size());
    }

    std::ostringstream out;
    auto emit = [&](const std::vector<std::string>& line) {
        for (size_t c = 0; c < line.size(); ++c) {
            if (c > 0)
                out << "  ";
            // text columns left, numbers right
            if (c == 0)
                out << std::left;
            else
                out << std::right;
            out << std::setw(static_cast<int>(widths[c])) << line[c];
        }
        out << '\n';
    };

    emit(header);
    for (const auto& line : cells)
        emit(line);
    return out.str();
}

} // namespace supply
