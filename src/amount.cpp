// amount.cpp - hex decoding and decimal scaling of token amounts

#include "amount.hpp"

namespace supply {

std::optional<Amount> parse_hex_amount(std::string_view hex)
{
    bool prefixed = false;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
        prefixed = true;
    }
    if (hex.empty()) {
        // "0x" is an empty byte string, a bare "" is not a quantity
        if (prefixed)
            return Amount(0);
        return std::nullopt;
    }

    Amount v = 0;
    for (char c : hex) {
        unsigned d;
        if (c >= '0' && c <= '9')
            d = c - '0';
        else if (c >= 'a' && c <= 'f')
            d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F')
            d = c - 'A' + 10;
        else
            return std::nullopt;
        v <<= 4;
        v |= d;
    }
    return v;
}

std::string format_scaled(const Amount& raw, unsigned decimals)
{
    if (decimals == 0)
        return raw.str();

    const Amount scale = boost::multiprecision::pow(Amount(10), decimals);
    const Amount whole = raw / scale;
    std::string frac = Amount(raw % scale).str();

    // left-pad the fractional part to `decimals` digits, then trim
    frac.insert(0, decimals - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0')
        frac.pop_back();

    if (frac.empty())
        return whole.str();
    return whole.str() + '.' + frac;
}

} // namespace supply
