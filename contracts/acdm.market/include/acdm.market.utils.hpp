#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include <limits>
#include <string>
#include <string_view>
#include <vector>

using std::string;
using std::string_view;
using std::vector;

inline int64_t calc_precision(uint8_t digit) {
    eosio::check(digit <= 18, "precision digit " + std::to_string(digit) + " should be in range[0,18]");
    int64_t p = 1;
    for (uint8_t i = 0; i < digit; ++i) p *= 10;
    return p;
}

inline int64_t get_precision(const eosio::symbol &s) {
    return calc_precision(s.precision());
}

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string_view::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}

// false on empty input, a non-digit or overflow
inline bool str_to_uint64(string_view s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t ret = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        uint64_t digit = c - '0';
        if (ret > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        ret = ret * 10 + digit;
    }
    out = ret;
    return true;
}
