#pragma once

#include <string>
#include <vector>
#include <algorithm>

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

using namespace std;

inline vector<string> split(const string& str, const string& delim) {
    vector<string> parts;
    size_t start = 0;
    size_t pos   = str.find(delim);
    while (pos != string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + delim.size();
        pos   = str.find(delim, start);
    }
    parts.push_back(str.substr(start));
    return parts;
}

// digits only; false on empty input, other characters or overflow
inline bool to_uint64(const string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) return false;
    uint64_t v = 0;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
        uint64_t d = c - '0';
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

// symbol code -> oracle table scope, e.g. USDC -> usdc
inline eosio::name to_lower_name(const eosio::symbol_code& code) {
    auto str = code.to_string();
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return eosio::name(str);
}
