#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/time.hpp>

// Read-only view of the price oracle tables. Both the RWA oracle and the crypto
// oracle publish prices in this layout.
namespace rwaoracle {

using namespace eosio;

//scope: lower-case symbol code, e.g. usdc, tbill
struct [[eosio::table, eosio::contract("rwa.oracle")]] coin_price_t {
    uint64_t        id;         //auto increment
    name            tpcode;
    asset           price;      //precision = price decimals
    time_point      updated_at;

    uint64_t primary_key() const { return id; }
    uint64_t by_time() const { return updated_at.sec_since_epoch(); }

    coin_price_t() {}
    coin_price_t(uint64_t i): id(i) {}

    typedef eosio::multi_index< "prices"_n, coin_price_t,
        indexed_by<"bytime"_n, const_mem_fun<coin_price_t, uint64_t, &coin_price_t::by_time>>
    > idx_t;

    EOSLIB_SERIALIZE( coin_price_t, (id)(tpcode)(price)(updated_at) )
};

} // namespace rwaoracle
