#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <map>
#include <string>

#include <rwa.lending/rwa.lending.types.hpp>

namespace rwalend {

using namespace std;
using namespace eosio;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

#define TBL struct [[eosio::table, eosio::contract("rwa.lending")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("rwa.lending")]]

// =====================================================
// 全局配置 + 池子状态 (load whole / store whole)
// =====================================================
NTBL("global") global_t {
    name                            admin;
    name                            rwa_oracle;                 // collateral prices
    name                            crypto_oracle;              // debt asset prices
    extended_symbol                 backstop_token;
    map<uint64_t, extended_symbol>  tokens;                     // symbol code -> token contract
    bool                            initialized = false;

    pool_state                      pool;

    EOSLIB_SERIALIZE( global_t, (admin)(rwa_oracle)(crypto_oracle)(backstop_token)
                                (tokens)(initialized)(pool) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

// 借款仓位
//scope: _self
TBL cdp_t {
    name                owner;                      //PK
    cdp_data            cdp;

    cdp_t() {}
    cdp_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"cdps"_n, cdp_t> tbl_t;

    EOSLIB_SERIALIZE( cdp_t, (owner)(cdp) )
};

// 存款份额 (bToken)
//scope: lender
TBL lender_t {
    symbol_code         sym;                        //PK, underlying asset
    int128              b_tokens = 0;

    lender_t() {}
    lender_t(const symbol_code& s): sym(s) {}

    uint64_t primary_key()const { return sym.raw(); }

    typedef multi_index<"lenders"_n, lender_t> tbl_t;

    EOSLIB_SERIALIZE( lender_t, (sym)(b_tokens) )
};

// backstop 存款
//scope: _self
TBL bsdeposit_t {
    name                owner;                      //PK
    backstop_deposit    deposit;

    bsdeposit_t() {}
    bsdeposit_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"bsdeposits"_n, bsdeposit_t> tbl_t;

    EOSLIB_SERIALIZE( bsdeposit_t, (owner)(deposit) )
};

// =====================================================
// notify logs
// =====================================================
struct accrual_log {
    symbol_code         asset;
    int128              b_rate;
    int128              d_rate;
    int128              ir_mod;
    int128              backstop_credit;            // credited by this accrual
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( accrual_log, (asset)(b_rate)(d_rate)(ir_mod)(backstop_credit)(created_at) )
};

struct auction_log {
    uint32_t                auction_id;
    name                    event;                  // created | filled | deleted
    uint8_t                 auction_type;
    name                    user;
    name                    filler;
    map<uint64_t, int128>   bid;
    map<uint64_t, int128>   lot;
    uint32_t                block;
    int128                  paid;                   // by the filler
    int128                  received;               // by the filler
    time_point_sec          created_at;

    EOSLIB_SERIALIZE( auction_log, (auction_id)(event)(auction_type)(user)(filler)(bid)(lot)
                                   (block)(paid)(received)(created_at) )
};

struct position_log {
    name                event;                      // deposit | withdraw | borrow | repay | addcoll | remcoll | bsdeposit | bsqueue | bswithdraw
    name                owner;
    asset               quantity;
    int128              share_delta;                // bTokens or dTokens moved
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( position_log, (event)(owner)(quantity)(share_delta)(created_at) )
};

} // namespace rwalend
