#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <rwa.lending.const.hpp>

namespace rwalend {

using token_id   = uint64_t;      // symbol_code raw value
using account_id = uint64_t;      // account name value

enum class err: uint8_t {
   NONE                          = 0,
   NOT_AUTHORIZED                = 1,
   NOT_INITIALIZED               = 2,
   ALREADY_INITIALIZED           = 3,
   NOT_POSITIVE                  = 4,
   ARITHMETIC_ERROR              = 5,
   INVALID_LEDGER_SEQUENCE       = 6,

   POOL_FROZEN                   = 10,
   POOL_ON_ICE                   = 11,
   INSUFFICIENT_POOL_BALANCE     = 12,
   INSUFFICIENT_LIQUIDITY        = 13,
   INVALID_POOL_STATUS           = 14,

   INSUFFICIENT_BTOKEN_BALANCE   = 20,
   INSUFFICIENT_DEPOSIT_AMOUNT   = 21,
   INSUFFICIENT_WITHDRAWAL_BALANCE = 22,

   INSUFFICIENT_COLLATERAL       = 30,
   INSUFFICIENT_BORROW_LIMIT     = 31,
   DEBT_ASSET_ALREADY_SET        = 32,
   DEBT_ASSET_NOT_SET            = 33,
   CANNOT_SWITCH_DEBT_ASSET      = 34,
   INSUFFICIENT_DTOKEN_BALANCE   = 35,
   INSUFFICIENT_DEBT_TO_REPAY    = 36,

   COLLATERAL_NOT_FOUND          = 40,
   COLLATERAL_AMOUNT_TOO_LARGE   = 41,
   INVALID_COLLATERAL_FACTOR     = 42,

   INVALID_INTEREST_RATE_PARAMS  = 50,
   INVALID_UTILIZATION_RATIO     = 51,
   RATE_ACCRUAL_ERROR            = 52,
   INVALID_UTIL_RATE             = 53,

   CDP_NOT_INSOLVENT             = 60,
   AUCTION_NOT_FOUND             = 61,
   AUCTION_NOT_ACTIVE            = 62,
   AUCTION_ALREADY_FILLED        = 63,
   INVALID_LIQUIDATION_AMOUNT    = 64,
   HEALTH_FACTOR_TOO_HIGH        = 65,
   HEALTH_FACTOR_TOO_LOW         = 66,
   INVALID_FILL_PERCENT          = 67,
   AUCTION_IN_PROGRESS           = 68,

   INSUFFICIENT_BACKSTOP_DEPOSIT = 70,
   WITHDRAWAL_QUEUE_ACTIVE       = 71,
   WITHDRAWAL_QUEUE_NOT_EXPIRED  = 72,
   BAD_DEBT_NOT_COVERED          = 73,
   BACKSTOP_THRESHOLD_NOT_MET    = 74,

   ORACLE_PRICE_FETCH_FAILED     = 80,
   ORACLE_DECIMALS_FETCH_FAILED  = 81,
   INVALID_ORACLE_PRICE          = 82,
   ASSET_NOT_FOUND_IN_ORACLE     = 83,
   TOKEN_CONTRACT_NOT_SET        = 84,

   MEMO_FORMAT_ERROR             = 90,
   CONTRACT_MISMATCH             = 91,
   SYMBOL_MISMATCH               = 92
};

/**
 * Value-or-error outcome returned by the engines. A failed result carries no value
 * and nothing it touched may be persisted by the caller.
 */
template<typename T>
struct result {
   T     value{};
   err   code = err::NONE;

   result(const T& v): value(v) {}
   result(err e): code(e) {}

   bool ok() const { return code == err::NONE; }
};

// propagate a failed result<> to the enclosing function, otherwise assign its value
#define RWA_TRY(lhs, expr) \
   { auto _rwa_res = (expr); if (!_rwa_res.ok()) return _rwa_res.code; lhs = _rwa_res.value; }

// propagate a failed err to the enclosing function
#define RWA_CHECK(expr) \
   { auto _rwa_code = (expr); if (_rwa_code != err::NONE) return _rwa_code; }

// ===== reserves =====

struct reserve_data {
   int128      b_rate            = XRATE_SCALE;     // bToken -> underlying
   int128      d_rate            = XRATE_SCALE;     // dToken -> underlying
   int128      ir_mod            = RATE_SCALE;      // reactivity modifier, [0.1, 10]
   int128      b_supply          = 0;
   int128      d_supply          = 0;
   int128      backstop_credit   = 0;               // interest owed to the backstop, not yet auctioned
   uint64_t    last_time         = 0;               // seconds
};

struct ir_params {
   uint32_t    target_util       = 7'500'000;
   uint32_t    max_util          = 9'500'000;
   uint32_t    r_base            = 100'000;
   uint32_t    r_one             = 500'000;
   uint32_t    r_two             = 5'000'000;
   uint32_t    r_three           = 15'000'000;
   uint32_t    reactivity        = 200;
};

// ===== positions =====

struct cdp_data {
   std::map<token_id, int128>    collateral;
   std::optional<token_id>       debt_asset;        // set iff d_tokens > 0
   int128                        d_tokens          = 0;
   uint64_t                      created_at        = 0;
   uint64_t                      last_update       = 0;
};

struct backstop_deposit {
   int128      amount            = 0;
   uint64_t    deposited_at      = 0;
};

struct withdrawal_request {
   account_id  owner             = 0;
   int128      amount            = 0;
   uint64_t    queued_at         = 0;
};

// ===== auctions =====

enum class auction_type: uint8_t {
   USER_LIQUIDATION  = 0,
   BAD_DEBT          = 1,
   INTEREST          = 2
};

struct auction_data {
   uint8_t                       type              = 0;     // auction_type
   account_id                    user              = 0;     // borrower, or the pool itself for interest
   std::map<token_id, int128>    bid;                       // paid by the filler
   std::map<token_id, int128>    lot;                       // received by the filler
   uint32_t                      block             = 0;     // start block
};

struct auction_modifiers {
   int128      lot               = 0;               // XRATE_SCALE based
   int128      bid               = 0;
};

// ===== oracle =====

struct price_data {
   int128      price             = 0;
   uint64_t    timestamp         = 0;               // seconds
   uint32_t    decimals          = 0;
};
using price_map = std::map<token_id, price_data>;

// ===== pool =====

enum class pool_status: uint8_t {
   ACTIVE   = 0,
   ON_ICE   = 1,      // no new borrowing
   FROZEN   = 2       // no new borrowing, deposits or collateral
};

struct pool_state {
   uint8_t                                status               = (uint8_t)pool_status::ON_ICE;
   std::map<token_id, reserve_data>       reserves;
   std::map<token_id, ir_params>          interest_params;
   std::map<token_id, uint32_t>           collateral_factors;
   std::map<token_id, int128>             pool_balances;         // liquid underlying held per asset
   std::map<uint32_t, auction_data>       auctions;

   token_id                               backstop_token       = 0;
   int128                                 backstop_total       = 0;
   int128                                 backstop_threshold   = 0;
   uint32_t                               backstop_take_rate   = 0;
   std::vector<withdrawal_request>        withdrawal_queue;
};

/// Reserve of `asset`, created on first access at 1:1 rates.
inline reserve_data& reserve_of(pool_state& pool, token_id asset, uint64_t now) {
   auto itr = pool.reserves.find(asset);
   if (itr == pool.reserves.end()) {
      reserve_data reserve;
      reserve.last_time = now;
      itr = pool.reserves.emplace(asset, reserve).first;
   }
   return itr->second;
}

inline ir_params ir_params_of(const pool_state& pool, token_id asset) {
   auto itr = pool.interest_params.find(asset);
   return itr == pool.interest_params.end() ? ir_params{} : itr->second;
}

inline uint32_t collateral_factor_of(const std::map<token_id, uint32_t>& factors, token_id token) {
   auto itr = factors.find(token);
   return itr == factors.end() ? DEFAULT_COLLATERAL_FACTOR : itr->second;
}

} // namespace rwalend
