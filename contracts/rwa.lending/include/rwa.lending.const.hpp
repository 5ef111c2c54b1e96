#pragma once

#include <cstdint>

namespace rwalend {

using int128 = __int128;

static constexpr int128    RATE_SCALE                         = 10'000'000;           // 10^7
static constexpr int128    XRATE_SCALE                        = 1'000'000'000'000;    // 10^12

static constexpr uint64_t  DAY_SECONDS                        = 24 * 60 * 60;
static constexpr uint64_t  SECONDS_PER_YEAR                   = 31'536'000;           // 365 days
static constexpr uint64_t  ORACLE_STALENESS_SECONDS           = DAY_SECONDS;
static constexpr uint64_t  BACKSTOP_WITHDRAWAL_QUEUE_SECONDS  = 17 * DAY_SECONDS;

static constexpr uint32_t  HEALTH_FACTOR_ONE                  = 10'000'000;           // 1.00
static constexpr uint32_t  MIN_HEALTH_FACTOR                  = 11'000'000;           // 1.10
static constexpr uint32_t  MAX_HEALTH_FACTOR                  = 11'500'000;           // 1.15
static constexpr uint32_t  HEALTH_FACTOR_INFINITE             = UINT32_MAX;
static constexpr uint32_t  DEFAULT_COLLATERAL_FACTOR          = 7'500'000;            // 75%

static constexpr int128    IR_MOD_MIN                         = RATE_SCALE / 10;
static constexpr int128    IR_MOD_MAX                         = RATE_SCALE * 10;
static constexpr uint32_t  MAX_TARGET_UTIL                    = 9'500'000;

static constexpr uint32_t  USER_LIQUIDATION_DURATION          = 200;                  // blocks, plus the same again for bid decay
static constexpr uint32_t  BAD_DEBT_DURATION                  = 400;
static constexpr uint32_t  INTEREST_AUCTION_DURATION          = 200;

static constexpr uint32_t  USER_LIQUIDATION_ID_OFFSET         = 2000;
static constexpr uint32_t  INTEREST_AUCTION_ID_OFFSET         = 1000;
static constexpr uint32_t  BAD_DEBT_ID_OFFSET                 = 0;

static constexpr int128    MIN_INTEREST_AUCTION_AMOUNT        = 100'0000000;          // 100 units at 7 decimals

static constexpr uint32_t  MAX_PRICE_DECIMALS                 = 18;

} // namespace rwalend
