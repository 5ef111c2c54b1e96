#pragma once

#include <rwa.lending/rwa.lending.types.hpp>

namespace rwalend { namespace health {

struct valuation {
   int128   collateral_value     = 0;    // sum of amount * price
   int128   factored_value       = 0;    // weighted by collateral factors
   int128   debt_value           = 0;
};

/// Rejects non-positive prices and prices older than 24 hours.
err validate_price(const price_data& price, uint64_t now);

/// amount * price / 10^decimals
result<int128> value_of(int128 amount, const price_data& price);

/// Underlying debt owed by the position, d_tokens * d_rate.
result<int128> debt_amount(const cdp_data& cdp, const std::map<token_id, reserve_data>& reserves);

result<valuation> evaluate(const cdp_data& cdp,
                           const std::map<token_id, uint32_t>& collateral_factors,
                           const std::map<token_id, reserve_data>& reserves,
                           const price_map& prices);

/**
 * Factored collateral value over debt value in RATE_SCALE. A position without debt
 * reports HEALTH_FACTOR_INFINITE, and large ratios saturate at the same sentinel.
 */
result<uint32_t> health_factor(const cdp_data& cdp,
                               const std::map<token_id, uint32_t>& collateral_factors,
                               const std::map<token_id, reserve_data>& reserves,
                               const price_map& prices);

inline result<uint32_t> health_factor(const cdp_data& cdp, const pool_state& pool, const price_map& prices) {
   return health_factor(cdp, pool.collateral_factors, pool.reserves, prices);
}

inline bool is_liquidatable(uint32_t hf) { return hf < HEALTH_FACTOR_ONE; }

} } // namespace rwalend::health
