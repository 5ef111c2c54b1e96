#pragma once

#include <rwa.lending/rwa.lending.types.hpp>

// Supply, borrow and collateral flows. Callers accrue the touched reserve first.
namespace rwalend { namespace lending {

struct repay_outcome {
   int128   repaid            = 0;
   int128   refund            = 0;      // part of the payment above the outstanding debt
   int128   d_tokens_burned   = 0;
};

/// Mints bTokens for `amount` of underlying into `b_balance`; returns the bTokens minted.
result<int128> deposit(pool_state& pool, token_id asset, int128 amount, int128& b_balance, uint64_t now);

/// Burns `b_tokens` from `b_balance`; returns the underlying paid out.
result<int128> withdraw(pool_state& pool, token_id asset, int128 b_tokens, int128& b_balance, uint64_t now);

err add_collateral(const pool_state& pool, cdp_data& cdp, token_id token, int128 amount, uint64_t now);

/// Keeps an indebted position at or above MIN_HEALTH_FACTOR.
err remove_collateral(const pool_state& pool,
                      cdp_data& cdp,
                      token_id token,
                      int128 amount,
                      const price_map& prices,
                      uint64_t now);

/// Returns the dTokens minted. A position carries one debt asset at a time.
result<int128> borrow(pool_state& pool,
                      cdp_data& cdp,
                      token_id asset,
                      int128 amount,
                      const price_map& prices,
                      uint64_t now);

result<repay_outcome> repay(pool_state& pool, cdp_data& cdp, token_id asset, int128 amount, uint64_t now);

} } // namespace rwalend::lending
