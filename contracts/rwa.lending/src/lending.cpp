#include <rwa.lending/lending.hpp>
#include <rwa.lending/health.hpp>

#include <safemath.hpp>

namespace rwalend { namespace lending {

using namespace rwalend::safemath;

static bool is_frozen(const pool_state& pool) {
   return pool.status == (uint8_t)pool_status::FROZEN;
}

result<int128> deposit(pool_state& pool, token_id asset, int128 amount, int128& b_balance, uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;
   if (is_frozen(pool)) return err::POOL_FROZEN;

   auto& reserve = reserve_of(pool, asset, now);

   int128 b_tokens;
   RWA_TRY(b_tokens, to_b_token_down(amount, reserve.b_rate))
   if (b_tokens <= 0) return err::INSUFFICIENT_DEPOSIT_AMOUNT;

   int128 b_supply, balance, pool_balance;
   RWA_TRY(b_supply,     add(reserve.b_supply, b_tokens))
   RWA_TRY(balance,      add(b_balance, b_tokens))
   RWA_TRY(pool_balance, add(pool.pool_balances[asset], amount))

   reserve.b_supply           = b_supply;
   b_balance                  = balance;
   pool.pool_balances[asset]  = pool_balance;
   return b_tokens;
}

result<int128> withdraw(pool_state& pool, token_id asset, int128 b_tokens, int128& b_balance, uint64_t now) {
   if (b_tokens <= 0) return err::NOT_POSITIVE;
   if (b_tokens > b_balance) return err::INSUFFICIENT_BTOKEN_BALANCE;

   auto& reserve = reserve_of(pool, asset, now);

   int128 amount;
   RWA_TRY(amount, to_underlying_from_b_token(b_tokens, reserve.b_rate))
   if (amount <= 0) return err::INSUFFICIENT_WITHDRAWAL_BALANCE;

   auto& pool_balance = pool.pool_balances[asset];
   if (pool_balance < amount) return err::INSUFFICIENT_LIQUIDITY;

   b_balance        -= b_tokens;
   reserve.b_supply  = saturating_sub(reserve.b_supply, b_tokens);
   pool_balance     -= amount;
   return amount;
}

err add_collateral(const pool_state& pool, cdp_data& cdp, token_id token, int128 amount, uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;
   if (is_frozen(pool)) return err::POOL_FROZEN;

   int128 total;
   RWA_TRY(total, add(cdp.collateral[token], amount))

   cdp.collateral[token] = total;
   if (cdp.created_at == 0) cdp.created_at = now;
   cdp.last_update = now;
   return err::NONE;
}

err remove_collateral(const pool_state& pool,
                      cdp_data& cdp,
                      token_id token,
                      int128 amount,
                      const price_map& prices,
                      uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;

   auto itr = cdp.collateral.find(token);
   if (itr == cdp.collateral.end() || itr->second == 0) return err::COLLATERAL_NOT_FOUND;
   if (amount > itr->second) return err::COLLATERAL_AMOUNT_TOO_LARGE;

   cdp_data next = cdp;
   next.collateral[token] -= amount;
   if (next.collateral[token] == 0) next.collateral.erase(token);

   if (next.d_tokens > 0) {
      uint32_t hf;
      RWA_TRY(hf, health::health_factor(next, pool, prices))
      if (hf < MIN_HEALTH_FACTOR) return err::HEALTH_FACTOR_TOO_LOW;
   }

   next.last_update = now;
   cdp = next;
   return err::NONE;
}

result<int128> borrow(pool_state& pool,
                      cdp_data& cdp,
                      token_id asset,
                      int128 amount,
                      const price_map& prices,
                      uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;
   if (is_frozen(pool)) return err::POOL_FROZEN;
   if (pool.status == (uint8_t)pool_status::ON_ICE) return err::POOL_ON_ICE;
   if (cdp.debt_asset && *cdp.debt_asset != asset) return err::CANNOT_SWITCH_DEBT_ASSET;

   auto& reserve      = reserve_of(pool, asset, now);
   auto& pool_balance = pool.pool_balances[asset];
   if (pool_balance < amount) return err::INSUFFICIENT_LIQUIDITY;

   int128 d_tokens;
   RWA_TRY(d_tokens, to_d_token_up(amount, reserve.d_rate))

   cdp_data next = cdp;
   RWA_TRY(next.d_tokens, add(cdp.d_tokens, d_tokens))
   next.debt_asset = asset;

   uint32_t hf;
   RWA_TRY(hf, health::health_factor(next, pool, prices))
   if (hf < MIN_HEALTH_FACTOR) return err::INSUFFICIENT_BORROW_LIMIT;

   int128 d_supply;
   RWA_TRY(d_supply, add(reserve.d_supply, d_tokens))

   if (next.created_at == 0) next.created_at = now;
   next.last_update  = now;
   cdp               = next;
   reserve.d_supply  = d_supply;
   pool_balance     -= amount;
   return d_tokens;
}

result<repay_outcome> repay(pool_state& pool, cdp_data& cdp, token_id asset, int128 amount, uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;
   if (!cdp.debt_asset || *cdp.debt_asset != asset || cdp.d_tokens <= 0) return err::DEBT_ASSET_NOT_SET;

   auto& reserve = reserve_of(pool, asset, now);

   int128 debt;
   RWA_TRY(debt, to_underlying_from_d_token(cdp.d_tokens, reserve.d_rate))

   repay_outcome outcome;
   outcome.repaid = amount < debt ? amount : debt;
   outcome.refund = amount - outcome.repaid;

   if (outcome.repaid == debt) {
      outcome.d_tokens_burned = cdp.d_tokens;
   } else {
      RWA_TRY(outcome.d_tokens_burned, to_d_token_down(outcome.repaid, reserve.d_rate))
   }
   if (outcome.d_tokens_burned <= 0) return err::INSUFFICIENT_DEBT_TO_REPAY;

   int128 pool_balance;
   RWA_TRY(pool_balance, add(pool.pool_balances[asset], outcome.repaid))

   cdp.d_tokens -= outcome.d_tokens_burned;
   if (cdp.d_tokens == 0) cdp.debt_asset.reset();
   cdp.last_update = now;

   reserve.d_supply          = saturating_sub(reserve.d_supply, outcome.d_tokens_burned);
   pool.pool_balances[asset] = pool_balance;
   return outcome;
}

} } // namespace rwalend::lending
