#include <rwa.lending/health.hpp>

#include <safemath.hpp>

namespace rwalend { namespace health {

using namespace rwalend::safemath;

static int128 pow10_i128(uint32_t p) {
   int128 x = 1;
   for (uint32_t i = 0; i < p; ++i) x *= 10;
   return x;
}

static result<price_data> find_price(const price_map& prices, token_id token) {
   auto itr = prices.find(token);
   if (itr == prices.end()) return err::ORACLE_PRICE_FETCH_FAILED;
   return itr->second;
}

err validate_price(const price_data& price, uint64_t now) {
   if (price.price <= 0) return err::INVALID_ORACLE_PRICE;
   if (price.decimals > MAX_PRICE_DECIMALS) return err::ORACLE_DECIMALS_FETCH_FAILED;
   if (price.timestamp + ORACLE_STALENESS_SECONDS < now) return err::ORACLE_PRICE_FETCH_FAILED;
   return err::NONE;
}

result<int128> value_of(int128 amount, const price_data& price) {
   if (price.price <= 0) return err::INVALID_ORACLE_PRICE;
   if (price.decimals > MAX_PRICE_DECIMALS) return err::ORACLE_DECIMALS_FETCH_FAILED;
   return mul_div(amount, price.price, pow10_i128(price.decimals));
}

result<int128> debt_amount(const cdp_data& cdp, const std::map<token_id, reserve_data>& reserves) {
   if (!cdp.debt_asset || cdp.d_tokens == 0) return int128(0);

   int128 d_rate = XRATE_SCALE;
   auto itr = reserves.find(*cdp.debt_asset);
   if (itr != reserves.end()) d_rate = itr->second.d_rate;

   return mul_div(cdp.d_tokens, d_rate, XRATE_SCALE);
}

result<valuation> evaluate(const cdp_data& cdp,
                           const std::map<token_id, uint32_t>& collateral_factors,
                           const std::map<token_id, reserve_data>& reserves,
                           const price_map& prices) {
   valuation val;

   for (const auto& [token, amount] : cdp.collateral) {
      if (amount <= 0) continue;

      price_data price;
      RWA_TRY(price, find_price(prices, token))

      int128 value, factored;
      RWA_TRY(value,    value_of(amount, price))
      RWA_TRY(factored, mul_rate(value, collateral_factor_of(collateral_factors, token)))

      RWA_TRY(val.collateral_value, add(val.collateral_value, value))
      RWA_TRY(val.factored_value,   add(val.factored_value, factored))
   }

   int128 debt;
   RWA_TRY(debt, debt_amount(cdp, reserves))
   if (debt > 0) {
      price_data price;
      RWA_TRY(price, find_price(prices, *cdp.debt_asset))
      RWA_TRY(val.debt_value, value_of(debt, price))
   }

   return val;
}

result<uint32_t> health_factor(const cdp_data& cdp,
                               const std::map<token_id, uint32_t>& collateral_factors,
                               const std::map<token_id, reserve_data>& reserves,
                               const price_map& prices) {
   if (!cdp.debt_asset || cdp.d_tokens == 0) return HEALTH_FACTOR_INFINITE;

   valuation val;
   RWA_TRY(val, evaluate(cdp, collateral_factors, reserves, prices))
   if (val.debt_value == 0) return HEALTH_FACTOR_INFINITE;

   int128 hf;
   RWA_TRY(hf, mul_div(val.factored_value, RATE_SCALE, val.debt_value))
   if (hf > (int128)HEALTH_FACTOR_INFINITE) return HEALTH_FACTOR_INFINITE;

   return (uint32_t)hf;
}

} } // namespace rwalend::health
