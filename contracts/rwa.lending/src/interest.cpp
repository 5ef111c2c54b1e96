#include <rwa.lending/interest.hpp>

#include <safemath.hpp>

namespace rwalend { namespace interest {

using namespace rwalend::safemath;

ir_params default_params() {
   return ir_params{};
}

err validate_params(const ir_params& params) {
   if (params.target_util > MAX_TARGET_UTIL)                      return err::INVALID_INTEREST_RATE_PARAMS;
   if (params.max_util <= params.target_util)                     return err::INVALID_INTEREST_RATE_PARAMS;
   if ((int128)params.max_util > RATE_SCALE)                      return err::INVALID_INTEREST_RATE_PARAMS;
   return err::NONE;
}

result<int128> utilization(const reserve_data& reserve) {
   if (reserve.b_supply == 0) return int128(0);

   int128 total_supply, total_liabilities;
   RWA_TRY(total_supply,      mul_div(reserve.b_supply, reserve.b_rate, XRATE_SCALE))
   RWA_TRY(total_liabilities, mul_div(reserve.d_supply, reserve.d_rate, XRATE_SCALE))

   if (total_supply == 0) return int128(0);
   if (total_liabilities >= total_supply) return RATE_SCALE;

   return mul_div(total_liabilities, RATE_SCALE, total_supply);
}

result<int128> borrow_rate(const ir_params& params, int128 util, int128 ir_mod) {
   if (util < 0 || util > RATE_SCALE) return err::INVALID_UTILIZATION_RATIO;

   const int128 target  = params.target_util;
   const int128 max     = params.max_util;
   const int128 r_base  = params.r_base;
   const int128 r_one   = params.r_one;
   const int128 r_two   = params.r_two;
   const int128 r_three = params.r_three;

   int128 rate = 0;

   // ----- segment 1: [0, target] -----
   if (util <= target) {
      int128 slope = 0;
      if (target > 0) {
         RWA_TRY(slope, mul_div(util, r_one, target))
      }
      RWA_TRY(rate, add(slope, r_base))
      return mul_div(rate, ir_mod, RATE_SCALE);
   }

   // ----- segment 2: (target, max] -----
   if (util <= max) {
      int128 slope;
      RWA_TRY(slope, mul_div(util - target, r_two, max - target))
      RWA_TRY(rate, add(slope, r_one + r_base))
      return mul_div(rate, ir_mod, RATE_SCALE);
   }

   // ----- segment 3: (max, 100%], not dampened by ir_mod -----
   if (max >= RATE_SCALE) return err::INVALID_INTEREST_RATE_PARAMS;
   int128 slope;
   RWA_TRY(slope, mul_div(util - max, r_three, RATE_SCALE - max))
   return add(slope, r_two + r_one + r_base);
}

result<accrual_factor> calc_accrual(const ir_params& params, int128 util, int128 ir_mod, uint64_t delta_time) {
   int128 rate;
   RWA_TRY(rate, borrow_rate(params, util, ir_mod))

   // accrual = 1 + rate * dt / year
   int128 growth;
   RWA_TRY(growth, mul((int128)delta_time, rate))
   RWA_TRY(growth, mul_div(growth, XRATE_SCALE, (int128)SECONDS_PER_YEAR * RATE_SCALE))

   accrual_factor factor;
   RWA_TRY(factor.accrual, add(XRATE_SCALE, growth))

   // ir_mod' = ir_mod + dt * (util - target) * reactivity, bounded to [0.1, 10]
   int128 drift;
   RWA_TRY(drift, mul((int128)delta_time, util - (int128)params.target_util))
   RWA_TRY(drift, mul_div(drift, params.reactivity, RATE_SCALE))

   int128 next_mod;
   RWA_TRY(next_mod, add(ir_mod, drift))
   if (next_mod < IR_MOD_MIN) next_mod = IR_MOD_MIN;
   if (next_mod > IR_MOD_MAX) next_mod = IR_MOD_MAX;
   factor.ir_mod = next_mod;

   return factor;
}

result<accrual_outcome> accrue(const reserve_data& reserve,
                               const ir_params& params,
                               uint32_t backstop_take_rate,
                               uint64_t now) {
   accrual_outcome outcome;
   outcome.reserve = reserve;

   if (now <= reserve.last_time) return outcome;
   if ((int128)backstop_take_rate > RATE_SCALE) return err::INVALID_UTIL_RATE;

   int128 util;
   RWA_TRY(util, utilization(reserve))

   auto& next = outcome.reserve;
   if (reserve.b_supply == 0 || util == 0) {
      next.last_time = now;
      return outcome;
   }

   accrual_factor factor;
   RWA_TRY(factor, calc_accrual(params, util, reserve.ir_mod, now - reserve.last_time))

   // ----- debt side -----
   const int128 old_d_rate = reserve.d_rate;
   RWA_TRY(next.d_rate, mul_div(old_d_rate, factor.accrual, XRATE_SCALE))

   // ----- backstop take -----
   int128 credited = 0;
   if (backstop_take_rate > 0 && reserve.d_supply > 0) {
      int128 interest_earned;
      RWA_TRY(interest_earned, mul_div(reserve.d_supply, next.d_rate - old_d_rate, XRATE_SCALE))
      RWA_TRY(credited, mul_rate(interest_earned, backstop_take_rate))
      RWA_TRY(next.backstop_credit, add(reserve.backstop_credit, credited))
   }

   // ----- lender side, net of the backstop share -----
   if (reserve.b_supply > 0) {
      int128 lender_growth, lender_accrual;
      RWA_TRY(lender_growth, mul_div(factor.accrual - XRATE_SCALE, RATE_SCALE - backstop_take_rate, RATE_SCALE))
      RWA_TRY(lender_accrual, add(XRATE_SCALE, lender_growth))
      RWA_TRY(next.b_rate, mul_div(reserve.b_rate, lender_accrual, XRATE_SCALE))
   }

   next.ir_mod    = factor.ir_mod;
   next.last_time = now;

   outcome.event = accrual_event{ next.b_rate, next.d_rate, next.ir_mod, credited, now };
   return outcome;
}

result<accrual_outcome> accrue_reserve(pool_state& pool, token_id asset, uint64_t now) {
   auto& reserve = reserve_of(pool, asset, now);

   accrual_outcome outcome;
   RWA_TRY(outcome, accrue(reserve, ir_params_of(pool, asset), pool.backstop_take_rate, now))

   reserve = outcome.reserve;
   return outcome;
}

result<int128> current_rate(const reserve_data& reserve, const ir_params& params) {
   int128 util;
   RWA_TRY(util, utilization(reserve))
   return borrow_rate(params, util, reserve.ir_mod);
}

} } // namespace rwalend::interest
