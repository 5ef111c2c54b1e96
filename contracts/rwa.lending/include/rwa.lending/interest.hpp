#pragma once

#include <optional>

#include <rwa.lending/rwa.lending.types.hpp>

namespace rwalend { namespace interest {

struct accrual_factor {
   int128      accrual     = XRATE_SCALE;     // growth applied to d_rate
   int128      ir_mod      = RATE_SCALE;      // next modifier
};

struct accrual_event {
   int128      b_rate            = 0;
   int128      d_rate            = 0;
   int128      ir_mod            = 0;
   int128      backstop_credit   = 0;         // credited by this accrual
   uint64_t    timestamp         = 0;
};

struct accrual_outcome {
   reserve_data                     reserve;
   std::optional<accrual_event>     event;    // empty when the rates did not move
};

ir_params default_params();

/// Rejects curves with target_util above 95% or max_util outside (target_util, 100%].
err validate_params(const ir_params& params);

/// Borrowed share of the supplied liquidity in RATE_SCALE, capped at 100%.
result<int128> utilization(const reserve_data& reserve);

/**
 * Annual borrow rate in RATE_SCALE for the given utilization. The two lower segments
 * are scaled by ir_mod, the segment above max_util is not.
 */
result<int128> borrow_rate(const ir_params& params, int128 util, int128 ir_mod);

/// Growth factor over `delta_time` seconds and the modifier nudged toward the target utilization.
result<accrual_factor> calc_accrual(const ir_params& params, int128 util, int128 ir_mod, uint64_t delta_time);

/**
 * Brings `reserve` up to `now`. Returns the reserve unchanged when `now` does not move
 * past last_time; with no supply or no borrowing only last_time advances.
 * Any arithmetic failure fails the whole accrual.
 */
result<accrual_outcome> accrue(const reserve_data& reserve,
                               const ir_params& params,
                               uint32_t backstop_take_rate,
                               uint64_t now);

/// Accrues the pool reserve of `asset` in place, creating it on first access.
result<accrual_outcome> accrue_reserve(pool_state& pool, token_id asset, uint64_t now);

/// Current annual borrow rate of the reserve.
result<int128> current_rate(const reserve_data& reserve, const ir_params& params);

} } // namespace rwalend::interest
