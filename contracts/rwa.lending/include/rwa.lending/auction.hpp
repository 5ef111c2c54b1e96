#pragma once

#include <rwa.lending/rwa.lending.types.hpp>

namespace rwalend {

/**
 * Dutch auctions over the pool state.
 *
 * Every auction shares the auction_data shape and lives in pool_state::auctions under
 * an id derived from the block sequence and the timestamp. Each kind below is a policy
 * class that owns its duration, id offset, modifier curve and its create/fill sizing.
 * The kinds are dispatched on auction_data::type only in modifiers_of().
 */

// ===== fill outcomes, consumed by the contract to move tokens =====

struct liquidation_fill {
   token_id    collateral_token     = 0;
   int128      collateral_received  = 0;
   token_id    debt_token           = 0;
   int128      debt_paid            = 0;
   int128      d_tokens_burned      = 0;
   uint32_t    health_factor        = 0;      // borrower, after the fill
};

struct bad_debt_fill {
   token_id    debt_token           = 0;
   int128      debt_covered         = 0;      // paid by the filler
   int128      d_tokens_burned      = 0;
   int128      backstop_paid        = 0;      // backstop tokens to the filler
   bool        completed            = false;  // debt cleared, auction removed
};

struct interest_fill {
   token_id    asset                = 0;
   int128      interest_received    = 0;      // underlying to the filler
   int128      backstop_paid        = 0;      // backstop tokens from the filler
   bool        completed            = false;
};

// ===== generic primitives =====

/// sequence + timestamp + offset, wrapping. Not collision proof: a later auction overwrites.
inline uint32_t make_auction_id(uint32_t sequence, uint32_t timestamp, uint32_t offset) {
   return sequence + timestamp + offset;
}

result<uint32_t> blocks_elapsed(const auction_data& auction, uint32_t current_block);

/// Stores `auction` under its id, replacing any auction already there.
uint32_t store_auction(pool_state& pool, const auction_data& auction, uint32_t offset, uint32_t timestamp);

// ===== kinds =====

class user_liquidation_auction {
public:
   static constexpr auction_type   TYPE        = auction_type::USER_LIQUIDATION;
   static constexpr uint32_t       DURATION    = USER_LIQUIDATION_DURATION;
   static constexpr uint32_t       ID_OFFSET   = USER_LIQUIDATION_ID_OFFSET;

   /// lot grows to 1 over DURATION; bid holds at 1 for DURATION and then decays to 0 over another DURATION
   static auction_modifiers modifiers(uint32_t blocks_elapsed);

   /**
    * Sizes a liquidation of `liquidation_percent` of the borrower's debt against
    * `rwa_token` collateral. The borrower must be insolvent (health factor below 1).
    */
   static result<auction_data> initiate(const pool_state& pool,
                                        account_id borrower,
                                        const cdp_data& cdp,
                                        token_id rwa_token,
                                        token_id debt_asset,
                                        uint32_t liquidation_percent,
                                        const price_map& prices,
                                        uint32_t current_block);

   /// All-or-nothing fill. Rejects fills leaving the borrower above MAX_HEALTH_FACTOR.
   static result<liquidation_fill> fill(pool_state& pool,
                                        cdp_data& cdp,
                                        uint32_t auction_id,
                                        const price_map& prices,
                                        uint32_t current_block,
                                        uint64_t now);
};

class bad_debt_auction {
public:
   static constexpr auction_type   TYPE        = auction_type::BAD_DEBT;
   static constexpr uint32_t       DURATION    = BAD_DEBT_DURATION;
   static constexpr uint32_t       ID_OFFSET   = BAD_DEBT_ID_OFFSET;

   static auction_modifiers modifiers(uint32_t blocks_elapsed);

   /// Only for positions that still owe debt with no collateral left.
   static result<auction_data> create(const pool_state& pool,
                                      account_id borrower,
                                      const cdp_data& cdp,
                                      uint32_t current_block);

   /**
    * The filler pays the whole current bid, `outstanding debt * bid modifier`, and dTokens
    * are burned for exactly that payment. In return it receives `remaining lot * lot modifier`
    * backstop tokens, bounded by backstop_total. The lot shrinks by every payout, so the
    * backstop never pays more than the debt snapshot taken at creation.
    * The auction is removed once the position owes nothing.
    */
   static result<bad_debt_fill> fill(pool_state& pool,
                                     cdp_data& cdp,
                                     uint32_t auction_id,
                                     uint32_t current_block,
                                     uint64_t now);
};

class interest_auction {
public:
   static constexpr auction_type   TYPE        = auction_type::INTEREST;
   static constexpr uint32_t       DURATION    = INTEREST_AUCTION_DURATION;
   static constexpr uint32_t       ID_OFFSET   = INTEREST_AUCTION_ID_OFFSET;

   static auction_modifiers modifiers(uint32_t blocks_elapsed);

   /// Offers the reserve's backstop credit once it reaches MIN_INTEREST_AUCTION_AMOUNT.
   /// One interest auction per asset at a time.
   static result<auction_data> create(const pool_state& pool,
                                      account_id pool_account,
                                      token_id asset,
                                      uint32_t current_block);

   /// Partial fill of `fill_percent` (RATE_SCALE) of the remaining lot, never more than
   /// the reserve's current backstop credit.
   static result<interest_fill> fill(pool_state& pool,
                                     uint32_t auction_id,
                                     uint32_t fill_percent,
                                     uint32_t current_block);
};

/// Current modifiers of a stored auction, by its kind.
result<auction_modifiers> modifiers_of(const auction_data& auction, uint32_t current_block);

} // namespace rwalend
