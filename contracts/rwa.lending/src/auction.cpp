#include <rwa.lending/auction.hpp>
#include <rwa.lending/health.hpp>

#include <algorithm>

#include <safemath.hpp>

namespace rwalend {

using namespace rwalend::safemath;

// elapsed * XRATE_SCALE / duration, reaching XRATE_SCALE at the end of the window
static int128 linear_progress(uint32_t elapsed, uint32_t duration) {
   if (elapsed >= duration) return XRATE_SCALE;
   return (int128)elapsed * XRATE_SCALE / duration;
}

static result<auction_data*> find_auction(pool_state& pool, uint32_t auction_id, auction_type type) {
   auto itr = pool.auctions.find(auction_id);
   if (itr == pool.auctions.end()) return err::AUCTION_NOT_FOUND;
   if (itr->second.type != (uint8_t)type) return err::AUCTION_NOT_ACTIVE;
   return &itr->second;
}

// the single (token, amount) leg of an auction side
static result<std::pair<token_id, int128>> single_leg(const std::map<token_id, int128>& leg) {
   if (leg.empty()) return err::AUCTION_NOT_ACTIVE;
   return std::pair<token_id, int128>(leg.begin()->first, leg.begin()->second);
}

result<uint32_t> blocks_elapsed(const auction_data& auction, uint32_t current_block) {
   if (current_block < auction.block) return err::INVALID_LEDGER_SEQUENCE;
   return current_block - auction.block;
}

uint32_t store_auction(pool_state& pool, const auction_data& auction, uint32_t offset, uint32_t timestamp) {
   auto id = make_auction_id(auction.block, timestamp, offset);
   pool.auctions[id] = auction;
   return id;
}

result<auction_modifiers> modifiers_of(const auction_data& auction, uint32_t current_block) {
   uint32_t elapsed;
   RWA_TRY(elapsed, blocks_elapsed(auction, current_block))

   switch ((auction_type)auction.type) {
      case auction_type::USER_LIQUIDATION:   return user_liquidation_auction::modifiers(elapsed);
      case auction_type::BAD_DEBT:           return bad_debt_auction::modifiers(elapsed);
      case auction_type::INTEREST:           return interest_auction::modifiers(elapsed);
   }
   return err::AUCTION_NOT_ACTIVE;
}

// =====================================================
// user liquidation
// =====================================================

auction_modifiers user_liquidation_auction::modifiers(uint32_t blocks_elapsed) {
   auction_modifiers mods;
   mods.lot = linear_progress(blocks_elapsed, DURATION);

   if (blocks_elapsed <= DURATION) {
      mods.bid = XRATE_SCALE;
   } else {
      mods.bid = XRATE_SCALE - linear_progress(blocks_elapsed - DURATION, DURATION);
   }
   return mods;
}

result<auction_data> user_liquidation_auction::initiate(const pool_state& pool,
                                                        account_id borrower,
                                                        const cdp_data& cdp,
                                                        token_id rwa_token,
                                                        token_id debt_asset,
                                                        uint32_t liquidation_percent,
                                                        const price_map& prices,
                                                        uint32_t current_block) {
   if (liquidation_percent == 0 || (int128)liquidation_percent > RATE_SCALE)
      return err::INVALID_LIQUIDATION_AMOUNT;
   if (!cdp.debt_asset || *cdp.debt_asset != debt_asset)
      return err::CDP_NOT_INSOLVENT;

   uint32_t hf;
   RWA_TRY(hf, health::health_factor(cdp, pool, prices))
   if (!health::is_liquidatable(hf)) return err::CDP_NOT_INSOLVENT;

   auto coll_itr = cdp.collateral.find(rwa_token);
   if (coll_itr == cdp.collateral.end() || coll_itr->second <= 0) return err::INSUFFICIENT_COLLATERAL;
   const int128 collateral_amount = coll_itr->second;

   int128 debt, liquidation_debt;
   RWA_TRY(debt,             health::debt_amount(cdp, pool.reserves))
   RWA_TRY(liquidation_debt, mul_rate(debt, liquidation_percent))

   // premium = 1 + (1 - collateral_factor) / 2
   const int128 cf      = collateral_factor_of(pool.collateral_factors, rwa_token);
   const int128 premium = (RATE_SCALE - cf) / 2 + RATE_SCALE;

   auto rwa_price  = prices.find(rwa_token);
   auto debt_price = prices.find(debt_asset);
   if (rwa_price == prices.end() || debt_price == prices.end()) return err::ORACLE_PRICE_FETCH_FAILED;

   int128 collateral_value, debt_value;
   RWA_TRY(collateral_value, health::value_of(collateral_amount, rwa_price->second))
   RWA_TRY(debt_value,       health::value_of(debt, debt_price->second))
   if (collateral_value == 0) return err::INSUFFICIENT_COLLATERAL;

   // collateral_percent = premium * liquidation_percent * debt_value / collateral_value, capped at 100%
   int128 collateral_percent;
   RWA_TRY(collateral_percent, mul(premium, liquidation_percent))
   RWA_TRY(collateral_percent, mul(collateral_percent, debt_value))
   RWA_TRY(collateral_percent, div(collateral_percent, collateral_value))
   RWA_TRY(collateral_percent, div(collateral_percent, RATE_SCALE))
   if (collateral_percent > RATE_SCALE) collateral_percent = RATE_SCALE;

   int128 liquidation_collateral;
   RWA_TRY(liquidation_collateral, mul_rate(collateral_amount, collateral_percent))
   if (liquidation_collateral <= 0 || liquidation_debt <= 0) return err::INVALID_LIQUIDATION_AMOUNT;

   auction_data auction;
   auction.type             = (uint8_t)TYPE;
   auction.user             = borrower;
   auction.bid[debt_asset]  = liquidation_debt;
   auction.lot[rwa_token]   = liquidation_collateral;
   auction.block            = current_block;
   return auction;
}

result<liquidation_fill> user_liquidation_auction::fill(pool_state& pool,
                                                        cdp_data& cdp,
                                                        uint32_t auction_id,
                                                        const price_map& prices,
                                                        uint32_t current_block,
                                                        uint64_t now) {
   auction_data* auction;
   RWA_TRY(auction, find_auction(pool, auction_id, TYPE))

   uint32_t elapsed;
   RWA_TRY(elapsed, blocks_elapsed(*auction, current_block))
   const auto mods = modifiers(elapsed);

   std::pair<token_id, int128> lot, bid;
   RWA_TRY(lot, single_leg(auction->lot))
   RWA_TRY(bid, single_leg(auction->bid))

   liquidation_fill filled;
   filled.collateral_token = lot.first;
   filled.debt_token       = bid.first;
   RWA_TRY(filled.collateral_received, mul_div(lot.second, mods.lot, XRATE_SCALE))
   RWA_TRY(filled.debt_paid,           mul_div(bid.second, mods.bid, XRATE_SCALE))

   if (!cdp.debt_asset || *cdp.debt_asset != filled.debt_token) return err::DEBT_ASSET_NOT_SET;
   auto res_itr = pool.reserves.find(filled.debt_token);
   if (res_itr == pool.reserves.end()) return err::DEBT_ASSET_NOT_SET;
   auto& reserve = res_itr->second;

   RWA_TRY(filled.d_tokens_burned, to_d_token_down(filled.debt_paid, reserve.d_rate))
   if (filled.d_tokens_burned > cdp.d_tokens) filled.d_tokens_burned = cdp.d_tokens;

   // ----- apply to a copy, commit only once the borrower is not over-liquidated -----
   cdp_data next = cdp;
   auto coll_itr = next.collateral.find(filled.collateral_token);
   if (coll_itr == next.collateral.end() || coll_itr->second < filled.collateral_received)
      return err::INSUFFICIENT_COLLATERAL;
   coll_itr->second -= filled.collateral_received;
   if (coll_itr->second == 0) next.collateral.erase(coll_itr);

   next.d_tokens -= filled.d_tokens_burned;
   if (next.d_tokens == 0) next.debt_asset.reset();
   next.last_update = now;

   RWA_TRY(filled.health_factor, health::health_factor(next, pool, prices))
   if (filled.health_factor > MAX_HEALTH_FACTOR) return err::HEALTH_FACTOR_TOO_HIGH;

   int128 balance;
   RWA_TRY(balance, add(pool.pool_balances[filled.debt_token], filled.debt_paid))

   cdp = next;
   reserve.d_supply = saturating_sub(reserve.d_supply, filled.d_tokens_burned);
   pool.pool_balances[filled.debt_token] = balance;
   pool.auctions.erase(auction_id);

   return filled;
}

// =====================================================
// bad debt
// =====================================================

auction_modifiers bad_debt_auction::modifiers(uint32_t blocks_elapsed) {
   auction_modifiers mods;
   mods.lot = linear_progress(blocks_elapsed, DURATION);
   mods.bid = XRATE_SCALE - mods.lot;
   return mods;
}

result<auction_data> bad_debt_auction::create(const pool_state& pool,
                                              account_id borrower,
                                              const cdp_data& cdp,
                                              uint32_t current_block) {
   if (cdp.d_tokens <= 0 || !cdp.debt_asset) return err::AUCTION_NOT_ACTIVE;
   for (const auto& [token, amount] : cdp.collateral) {
      if (amount > 0) return err::CDP_NOT_INSOLVENT;
   }

   int128 debt;
   RWA_TRY(debt, health::debt_amount(cdp, pool.reserves))

   auction_data auction;
   auction.type                        = (uint8_t)TYPE;
   auction.user                        = borrower;
   auction.bid[*cdp.debt_asset]        = debt;
   auction.lot[pool.backstop_token]    = debt;
   auction.block                       = current_block;
   return auction;
}

result<bad_debt_fill> bad_debt_auction::fill(pool_state& pool,
                                             cdp_data& cdp,
                                             uint32_t auction_id,
                                             uint32_t current_block,
                                             uint64_t now) {
   auction_data* auction;
   RWA_TRY(auction, find_auction(pool, auction_id, TYPE))

   std::pair<token_id, int128> bid, lot;
   RWA_TRY(bid, single_leg(auction->bid))
   RWA_TRY(lot, single_leg(auction->lot))
   if (!cdp.debt_asset || *cdp.debt_asset != bid.first || cdp.d_tokens <= 0) return err::DEBT_ASSET_NOT_SET;

   // collateral posted after creation makes the position solvent again
   for (const auto& [token, amount] : cdp.collateral) {
      if (amount > 0) return err::CDP_NOT_INSOLVENT;
   }

   auto res_itr = pool.reserves.find(bid.first);
   if (res_itr == pool.reserves.end()) return err::DEBT_ASSET_NOT_SET;
   auto& reserve = res_itr->second;

   int128 outstanding;
   RWA_TRY(outstanding, to_underlying_from_d_token(cdp.d_tokens, reserve.d_rate))

   uint32_t elapsed;
   RWA_TRY(elapsed, blocks_elapsed(*auction, current_block))
   const auto mods = modifiers(elapsed);

   bad_debt_fill filled;
   filled.debt_token = bid.first;
   RWA_TRY(filled.debt_covered,  mul_div(outstanding, mods.bid, XRATE_SCALE))
   RWA_TRY(filled.backstop_paid, mul_div(lot.second, mods.lot, XRATE_SCALE))
   if (filled.backstop_paid > pool.backstop_total) filled.backstop_paid = pool.backstop_total;

   if (filled.debt_covered >= outstanding) {
      filled.d_tokens_burned = cdp.d_tokens;
   } else {
      RWA_TRY(filled.d_tokens_burned, to_d_token_down(filled.debt_covered, reserve.d_rate))
      if (filled.d_tokens_burned > cdp.d_tokens) filled.d_tokens_burned = cdp.d_tokens;
   }

   int128 balance;
   RWA_TRY(balance, add(pool.pool_balances[filled.debt_token], filled.debt_covered))

   cdp.d_tokens   -= filled.d_tokens_burned;
   cdp.last_update = now;
   if (cdp.d_tokens == 0) cdp.debt_asset.reset();

   reserve.d_supply    = saturating_sub(reserve.d_supply, filled.d_tokens_burned);
   pool.backstop_total = saturating_sub(pool.backstop_total, filled.backstop_paid);
   pool.pool_balances[filled.debt_token] = balance;

   if (cdp.d_tokens == 0) {
      pool.auctions.erase(auction_id);
      filled.completed = true;
   } else {
      auction->bid[filled.debt_token] = outstanding - filled.debt_covered;
      auction->lot[lot.first]         = lot.second - filled.backstop_paid;
   }
   return filled;
}

// =====================================================
// interest
// =====================================================

auction_modifiers interest_auction::modifiers(uint32_t blocks_elapsed) {
   auction_modifiers mods;
   mods.lot = XRATE_SCALE;
   mods.bid = XRATE_SCALE - linear_progress(blocks_elapsed, DURATION);
   return mods;
}

result<auction_data> interest_auction::create(const pool_state& pool,
                                              account_id pool_account,
                                              token_id asset,
                                              uint32_t current_block) {
   auto res_itr = pool.reserves.find(asset);
   if (res_itr == pool.reserves.end()) return err::AUCTION_NOT_ACTIVE;

   const int128 credit = res_itr->second.backstop_credit;
   if (credit < MIN_INTEREST_AUCTION_AMOUNT) return err::AUCTION_NOT_ACTIVE;

   // the credit on sale is not reserved, so it may only be on sale once
   for (const auto& [id, stored] : pool.auctions) {
      if (stored.type == (uint8_t)TYPE && stored.lot.count(asset)) return err::AUCTION_IN_PROGRESS;
   }

   auction_data auction;
   auction.type                        = (uint8_t)TYPE;
   auction.user                        = pool_account;
   auction.lot[asset]                  = credit;
   auction.bid[pool.backstop_token]    = credit;
   auction.block                       = current_block;
   return auction;
}

result<interest_fill> interest_auction::fill(pool_state& pool,
                                             uint32_t auction_id,
                                             uint32_t fill_percent,
                                             uint32_t current_block) {
   auction_data* auction;
   RWA_TRY(auction, find_auction(pool, auction_id, TYPE))
   if (fill_percent == 0 || (int128)fill_percent > RATE_SCALE) return err::INVALID_FILL_PERCENT;

   std::pair<token_id, int128> lot;
   RWA_TRY(lot, single_leg(auction->lot))

   uint32_t elapsed;
   RWA_TRY(elapsed, blocks_elapsed(*auction, current_block))
   const auto mods = modifiers(elapsed);

   interest_fill filled;
   filled.asset = lot.first;

   int128 portion;
   RWA_TRY(portion,                  mul_rate(lot.second, fill_percent))
   RWA_TRY(filled.interest_received, mul_div(portion, mods.lot, XRATE_SCALE))

   auto res_itr = pool.reserves.find(filled.asset);
   if (res_itr == pool.reserves.end()) return err::AUCTION_NOT_ACTIVE;
   auto& credit = res_itr->second.backstop_credit;
   if (filled.interest_received > credit) filled.interest_received = credit;

   RWA_TRY(filled.backstop_paid,     mul_div(filled.interest_received, mods.bid, XRATE_SCALE))

   auto& balance = pool.pool_balances[filled.asset];
   if (balance < filled.interest_received) return err::INSUFFICIENT_POOL_BALANCE;

   int128 backstop_total;
   RWA_TRY(backstop_total, add(pool.backstop_total, filled.backstop_paid))

   credit             -= filled.interest_received;
   balance            -= filled.interest_received;
   pool.backstop_total = backstop_total;

   const int128 remaining = std::min(lot.second - filled.interest_received, credit);
   if (remaining <= 0) {
      pool.auctions.erase(auction_id);
      filled.completed = true;
   } else {
      auction->lot[filled.asset] = remaining;
      if (!auction->bid.empty()) auction->bid.begin()->second = remaining;
   }
   return filled;
}

} // namespace rwalend
