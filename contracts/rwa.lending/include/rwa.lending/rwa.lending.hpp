#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>

#include <rwa.lending/rwa.lending.db.hpp>

namespace rwalend {

using std::string;
using namespace eosio;

static constexpr name  active_perm  = "active"_n;

/**
 * The `rwa.lending` contract runs a lending pool where borrowers post tokenized real-world
 * assets as collateral and borrow a single crypto debt asset against them.
 *
 * Lenders earn through bTokens whose exchange rate grows with accrued interest; borrowers
 * owe dTokens that grow the same way. A share of the interest is credited to the backstop,
 * an insurance pool which absorbs bad debt. Unhealthy positions, bad debt and the backstop's
 * interest are all cleared through block-timed Dutch auctions.
 *
 * Tokens enter through `transfer` notifications with a command memo:
 *    deposit                     supply liquidity
 *    collateral                  add collateral to the sender's position
 *    repay[:borrower]            repay debt, the excess is refunded
 *    backstop                    deposit backstop tokens
 *    fill:<id>                   fill a user liquidation with the debt asset
 *    baddebt:<id>                fill a bad debt auction with the debt asset
 *    interest:<id>:<percent>     fill part of an interest auction with backstop tokens
 */
class [[eosio::contract("rwa.lending")]] rwa_lending : public contract {
public:
   using contract::contract;

   rwa_lending(name receiver, name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value) {
      _gstate = _global.exists() ? _global.get() : global_t{};
   }

   ~rwa_lending() {
      _global.set(_gstate, get_self());
   }

   //admin
   ACTION init(const name& admin, const name& rwa_oracle, const name& crypto_oracle,
               const extended_symbol& backstop_token);
   ACTION setoracles(const name& rwa_oracle, const name& crypto_oracle);
   ACTION settoken(const extended_symbol& token);
   ACTION setcollfac(const symbol_code& token, const uint32_t& factor);
   ACTION setirparams(const symbol_code& asset, const ir_params& params);
   ACTION setpoolstat(const uint8_t& status);
   ACTION setbsthresh(const asset& threshold);
   ACTION setbstake(const uint32_t& take_rate);

   //user
   ACTION withdraw(const name& lender, const asset& b_tokens);
   ACTION borrow(const name& borrower, const asset& quantity);
   ACTION remcoll(const name& borrower, const asset& quantity);
   ACTION accrue(const symbol_code& asset);

   ACTION bsqueue(const name& owner, const asset& quantity);
   ACTION bswithdraw(const name& owner);

   //auctions
   ACTION liquidate(const name& liquidator, const name& borrower,
                    const symbol_code& rwa_token, const symbol_code& debt_asset,
                    const uint32_t& liquidation_percent);
   ACTION newbaddebt(const name& caller, const name& borrower);
   ACTION newintauct(const name& caller, const symbol_code& asset);

   //views
   [[eosio::action]] uint32_t gethealth(const name& borrower);
   [[eosio::action]] uint64_t getrate(const symbol_code& asset);
   [[eosio::action]] auction_modifiers getauctmod(const uint32_t& auction_id);

   [[eosio::on_notify("*::transfer")]]
   void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

   ACTION notifyaccr(const accrual_log& log);
   using notifyaccr_action = action_wrapper<"notifyaccr"_n, &rwa_lending::notifyaccr>;
   ACTION notifyauct(const auction_log& log);
   using notifyauct_action = action_wrapper<"notifyauct"_n, &rwa_lending::notifyauct>;
   ACTION notifypos(const position_log& log);
   using notifypos_action  = action_wrapper<"notifypos"_n,  &rwa_lending::notifypos>;

private:
   global_singleton     _global;
   global_t             _gstate;

   // ========= transfer flows =========
   void _on_deposit(const name& lender, const asset& quantity);
   void _on_add_collateral(const name& borrower, const asset& quantity);
   void _on_repay(const name& payer, const name& borrower, const asset& quantity);
   void _on_backstop_deposit(const name& owner, const asset& quantity);
   void _on_fill_liquidation(const name& liquidator, uint32_t auction_id, const asset& quantity);
   void _on_fill_bad_debt(const name& filler, uint32_t auction_id, const asset& quantity);
   void _on_fill_interest(const name& filler, uint32_t auction_id, uint32_t fill_percent, const asset& quantity);

   // ========= helpers =========
   void _check_admin();
   void _check_initialized();
   void _accrue(const symbol_code& asset);

   cdp_data _get_cdp(const name& owner);
   void     _set_cdp(const name& owner, const cdp_data& cdp);

   price_map  _load_prices(const cdp_data& cdp);
   price_data _get_price(const name& oracle, const symbol_code& token);

   const extended_symbol& _token(const symbol_code& code);
   void  _check_token(const name& token_bank, const symbol& sym);
   void  _transfer_out(const symbol_code& code, const name& to, int128 amount, const string& memo);

   uint64_t _now() const;
   uint32_t _block() const;

   void _notify_auction(const name& event, uint32_t auction_id, const auction_data& auction,
                        const name& filler, int128 paid, int128 received);
   void _notify_position(const name& event, const name& owner, const asset& quantity, int128 share_delta);
};

} // namespace rwalend
