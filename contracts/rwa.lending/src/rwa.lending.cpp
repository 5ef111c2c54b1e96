#include <rwa.lending/rwa.lending.hpp>
#include <rwa.lending/auction.hpp>
#include <rwa.lending/backstop.hpp>
#include <rwa.lending/health.hpp>
#include <rwa.lending/interest.hpp>
#include <rwa.lending/lending.hpp>
#include <rwa.oracle/rwa.oracle.states.hpp>

#include <eosio/system.hpp>

#include <limits>

#include <rwa.lending.utils.hpp>

namespace rwalend {
using namespace std;

#define NOTIFY_ACCRUAL_ACTION( item ) \
     { rwa_lending::notifyaccr_action act{ _self, { {_self, active_perm} } };\
	        act.send( item );}

#define NOTIFY_AUCTION_ACTION( item ) \
     { rwa_lending::notifyauct_action act{ _self, { {_self, active_perm} } };\
	        act.send( item );}

#define NOTIFY_POSITION_ACTION( item ) \
     { rwa_lending::notifypos_action act{ _self, { {_self, active_perm} } };\
	        act.send( item );}

static const string MEMO_DEPOSIT       = "deposit";
static const string MEMO_COLLATERAL    = "collateral";
static const string MEMO_REPAY         = "repay";
static const string MEMO_BACKSTOP      = "backstop";
static const string MEMO_FILL          = "fill";
static const string MEMO_BAD_DEBT      = "baddebt";
static const string MEMO_INTEREST      = "interest";

template<typename T>
static T unwrap(const result<T>& res, const string& msg) {
   CHECKC( res.ok(), res.code, msg )
   return res.value;
}

static void check_ok(err code, const string& msg) {
   CHECKC( code == err::NONE, code, msg )
}

static asset to_asset(int128 amount, const symbol& sym) {
   CHECKC( amount >= 0 && amount <= std::numeric_limits<int64_t>::max(), err::ARITHMETIC_ERROR, "amount out of range" )
   return asset( (int64_t)amount, sym );
}

static uint32_t parse_uint32(const string& str, const string& what) {
   uint64_t v = 0;
   CHECKC( to_uint64(str, v) && v <= UINT32_MAX, err::MEMO_FORMAT_ERROR, "invalid " + what + ": " + str )
   return (uint32_t)v;
}

static auction_log make_auction_log(const name& event, uint32_t auction_id, const auction_data& auction,
                                    const name& filler, int128 paid, int128 received) {
   auction_log log;
   log.auction_id    = auction_id;
   log.event         = event;
   log.auction_type  = auction.type;
   log.user          = name(auction.user);
   log.filler        = filler;
   log.bid           = auction.bid;
   log.lot           = auction.lot;
   log.block         = auction.block;
   log.paid          = paid;
   log.received      = received;
   log.created_at    = time_point_sec( current_time_point() );
   return log;
}

// =====================================================
// admin
// =====================================================

void rwa_lending::init(const name& admin, const name& rwa_oracle, const name& crypto_oracle,
                       const extended_symbol& backstop_token) {
   require_auth( _self );
   CHECKC( !_gstate.initialized, err::ALREADY_INITIALIZED, "already initialized" )
   CHECKC( is_account(admin), err::NOT_AUTHORIZED, "admin account does not exist" )

   _gstate.admin                 = admin;
   _gstate.rwa_oracle            = rwa_oracle;
   _gstate.crypto_oracle         = crypto_oracle;
   _gstate.backstop_token        = backstop_token;
   _gstate.tokens[ backstop_token.get_symbol().code().raw() ] = backstop_token;
   _gstate.pool.backstop_token   = backstop_token.get_symbol().code().raw();
   _gstate.pool.status           = (uint8_t)pool_status::ON_ICE;
   _gstate.initialized           = true;
}

void rwa_lending::setoracles(const name& rwa_oracle, const name& crypto_oracle) {
   _check_admin();
   CHECKC( is_account(rwa_oracle) && is_account(crypto_oracle), err::ASSET_NOT_FOUND_IN_ORACLE, "oracle account does not exist" )

   _gstate.rwa_oracle      = rwa_oracle;
   _gstate.crypto_oracle   = crypto_oracle;
}

void rwa_lending::settoken(const extended_symbol& token) {
   _check_admin();
   CHECKC( is_account(token.get_contract()), err::TOKEN_CONTRACT_NOT_SET, "token contract does not exist" )
   CHECKC( token.get_symbol().code() != _gstate.backstop_token.get_symbol().code(), err::SYMBOL_MISMATCH,
           "backstop token is set by init" )

   _gstate.tokens[ token.get_symbol().code().raw() ] = token;
}

void rwa_lending::setcollfac(const symbol_code& token, const uint32_t& factor) {
   _check_admin();
   CHECKC( (int128)factor <= RATE_SCALE, err::INVALID_COLLATERAL_FACTOR, "collateral factor above 100%" )

   _gstate.pool.collateral_factors[ token.raw() ] = factor;
}

void rwa_lending::setirparams(const symbol_code& asset, const ir_params& params) {
   _check_admin();
   check_ok( interest::validate_params(params), "invalid interest rate params" );

   // elapsed time accrues under the curve it ran under
   _accrue( asset );
   _gstate.pool.interest_params[ asset.raw() ] = params;
}

void rwa_lending::setpoolstat(const uint8_t& status) {
   _check_admin();
   CHECKC( status <= (uint8_t)pool_status::FROZEN, err::INVALID_POOL_STATUS, "unknown pool status" )
   if (status == (uint8_t)pool_status::ACTIVE)
      CHECKC( _gstate.pool.backstop_total >= _gstate.pool.backstop_threshold, err::BACKSTOP_THRESHOLD_NOT_MET,
              "backstop below threshold" )

   _gstate.pool.status = status;
}

void rwa_lending::setbsthresh(const asset& threshold) {
   _check_admin();
   CHECKC( threshold.symbol == _gstate.backstop_token.get_symbol(), err::SYMBOL_MISMATCH, "threshold must be in backstop token" )
   CHECKC( threshold.amount >= 0, err::NOT_POSITIVE, "negative threshold" )

   _gstate.pool.backstop_threshold = threshold.amount;
}

void rwa_lending::setbstake(const uint32_t& take_rate) {
   _check_admin();
   CHECKC( (int128)take_rate <= RATE_SCALE, err::INVALID_UTIL_RATE, "take rate above 100%" )

   // interest up to now goes out at the old take rate
   for (const auto& entry : _gstate.pool.reserves) {
      _accrue( symbol_code(entry.first) );
   }
   _gstate.pool.backstop_take_rate = take_rate;
}

// =====================================================
// transfer in
// =====================================================

/**
 * @param memo:
 *    deposit | collateral | backstop
 *    repay[:borrower]
 *    fill:<auction_id>
 *    baddebt:<auction_id>
 *    interest:<auction_id>:<fill_percent>
 */
void rwa_lending::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   _check_initialized();
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )
   _check_token( get_first_receiver(), quantity.symbol );

   auto parts = split( memo, ":" );
   const auto& cmd = parts[0];

   if (cmd == MEMO_DEPOSIT) {
      CHECKC( parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_deposit( from, quantity );
   } else if (cmd == MEMO_COLLATERAL) {
      CHECKC( parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_add_collateral( from, quantity );
   } else if (cmd == MEMO_REPAY) {
      CHECKC( parts.size() <= 2, err::MEMO_FORMAT_ERROR, "memo format error" )
      auto borrower = parts.size() == 2 ? name(parts[1]) : from;
      _on_repay( from, borrower, quantity );
   } else if (cmd == MEMO_BACKSTOP) {
      CHECKC( parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_backstop_deposit( from, quantity );
   } else if (cmd == MEMO_FILL) {
      CHECKC( parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_fill_liquidation( from, parse_uint32(parts[1], "auction id"), quantity );
   } else if (cmd == MEMO_BAD_DEBT) {
      CHECKC( parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_fill_bad_debt( from, parse_uint32(parts[1], "auction id"), quantity );
   } else if (cmd == MEMO_INTEREST) {
      CHECKC( parts.size() == 3, err::MEMO_FORMAT_ERROR, "memo format error" )
      _on_fill_interest( from, parse_uint32(parts[1], "auction id"), parse_uint32(parts[2], "fill percent"), quantity );
   } else {
      CHECKC( false, err::MEMO_FORMAT_ERROR, "unknown memo: " + memo )
   }
}

void rwa_lending::_on_deposit(const name& lender, const asset& quantity) {
   const auto code = quantity.symbol.code();
   CHECKC( code != _gstate.backstop_token.get_symbol().code(), err::SYMBOL_MISMATCH, "backstop token is not lendable" )
   _accrue( code );

   lender_t::tbl_t lenders(_self, lender.value);
   auto itr = lenders.find( code.raw() );
   int128 b_balance = itr == lenders.end() ? 0 : itr->b_tokens;

   auto minted = unwrap( lending::deposit(_gstate.pool, code.raw(), quantity.amount, b_balance, _now()), "deposit failed" );

   if (itr == lenders.end()) {
      lenders.emplace( _self, [&]( auto& row ) {
         row.sym        = code;
         row.b_tokens   = b_balance;
      });
   } else {
      lenders.modify( itr, same_payer, [&]( auto& row ) {
         row.b_tokens   = b_balance;
      });
   }
   _notify_position( "deposit"_n, lender, quantity, minted );
}

void rwa_lending::_on_add_collateral(const name& borrower, const asset& quantity) {
   const auto code = quantity.symbol.code();
   CHECKC( code != _gstate.backstop_token.get_symbol().code(), err::SYMBOL_MISMATCH, "backstop token is not collateral" )

   auto cdp = _get_cdp( borrower );
   check_ok( lending::add_collateral(_gstate.pool, cdp, code.raw(), quantity.amount, _now()), "add collateral failed" );
   _set_cdp( borrower, cdp );

   _notify_position( "addcoll"_n, borrower, quantity, 0 );
}

void rwa_lending::_on_repay(const name& payer, const name& borrower, const asset& quantity) {
   const auto code = quantity.symbol.code();
   _accrue( code );

   auto cdp = _get_cdp( borrower );
   auto outcome = unwrap( lending::repay(_gstate.pool, cdp, code.raw(), quantity.amount, _now()), "repay failed" );
   _set_cdp( borrower, cdp );

   _transfer_out( code, payer, outcome.refund, "repay refund" );
   _notify_position( "repay"_n, borrower, to_asset(outcome.repaid, quantity.symbol), outcome.d_tokens_burned );
}

void rwa_lending::_on_backstop_deposit(const name& owner, const asset& quantity) {
   CHECKC( quantity.symbol == _gstate.backstop_token.get_symbol(), err::SYMBOL_MISMATCH, "not the backstop token" )

   bsdeposit_t::tbl_t deposits(_self, _self.value);
   auto itr = deposits.find( owner.value );
   auto dep = itr == deposits.end() ? backstop_deposit{} : itr->deposit;

   check_ok( backstop::deposit(_gstate.pool, dep, quantity.amount, _now()), "backstop deposit failed" );

   if (itr == deposits.end()) {
      deposits.emplace( _self, [&]( auto& row ) {
         row.owner      = owner;
         row.deposit    = dep;
      });
   } else {
      deposits.modify( itr, same_payer, [&]( auto& row ) {
         row.deposit    = dep;
      });
   }
   _notify_position( "bsdeposit"_n, owner, quantity, quantity.amount );
}

// 清算拍卖成交: filler pays the bid in the debt asset and takes the collateral lot
void rwa_lending::_on_fill_liquidation(const name& liquidator, uint32_t auction_id, const asset& quantity) {
   auto itr = _gstate.pool.auctions.find( auction_id );
   CHECKC( itr != _gstate.pool.auctions.end(), err::AUCTION_NOT_FOUND, "auction not found: " + to_string(auction_id) )
   const auto auction = itr->second;
   CHECKC( auction.bid.count(quantity.symbol.code().raw()), err::SYMBOL_MISMATCH, "bid is not in " + quantity.symbol.code().to_string() )

   const auto borrower = name( auction.user );
   _accrue( quantity.symbol.code() );

   auto cdp    = _get_cdp( borrower );
   auto prices = _load_prices( cdp );
   auto filled = unwrap( user_liquidation_auction::fill(_gstate.pool, cdp, auction_id, prices, _block(), _now()), "liquidation fill failed" );
   CHECKC( quantity.amount >= filled.debt_paid, err::INSUFFICIENT_DEPOSIT_AMOUNT,
           "payment below bid: " + to_asset(filled.debt_paid, quantity.symbol).to_string() )

   _set_cdp( borrower, cdp );

   const auto collateral_code = symbol_code( filled.collateral_token );
   _transfer_out( collateral_code, liquidator, filled.collateral_received, "liquidation lot: " + to_string(auction_id) );
   _transfer_out( quantity.symbol.code(), liquidator, quantity.amount - filled.debt_paid, "liquidation refund" );

   _notify_auction( "filled"_n, auction_id, auction, liquidator, filled.debt_paid, filled.collateral_received );
}

void rwa_lending::_on_fill_bad_debt(const name& filler, uint32_t auction_id, const asset& quantity) {
   auto itr = _gstate.pool.auctions.find( auction_id );
   CHECKC( itr != _gstate.pool.auctions.end(), err::AUCTION_NOT_FOUND, "auction not found: " + to_string(auction_id) )
   const auto auction = itr->second;
   CHECKC( auction.bid.count(quantity.symbol.code().raw()), err::SYMBOL_MISMATCH, "bid is not in " + quantity.symbol.code().to_string() )

   const auto borrower = name( auction.user );
   _accrue( quantity.symbol.code() );

   auto cdp    = _get_cdp( borrower );
   auto filled = unwrap( bad_debt_auction::fill(_gstate.pool, cdp, auction_id, _block(), _now()), "bad debt fill failed" );
   CHECKC( quantity.amount >= filled.debt_covered, err::INSUFFICIENT_DEPOSIT_AMOUNT,
           "payment below bid: " + to_asset(filled.debt_covered, quantity.symbol).to_string() )
   _set_cdp( borrower, cdp );

   _transfer_out( _gstate.backstop_token.get_symbol().code(), filler, filled.backstop_paid, "bad debt lot: " + to_string(auction_id) );
   _transfer_out( quantity.symbol.code(), filler, quantity.amount - filled.debt_covered, "bad debt refund" );

   _notify_auction( filled.completed ? "deleted"_n : "filled"_n, auction_id, auction, filler, filled.debt_covered, filled.backstop_paid );
}

void rwa_lending::_on_fill_interest(const name& filler, uint32_t auction_id, uint32_t fill_percent, const asset& quantity) {
   CHECKC( quantity.symbol == _gstate.backstop_token.get_symbol(), err::SYMBOL_MISMATCH, "interest auctions are paid in the backstop token" )

   auto itr = _gstate.pool.auctions.find( auction_id );
   CHECKC( itr != _gstate.pool.auctions.end(), err::AUCTION_NOT_FOUND, "auction not found: " + to_string(auction_id) )
   const auto auction = itr->second;

   auto filled = unwrap( interest_auction::fill(_gstate.pool, auction_id, fill_percent, _block()), "interest fill failed" );
   CHECKC( quantity.amount >= filled.backstop_paid, err::INSUFFICIENT_DEPOSIT_AMOUNT,
           "payment below bid: " + to_asset(filled.backstop_paid, quantity.symbol).to_string() )

   _transfer_out( symbol_code(filled.asset), filler, filled.interest_received, "interest lot: " + to_string(auction_id) );
   _transfer_out( quantity.symbol.code(), filler, quantity.amount - filled.backstop_paid, "interest refund" );

   _notify_auction( filled.completed ? "deleted"_n : "filled"_n, auction_id, auction, filler, filled.backstop_paid, filled.interest_received );
}

// =====================================================
// user actions
// =====================================================

void rwa_lending::withdraw(const name& lender, const asset& b_tokens) {
   require_auth( lender );
   _check_initialized();
   _check_token( _token(b_tokens.symbol.code()).get_contract(), b_tokens.symbol );

   const auto code = b_tokens.symbol.code();
   _accrue( code );

   lender_t::tbl_t lenders(_self, lender.value);
   auto itr = lenders.find( code.raw() );
   CHECKC( itr != lenders.end(), err::INSUFFICIENT_BTOKEN_BALANCE, "no deposit of " + code.to_string() )

   int128 b_balance = itr->b_tokens;
   auto amount = unwrap( lending::withdraw(_gstate.pool, code.raw(), b_tokens.amount, b_balance, _now()), "withdraw failed" );

   if (b_balance == 0) {
      lenders.erase( itr );
   } else {
      lenders.modify( itr, same_payer, [&]( auto& row ) {
         row.b_tokens   = b_balance;
      });
   }

   auto quantity = to_asset( amount, b_tokens.symbol );
   _transfer_out( code, lender, amount, "withdraw" );
   _notify_position( "withdraw"_n, lender, quantity, -(int128)b_tokens.amount );
}

void rwa_lending::borrow(const name& borrower, const asset& quantity) {
   require_auth( borrower );
   _check_initialized();
   _check_token( _token(quantity.symbol.code()).get_contract(), quantity.symbol );
   CHECKC( quantity.symbol.code() != _gstate.backstop_token.get_symbol().code(), err::SYMBOL_MISMATCH, "backstop token is not lendable" )

   const auto code = quantity.symbol.code();
   _accrue( code );

   auto cdp    = _get_cdp( borrower );
   auto priced = cdp;
   priced.debt_asset = code.raw();
   auto prices = _load_prices( priced );

   auto minted = unwrap( lending::borrow(_gstate.pool, cdp, code.raw(), quantity.amount, prices, _now()), "borrow failed" );
   _set_cdp( borrower, cdp );

   _transfer_out( code, borrower, quantity.amount, "borrow" );
   _notify_position( "borrow"_n, borrower, quantity, minted );
}

void rwa_lending::remcoll(const name& borrower, const asset& quantity) {
   require_auth( borrower );
   _check_initialized();
   _check_token( _token(quantity.symbol.code()).get_contract(), quantity.symbol );

   auto cdp = _get_cdp( borrower );
   price_map prices;
   if (cdp.d_tokens > 0) {
      _accrue( symbol_code(*cdp.debt_asset) );
      prices = _load_prices( cdp );
   }

   check_ok( lending::remove_collateral(_gstate.pool, cdp, quantity.symbol.code().raw(), quantity.amount, prices, _now()),
             "remove collateral failed" );
   _set_cdp( borrower, cdp );

   _transfer_out( quantity.symbol.code(), borrower, quantity.amount, "remove collateral" );
   _notify_position( "remcoll"_n, borrower, quantity, 0 );
}

void rwa_lending::accrue(const symbol_code& asset) {
   _check_initialized();
   _accrue( asset );
}

void rwa_lending::bsqueue(const name& owner, const asset& quantity) {
   require_auth( owner );
   _check_initialized();
   CHECKC( quantity.symbol == _gstate.backstop_token.get_symbol(), err::SYMBOL_MISMATCH, "not the backstop token" )

   bsdeposit_t::tbl_t deposits(_self, _self.value);
   auto itr = deposits.find( owner.value );
   CHECKC( itr != deposits.end(), err::INSUFFICIENT_BACKSTOP_DEPOSIT, "no backstop deposit" )

   check_ok( backstop::queue_withdrawal(_gstate.pool, owner.value, itr->deposit, quantity.amount, _now()),
             "queue withdrawal failed" );
   _notify_position( "bsqueue"_n, owner, quantity, 0 );
}

void rwa_lending::bswithdraw(const name& owner) {
   require_auth( owner );
   _check_initialized();

   bsdeposit_t::tbl_t deposits(_self, _self.value);
   auto itr = deposits.find( owner.value );
   CHECKC( itr != deposits.end(), err::INSUFFICIENT_BACKSTOP_DEPOSIT, "no backstop deposit" )

   auto dep    = itr->deposit;
   auto amount = unwrap( backstop::withdraw(_gstate.pool, owner.value, dep, _now()), "backstop withdraw failed" );

   if (dep.amount == 0) {
      deposits.erase( itr );
   } else {
      deposits.modify( itr, same_payer, [&]( auto& row ) {
         row.deposit    = dep;
      });
   }

   const auto& sym = _gstate.backstop_token.get_symbol();
   _transfer_out( sym.code(), owner, amount, "backstop withdraw" );
   _notify_position( "bswithdraw"_n, owner, to_asset(amount, sym), -amount );
}

// =====================================================
// auctions
// =====================================================

void rwa_lending::liquidate(const name& liquidator, const name& borrower,
                            const symbol_code& rwa_token, const symbol_code& debt_asset,
                            const uint32_t& liquidation_percent) {
   require_auth( liquidator );
   _check_initialized();
   _accrue( debt_asset );

   auto cdp    = _get_cdp( borrower );
   auto prices = _load_prices( cdp );
   auto auction = unwrap( user_liquidation_auction::initiate(_gstate.pool, borrower.value, cdp, rwa_token.raw(),
                                                             debt_asset.raw(), liquidation_percent, prices, _block()),
                          "liquidation rejected" );

   auto auction_id = store_auction( _gstate.pool, auction, user_liquidation_auction::ID_OFFSET, (uint32_t)_now() );
   _notify_auction( "created"_n, auction_id, auction, liquidator, 0, 0 );
}

void rwa_lending::newbaddebt(const name& caller, const name& borrower) {
   require_auth( caller );
   _check_initialized();

   auto cdp = _get_cdp( borrower );
   if (cdp.debt_asset) _accrue( symbol_code(*cdp.debt_asset) );

   auto auction = unwrap( bad_debt_auction::create(_gstate.pool, borrower.value, cdp, _block()), "bad debt auction rejected" );
   auto auction_id = store_auction( _gstate.pool, auction, bad_debt_auction::ID_OFFSET, (uint32_t)_now() );
   _notify_auction( "created"_n, auction_id, auction, caller, 0, 0 );
}

void rwa_lending::newintauct(const name& caller, const symbol_code& asset) {
   require_auth( caller );
   _check_initialized();
   _accrue( asset );

   auto auction = unwrap( interest_auction::create(_gstate.pool, get_self().value, asset.raw(), _block()), "interest auction rejected" );
   auto auction_id = store_auction( _gstate.pool, auction, interest_auction::ID_OFFSET, (uint32_t)_now() );
   _notify_auction( "created"_n, auction_id, auction, caller, 0, 0 );
}

// =====================================================
// views, evaluated on an accrued copy of the pool
// =====================================================

uint32_t rwa_lending::gethealth(const name& borrower) {
   _check_initialized();
   auto cdp  = _get_cdp( borrower );
   auto pool = _gstate.pool;
   if (cdp.debt_asset) unwrap( interest::accrue_reserve(pool, *cdp.debt_asset, _now()), "accrual failed" );

   return unwrap( health::health_factor(cdp, pool, _load_prices(cdp)), "health factor failed" );
}

uint64_t rwa_lending::getrate(const symbol_code& asset) {
   _check_initialized();
   auto pool = _gstate.pool;
   unwrap( interest::accrue_reserve(pool, asset.raw(), _now()), "accrual failed" );

   auto rate = unwrap( interest::current_rate(pool.reserves[asset.raw()], ir_params_of(pool, asset.raw())), "rate failed" );
   return (uint64_t)rate;
}

auction_modifiers rwa_lending::getauctmod(const uint32_t& auction_id) {
   auto itr = _gstate.pool.auctions.find( auction_id );
   CHECKC( itr != _gstate.pool.auctions.end(), err::AUCTION_NOT_FOUND, "auction not found: " + to_string(auction_id) )

   return unwrap( modifiers_of(itr->second, _block()), "auction modifiers failed" );
}

void rwa_lending::notifyaccr(const accrual_log& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

void rwa_lending::notifyauct(const auction_log& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

void rwa_lending::notifypos(const position_log& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

// =====================================================
// helpers
// =====================================================

void rwa_lending::_check_initialized() {
   CHECKC( _gstate.initialized, err::NOT_INITIALIZED, "contract not initialized" )
}

void rwa_lending::_check_admin() {
   _check_initialized();
   CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NOT_AUTHORIZED, "no auth for operate" )
}

void rwa_lending::_accrue(const symbol_code& asset) {
   auto outcome = unwrap( interest::accrue_reserve(_gstate.pool, asset.raw(), _now()), "accrual failed for " + asset.to_string() );
   if (!outcome.event) return;

   accrual_log log;
   log.asset            = asset;
   log.b_rate           = outcome.event->b_rate;
   log.d_rate           = outcome.event->d_rate;
   log.ir_mod           = outcome.event->ir_mod;
   log.backstop_credit  = outcome.event->backstop_credit;
   log.created_at       = time_point_sec( (uint32_t)outcome.event->timestamp );
   NOTIFY_ACCRUAL_ACTION( log )
}

cdp_data rwa_lending::_get_cdp(const name& owner) {
   cdp_t::tbl_t cdps(_self, _self.value);
   auto itr = cdps.find( owner.value );
   return itr == cdps.end() ? cdp_data{} : itr->cdp;
}

void rwa_lending::_set_cdp(const name& owner, const cdp_data& cdp) {
   cdp_t::tbl_t cdps(_self, _self.value);
   auto itr = cdps.find( owner.value );
   const bool empty = cdp.collateral.empty() && cdp.d_tokens == 0;

   if (itr == cdps.end()) {
      if (empty) return;
      cdps.emplace( _self, [&]( auto& row ) {
         row.owner   = owner;
         row.cdp     = cdp;
      });
   } else if (empty) {
      cdps.erase( itr );
   } else {
      cdps.modify( itr, same_payer, [&]( auto& row ) {
         row.cdp     = cdp;
      });
   }
}

// collateral from the RWA oracle, the debt asset from the crypto oracle
price_map rwa_lending::_load_prices(const cdp_data& cdp) {
   price_map prices;
   for (const auto& [token, amount] : cdp.collateral) {
      if (amount <= 0) continue;
      prices[token] = _get_price( _gstate.rwa_oracle, symbol_code(token) );
   }
   if (cdp.debt_asset)
      prices[*cdp.debt_asset] = _get_price( _gstate.crypto_oracle, symbol_code(*cdp.debt_asset) );
   return prices;
}

price_data rwa_lending::_get_price(const name& oracle, const symbol_code& token) {
   rwaoracle::coin_price_t::idx_t price_tbl(oracle, to_lower_name(token).value);
   auto idx = price_tbl.get_index<"bytime"_n>();
   auto itr = idx.rbegin();
   CHECKC( itr != idx.rend(), err::ORACLE_PRICE_FETCH_FAILED, "no price for " + token.to_string() )

   price_data price;
   price.price       = itr->price.amount;
   price.timestamp   = itr->updated_at.sec_since_epoch();
   price.decimals    = itr->price.symbol.precision();
   check_ok( health::validate_price(price, _now()), "bad price for " + token.to_string() );
   return price;
}

const extended_symbol& rwa_lending::_token(const symbol_code& code) {
   auto itr = _gstate.tokens.find( code.raw() );
   CHECKC( itr != _gstate.tokens.end(), err::TOKEN_CONTRACT_NOT_SET, "token not registered: " + code.to_string() )
   return itr->second;
}

void rwa_lending::_check_token(const name& token_bank, const symbol& sym) {
   const auto& token = _token( sym.code() );
   CHECKC( token.get_contract() == token_bank, err::CONTRACT_MISMATCH, "token contract mismatch: " + token_bank.to_string() )
   CHECKC( token.get_symbol() == sym, err::SYMBOL_MISMATCH, "symbol precision mismatch: " + sym.code().to_string() )
}

void rwa_lending::_transfer_out(const symbol_code& code, const name& to, int128 amount, const string& memo) {
   if (amount <= 0) return;

   const auto& token = _token( code );
   auto quantity = to_asset( amount, token.get_symbol() );
   action(permission_level{get_self(), active_perm}, token.get_contract(), "transfer"_n,
          std::make_tuple(get_self(), to, quantity, memo)).send();
}

uint64_t rwa_lending::_now() const {
   return current_time_point().sec_since_epoch();
}

uint32_t rwa_lending::_block() const {
   return current_block_time().slot;
}

void rwa_lending::_notify_auction(const name& event, uint32_t auction_id, const auction_data& auction,
                                  const name& filler, int128 paid, int128 received) {
   auto log = make_auction_log( event, auction_id, auction, filler, paid, received );
   NOTIFY_AUCTION_ACTION( log )
}

void rwa_lending::_notify_position(const name& event, const name& owner, const asset& quantity, int128 share_delta) {
   position_log log;
   log.event         = event;
   log.owner         = owner;
   log.quantity      = quantity;
   log.share_delta   = share_delta;
   log.created_at    = time_point_sec( current_time_point() );
   NOTIFY_POSITION_ACTION( log )
}

} // namespace rwalend
