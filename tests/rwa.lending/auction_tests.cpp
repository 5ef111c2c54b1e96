#include <test.pool.hpp>

#include <rwa.lending/auction.hpp>
#include <rwa.lending/lending.hpp>

using namespace rwalend;
using namespace rwalend::test;

namespace {

static constexpr uint32_t START = 5000;
static constexpr int128   HALF  = XRATE_SCALE / 2;
static constexpr uint64_t LATER = NOW + 1000;

// 1000 TBILL against 800 USDC of debt: 750 / 800, insolvent
struct liquidation_fixture {
   pool_state  pool = active_pool();
   cdp_data    cdp  = make_cdp(1000, 800);
   price_map   prices = unit_prices();

   liquidation_fixture() {
      pool.reserves[USDC].d_supply = 800;
   }

   uint32_t open(uint32_t percent) {
      auto auction = user_liquidation_auction::initiate(pool, ALICE, cdp, TBILL, USDC, percent, prices, START);
      BOOST_REQUIRE( auction.ok() );
      return store_auction(pool, auction.value, user_liquidation_auction::ID_OFFSET, (uint32_t)NOW);
   }
};

struct bad_debt_fixture {
   pool_state  pool = active_pool();
   cdp_data    cdp  = make_cdp(0, 500);

   bad_debt_fixture() {
      pool.reserves[USDC].d_supply = 500;
      pool.backstop_total          = 1000;
   }

   uint32_t open() {
      auto auction = bad_debt_auction::create(pool, ALICE, cdp, START);
      BOOST_REQUIRE( auction.ok() );
      return store_auction(pool, auction.value, bad_debt_auction::ID_OFFSET, (uint32_t)NOW);
   }
};

struct interest_fixture {
   pool_state  pool = active_pool();

   interest_fixture() {
      pool.reserves[USDC].backstop_credit = 200'0000000;
      pool.pool_balances[USDC]            = 1000'0000000;
   }

   uint32_t open() {
      auto auction = interest_auction::create(pool, POOL, USDC, START);
      BOOST_REQUIRE( auction.ok() );
      return store_auction(pool, auction.value, interest_auction::ID_OFFSET, (uint32_t)NOW);
   }
};

}

BOOST_AUTO_TEST_SUITE(auction_tests)

BOOST_AUTO_TEST_CASE( user_liquidation_modifiers ) {
   auto m = user_liquidation_auction::modifiers(0);
   BOOST_REQUIRE_EQUAL( m.lot, 0 );
   BOOST_REQUIRE_EQUAL( m.bid, XRATE_SCALE );

   m = user_liquidation_auction::modifiers(100);
   BOOST_REQUIRE_EQUAL( m.lot, HALF );
   BOOST_REQUIRE_EQUAL( m.bid, XRATE_SCALE );

   m = user_liquidation_auction::modifiers(200);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, XRATE_SCALE );

   m = user_liquidation_auction::modifiers(300);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, HALF );

   m = user_liquidation_auction::modifiers(400);
   BOOST_REQUIRE_EQUAL( m.bid, 0 );
   m = user_liquidation_auction::modifiers(10'000);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, 0 );
}

BOOST_AUTO_TEST_CASE( bad_debt_and_interest_modifiers ) {
   auto m = bad_debt_auction::modifiers(0);
   BOOST_REQUIRE_EQUAL( m.lot, 0 );
   BOOST_REQUIRE_EQUAL( m.bid, XRATE_SCALE );

   m = bad_debt_auction::modifiers(200);
   BOOST_REQUIRE_EQUAL( m.lot, HALF );
   BOOST_REQUIRE_EQUAL( m.bid, HALF );

   m = bad_debt_auction::modifiers(400);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, 0 );

   m = interest_auction::modifiers(0);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, XRATE_SCALE );

   m = interest_auction::modifiers(100);
   BOOST_REQUIRE_EQUAL( m.lot, XRATE_SCALE );
   BOOST_REQUIRE_EQUAL( m.bid, HALF );

   m = interest_auction::modifiers(250);
   BOOST_REQUIRE_EQUAL( m.bid, 0 );
}

BOOST_AUTO_TEST_CASE( modifiers_reject_a_clock_behind_the_start ) {
   auction_data auction;
   auction.type  = (uint8_t)auction_type::BAD_DEBT;
   auction.block = START;

   BOOST_REQUIRE_EQUAL( blocks_elapsed(auction, START - 1).code, err::INVALID_LEDGER_SEQUENCE );
   BOOST_REQUIRE_EQUAL( modifiers_of(auction, START - 1).code, err::INVALID_LEDGER_SEQUENCE );

   auto m = modifiers_of(auction, START + 200);
   BOOST_REQUIRE( m.ok() );
   BOOST_REQUIRE_EQUAL( m.value.lot, HALF );
}

BOOST_AUTO_TEST_CASE( colliding_ids_overwrite ) {
   pool_state pool;
   auction_data first, second;
   first.user   = ALICE;
   first.block  = START;
   second.user  = BOB;
   second.block = START;

   auto id1 = store_auction(pool, first,  BAD_DEBT_ID_OFFSET, (uint32_t)NOW);
   auto id2 = store_auction(pool, second, BAD_DEBT_ID_OFFSET, (uint32_t)NOW);
   BOOST_REQUIRE_EQUAL( id1, id2 );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
   BOOST_REQUIRE_EQUAL( pool.auctions[id1].user, BOB );

   // other kinds land on other ids in the same block
   auto id3 = store_auction(pool, first, INTEREST_AUCTION_ID_OFFSET, (uint32_t)NOW);
   BOOST_REQUIRE_EQUAL( id3, id1 + INTEREST_AUCTION_ID_OFFSET );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 2u );
}

// ===== user liquidation =====

BOOST_FIXTURE_TEST_CASE( liquidation_sizing, liquidation_fixture ) {
   auto auction = user_liquidation_auction::initiate(pool, ALICE, cdp, TBILL, USDC, 5'000'000, prices, START);
   BOOST_REQUIRE( auction.ok() );

   // half the debt, collateral at a 1.125 premium
   BOOST_REQUIRE_EQUAL( auction.value.bid.at(USDC),  400 );
   BOOST_REQUIRE_EQUAL( auction.value.lot.at(TBILL), 450 );
   BOOST_REQUIRE_EQUAL( auction.value.user,  ALICE );
   BOOST_REQUIRE_EQUAL( auction.value.block, START );
}

BOOST_FIXTURE_TEST_CASE( liquidation_preconditions, liquidation_fixture ) {
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::initiate(pool, ALICE, cdp, TBILL, USDC, 0, prices, START).code,
                        err::INVALID_LIQUIDATION_AMOUNT );
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::initiate(pool, ALICE, cdp, TBILL, USDC, 10'000'001, prices, START).code,
                        err::INVALID_LIQUIDATION_AMOUNT );
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::initiate(pool, ALICE, cdp, TBILL, USDT, 5'000'000, prices, START).code,
                        err::CDP_NOT_INSOLVENT );
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::initiate(pool, ALICE, cdp, USDT, USDC, 5'000'000, prices, START).code,
                        err::INSUFFICIENT_COLLATERAL );

   auto healthy = make_cdp(2000, 800);
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::initiate(pool, ALICE, healthy, TBILL, USDC, 5'000'000, prices, START).code,
                        err::CDP_NOT_INSOLVENT );
}

BOOST_FIXTURE_TEST_CASE( liquidation_fill_after_lot_matures, liquidation_fixture ) {
   auto id = open(5'000'000);

   auto res = user_liquidation_auction::fill(pool, cdp, id, prices, START + 200, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.collateral_received, 450 );
   BOOST_REQUIRE_EQUAL( res.value.debt_paid,           400 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned,     400 );
   BOOST_REQUIRE_EQUAL( res.value.health_factor,       10'300'000 );

   BOOST_REQUIRE_EQUAL( cdp.collateral.at(TBILL), 550 );
   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 400 );
   BOOST_REQUIRE_EQUAL( cdp.last_update, LATER );
   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].d_supply, 400 );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 400 );
   BOOST_REQUIRE( pool.auctions.empty() );
}

BOOST_FIXTURE_TEST_CASE( liquidation_fill_rejects_over_liquidation, liquidation_fixture ) {
   auto id = open(5'000'000);

   // no collateral released yet while the full debt is paid: 750 / 400
   auto res = user_liquidation_auction::fill(pool, cdp, id, prices, START, LATER);
   BOOST_REQUIRE_EQUAL( res.code, err::HEALTH_FACTOR_TOO_HIGH );

   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 800 );
   BOOST_REQUIRE_EQUAL( cdp.collateral.at(TBILL), 1000 );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( full_liquidation_is_capped, liquidation_fixture ) {
   auto id = open(10'000'000);

   // clearing every unit of debt leaves an unbounded health factor
   auto res = user_liquidation_auction::fill(pool, cdp, id, prices, START + 200, LATER);
   BOOST_REQUIRE_EQUAL( res.code, err::HEALTH_FACTOR_TOO_HIGH );
}

BOOST_FIXTURE_TEST_CASE( liquidation_fill_after_partial_repay, liquidation_fixture ) {
   auto id = open(5'000'000);

   // the borrower repaid down to 300 dTokens, below the 400 on sale
   cdp.d_tokens                 = 300;
   pool.reserves[USDC].d_supply = 300;

   // covering the bid would clear every dToken, which the health cap rejects
   auto res = user_liquidation_auction::fill(pool, cdp, id, prices, START + 200, LATER);
   BOOST_REQUIRE_EQUAL( res.code, err::HEALTH_FACTOR_TOO_HIGH );

   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 300 );
   BOOST_REQUIRE_EQUAL( cdp.last_update, NOW );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 0 );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( liquidation_fill_lookup, liquidation_fixture ) {
   auto id = open(5'000'000);

   BOOST_REQUIRE_EQUAL( user_liquidation_auction::fill(pool, cdp, id + 1, prices, START + 200, LATER).code, err::AUCTION_NOT_FOUND );
   BOOST_REQUIRE_EQUAL( bad_debt_auction::fill(pool, cdp, id, START + 200, LATER).code, err::AUCTION_NOT_ACTIVE );
   BOOST_REQUIRE_EQUAL( user_liquidation_auction::fill(pool, cdp, id, prices, START - 1, LATER).code, err::INVALID_LEDGER_SEQUENCE );
}

// ===== bad debt =====

BOOST_FIXTURE_TEST_CASE( bad_debt_requires_no_collateral, bad_debt_fixture ) {
   auto with_collateral = make_cdp(1, 500);
   BOOST_REQUIRE_EQUAL( bad_debt_auction::create(pool, ALICE, with_collateral, START).code, err::CDP_NOT_INSOLVENT );

   auto without_debt = make_cdp(0, 0);
   BOOST_REQUIRE_EQUAL( bad_debt_auction::create(pool, ALICE, without_debt, START).code, err::AUCTION_NOT_ACTIVE );

   auto auction = bad_debt_auction::create(pool, ALICE, cdp, START);
   BOOST_REQUIRE( auction.ok() );
   BOOST_REQUIRE_EQUAL( auction.value.bid.at(USDC), 500 );
   BOOST_REQUIRE_EQUAL( auction.value.lot.at(BSTK), 500 );
}

BOOST_FIXTURE_TEST_CASE( bad_debt_fill_burns_what_is_paid, bad_debt_fixture ) {
   auto id = open();

   auto res = bad_debt_auction::fill(pool, cdp, id, START + 300, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.debt_covered,    125 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned, 125 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,   375 );
   BOOST_REQUIRE( !res.value.completed );

   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 375 );
   BOOST_REQUIRE( cdp.debt_asset && *cdp.debt_asset == USDC );
   BOOST_REQUIRE_EQUAL( cdp.last_update, LATER );
   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].d_supply, 375 );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 125 );
   BOOST_REQUIRE_EQUAL( pool.backstop_total, 625 );

   // what is left stays on sale
   BOOST_REQUIRE_EQUAL( pool.auctions[id].bid.at(USDC), 375 );
   BOOST_REQUIRE_EQUAL( pool.auctions[id].lot.at(BSTK), 125 );
}

BOOST_FIXTURE_TEST_CASE( bad_debt_payout_never_exceeds_the_lot, bad_debt_fixture ) {
   auto id = open();

   auto res = bad_debt_auction::fill(pool, cdp, id, START + 200, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.debt_covered,    250 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned, 250 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,   250 );
   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 250 );

   // zero bid: nothing is burned and the rest of the lot goes out once
   res = bad_debt_auction::fill(pool, cdp, id, START + 400, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.debt_covered,    0 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned, 0 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,   250 );

   res = bad_debt_auction::fill(pool, cdp, id, START + 400, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid, 0 );

   BOOST_REQUIRE_EQUAL( pool.backstop_total, 500 );
   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 250 );
   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].d_supply, 250 );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 250 );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( bad_debt_fill_at_start_clears_the_debt, bad_debt_fixture ) {
   auto id = open();

   auto res = bad_debt_auction::fill(pool, cdp, id, START, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,   0 );
   BOOST_REQUIRE_EQUAL( res.value.debt_covered,    500 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned, 500 );
   BOOST_REQUIRE( res.value.completed );

   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 0 );
   BOOST_REQUIRE( !cdp.debt_asset );
   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].d_supply, 0 );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 500 );
   BOOST_REQUIRE_EQUAL( pool.backstop_total, 1000 );
   BOOST_REQUIRE( pool.auctions.empty() );

   BOOST_REQUIRE_EQUAL( bad_debt_auction::fill(pool, cdp, id, START, LATER).code, err::AUCTION_NOT_FOUND );
}

BOOST_FIXTURE_TEST_CASE( bad_debt_payout_bounded_by_backstop, bad_debt_fixture ) {
   pool.backstop_total = 100;
   auto id = open();

   auto res = bad_debt_auction::fill(pool, cdp, id, START + 400, LATER);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,    100 );
   BOOST_REQUIRE_EQUAL( res.value.debt_covered,     0 );
   BOOST_REQUIRE_EQUAL( res.value.d_tokens_burned,  0 );
   BOOST_REQUIRE_EQUAL( pool.backstop_total, 0 );
   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 500 );
   BOOST_REQUIRE_EQUAL( pool.auctions[id].lot.at(BSTK), 400 );
}

BOOST_FIXTURE_TEST_CASE( bad_debt_fill_rejects_new_collateral, bad_debt_fixture ) {
   auto id = open();
   BOOST_REQUIRE_EQUAL( lending::add_collateral(pool, cdp, TBILL, 10, NOW), err::NONE );

   auto res = bad_debt_auction::fill(pool, cdp, id, START + 400, LATER);
   BOOST_REQUIRE_EQUAL( res.code, err::CDP_NOT_INSOLVENT );

   BOOST_REQUIRE_EQUAL( cdp.d_tokens, 500 );
   BOOST_REQUIRE_EQUAL( cdp.collateral.at(TBILL), 10 );
   BOOST_REQUIRE_EQUAL( pool.backstop_total, 1000 );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
}

// ===== interest =====

BOOST_FIXTURE_TEST_CASE( interest_auction_needs_enough_credit, interest_fixture ) {
   pool.reserves[USDC].backstop_credit = MIN_INTEREST_AUCTION_AMOUNT - 1;
   BOOST_REQUIRE_EQUAL( interest_auction::create(pool, POOL, USDC, START).code, err::AUCTION_NOT_ACTIVE );
   BOOST_REQUIRE_EQUAL( interest_auction::create(pool, POOL, USDT, START).code, err::AUCTION_NOT_ACTIVE );

   pool.reserves[USDC].backstop_credit = 200'0000000;
   auto auction = interest_auction::create(pool, POOL, USDC, START);
   BOOST_REQUIRE( auction.ok() );
   BOOST_REQUIRE_EQUAL( auction.value.lot.at(USDC), 200'0000000 );
   BOOST_REQUIRE_EQUAL( auction.value.bid.at(BSTK), 200'0000000 );
}

BOOST_FIXTURE_TEST_CASE( interest_fill_percent, interest_fixture ) {
   auto id = open();

   BOOST_REQUIRE_EQUAL( interest_auction::fill(pool, id, 0, START).code,          err::INVALID_FILL_PERCENT );
   BOOST_REQUIRE_EQUAL( interest_auction::fill(pool, id, 10'000'001, START).code, err::INVALID_FILL_PERCENT );

   auto res = interest_auction::fill(pool, id, 5'000'000, START + 100);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.interest_received, 100'0000000 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,     50'0000000 );
   BOOST_REQUIRE( !res.value.completed );

   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 900'0000000 );
   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].backstop_credit, 100'0000000 );
   BOOST_REQUIRE_EQUAL( pool.backstop_total, 50'0000000 );
   BOOST_REQUIRE_EQUAL( pool.auctions[id].lot.at(USDC), 100'0000000 );

   res = interest_auction::fill(pool, id, 10'000'000, START + 200);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.interest_received, 100'0000000 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,     0 );
   BOOST_REQUIRE( res.value.completed );
   BOOST_REQUIRE( pool.auctions.empty() );
}

BOOST_FIXTURE_TEST_CASE( one_interest_auction_per_asset, interest_fixture ) {
   auto id = open();

   BOOST_REQUIRE_EQUAL( interest_auction::create(pool, POOL, USDC, START + 1).code, err::AUCTION_IN_PROGRESS );

   auto res = interest_auction::fill(pool, id, 10'000'000, START + 300);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.interest_received, 200'0000000 );
   BOOST_REQUIRE( res.value.completed );

   // the credit was sold once
   BOOST_REQUIRE_EQUAL( interest_auction::create(pool, POOL, USDC, START + 301).code, err::AUCTION_NOT_ACTIVE );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 800'0000000 );

   pool.reserves[USDC].backstop_credit = 150'0000000;
   BOOST_REQUIRE( interest_auction::create(pool, POOL, USDC, START + 302).ok() );
}

BOOST_FIXTURE_TEST_CASE( interest_fill_capped_by_credit, interest_fixture ) {
   auto id = open();
   pool.reserves[USDC].backstop_credit = 50'0000000;

   auto res = interest_auction::fill(pool, id, 10'000'000, START + 300);
   BOOST_REQUIRE( res.ok() );
   BOOST_REQUIRE_EQUAL( res.value.interest_received, 50'0000000 );
   BOOST_REQUIRE_EQUAL( res.value.backstop_paid,     0 );
   BOOST_REQUIRE( res.value.completed );

   BOOST_REQUIRE_EQUAL( pool.reserves[USDC].backstop_credit, 0 );
   BOOST_REQUIRE_EQUAL( pool.pool_balances[USDC], 950'0000000 );
   BOOST_REQUIRE( pool.auctions.empty() );
}

BOOST_FIXTURE_TEST_CASE( interest_fill_needs_pool_balance, interest_fixture ) {
   auto id = open();
   pool.pool_balances[USDC] = 0;

   BOOST_REQUIRE_EQUAL( interest_auction::fill(pool, id, 10'000'000, START).code, err::INSUFFICIENT_POOL_BALANCE );
   BOOST_REQUIRE_EQUAL( pool.auctions.size(), 1u );
}

BOOST_AUTO_TEST_SUITE_END()
