#include <eosio/tester.hpp>

#include <fee_splitter.hpp>
#include <reserve_math.hpp>
#include <transfer_policy.hpp>

#include <cstring>
#include <map>

using namespace eosio;
using namespace plstr;

static const time_point_sec   DEPLOYED_AT    = time_point_sec(1'700'000'000);
static constexpr uint64_t     WINDOW_SEC     = 180 * DAY_SECONDS;
static constexpr int64_t      MIN_LIQUIDITY  = 1'0000;
static constexpr int64_t      MIN_TRANSFER   = 1'0000;

static time_point_sec at( const uint64_t& offset ) {
   return time_point_sec( (uint32_t)(DEPLOYED_AT.sec_since_epoch() + offset) );
}

// in-memory vault ledger driven by the same arithmetic as the contract
struct vault_model {
   name                       controller     = "plstr.ctrl"_n;
   name                       custody        = "plstr.vaulta"_n;
   int64_t                    reserve        = 0;
   int64_t                    supply         = 0;
   int64_t                    total_minted   = 0;
   int64_t                    total_burned   = 0;
   std::map<name, int64_t>    balances;

   issue_plan_t issue( const name& buyer, const int64_t& amount, const time_point_sec& now ) {
      auto plan = plan_issue( amount, MIN_LIQUIDITY, ISSUE_FEE_BPS, now, DEPLOYED_AT, WINDOW_SEC );
      reserve                 += amount - plan.collector_backing;
      balances[buyer]         += plan.buyer_shares;
      balances[controller]    += plan.collector_shares;
      supply                  += plan.buyer_shares + plan.collector_shares;
      total_minted            += plan.buyer_shares + plan.collector_shares;
      return plan;
   }

   fee_split_t transfer( const name& from, const name& to, const int64_t& amount ) {
      auto plan = plan_transfer( classify_transfer( from, to, custody, controller ), amount, MIN_TRANSFER,
                                 TRANSFER_TAX_BPS, TRANSFER_BURN_PCT );
      ASSERT( balances[from] >= amount );
      balances[from]          -= amount;
      balances[controller]    += plan.split.redirected;
      balances[to]            += plan.split.net;
      supply                  -= plan.split.burned;
      total_burned            += plan.split.burned;
      return plan.split;
   }

   int64_t redeem( const name& owner, const int64_t& shares ) {
      auto payout = calc_redeem_payout( reserve, shares, supply, balances[owner] );
      balances[owner]   -= shares;
      supply            -= shares;
      total_burned      += shares;
      reserve           -= payout;
      return payout;
   }

   bool invariants_hold() const {
      return supply >= 0 && reserve >= 0 && supply <= total_minted && supply == total_minted - total_burned;
   }
};

// reserve/supply did not go down
static bool ratio_not_decreased( const int64_t& prev_reserve, const int64_t& prev_supply, const int64_t& reserve, const int64_t& supply ) {
   if( prev_supply == 0 || supply == 0 ) return true;
   return (int128_t)reserve * prev_supply >= (int128_t)prev_reserve * supply;
}

EOSIO_TEST_BEGIN(issue_plan_test)
   //100.0000 backing in
   auto plan = plan_issue( 100'0000, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(0), DEPLOYED_AT, WINDOW_SEC );
   CHECK_EQUAL( plan.fee, 4'5000 )
   CHECK_EQUAL( plan.buyer_shares, 95'5000 )
   CHECK_EQUAL( plan.collector_shares, 2'2500 )
   CHECK_EQUAL( plan.collector_backing, 2'2500 )

   //odd fee: the remainder unit stays in the reserve
   plan = plan_issue( 1'1000, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(0), DEPLOYED_AT, WINDOW_SEC );
   CHECK_EQUAL( plan.fee, 495 )
   CHECK_EQUAL( plan.buyer_shares, 1'0505 )
   CHECK_EQUAL( plan.collector_shares, 247 )
   CHECK_EQUAL( plan.collector_backing, 247 )

   CHECK_ASSERT( "[[19]] issue amount below minimum liquidity", ([&]() {
      plan_issue( MIN_LIQUIDITY - 1, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(0), DEPLOYED_AT, WINDOW_SEC );
   }) )
   CHECK_ASSERT( "[[19]] issue amount below minimum liquidity", ([&]() {
      plan_issue( 0, 0, ISSUE_FEE_BPS, at(0), DEPLOYED_AT, WINDOW_SEC );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(issuance_window_test)
   CHECK_EQUAL( is_issuance_active( at(0), DEPLOYED_AT, WINDOW_SEC ), true )
   CHECK_EQUAL( is_issuance_active( at(WINDOW_SEC), DEPLOYED_AT, WINDOW_SEC ), true )
   CHECK_EQUAL( is_issuance_active( at(WINDOW_SEC + 1), DEPLOYED_AT, WINDOW_SEC ), false )

   CHECK_EQUAL( issuance_time_remaining( at(0), DEPLOYED_AT, WINDOW_SEC ), WINDOW_SEC )
   CHECK_EQUAL( issuance_time_remaining( at(WINDOW_SEC - 60), DEPLOYED_AT, WINDOW_SEC ), 60u )
   CHECK_EQUAL( issuance_time_remaining( at(WINDOW_SEC), DEPLOYED_AT, WINDOW_SEC ), 0u )
   CHECK_EQUAL( issuance_time_remaining( at(WINDOW_SEC + DAY_SECONDS), DEPLOYED_AT, WINDOW_SEC ), 0u )

   //last second of the window still issues
   auto plan = plan_issue( 10'0000, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(WINDOW_SEC), DEPLOYED_AT, WINDOW_SEC );
   CHECK_EQUAL( plan.buyer_shares, 9'5500 )

   CHECK_ASSERT( "[[12]] issuance window closed", ([&]() {
      plan_issue( 10'0000, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(WINDOW_SEC + 1), DEPLOYED_AT, WINDOW_SEC );
   }) )

   //the amount is validated before the window
   CHECK_ASSERT( "[[19]] issue amount below minimum liquidity", ([&]() {
      plan_issue( 1, MIN_LIQUIDITY, ISSUE_FEE_BPS, at(WINDOW_SEC + 1), DEPLOYED_AT, WINDOW_SEC );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(redeem_payout_test)
   CHECK_EQUAL( calc_redeem_payout( 97'7500, 95'5000, 97'7500, 95'5000 ), 95'5000 )
   CHECK_EQUAL( calc_redeem_payout( 200, 10, 100, 10 ), 20 )
   CHECK_EQUAL( calc_redeem_payout( 100, 1, 3, 1 ), 33 )

   CHECK_ASSERT( "[[21]] share supply is zero", ([&]() {
      calc_redeem_payout( 100, 10, 0, 10 );
   }) )
   CHECK_ASSERT( "[[19]] redeem amount must be positive", ([&]() {
      calc_redeem_payout( 100, 0, 10, 10 );
   }) )
   CHECK_ASSERT( "[[20]] insufficient share balance", ([&]() {
      calc_redeem_payout( 100, 11, 20, 10 );
   }) )
   CHECK_ASSERT( "[[21]] reserve is empty", ([&]() {
      calc_redeem_payout( 0, 10, 20, 10 );
   }) )
   CHECK_ASSERT( "[[21]] redeem payout is zero", ([&]() {
      calc_redeem_payout( 1, 1, 3, 1 );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(backing_ratio_test)
   CHECK_EQUAL( calc_backing_ratio( 100, 100 ) == HIGH_PRECISION, true )
   CHECK_EQUAL( calc_backing_ratio( 200, 100 ) == 2 * HIGH_PRECISION, true )
   CHECK_EQUAL( calc_backing_ratio( 100, 0 ) == 0, true )
   CHECK_EQUAL( calc_backing_ratio( 0, 100 ) == 0, true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(vault_sequence_test)
   vault_model vault;
   const name alice  = "alice"_n;
   const name bob    = "bob"_n;
   const name carol  = "carol"_n;

   vault.issue( alice, 100'0000, at(0) );
   CHECK_EQUAL( vault.balances[alice], 95'5000 )
   CHECK_EQUAL( vault.balances[vault.controller], 2'2500 )
   CHECK_EQUAL( vault.reserve, 97'7500 )
   CHECK_EQUAL( vault.supply, 97'7500 )
   CHECK_EQUAL( vault.invariants_hold(), true )

   auto prev_reserve = vault.reserve;
   auto prev_supply  = vault.supply;

   auto split = vault.transfer( alice, bob, 1000'0 );
   CHECK_EQUAL( split.burned + split.redirected + split.net, 1000'0 )
   CHECK_EQUAL( vault.balances[bob], 955'0 )
   CHECK_EQUAL( vault.invariants_hold(), true )
   CHECK_EQUAL( ratio_not_decreased( prev_reserve, prev_supply, vault.reserve, vault.supply ), true )
   prev_reserve = vault.reserve;
   prev_supply  = vault.supply;

   //controller and custody move untaxed
   split = vault.transfer( vault.controller, carol, 1'0000 );
   CHECK_EQUAL( split.fee(), 0 )
   CHECK_EQUAL( vault.balances[carol], 1'0000 )

   CHECK_ASSERT( "[[19]] transfer amount below minimum", ([&]() {
      vault.transfer( bob, carol, MIN_TRANSFER - 1 );
   }) )

   vault.issue( carol, 33'3333, at(DAY_SECONDS) );
   CHECK_EQUAL( vault.invariants_hold(), true )
   CHECK_EQUAL( ratio_not_decreased( prev_reserve, prev_supply, vault.reserve, vault.supply ), true )
   prev_reserve = vault.reserve;
   prev_supply  = vault.supply;

   const name holders[] = { alice, bob, carol, vault.controller };
   for( auto holder : holders ) {
      auto shares = vault.balances[holder] / 2;
      if( shares == 0 ) continue;
      vault.redeem( holder, shares );
      CHECK_EQUAL( vault.invariants_hold(), true )
      CHECK_EQUAL( ratio_not_decreased( prev_reserve, prev_supply, vault.reserve, vault.supply ), true )
      prev_reserve = vault.reserve;
      prev_supply  = vault.supply;
   }

   for( auto holder : holders ) {
      if( vault.balances[holder] == 0 ) continue;
      vault.redeem( holder, vault.balances[holder] );
      CHECK_EQUAL( vault.invariants_hold(), true )
   }
   CHECK_EQUAL( vault.supply, 0 )
   CHECK_EQUAL( vault.reserve >= 0, true )

   CHECK_ASSERT( "[[21]] share supply is zero", ([&]() {
      vault.redeem( alice, 1 );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(round_trip_not_profitable_test)
   const int64_t deposits[] = { 1'0000, 1'2345, 100'0000, 7'777'7777 };
   for( auto deposit : deposits ) {
      vault_model vault;
      vault.issue( "alice"_n, 50'0000, at(0) );
      vault.issue( "bob"_n, deposit, at(60) );

      auto payout = vault.redeem( "bob"_n, vault.balances["bob"_n] );
      CHECK_EQUAL( payout <= deposit, true )
      CHECK_EQUAL( vault.invariants_hold(), true )
   }
EOSIO_TEST_END

int main(int argc, char* argv[]) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(issue_plan_test);
   EOSIO_TEST(issuance_window_test);
   EOSIO_TEST(redeem_payout_test);
   EOSIO_TEST(backing_ratio_test);
   EOSIO_TEST(vault_sequence_test);
   EOSIO_TEST(round_trip_not_profitable_test);
   return has_failed();
}
