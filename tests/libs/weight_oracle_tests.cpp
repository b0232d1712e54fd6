#include <eosio/tester.hpp>

#include <weight_oracle.hpp>

#include <cstring>

using namespace eosio;
using namespace plstr;

static const time_point_sec START = time_point_sec(1'700'000'000);

static time_point_sec after( const uint64_t& offset ) {
   return time_point_sec( (uint32_t)(START.sec_since_epoch() + offset) );
}

EOSIO_TEST_BEGIN(calc_weight_test)
   CHECK_EQUAL( calc_weight( 1000, 2500 ) == HIGH_PRECISION * 5 / 2, true )
   CHECK_EQUAL( calc_weight( 1000, 1000 ) == HIGH_PRECISION, true )
   CHECK_EQUAL( calc_weight( 4, 1 ) == HIGH_PRECISION / 4, true )

   CHECK_ASSERT( "[[22]] weight source supply is zero", ([&]() {
      calc_weight( 0, 1000 );
   }) )
   CHECK_ASSERT( "[[22]] weight source supply is zero", ([&]() {
      calc_weight( 1000, 0 );
   }) )
   CHECK_ASSERT( "[[22]] weight rounds to zero", ([&]() {
      calc_weight( 2'000'000'000'000'000'000, 1 );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(update_weight_test)
   weight_st w;
   CHECK_EQUAL( w.weight == 0, true )

   update_weight( w, START, WEIGHT_COOLDOWN_SEC, 1000, 2500 );
   CHECK_EQUAL( w.weight == HIGH_PRECISION * 5 / 2, true )
   CHECK_EQUAL( w.updated_at == START, true )
   CHECK_EQUAL( is_weight_cooling_down( w, after(1), WEIGHT_COOLDOWN_SEC ), true )

   //a second update inside the window is rejected
   CHECK_ASSERT( "[[13]] weight update cooldown not elapsed", ([&]() {
      auto copy = w;
      update_weight( copy, after(WEIGHT_COOLDOWN_SEC - 1), WEIGHT_COOLDOWN_SEC, 1000, 5000 );
   }) )
   CHECK_EQUAL( w.weight == HIGH_PRECISION * 5 / 2, true )

   //exactly one cooldown later is allowed
   CHECK_EQUAL( is_weight_cooling_down( w, after(WEIGHT_COOLDOWN_SEC), WEIGHT_COOLDOWN_SEC ), false )
   update_weight( w, after(WEIGHT_COOLDOWN_SEC), WEIGHT_COOLDOWN_SEC, 1000, 5000 );
   CHECK_EQUAL( w.weight == HIGH_PRECISION * 5, true )
   CHECK_EQUAL( w.updated_at == after(WEIGHT_COOLDOWN_SEC), true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(failed_update_keeps_state_test)
   weight_st w;
   update_weight( w, START, WEIGHT_COOLDOWN_SEC, 1000, 2500 );

   weight_st attempt = w;
   CHECK_ASSERT( "[[22]] weight source supply is zero", ([&]() {
      update_weight( attempt, after(2 * WEIGHT_COOLDOWN_SEC), WEIGHT_COOLDOWN_SEC, 0, 2500 );
   }) )
   CHECK_EQUAL( attempt.weight == w.weight, true )
   CHECK_EQUAL( attempt.updated_at == START, true )
EOSIO_TEST_END

int main(int argc, char* argv[]) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(calc_weight_test);
   EOSIO_TEST(update_weight_test);
   EOSIO_TEST(failed_update_keeps_state_test);
   return has_failed();
}
