#include <eosio/tester.hpp>

#include <entry_guard.hpp>

#include <cstring>

using namespace eosio;
using namespace plstr;

EOSIO_TEST_BEGIN(entry_guard_release_test)
   bool entered = false;
   {
      entry_guard guard( entered );
      CHECK_EQUAL( entered, true )
   }
   CHECK_EQUAL( entered, false )

   //released flag can be taken again
   {
      entry_guard guard( entered );
      CHECK_EQUAL( entered, true )
   }
   CHECK_EQUAL( entered, false )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(entry_guard_nested_test)
   bool entered = true;
   CHECK_ASSERT( "[[24]] reentrant call", ([&]() {
      entry_guard guard( entered );
   }) )

   bool other = false;
   CHECK_ASSERT( "[[24]] reentrant call", ([&]() {
      other = true;
      entry_guard inner( other );
   }) )
EOSIO_TEST_END

int main(int argc, char* argv[]) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(entry_guard_release_test);
   EOSIO_TEST(entry_guard_nested_test);
   return has_failed();
}
