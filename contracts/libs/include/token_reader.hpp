#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <plstr.const.hpp>

// read-only views over the standard token tables (`accounts` and `stat`) of another contract
namespace plstr { namespace token {

using namespace eosio;

struct account_row {
   asset    balance;

   uint64_t primary_key() const { return balance.symbol.code().raw(); }
};
typedef eosio::multi_index<"accounts"_n, account_row> accounts;

struct currency_stats_row {
   asset    supply;
   asset    max_supply;
   name     issuer;

   uint64_t primary_key() const { return supply.symbol.code().raw(); }
};
typedef eosio::multi_index<"stat"_n, currency_stats_row> stats;

// zero when the owner has no row yet
inline asset get_balance( const name& token_contract, const name& owner, const symbol& sym ) {
   accounts accts( token_contract, owner.value );
   auto itr = accts.find( sym.code().raw() );
   if( itr == accts.end() ) return asset(0, sym);
   CHECKC( itr->balance.symbol == sym, err::SYMBOL_MISMATCH, "balance symbol mismatch: " + itr->balance.to_string() )
   return itr->balance;
}

inline asset get_supply( const name& token_contract, const symbol& sym ) {
   stats statstable( token_contract, sym.code().raw() );
   auto itr = statstable.find( sym.code().raw() );
   if( itr == statstable.end() ) return asset(0, sym);
   CHECKC( itr->supply.symbol == sym, err::SYMBOL_MISMATCH, "supply symbol mismatch: " + itr->supply.to_string() )
   return itr->supply;
}

inline asset get_balance( const extended_symbol& token, const name& owner ) {
   return get_balance( token.get_contract(), owner, token.get_symbol() );
}

inline asset get_supply( const extended_symbol& token ) {
   return get_supply( token.get_contract(), token.get_symbol() );
}

} } //namespace plstr::token
