#pragma once

#include <plstr.const.hpp>
#include <fee_splitter.hpp>

#include <string>

namespace plstr {

enum class transfer_kind: uint8_t {
   EXEMPT   = 0,
   TAXED    = 1
};

struct transfer_plan_t {
   transfer_kind  kind  = transfer_kind::EXEMPT;
   fee_split_t    split;
};

// null endpoints (mint/burn), the token's own custody account and the fee collector move untaxed
inline transfer_kind classify_transfer( const name& from, const name& to, const name& custody, const name& collector ) {
   if( !from || !to )                              return transfer_kind::EXEMPT;
   if( from == custody || to == custody )          return transfer_kind::EXEMPT;
   if( from == collector || to == collector )      return transfer_kind::EXEMPT;
   return transfer_kind::TAXED;
}

/**
 * Resolve how a transfer of `amount` moves through the ledger.
 * The minimum only binds taxed transfers; exempt ones pass the full amount untouched.
 */
inline transfer_plan_t plan_transfer( const transfer_kind& kind, const int64_t& amount, const int64_t& min_amount,
                                      const uint16_t& fee_bps, const uint8_t& burn_pct ) {
   CHECKC( amount > 0, err::NOT_POSITIVE, "must transfer positive quantity" )

   transfer_plan_t plan;
   plan.kind = kind;
   switch( kind ) {
      case transfer_kind::EXEMPT:
         plan.split.net = amount;
         break;
      case transfer_kind::TAXED:
         CHECKC( amount >= min_amount, err::INCORRECT_AMOUNT, "transfer amount below minimum" )
         plan.split = split_fee( amount, fee_bps, burn_pct );
         break;
   }
   return plan;
}

/**
 * PLSTR transfer: the minimum binds every transfer, exempt or not. Taxed transfers burn the
 * whole fee, nothing is redirected.
 */
inline transfer_plan_t plan_burning_transfer( const name& from, const name& to, const name& custody,
                                              const int64_t& amount, const int64_t& min_amount ) {
   CHECKC( amount > 0,            err::NOT_POSITIVE,     "must transfer positive quantity" )
   CHECKC( amount >= min_amount,  err::INCORRECT_AMOUNT, "transfer amount below minimum" )
   return plan_transfer( classify_transfer( from, to, custody, custody ), amount, 0, PLSTR_BURN_BPS, PCT_HUNDRED );
}

// incoming token notification must come from the configured token contract and carry the expected memo
inline void check_incoming_transfer( const name& token_bank, const asset& quant, const std::string& memo,
                                     const extended_symbol& expected, const std::string& expected_memo ) {
   CHECKC( token_bank == expected.get_contract(),  err::CONTRACT_MISMATCH, "token contract mismatch" )
   CHECKC( quant.symbol == expected.get_symbol(),  err::SYMBOL_MISMATCH,   "token symbol mismatch" )
   CHECKC( quant.amount > 0,                       err::NOT_POSITIVE,      "must transfer positive quantity" )
   CHECKC( memo == expected_memo,                  err::MEMO_FORMAT_ERROR, "memo must be: " + expected_memo )
}

} //namespace plstr
