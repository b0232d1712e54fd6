#pragma once

#include <plstr.const.hpp>

namespace plstr {

struct fee_split_t {
   int64_t     net         = 0;
   int64_t     burned      = 0;
   int64_t     redirected  = 0;

   int64_t fee() const { return burned + redirected; }
};

/**
 * Split a gross amount into the part that reaches the recipient, the part that is
 * destroyed and the part that is redirected to the fee collector.
 *
 * The fee is truncated once and then divided, so burned + redirected == fee and
 * net + fee == amount hold exactly.
 *
 * @param amount     gross amount, non-negative
 * @param fee_bps    fee rate in basis points of PCT_BOOST
 * @param burn_pct   share of the fee that is burnt, in percent
 */
inline fee_split_t split_fee( const int64_t& amount, const uint16_t& fee_bps, const uint8_t& burn_pct ) {
   ASSERT( amount >= 0 && fee_bps <= PCT_BOOST && burn_pct <= PCT_HUNDRED );

   auto fee          = (int64_t)( (int128_t)amount * fee_bps / PCT_BOOST );
   fee_split_t split;
   split.burned      = (int64_t)( (int128_t)fee * burn_pct / PCT_HUNDRED );
   split.redirected  = fee - split.burned;
   split.net         = amount - fee;
   return split;
}

} //namespace plstr
