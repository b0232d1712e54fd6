#pragma once

#include <eosio/time.hpp>
#include <plstr.const.hpp>

namespace plstr {

struct weight_st {
   int128_t          weight         = 0;     //supply_b / supply_a, scaled by HIGH_PRECISION
   time_point_sec    updated_at;

   EOSLIB_SERIALIZE( weight_st, (weight)(updated_at) )
};

inline int128_t calc_weight( const int64_t& supply_a, const int64_t& supply_b ) {
   CHECKC( supply_a > 0 && supply_b > 0, err::SUPPLY_INVALID, "weight source supply is zero" )

   int128_t weight = (int128_t)supply_b * HIGH_PRECISION / supply_a;
   CHECKC( weight > 0, err::SUPPLY_INVALID, "weight rounds to zero" )
   return weight;
}

inline bool is_weight_cooling_down( const weight_st& w, const time_point_sec& now, const uint64_t& cooldown_sec ) {
   return now.sec_since_epoch() < (uint64_t)w.updated_at.sec_since_epoch() + cooldown_sec;
}

/**
 * Recalibrate the weight from two external total supplies, at most once per cooldown.
 * Nothing is written when any check fails, so a second call inside the window leaves
 * the stored weight as it was.
 */
inline void update_weight( weight_st& w, const time_point_sec& now, const uint64_t& cooldown_sec,
                           const int64_t& supply_a, const int64_t& supply_b ) {
   CHECKC( !is_weight_cooling_down( w, now, cooldown_sec ), err::TIME_PREMATURE, "weight update cooldown not elapsed" )

   auto weight    = calc_weight( supply_a, supply_b );
   w.weight       = weight;
   w.updated_at   = now;
}

} //namespace plstr
