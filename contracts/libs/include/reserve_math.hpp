#pragma once

#include <eosio/time.hpp>
#include <plstr.const.hpp>

namespace plstr {

struct issue_plan_t {
   int64_t     fee                  = 0;
   int64_t     buyer_shares         = 0;
   int64_t     collector_shares     = 0;   //fee/2 shares minted to the controller
   int64_t     collector_backing    = 0;   //fee/2 backing asset pushed to the controller
};

inline time_point_sec issuance_deadline( const time_point_sec& deployed_at, const uint64_t& window_sec ) {
   return time_point_sec( (uint32_t)(deployed_at.sec_since_epoch() + window_sec) );
}

inline bool is_issuance_active( const time_point_sec& now, const time_point_sec& deployed_at, const uint64_t& window_sec ) {
   return now <= issuance_deadline( deployed_at, window_sec );
}

inline uint64_t issuance_time_remaining( const time_point_sec& now, const time_point_sec& deployed_at, const uint64_t& window_sec ) {
   auto deadline = issuance_deadline( deployed_at, window_sec );
   if( now >= deadline ) return 0;
   return deadline.sec_since_epoch() - now.sec_since_epoch();
}

/**
 * Work out how an issuance of `backing_amount` is distributed.
 * Buyer gets the amount 1:1 minus the fee; half of the fee is minted to the controller
 * as shares and half is paid out to it in backing asset. The odd unit of an odd fee
 * stays in the reserve.
 */
inline issue_plan_t plan_issue( const int64_t& backing_amount, const int64_t& min_liquidity, const uint16_t& fee_bps,
                                const time_point_sec& now, const time_point_sec& deployed_at, const uint64_t& window_sec ) {
   CHECKC( backing_amount > 0 && backing_amount >= min_liquidity, err::INCORRECT_AMOUNT, "issue amount below minimum liquidity" )
   CHECKC( is_issuance_active( now, deployed_at, window_sec ), err::TIME_EXPIRED, "issuance window closed" )

   issue_plan_t plan;
   plan.fee                = (int64_t)( (int128_t)backing_amount * fee_bps / PCT_BOOST );
   plan.buyer_shares       = backing_amount - plan.fee;
   plan.collector_shares   = plan.fee / 2;
   plan.collector_backing  = plan.fee / 2;
   return plan;
}

/**
 * Pro-rata payout for burning `shares` out of `supply` against `reserve`.
 * Reserve and supply must both be read live in the same action.
 */
inline int64_t calc_redeem_payout( const int64_t& reserve, const int64_t& shares, const int64_t& supply, const int64_t& balance ) {
   CHECKC( shares > 0,          err::INCORRECT_AMOUNT,      "redeem amount must be positive" )
   CHECKC( supply > 0,          err::RESERVE_INSUFFICIENT,  "share supply is zero" )
   CHECKC( shares <= balance,   err::OVERDRAWN,             "insufficient share balance" )
   CHECKC( reserve > 0,         err::RESERVE_INSUFFICIENT,  "reserve is empty" )

   auto payout = (int128_t)reserve * shares / supply;
   CHECKC( payout > 0,          err::RESERVE_INSUFFICIENT,  "redeem payout is zero" )
   ASSERT( payout <= reserve );
   return (int64_t)payout;
}

//backing asset per share, scaled by HIGH_PRECISION
inline int128_t calc_backing_ratio( const int64_t& reserve, const int64_t& supply ) {
   if( supply <= 0 || reserve <= 0 ) return 0;
   return (int128_t)reserve * HIGH_PRECISION / supply;
}

} //namespace plstr
