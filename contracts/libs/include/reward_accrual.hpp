#pragma once

#include <limits>
#include <plstr.const.hpp>

namespace plstr {

//per-account checkpoint against the global reward_per_share
struct reward_checkpoint_st {
   int128_t    last_reward_per_share   = 0;
   int64_t     unclaimed               = 0;    //reward frozen at the last settlement
   int64_t     balance_a               = 0;    //vault share balances seen at the last settlement
   int64_t     balance_b               = 0;

   EOSLIB_SERIALIZE( reward_checkpoint_st, (last_reward_per_share)(unclaimed)(balance_a)(balance_b) )
};

//reward_per_share increment for `rewards` spread over `total_shares`
inline int128_t calc_reward_per_share_delta( const int64_t& rewards, const int64_t& total_shares ) {
   ASSERT( rewards >= 0 && total_shares >= 0 );
   int128_t new_reward_per_share_delta = 0;
   if( rewards > 0 && total_shares > 0 ) {
      new_reward_per_share_delta = (int128_t)rewards * HIGH_PRECISION / total_shares;
   }
   return new_reward_per_share_delta;
}

inline int64_t calc_sharer_rewards( const int64_t& shares, const int128_t& reward_per_share_delta ) {
   ASSERT( shares >= 0 && reward_per_share_delta >= 0 );
   CHECKC( reward_per_share_delta == 0 || shares <= MAX_INT128 / reward_per_share_delta,
           err::OVERSIZED, "calculated rewards overflow" )
   int128_t rewards = shares * reward_per_share_delta / HIGH_PRECISION;
   CHECKC( rewards <= std::numeric_limits<int64_t>::max(), err::OVERSIZED, "calculated rewards overflow" )
   return (int64_t)rewards;
}

/**
 * Balance that counts for rewards: the A share balance plus the B share balance scaled
 * by the current weight.
 */
inline int64_t calc_weighted_balance( const int64_t& balance_a, const int64_t& balance_b, const int128_t& weight ) {
   ASSERT( balance_a >= 0 && balance_b >= 0 && weight >= 0 );
   CHECKC( weight == 0 || balance_b <= MAX_INT128 / weight, err::OVERSIZED, "weighted balance overflow" )
   int128_t weighted = balance_a + balance_b * weight / HIGH_PRECISION;
   CHECKC( weighted <= std::numeric_limits<int64_t>::max(), err::OVERSIZED, "weighted balance overflow" )
   return (int64_t)weighted;
}

/**
 * Fold `rewards` into the global accumulator.
 * Returns false when nothing is eligible; the deposit then stays unattributed and the
 * accumulator is left untouched.
 */
inline bool accrue_reward( int128_t& reward_per_share, const int64_t& rewards, const int64_t& total_weighted ) {
   if( total_weighted <= 0 ) return false;
   auto delta = calc_reward_per_share_delta( rewards, total_weighted );
   CHECKC( reward_per_share <= MAX_INT128 - delta, err::OVERSIZED, "reward per share overflow" )
   reward_per_share += delta;
   return true;
}

/**
 * Apply an incoming deposit to the accumulator.
 * Returns the part that could not be attributed to any holder.
 */
inline int64_t apply_deposit( int128_t& reward_per_share, const int64_t& amount, const int64_t& min_amount,
                              const int64_t& total_weighted ) {
   CHECKC( amount > 0 && amount >= min_amount, err::INCORRECT_AMOUNT, "deposit amount below minimum" )
   return accrue_reward( reward_per_share, amount, total_weighted ) ? 0 : amount;
}

inline int64_t calc_earned( const reward_checkpoint_st& checkpoint, const int64_t& weighted, const int128_t& reward_per_share ) {
   int128_t delta = reward_per_share - checkpoint.last_reward_per_share;
   ASSERT( delta >= 0 );
   return checkpoint.unclaimed + calc_sharer_rewards( weighted, delta );
}

// freeze what was earned so far and move the checkpoint to the current accumulator
inline int64_t settle_reward( reward_checkpoint_st& checkpoint, const int64_t& weighted, const int128_t& reward_per_share ) {
   checkpoint.unclaimed                = calc_earned( checkpoint, weighted, reward_per_share );
   checkpoint.last_reward_per_share    = reward_per_share;
   return checkpoint.unclaimed;
}

inline int64_t take_reward( reward_checkpoint_st& checkpoint, const int64_t& weighted, const int128_t& reward_per_share ) {
   auto rewards = settle_reward( checkpoint, weighted, reward_per_share );
   CHECKC( rewards > 0, err::NO_REWARD, "no reward to claim" )
   checkpoint.unclaimed = 0;
   return rewards;
}

/**
 * Checkpoint for an account seen for the first time. It starts at the current accumulator,
 * so nothing deposited before the account held shares is owed to it.
 */
inline reward_checkpoint_st open_checkpoint( const int128_t& reward_per_share, const int64_t& balance_a, const int64_t& balance_b ) {
   CHECKC( balance_a > 0 || balance_b > 0, err::RECORD_NOT_FOUND, "no eligible shares to checkpoint" )

   reward_checkpoint_st checkpoint;
   checkpoint.last_reward_per_share = reward_per_share;
   checkpoint.balance_a             = balance_a;
   checkpoint.balance_b             = balance_b;
   return checkpoint;
}

inline int64_t checkpoint_weighted_balance( const reward_checkpoint_st& checkpoint, const int128_t& weight ) {
   return calc_weighted_balance( checkpoint.balance_a, checkpoint.balance_b, weight );
}

/**
 * Settle on the balances held since the last settlement, then record the live balances
 * that accrue from here on. Must run on every change of either share balance.
 */
inline int64_t sync_checkpoint( reward_checkpoint_st& checkpoint, const int128_t& reward_per_share, const int128_t& weight,
                                 const int64_t& live_balance_a, const int64_t& live_balance_b ) {
   ASSERT( live_balance_a >= 0 && live_balance_b >= 0 );
   settle_reward( checkpoint, checkpoint_weighted_balance( checkpoint, weight ), reward_per_share );
   checkpoint.balance_a = live_balance_a;
   checkpoint.balance_b = live_balance_b;
   return checkpoint.unclaimed;
}

inline int64_t take_synced_reward( reward_checkpoint_st& checkpoint, const int128_t& reward_per_share, const int128_t& weight,
                                   const int64_t& live_balance_a, const int64_t& live_balance_b ) {
   auto rewards = sync_checkpoint( checkpoint, reward_per_share, weight, live_balance_a, live_balance_b );
   CHECKC( rewards > 0, err::NO_REWARD, "no reward to claim" )
   checkpoint.unclaimed = 0;
   return rewards;
}

} //namespace plstr
