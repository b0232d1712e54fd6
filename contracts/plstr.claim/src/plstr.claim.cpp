#include <plstr.claim/plstr.claim.hpp>

#include <entry_guard.hpp>
#include <fee_splitter.hpp>
#include <reserve_math.hpp>
#include <reward_accrual.hpp>
#include <token_reader.hpp>
#include <transfer_policy.hpp>
#include <weight_oracle.hpp>

#include <algorithm>

namespace plstr {

using namespace std;

void plstr_claim::init( const extended_symbol& deposit_token, const symbol& plstr_symbol,
                        const extended_symbol& share_a, const extended_symbol& share_b,
                        const extended_symbol& weight_source_a, const extended_symbol& weight_source_b,
                        const asset& min_deposit, const asset& min_transfer ) {
   require_auth( _self );
   CHECKC( !_gstate.initialized,                                 err::RECORD_EXISTING,   "claim vault already initialized" )
   CHECKC( is_account(deposit_token.get_contract()),             err::ACCOUNT_INVALID,   "deposit token contract invalid" )
   CHECKC( deposit_token.get_contract() != _self,                err::CONTRACT_MISMATCH, "deposit token cannot be PLSTR" )
   CHECKC( plstr_symbol.is_valid(),                              err::SYMBOL_MISMATCH,   "invalid PLSTR symbol" )
   CHECKC( plstr_symbol.precision() == deposit_token.get_symbol().precision(),
                                                                 err::SYMBOL_MISMATCH,   "PLSTR precision must equal deposit precision" )
   CHECKC( is_account(share_a.get_contract()) && is_account(share_b.get_contract()),
                                                                 err::ACCOUNT_INVALID,   "vault share contract invalid" )
   CHECKC( share_a != share_b,                                   err::PARAM_ERROR,       "vault shares must differ" )
   CHECKC( share_a.get_symbol().precision() == share_b.get_symbol().precision(),
                                                                 err::SYMBOL_MISMATCH,   "vault share precisions must match" )
   CHECKC( is_account(weight_source_a.get_contract()) && is_account(weight_source_b.get_contract()),
                                                                 err::ACCOUNT_INVALID,   "weight source contract invalid" )
   CHECKC( min_deposit.symbol == deposit_token.get_symbol() && min_deposit.amount > 0,
                                                                 err::PARAM_ERROR,       "invalid min deposit: " + min_deposit.to_string() )
   CHECKC( min_transfer.symbol == plstr_symbol && min_transfer.amount >= 0,
                                                                 err::PARAM_ERROR,       "invalid min transfer: " + min_transfer.to_string() )

   stats statstable( _self, plstr_symbol.code().raw() );
   CHECKC( statstable.find( plstr_symbol.code().raw() ) == statstable.end(), err::RECORD_EXISTING, "PLSTR already exists" )
   statstable.emplace( _self, [&]( auto& s ) {
      s.supply       = asset(0, plstr_symbol);
      s.max_supply   = asset(asset::max_amount, plstr_symbol);
      s.issuer       = _self;
   });

   _gstate.deposit_token         = deposit_token;
   _gstate.plstr_symbol          = plstr_symbol;
   _gstate.share_a               = share_a;
   _gstate.share_b               = share_b;
   _gstate.weight_source_a       = weight_source_a;
   _gstate.weight_source_b       = weight_source_b;
   _gstate.min_deposit           = min_deposit;
   _gstate.min_transfer          = min_transfer;
   _gstate.total_minted          = asset(0, plstr_symbol);
   _gstate.total_burned          = asset(0, plstr_symbol);
   _gstate.total_deposited       = asset(0, deposit_token.get_symbol());
   _gstate.unattributed_deposits = asset(0, deposit_token.get_symbol());
   _gstate.initialized           = true;
}

void plstr_claim::updateweight( const name& caller ) {
   require_auth( caller );
   entry_guard guard( _entered );
   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )

   auto now       = time_point_sec(current_time_point());
   auto supply_a  = token::get_supply( _gstate.weight_source_a );
   auto supply_b  = token::get_supply( _gstate.weight_source_b );
   update_weight( _gstate.weight, now, WEIGHT_COOLDOWN_SEC, supply_a.amount, supply_b.amount );

   WEIGHT_LOG( _gstate.weight.weight )
}

/**
 * @param memo: deposit
 */
void plstr_claim::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )
   check_incoming_transfer( get_first_receiver(), quant, memo, _gstate.deposit_token, "deposit" );

   _deposit( from, quant );
}

void plstr_claim::_deposit( const name& from, const asset& quant ) {
   entry_guard guard( _entered );

   //nothing eligible: the deposit stays in the pool without being attributed
   auto unattributed = apply_deposit( _gstate.reward_per_share, quant.amount, _gstate.min_deposit.amount,
                                      _total_weighted_supply() );
   _gstate.unattributed_deposits   += asset(unattributed, quant.symbol);
   _gstate.total_deposited         += quant;

   DEPOSIT_LOG( from, quant )
}

void plstr_claim::onissuelog( const name& buyer, const name& collector, const asset& shares, const asset& fee ) {
   if( !_is_vault_share( get_first_receiver(), shares.symbol ) ) return;
   entry_guard guard( _entered );

   _sync_holders( { buyer, collector } );
}

void plstr_claim::onredeemlog( const name& redeemer, const asset& shares, const asset& payout ) {
   if( !_is_vault_share( get_first_receiver(), shares.symbol ) ) return;
   entry_guard guard( _entered );

   _sync_holders( { redeemer } );
}

void plstr_claim::ontaxlog( const name& from, const name& to, const name& collector,
                            const asset& net, const asset& redirected, const asset& burned ) {
   if( !_is_vault_share( get_first_receiver(), net.symbol ) ) return;
   entry_guard guard( _entered );

   _sync_holders( { from, to, collector } );
}

void plstr_claim::claim( const name& claimer ) {
   require_auth( claimer );
   entry_guard guard( _entered );
   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )

   auto claimers  = claimer_t::tbl_t(_self, _self.value);
   auto itr       = claimers.find( claimer.value );
   CHECKC( itr != claimers.end(), err::NO_REWARD, "no reward to claim" )

   auto balance_a    = token::get_balance( _gstate.share_a, claimer ).amount;
   auto balance_b    = token::get_balance( _gstate.share_b, claimer ).amount;
   auto checkpoint   = itr->reward;
   auto rewards      = asset( take_synced_reward( checkpoint, _gstate.reward_per_share, _gstate.weight.weight,
                                                  balance_a, balance_b ),
                              _gstate.plstr_symbol );

   claimers.modify( itr, same_payer, [&]( auto& c ) {
      c.reward       = checkpoint;
      c.claimed      += rewards;
      c.updated_at   = time_point_sec(current_time_point());
   });

   _mint( claimer, rewards );
   _gstate.total_minted += rewards;

   CLAIM_LOG( claimer, rewards )
}

void plstr_claim::settle( const name& account ) {
   require_auth( account );
   entry_guard guard( _entered );
   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )

   _sync_claimer( account );
}

reward_checkpoint_st plstr_claim::_sync_claimer( const name& account ) {
   auto balance_a = token::get_balance( _gstate.share_a, account ).amount;
   auto balance_b = token::get_balance( _gstate.share_b, account ).amount;
   auto now       = time_point_sec(current_time_point());
   auto claimers  = claimer_t::tbl_t(_self, _self.value);
   auto itr       = claimers.find( account.value );

   if( itr == claimers.end() ) {
      auto checkpoint = open_checkpoint( _gstate.reward_per_share, balance_a, balance_b );
      claimers.emplace( _self, [&]( auto& c ) {
         c.owner        = account;
         c.reward       = checkpoint;
         c.claimed      = asset(0, _gstate.plstr_symbol);
         c.updated_at   = now;
      });
      return checkpoint;
   }

   auto checkpoint = itr->reward;
   sync_checkpoint( checkpoint, _gstate.reward_per_share, _gstate.weight.weight, balance_a, balance_b );
   claimers.modify( itr, same_payer, [&]( auto& c ) {
      c.reward       = checkpoint;
      c.updated_at   = now;
   });
   return checkpoint;
}

// accounts without a checkpoint and without shares have nothing to settle
void plstr_claim::_sync_holders( const std::vector<name>& holders ) {
   auto claimers = claimer_t::tbl_t(_self, _self.value);
   for( auto it = holders.begin(); it != holders.end(); it++ ) {
      if( it->value == 0 || std::find( holders.begin(), it, *it ) != it ) continue;

      if( claimers.find( it->value ) == claimers.end()
            && token::get_balance( _gstate.share_a, *it ).amount == 0
            && token::get_balance( _gstate.share_b, *it ).amount == 0 ) continue;

      _sync_claimer( *it );
   }
}

bool plstr_claim::_is_vault_share( const name& bank, const symbol& sym ) {
   if( !_gstate.initialized ) return false;
   return ( bank == _gstate.share_a.get_contract() && sym == _gstate.share_a.get_symbol() )
       || ( bank == _gstate.share_b.get_contract() && sym == _gstate.share_b.get_symbol() );
}

void plstr_claim::redeem( const name& owner, const asset& quantity ) {
   require_auth( owner );
   entry_guard guard( _entered );

   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )
   CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity" )
   CHECKC( quantity.symbol == _gstate.plstr_symbol, err::SYMBOL_MISMATCH, "PLSTR symbol mismatch" )

   auto reserve   = _get_reserve();
   auto supply    = _get_supply();
   auto balance   = token::get_balance( _self, owner, _gstate.plstr_symbol );
   auto payout    = asset( calc_redeem_payout( reserve.amount, quantity.amount, supply.amount, balance.amount ),
                           _gstate.deposit_token.get_symbol() );

   _burn( owner, quantity );
   _gstate.total_burned += quantity;

   TRANSFER( _gstate.deposit_token.get_contract(), owner, payout, "redeem PLSTR" )
   REDEEM_LOG( owner, quantity, payout )
}

void plstr_claim::transfer( const name& from, const name& to, const asset& quantity, const string& memo ) {
   require_auth( from );
   entry_guard guard( _entered );

   CHECKC( from != to,                                err::ACCOUNT_INVALID,  "cannot transfer to self" )
   CHECKC( is_account( to ),                          err::ACCOUNT_INVALID,  "to account does not exist" )
   CHECKC( quantity.is_valid(),                       err::PARAM_ERROR,      "invalid quantity" )
   CHECKC( quantity.symbol == _gstate.plstr_symbol,   err::SYMBOL_MISMATCH,  "symbol precision mismatch" )
   CHECKC( memo.size() <= 256,                        err::OVERSIZED,        "memo has more than 256 bytes" )

   require_recipient( from );
   require_recipient( to );

   auto payer  = has_auth( to ) ? to : from;
   auto plan   = plan_burning_transfer( from, to, _self, quantity.amount, _gstate.min_transfer.amount );
   auto net    = asset(plan.split.net, quantity.symbol);
   auto burned = asset(plan.split.burned, quantity.symbol);
   ASSERT( plan.split.redirected == 0 && net + burned == quantity );

   sub_balance( from, quantity );
   if( burned.amount > 0 ) {
      stats statstable( _self, quantity.symbol.code().raw() );
      const auto& st = statstable.get( quantity.symbol.code().raw(), "PLSTR does not exist" );
      statstable.modify( st, same_payer, [&]( auto& s ) {
         s.supply -= burned;
      });
      _gstate.total_burned += burned;
      BURN_LOG( from, burned )
   }
   add_balance( to, net, payer );
}

void plstr_claim::open( const name& owner, const symbol& symbol, const name& ram_payer ) {
   require_auth( ram_payer );

   CHECKC( is_account( owner ),                 err::ACCOUNT_INVALID, "owner account does not exist" )
   CHECKC( symbol == _gstate.plstr_symbol,      err::SYMBOL_MISMATCH, "symbol precision mismatch" )

   accounts acnts( _self, owner.value );
   auto it = acnts.find( symbol.code().raw() );
   if( it == acnts.end() ) {
      acnts.emplace( ram_payer, [&]( auto& a ){
        a.balance = asset(0, symbol);
      });
   }
}

void plstr_claim::close( const name& owner, const symbol& symbol ) {
   require_auth( owner );

   accounts acnts( _self, owner.value );
   auto it = acnts.find( symbol.code().raw() );
   CHECKC( it != acnts.end(),          err::RECORD_NOT_FOUND, "balance row already deleted or never existed" )
   CHECKC( it->balance.amount == 0,    err::PARAM_ERROR,      "cannot close because the balance is not zero" )
   acnts.erase( it );
}

claim_metrics plstr_claim::getmetrics() {
   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )

   auto total_weighted = _total_weighted_supply();

   claim_metrics metrics;
   metrics.supply                = _get_supply();
   metrics.reserve               = _get_reserve();
   metrics.total_minted          = _gstate.total_minted;
   metrics.total_burned          = _gstate.total_burned;
   metrics.reward_per_share      = _gstate.reward_per_share;
   metrics.avg_reward_per_unit   = total_weighted > 0 ? (int128_t)metrics.reserve.amount * HIGH_PRECISION / total_weighted : 0;
   metrics.backing_ratio         = calc_backing_ratio( metrics.reserve.amount, metrics.supply.amount );
   return metrics;
}

claim_eligibility plstr_claim::geteligible( const name& account ) {
   CHECKC( _gstate.initialized, err::NOT_STARTED, "claim vault not initialized" )

   auto claimers  = claimer_t::tbl_t(_self, _self.value);
   auto itr       = claimers.find( account.value );

   claim_eligibility eligibility;
   eligibility.balance_a   = token::get_balance( _gstate.share_a, account );
   eligibility.balance_b   = token::get_balance( _gstate.share_b, account );
   eligibility.claimable   = asset(0, _gstate.plstr_symbol);
   if( itr != claimers.end() ) {
      auto weighted           = checkpoint_weighted_balance( itr->reward, _gstate.weight.weight );
      eligibility.claimable   = asset( calc_earned( itr->reward, weighted, _gstate.reward_per_share ), _gstate.plstr_symbol );
   }
   return eligibility;
}

int128_t plstr_claim::getweight() {
   return _gstate.weight.weight;
}

time_point_sec plstr_claim::getweightat() {
   return _gstate.weight.updated_at;
}

int64_t plstr_claim::_total_weighted_supply() {
   auto supply_a = token::get_supply( _gstate.share_a );
   auto supply_b = token::get_supply( _gstate.share_b );
   return calc_weighted_balance( supply_a.amount, supply_b.amount, _gstate.weight.weight );
}

void plstr_claim::_mint( const name& to, const asset& quantity ) {
   stats statstable( _self, quantity.symbol.code().raw() );
   const auto& st = statstable.get( quantity.symbol.code().raw(), "PLSTR does not exist" );
   CHECKC( quantity.amount <= st.max_supply.amount - st.supply.amount, err::OVERSIZED, "quantity exceeds available supply" )

   statstable.modify( st, same_payer, [&]( auto& s ) {
      s.supply += quantity;
   });
   add_balance( to, quantity, _self );
}

void plstr_claim::_burn( const name& from, const asset& quantity ) {
   stats statstable( _self, quantity.symbol.code().raw() );
   const auto& st = statstable.get( quantity.symbol.code().raw(), "PLSTR does not exist" );
   CHECKC( st.supply >= quantity, err::OVERDRAWN, "supply over-burnt" )

   sub_balance( from, quantity );
   statstable.modify( st, same_payer, [&]( auto& s ) {
      s.supply -= quantity;
   });
}

void plstr_claim::sub_balance( const name& owner, const asset& value ) {
   accounts from_acnts( _self, owner.value );
   auto from = from_acnts.find( value.symbol.code().raw() );
   CHECKC( from != from_acnts.end(),  err::OVERDRAWN, "no balance object found" )
   CHECKC( from->balance >= value,    err::OVERDRAWN, "overdrawn balance" )

   from_acnts.modify( from, same_payer, [&]( auto& a ) {
      a.balance -= value;
   });
}

void plstr_claim::add_balance( const name& owner, const asset& value, const name& ram_payer ) {
   accounts to_acnts( _self, owner.value );
   auto to = to_acnts.find( value.symbol.code().raw() );
   if( to == to_acnts.end() ) {
      to_acnts.emplace( ram_payer, [&]( auto& a ){
        a.balance = value;
      });
   } else {
      to_acnts.modify( to, same_payer, [&]( auto& a ) {
        a.balance += value;
      });
   }
}

asset plstr_claim::_get_supply() {
   return token::get_supply( _self, _gstate.plstr_symbol );
}

asset plstr_claim::_get_reserve() {
   return token::get_balance( _gstate.deposit_token, _self );
}

} //namespace plstr
