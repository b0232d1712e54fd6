#include <plstr.vault/plstr.vault.hpp>

#include <entry_guard.hpp>
#include <fee_splitter.hpp>
#include <reserve_math.hpp>
#include <token_reader.hpp>
#include <transfer_policy.hpp>

namespace plstr {

using namespace std;

void plstr_vault::init( const name& controller, const extended_symbol& backing_token, const symbol& share_symbol,
                        const asset& min_transfer, const asset& min_liquidity, const uint64_t& issuance_window_sec,
                        const name& claim_contract ) {
   require_auth( _self );
   CHECKC( !_gstate.initialized,                               err::RECORD_EXISTING,   "vault already initialized" )
   CHECKC( controller.value != 0 && is_account(controller),    err::ACCOUNT_INVALID,   "controller account invalid" )
   CHECKC( controller != _self,                                err::ACCOUNT_INVALID,   "controller cannot be the vault" )
   CHECKC( is_account(backing_token.get_contract()),           err::ACCOUNT_INVALID,   "backing token contract invalid" )
   CHECKC( backing_token.get_contract() != _self,              err::CONTRACT_MISMATCH, "backing token cannot be the share token" )
   CHECKC( share_symbol.is_valid(),                            err::SYMBOL_MISMATCH,   "invalid share symbol" )
   CHECKC( share_symbol.precision() == backing_token.get_symbol().precision(),
                                                               err::SYMBOL_MISMATCH,   "share precision must equal backing precision" )
   CHECKC( min_transfer.symbol == share_symbol && min_transfer.amount >= 0,
                                                               err::PARAM_ERROR,       "invalid min transfer: " + min_transfer.to_string() )
   CHECKC( min_liquidity.symbol == backing_token.get_symbol() && min_liquidity.amount > 0,
                                                               err::PARAM_ERROR,       "invalid min liquidity: " + min_liquidity.to_string() )
   CHECKC( issuance_window_sec > 0 && issuance_window_sec <= MAX_ISSUANCE_WINDOW_SEC,
                                                               err::PARAM_ERROR,       "invalid issuance window" )
   CHECKC( claim_contract.value == 0 || (is_account(claim_contract) && claim_contract != _self),
                                                               err::ACCOUNT_INVALID,   "claim contract invalid" )

   stats statstable( _self, share_symbol.code().raw() );
   CHECKC( statstable.find( share_symbol.code().raw() ) == statstable.end(), err::RECORD_EXISTING, "share token already exists" )
   statstable.emplace( _self, [&]( auto& s ) {
      s.supply       = asset(0, share_symbol);
      s.max_supply   = asset(asset::max_amount, share_symbol);
      s.issuer       = _self;
   });

   _gstate.controller            = controller;
   _gstate.backing_token         = backing_token;
   _gstate.share_symbol          = share_symbol;
   _gstate.min_transfer          = min_transfer;
   _gstate.min_liquidity         = min_liquidity;
   _gstate.issuance_window_sec   = issuance_window_sec;
   _gstate.deployed_at           = time_point_sec(current_time_point());
   _gstate.claim_contract        = claim_contract;
   _gstate.total_minted          = asset(0, share_symbol);
   _gstate.total_burned          = asset(0, share_symbol);
   _gstate.initialized           = true;
}

/**
 * @param memo: issue
 */
void plstr_vault::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate.initialized, err::NOT_STARTED, "vault not initialized" )
   check_incoming_transfer( get_first_receiver(), quant, memo, _gstate.backing_token, "issue" );

   _issue_shares( from, quant );
}

void plstr_vault::_issue_shares( const name& buyer, const asset& quant ) {
   entry_guard guard( _entered );

   auto now    = time_point_sec(current_time_point());
   auto plan   = plan_issue( quant.amount, _gstate.min_liquidity.amount, ISSUE_FEE_BPS,
                             now, _gstate.deployed_at, _gstate.issuance_window_sec );

   auto buyer_shares       = asset(plan.buyer_shares, _gstate.share_symbol);
   auto collector_shares   = asset(plan.collector_shares, _gstate.share_symbol);
   _mint( buyer, buyer_shares );
   if( collector_shares.amount > 0 )
      _mint( _gstate.controller, collector_shares );
   _gstate.total_minted    += buyer_shares + collector_shares;

   //backing half of the fee leaves the reserve
   if( plan.collector_backing > 0 )
      TRANSFER( _gstate.backing_token.get_contract(), _gstate.controller,
                asset(plan.collector_backing, _gstate.backing_token.get_symbol()), "issuance fee" )

   ISSUE_LOG( buyer, _gstate.controller, buyer_shares, asset(plan.fee, quant.symbol) )
}

void plstr_vault::redeem( const name& owner, const asset& quantity ) {
   require_auth( owner );
   entry_guard guard( _entered );

   CHECKC( _gstate.initialized, err::NOT_STARTED, "vault not initialized" )
   CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity" )
   CHECKC( quantity.symbol == _gstate.share_symbol, err::SYMBOL_MISMATCH, "share symbol mismatch" )

   auto reserve   = _get_reserve();
   auto supply    = _get_supply();
   auto balance   = _get_balance( owner );
   auto payout    = asset( calc_redeem_payout( reserve.amount, quantity.amount, supply.amount, balance.amount ),
                           _gstate.backing_token.get_symbol() );

   _burn( owner, quantity );
   _gstate.total_burned += quantity;

   TRANSFER( _gstate.backing_token.get_contract(), owner, payout, "redeem" )
   REDEEM_LOG( owner, quantity, payout )
}

void plstr_vault::transfer( const name& from, const name& to, const asset& quantity, const string& memo ) {
   require_auth( from );
   entry_guard guard( _entered );

   CHECKC( from != to,                                err::ACCOUNT_INVALID, "cannot transfer to self" )
   CHECKC( is_account( to ),                          err::ACCOUNT_INVALID, "to account does not exist" )
   CHECKC( quantity.is_valid(),                       err::PARAM_ERROR,     "invalid quantity" )
   CHECKC( quantity.symbol == _gstate.share_symbol,   err::SYMBOL_MISMATCH, "symbol precision mismatch" )
   CHECKC( quantity.amount > 0,                       err::NOT_POSITIVE,    "must transfer positive quantity" )
   CHECKC( memo.size() <= 256,                        err::OVERSIZED,       "memo has more than 256 bytes" )

   require_recipient( from );
   require_recipient( to );

   auto payer = has_auth( to ) ? to : from;

   switch( classify_transfer( from, to, _self, _gstate.controller ) ) {
      case transfer_kind::EXEMPT:
         _transfer_exempt( from, to, quantity, payer );
         break;
      case transfer_kind::TAXED:
         _transfer_taxed( from, to, quantity, payer );
         break;
   }
}

void plstr_vault::_transfer_exempt( const name& from, const name& to, const asset& quantity, const name& payer ) {
   sub_balance( from, quantity );
   add_balance( to, quantity, payer );

   auto zero = asset(0, quantity.symbol);
   TAX_LOG( from, to, _gstate.controller, quantity, zero, zero )
}

void plstr_vault::_transfer_taxed( const name& from, const name& to, const asset& quantity, const name& payer ) {
   auto plan         = plan_transfer( transfer_kind::TAXED, quantity.amount, _gstate.min_transfer.amount,
                                      TRANSFER_TAX_BPS, TRANSFER_BURN_PCT );
   auto net          = asset(plan.split.net, quantity.symbol);
   auto redirected   = asset(plan.split.redirected, quantity.symbol);
   auto burned       = asset(plan.split.burned, quantity.symbol);
   ASSERT( net + redirected + burned == quantity );

   sub_balance( from, quantity );
   if( burned.amount > 0 ) {
      stats statstable( _self, quantity.symbol.code().raw() );
      const auto& st = statstable.get( quantity.symbol.code().raw(), "share token does not exist" );
      statstable.modify( st, same_payer, [&]( auto& s ) {
         s.supply -= burned;
      });
      _gstate.total_burned += burned;
   }
   if( redirected.amount > 0 )
      add_balance( _gstate.controller, redirected, payer );
   add_balance( to, net, payer );

   TAX_LOG( from, to, _gstate.controller, net, redirected, burned )
}

void plstr_vault::open( const name& owner, const symbol& symbol, const name& ram_payer ) {
   require_auth( ram_payer );

   CHECKC( is_account( owner ),                 err::ACCOUNT_INVALID, "owner account does not exist" )
   CHECKC( symbol == _gstate.share_symbol,      err::SYMBOL_MISMATCH, "symbol precision mismatch" )

   accounts acnts( _self, owner.value );
   auto it = acnts.find( symbol.code().raw() );
   if( it == acnts.end() ) {
      acnts.emplace( ram_payer, [&]( auto& a ){
        a.balance = asset(0, symbol);
      });
   }
}

void plstr_vault::close( const name& owner, const symbol& symbol ) {
   require_auth( owner );

   accounts acnts( _self, owner.value );
   auto it = acnts.find( symbol.code().raw() );
   CHECKC( it != acnts.end(),          err::RECORD_NOT_FOUND, "balance row already deleted or never existed" )
   CHECKC( it->balance.amount == 0,    err::PARAM_ERROR,      "cannot close because the balance is not zero" )
   acnts.erase( it );
}

vault_metrics plstr_vault::getmetrics() {
   CHECKC( _gstate.initialized, err::NOT_STARTED, "vault not initialized" )

   vault_metrics metrics;
   metrics.supply          = _get_supply();
   metrics.reserve         = _get_reserve();
   metrics.total_minted    = _gstate.total_minted;
   metrics.total_burned    = _gstate.total_burned;
   metrics.backing_ratio   = calc_backing_ratio( metrics.reserve.amount, metrics.supply.amount );
   return metrics;
}

issuance_status plstr_vault::getissuance() {
   CHECKC( _gstate.initialized, err::NOT_STARTED, "vault not initialized" )

   auto now = time_point_sec(current_time_point());
   issuance_status status;
   status.is_active        = is_issuance_active( now, _gstate.deployed_at, _gstate.issuance_window_sec );
   status.time_remaining   = issuance_time_remaining( now, _gstate.deployed_at, _gstate.issuance_window_sec );
   return status;
}

void plstr_vault::_mint( const name& to, const asset& quantity ) {
   stats statstable( _self, quantity.symbol.code().raw() );
   const auto& st = statstable.get( quantity.symbol.code().raw(), "share token does not exist" );
   CHECKC( quantity.amount <= st.max_supply.amount - st.supply.amount, err::OVERSIZED, "quantity exceeds available supply" )

   statstable.modify( st, same_payer, [&]( auto& s ) {
      s.supply += quantity;
   });
   add_balance( to, quantity, _self );
}

void plstr_vault::_burn( const name& from, const asset& quantity ) {
   stats statstable( _self, quantity.symbol.code().raw() );
   const auto& st = statstable.get( quantity.symbol.code().raw(), "share token does not exist" );
   CHECKC( st.supply >= quantity, err::OVERDRAWN, "supply over-burnt" )

   sub_balance( from, quantity );
   statstable.modify( st, same_payer, [&]( auto& s ) {
      s.supply -= quantity;
   });
}

void plstr_vault::sub_balance( const name& owner, const asset& value ) {
   accounts from_acnts( _self, owner.value );
   auto from = from_acnts.find( value.symbol.code().raw() );
   CHECKC( from != from_acnts.end(),  err::OVERDRAWN, "no balance object found" )
   CHECKC( from->balance >= value,    err::OVERDRAWN, "overdrawn balance" )

   from_acnts.modify( from, same_payer, [&]( auto& a ) {
      a.balance -= value;
   });
}

void plstr_vault::add_balance( const name& owner, const asset& value, const name& ram_payer ) {
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

asset plstr_vault::_get_supply() {
   return token::get_supply( _self, _gstate.share_symbol );
}

asset plstr_vault::_get_balance( const name& owner ) {
   return token::get_balance( _self, owner, _gstate.share_symbol );
}

asset plstr_vault::_get_reserve() {
   return token::get_balance( _gstate.backing_token, _self );
}

} //namespace plstr
