#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <plstr.vault/plstr.vault.db.hpp>
#include <transfer_policy.hpp>

namespace plstr {

using std::string;

#define TRANSFER(bank, to, quantity, memo) \
    {   action( permission_level{ _self, active_perm }, bank, "transfer"_n, \
                std::make_tuple( _self, to, quantity, string(memo) ) ).send(); }

#define ISSUE_LOG(buyer, collector, shares, fee) \
    {   plstr_vault::issuelog_action act{ _self, { {_self, active_perm} } };\
            act.send( buyer, collector, shares, fee ); }

#define REDEEM_LOG(redeemer, shares, payout) \
    {   plstr_vault::redeemlog_action act{ _self, { {_self, active_perm} } };\
            act.send( redeemer, shares, payout ); }

#define TAX_LOG(from, to, collector, net, redirected, burned) \
    {   plstr_vault::taxlog_action act{ _self, { {_self, active_perm} } };\
            act.send( from, to, collector, net, redirected, burned ); }

/**
 * The `plstr.vault` contract is a reserve-backed share token. Depositors push the backing
 * asset in with memo `issue` and receive shares 1:1 minus the issuance fee; share holders
 * redeem at any time for a pro-rata slice of the reserve.
 *
 * The share token lives in the contract's own `accounts` and `stat` tables. Every share
 * transfer that does not touch the vault or its controller pays a 4.5% tax, 60% of which is
 * burnt and 40% of which goes to the controller.
 *
 * One build of this contract is deployed once per backing asset; backing token, share symbol,
 * minimums and issuance window are set by `init`.
 *
 * Every share balance change ends in one of the log actions below. When a claim contract is
 * configured the logs are also delivered to it, so it can settle rewards of the accounts involved.
 */
class [[eosio::contract("plstr.vault")]] plstr_vault : public contract {
   public:
      using contract::contract;

   plstr_vault(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~plstr_vault() { _global.set( _gstate, get_self() ); }

   ACTION init( const name& controller, const extended_symbol& backing_token, const symbol& share_symbol,
                const asset& min_transfer, const asset& min_liquidity, const uint64_t& issuance_window_sec,
                const name& claim_contract );

   /**
    * Issue shares for backing asset transferred in.
    *
    * @param memo: issue
    */
   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   /**
    * Burn `quantity` shares of `owner` and pay out reserve * quantity / supply backing asset.
    */
   ACTION redeem( const name& owner, const asset& quantity );

   /**
    * Share transfer. Classified once as exempt or taxed; a taxed transfer must reach
    * `min_transfer` and is split into net, redirected and burnt parts.
    */
   ACTION transfer( const name& from, const name& to, const asset& quantity, const string& memo );

   ACTION open( const name& owner, const symbol& symbol, const name& ram_payer );

   ACTION close( const name& owner, const symbol& symbol );

   [[eosio::action]] vault_metrics getmetrics();
   [[eosio::action]] issuance_status getissuance();

   //logs, triggered as inline actions
   ACTION issuelog( const name& buyer, const name& collector, const asset& shares, const asset& fee ) {
      require_auth( _self );
      require_recipient( buyer );
      _notify_claim();
   }

   ACTION redeemlog( const name& redeemer, const asset& shares, const asset& payout ) {
      require_auth( _self );
      require_recipient( redeemer );
      _notify_claim();
   }

   ACTION taxlog( const name& from, const name& to, const name& collector,
                  const asset& net, const asset& redirected, const asset& burned ) {
      require_auth( _self );
      require_recipient( from );
      _notify_claim();
   }

   using issuelog_action   = eosio::action_wrapper<"issuelog"_n,  &plstr_vault::issuelog>;
   using redeemlog_action  = eosio::action_wrapper<"redeemlog"_n, &plstr_vault::redeemlog>;
   using taxlog_action     = eosio::action_wrapper<"taxlog"_n,    &plstr_vault::taxlog>;

   private:
      void _notify_claim() {
         if( _gstate.claim_contract.value != 0 )
            require_recipient( _gstate.claim_contract );
      }

      void _issue_shares( const name& buyer, const asset& quant );

      void _transfer_exempt( const name& from, const name& to, const asset& quantity, const name& payer );
      void _transfer_taxed( const name& from, const name& to, const asset& quantity, const name& payer );

      void _mint( const name& to, const asset& quantity );
      void _burn( const name& from, const asset& quantity );

      void sub_balance( const name& owner, const asset& value );
      void add_balance( const name& owner, const asset& value, const name& ram_payer );

      asset _get_supply();
      asset _get_balance( const name& owner );
      asset _get_reserve();

      global_singleton     _global;
      global_t             _gstate;
      bool                 _entered    = false;
};
} //namespace plstr
