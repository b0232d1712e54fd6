#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>
#include <vector>

#include <plstr.claim/plstr.claim.db.hpp>
#include <transfer_policy.hpp>

namespace plstr {

using std::string;

#define TRANSFER(bank, to, quantity, memo) \
    {   action( permission_level{ _self, active_perm }, bank, "transfer"_n, \
                std::make_tuple( _self, to, quantity, string(memo) ) ).send(); }

#define DEPOSIT_LOG(depositor, quantity) \
    {   plstr_claim::depositlog_action act{ _self, { {_self, active_perm} } };\
            act.send( depositor, quantity ); }

#define CLAIM_LOG(claimer, quantity) \
    {   plstr_claim::claimlog_action act{ _self, { {_self, active_perm} } };\
            act.send( claimer, quantity ); }

#define REDEEM_LOG(redeemer, shares, payout) \
    {   plstr_claim::redeemlog_action act{ _self, { {_self, active_perm} } };\
            act.send( redeemer, shares, payout ); }

#define WEIGHT_LOG(weight) \
    {   plstr_claim::weightlog_action act{ _self, { {_self, active_perm} } };\
            act.send( weight ); }

#define BURN_LOG(from, quantity) \
    {   plstr_claim::burnlog_action act{ _self, { {_self, active_perm} } };\
            act.send( from, quantity ); }

/**
 * The `plstr.claim` contract mints PLSTR to holders of the two vault share tokens.
 *
 * Deposit token pushed in with memo `deposit` raises `reward_per_share` by
 * amount / (supply_a + supply_b * weight). A holder earns its weighted balance times the
 * accumulator growth since its last checkpoint and claims the earnings as freshly minted
 * PLSTR. PLSTR is redeemable pro-rata against the pooled deposit token.
 *
 * Both vaults deliver their `issuelog`, `redeemlog` and `taxlog` actions here. Each one settles
 * the accounts involved on the balances they held so far and records their new balances.
 *
 * The weight is recalibrated by anyone, at most once per WEIGHT_COOLDOWN_SEC, from the total
 * supplies of two configured tokens. Balances and supplies of the vault shares are always read
 * live from the vault contracts.
 */
class [[eosio::contract("plstr.claim")]] plstr_claim : public contract {
   public:
      using contract::contract;

   plstr_claim(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~plstr_claim() { _global.set( _gstate, get_self() ); }

   ACTION init( const extended_symbol& deposit_token, const symbol& plstr_symbol,
                const extended_symbol& share_a, const extended_symbol& share_b,
                const extended_symbol& weight_source_a, const extended_symbol& weight_source_b,
                const asset& min_deposit, const asset& min_transfer );

   /**
    * Recalibrate weight = supply(weight_source_b) * 1e18 / supply(weight_source_a).
    * Open to any account once the cooldown has passed.
    */
   ACTION updateweight( const name& caller );

   /**
    * @param memo: deposit
    */
   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   [[eosio::on_notify("*::issuelog")]]
   void onissuelog( const name& buyer, const name& collector, const asset& shares, const asset& fee );

   [[eosio::on_notify("*::redeemlog")]]
   void onredeemlog( const name& redeemer, const asset& shares, const asset& payout );

   [[eosio::on_notify("*::taxlog")]]
   void ontaxlog( const name& from, const name& to, const name& collector,
                  const asset& net, const asset& redirected, const asset& burned );

   ACTION claim( const name& claimer );

   // checkpoint accrued rewards without minting and pick up the live share balances
   ACTION settle( const name& account );

   ACTION redeem( const name& owner, const asset& quantity );

   ACTION transfer( const name& from, const name& to, const asset& quantity, const string& memo );

   ACTION open( const name& owner, const symbol& symbol, const name& ram_payer );

   ACTION close( const name& owner, const symbol& symbol );

   [[eosio::action]] claim_metrics getmetrics();
   [[eosio::action]] claim_eligibility geteligible( const name& account );
   [[eosio::action]] int128_t getweight();
   [[eosio::action]] time_point_sec getweightat();

   ACTION depositlog( const name& depositor, const asset& quantity ) {
      require_auth( _self );
      require_recipient( depositor );
   }

   ACTION claimlog( const name& claimer, const asset& quantity ) {
      require_auth( _self );
      require_recipient( claimer );
   }

   ACTION redeemlog( const name& redeemer, const asset& shares, const asset& payout ) {
      require_auth( _self );
      require_recipient( redeemer );
   }

   ACTION weightlog( const int128_t& weight ) {
      require_auth( _self );
   }

   ACTION burnlog( const name& from, const asset& quantity ) {
      require_auth( _self );
      require_recipient( from );
   }

   using depositlog_action = eosio::action_wrapper<"depositlog"_n, &plstr_claim::depositlog>;
   using claimlog_action   = eosio::action_wrapper<"claimlog"_n,   &plstr_claim::claimlog>;
   using redeemlog_action  = eosio::action_wrapper<"redeemlog"_n,  &plstr_claim::redeemlog>;
   using weightlog_action  = eosio::action_wrapper<"weightlog"_n,  &plstr_claim::weightlog>;
   using burnlog_action    = eosio::action_wrapper<"burnlog"_n,    &plstr_claim::burnlog>;

   private:
      void _deposit( const name& from, const asset& quant );

      bool _is_vault_share( const name& bank, const symbol& sym );
      void _sync_holders( const std::vector<name>& holders );

      int64_t _total_weighted_supply();
      reward_checkpoint_st _sync_claimer( const name& account );

      void _mint( const name& to, const asset& quantity );
      void _burn( const name& from, const asset& quantity );

      void sub_balance( const name& owner, const asset& value );
      void add_balance( const name& owner, const asset& value, const name& ram_payer );

      asset _get_supply();
      asset _get_reserve();

      global_singleton     _global;
      global_t             _gstate;
      bool                 _entered    = false;
};
} //namespace plstr
