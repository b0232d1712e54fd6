#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <plstr.const.hpp>
#include <reward_accrual.hpp>
#include <weight_oracle.hpp>

#include <string>

namespace plstr {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("plstr.claim")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("plstr.claim")]]

NTBL("global") global_t {
    extended_symbol     deposit_token;                      //pooled reserve behind PLSTR, E.g. 4,VPLS@vpls.token
    symbol              plstr_symbol;                       //same precision as the deposit token
    extended_symbol     share_a;                            //share token of the first vault, counted 1:1
    extended_symbol     share_b;                            //share token of the second vault, counted by weight
    extended_symbol     weight_source_a;                    //weight = supply(source_b) / supply(source_a)
    extended_symbol     weight_source_b;
    asset               min_deposit;
    asset               min_transfer;                       //smallest PLSTR transfer

    weight_st           weight;
    int128_t            reward_per_share            = 0;    //cumulative reward per weighted share, HIGH_PRECISION

    asset               total_minted;
    asset               total_burned;
    asset               total_deposited;
    asset               unattributed_deposits;              //deposits made while nothing was eligible
    bool                initialized                 = false;

    EOSLIB_SERIALIZE( global_t, (deposit_token)(plstr_symbol)(share_a)(share_b)
                                (weight_source_a)(weight_source_b)(min_deposit)(min_transfer)
                                (weight)(reward_per_share)
                                (total_minted)(total_burned)(total_deposited)(unattributed_deposits)
                                (initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL claimer_t {
    name                    owner;                          //PK
    reward_checkpoint_st    reward;
    asset                   claimed;                        //lifetime PLSTR claimed
    time_point_sec          updated_at;

    claimer_t() {}
    claimer_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"claimers"_n, claimer_t> tbl_t;

    EOSLIB_SERIALIZE( claimer_t, (owner)(reward)(claimed)(updated_at) )
};

//Scope: owner
TBL account {
    asset    balance;

    uint64_t primary_key()const { return balance.symbol.code().raw(); }

    EOSLIB_SERIALIZE( account, (balance) )
};
typedef eosio::multi_index< "accounts"_n, account > accounts;

//Scope: PLSTR symbol code
TBL currency_stats {
    asset    supply;
    asset    max_supply;
    name     issuer;

    uint64_t primary_key()const { return supply.symbol.code().raw(); }

    EOSLIB_SERIALIZE( currency_stats, (supply)(max_supply)(issuer) )
};
typedef eosio::multi_index< "stat"_n, currency_stats > stats;

struct claim_metrics {
    asset       supply;
    asset       reserve;
    asset       total_minted;
    asset       total_burned;
    int128_t    reward_per_share;
    int128_t    avg_reward_per_unit;        //reserve per weighted eligible unit, HIGH_PRECISION
    int128_t    backing_ratio;              //reserve per PLSTR, HIGH_PRECISION

    EOSLIB_SERIALIZE( claim_metrics, (supply)(reserve)(total_minted)(total_burned)
                                     (reward_per_share)(avg_reward_per_unit)(backing_ratio) )
};

struct claim_eligibility {
    asset       claimable;
    asset       balance_a;
    asset       balance_b;

    EOSLIB_SERIALIZE( claim_eligibility, (claimable)(balance_a)(balance_b) )
};

} //namespace plstr
