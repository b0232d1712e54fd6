#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <plstr.const.hpp>

#include <string>

namespace plstr {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("plstr.vault")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("plstr.vault")]]

static constexpr uint64_t   DEFAULT_ISSUANCE_WINDOW_SEC   = 180 * DAY_SECONDS;
static constexpr uint64_t   MAX_ISSUANCE_WINDOW_SEC       = 10 * 365 * DAY_SECONDS;

NTBL("global") global_t {
    name                controller;                                         //tax exempt, collects redirect tax and issuance fee
    extended_symbol     backing_token;                                      //reserve asset, E.g. 4,PLS@eosio.token
    symbol              share_symbol;                                       //same precision as the backing asset
    asset               min_transfer;                                       //smallest taxed share transfer
    asset               min_liquidity;                                      //smallest issuance in backing asset
    uint64_t            issuance_window_sec         = DEFAULT_ISSUANCE_WINDOW_SEC;
    time_point_sec      deployed_at;                                        //issuance closes at deployed_at + issuance_window_sec
    name                claim_contract;                                     //receives every share log, empty for none

    asset               total_minted;                                       //lifetime minted, only issuance adds
    asset               total_burned;                                       //lifetime burnt by tax and redemption
    bool                initialized                 = false;

    EOSLIB_SERIALIZE( global_t, (controller)(backing_token)(share_symbol)
                                (min_transfer)(min_liquidity)(issuance_window_sec)(deployed_at)(claim_contract)
                                (total_minted)(total_burned)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: owner
TBL account {
    asset    balance;

    uint64_t primary_key()const { return balance.symbol.code().raw(); }

    EOSLIB_SERIALIZE( account, (balance) )
};
typedef eosio::multi_index< "accounts"_n, account > accounts;

//Scope: share symbol code
TBL currency_stats {
    asset    supply;
    asset    max_supply;
    name     issuer;

    uint64_t primary_key()const { return supply.symbol.code().raw(); }

    EOSLIB_SERIALIZE( currency_stats, (supply)(max_supply)(issuer) )
};
typedef eosio::multi_index< "stat"_n, currency_stats > stats;

struct vault_metrics {
    asset       supply;
    asset       reserve;
    asset       total_minted;
    asset       total_burned;
    int128_t    backing_ratio;          //reserve per share, scaled by HIGH_PRECISION

    EOSLIB_SERIALIZE( vault_metrics, (supply)(reserve)(total_minted)(total_burned)(backing_ratio) )
};

struct issuance_status {
    bool        is_active;
    uint64_t    time_remaining;         //seconds

    EOSLIB_SERIALIZE( issuance_status, (is_active)(time_remaining) )
};

} //namespace plstr
