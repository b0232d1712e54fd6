#pragma once

#include <cstdint>
#include <string>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>

#ifndef ASSERT
    #define ASSERT(exp) eosio::check(exp, #exp)
#endif

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

namespace plstr {

using namespace eosio;

static constexpr uint16_t  PCT_BOOST            = 10000;
static constexpr uint8_t   PCT_HUNDRED          = 100;
static constexpr uint64_t  DAY_SECONDS          = 24 * 60 * 60;
static constexpr int128_t  HIGH_PRECISION       = 1'000'000'000'000'000'000; // 10^18
static constexpr int128_t  MAX_INT128           = (int128_t)(((uint128_t)1 << 127) - 1);

static constexpr uint16_t  TRANSFER_TAX_BPS     = 450;      //4.5% of every taxed share transfer
static constexpr uint8_t   TRANSFER_BURN_PCT    = 60;       //60% of the tax burnt, 40% to controller
static constexpr uint16_t  ISSUE_FEE_BPS        = 450;      //4.5% of every issuance
static constexpr uint16_t  PLSTR_BURN_BPS       = 50;       //0.5% of every taxed PLSTR transfer, all burnt
static constexpr uint64_t  WEIGHT_COOLDOWN_SEC  = DAY_SECONDS;

static constexpr eosio::name active_perm        {"active"_n};

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   CONTRACT_MISMATCH    = 3,
   SYMBOL_MISMATCH      = 4,
   PARAM_ERROR          = 5,
   MEMO_FORMAT_ERROR    = 6,
   NO_AUTH              = 8,
   NOT_POSITIVE         = 9,
   NOT_STARTED          = 10,
   OVERSIZED            = 11,
   TIME_EXPIRED         = 12,
   TIME_PREMATURE       = 13,
   ACCOUNT_INVALID      = 15,
   INCORRECT_AMOUNT     = 19,
   OVERDRAWN            = 20,
   RESERVE_INSUFFICIENT = 21,
   SUPPLY_INVALID       = 22,
   NO_REWARD            = 23,
   REENTRANT_CALL       = 24
};

} //namespace plstr
