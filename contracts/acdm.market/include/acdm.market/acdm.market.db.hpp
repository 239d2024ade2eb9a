#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <acdm.market/acdm.market.rules.hpp>

#include <string>

namespace acdm {

using namespace eosio;
using std::string;

#define SYMBOL(sym_code, precision) symbol(symbol_code(sym_code), precision)

// =====================================================
// constants
// =====================================================
static constexpr name      PAY_BANK          = "amax.token"_n;
static constexpr symbol    PAY_SYMBOL        = SYMBOL("AMAX", 8);
static constexpr name      ACDM_BANK         = "acdm.token"_n;
static constexpr symbol    ACDM_SYMBOL       = SYMBOL("ACDM", 6);

static constexpr uint32_t  DAY_SECONDS       = 24 * 60 * 60;
static constexpr uint32_t  ROUND_DURATION    = 3 * DAY_SECONDS;
static constexpr int64_t   SEED_PRICE        = 1000;             // 0.00001000 AMAX per ACDM
static constexpr int64_t   SEED_VOLUME       = 1'0000'0000;      // 1.00000000 AMAX
static constexpr int64_t   PRICE_INCREMENT   = 400;              // 0.00000400 AMAX

enum class err: uint8_t {
   NONE                 = 0,
   INAPPROPRIATE_ROUND  = 1,
   RECORD_NOT_FOUND     = 2,
   RECORD_EXISTING      = 3,
   PARAM_ERROR          = 4,
   NOT_POSITIVE         = 5,
   ACCOUNT_INVALID      = 6,
   SYMBOL_MISMATCH      = 7,
   CONTRACT_MISMATCH    = 8,
   MEMO_FORMAT_ERROR    = 9,
   INSUFFICIENT_FUNDS   = 10,
   OVERFLOWED           = 11,
   NOT_INITIALIZED      = 12,
   REENTRANT_CALL       = 13
};

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + std::to_string((int)code) + string("]] ") + msg); }

#define TBL struct [[eosio::table, eosio::contract("acdm.market")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("acdm.market")]]

// referral rates in basis points, one pair per round type
struct ref_reward_conf_t {
    uint16_t            sale_l1         = 500;
    uint16_t            sale_l2         = 300;
    uint16_t            trade_l1        = 250;
    uint16_t            trade_l2        = 250;

    EOSLIB_SERIALIZE( ref_reward_conf_t, (sale_l1)(sale_l2)(trade_l1)(trade_l2) )
};

// the single active round
struct round_t {
    uint8_t             type                    = (uint8_t)rules::round_type::trade;
    uint32_t            sale_round_count        = 0;                            // sale rounds started so far
    time_point_sec      ended_at;
    asset               sale_tokens_remaining   = asset(0, ACDM_SYMBOL);
    asset               sale_price              = asset(SEED_PRICE, PAY_SYMBOL);  // price of the last sale round
    asset               trade_volume            = asset(SEED_VOLUME, PAY_SYMBOL); // redeemed since the last sale round

    rules::round_type current_type() const { return (rules::round_type)type; }

    EOSLIB_SERIALIZE( round_t, (type)(sale_round_count)(ended_at)
                               (sale_tokens_remaining)(sale_price)(trade_volume) )
};

NTBL("global") global_t {
    name                admin;
    name                fallback_sink;
    extended_symbol     pay_token           = extended_symbol(PAY_SYMBOL, PAY_BANK);
    extended_symbol     market_token        = extended_symbol(ACDM_SYMBOL, ACDM_BANK);
    uint32_t            round_duration      = ROUND_DURATION;
    asset               seed_price          = asset(SEED_PRICE, PAY_SYMBOL);
    asset               price_increment     = asset(PRICE_INCREMENT, PAY_SYMBOL);
    ref_reward_conf_t   ref_rates;
    bool                root_takes_l2       = false;
    round_t             round;
    uint64_t            last_order_id       = 0;
    bool                initialized         = false;
    bool                locked              = false;

    EOSLIB_SERIALIZE( global_t, (admin)(fallback_sink)(pay_token)(market_token)
                                (round_duration)(seed_price)(price_increment)
                                (ref_rates)(root_takes_l2)(round)
                                (last_order_id)(initialized)(locked) )
};
using global_singleton = eosio::singleton<"global"_n, global_t>;

// Scope: _self
NTBL("orders") order_t {
    uint64_t            id;
    name                owner;
    asset               price;              // pay token per whole market token
    asset               quantity;           // offered when the order was added
    asset               remaining;
    time_point_sec      created_at;

    uint64_t primary_key() const { return id; }
    uint64_t by_owner() const { return owner.value; }

    EOSLIB_SERIALIZE( order_t, (id)(owner)(price)(quantity)(remaining)(created_at) )
};
using orders_t = eosio::multi_index<"orders"_n, order_t,
    indexed_by<"byowner"_n, const_mem_fun<order_t, uint64_t, &order_t::by_owner>>
>;

// Scope: _self
NTBL("referrals") referral_t {
    name                user;
    name                sponsor;
    time_point_sec      created_at;

    uint64_t primary_key() const { return user.value; }
    uint64_t by_sponsor() const { return sponsor.value; }

    EOSLIB_SERIALIZE( referral_t, (user)(sponsor)(created_at) )
};
using referrals_t = eosio::multi_index<"referrals"_n, referral_t,
    indexed_by<"bysponsor"_n, const_mem_fun<referral_t, uint64_t, &referral_t::by_sponsor>>
>;

} // namespace acdm
