#pragma once

#include <eosio/action.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <optional>
#include <string>

#include "acdm.market.db.hpp"

namespace acdm {

using namespace eosio;
using std::string;

/**
 * The `acdm.market` contract runs a two-phase market for the ACDM token.
 *
 * A sale round mints a batch sized by the previous trade round's volume and sells it at an
 * escalating price. A trade round runs a limit-order book between holders. Rounds alternate
 * strictly, sale then trade, and expire lazily against the block time.
 *
 * Payments and order escrow arrive as token transfers to this contract:
 *  - `buy`                 pay token, buys from the current sale batch
 *  - `order:<price>`       market token, opens a sell order, price in pay-token units per whole token
 *  - `redeem:<order_id>`   pay token, buys from a sell order
 *
 * Every sale and every redeemed trade pays two levels of referral rewards, walked up the
 * sponsor chain of the buyer (sale) or of the order owner (trade).
 */
class [[eosio::contract("acdm.market")]] acdm_market : public contract {
public:
   using contract::contract;

   acdm_market(name receiver, name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value) {
      _gstate = _global.exists() ? _global.get() : global_t{};
   }

   ~acdm_market() {
      _global.set(_gstate, get_self());
   }

   ACTION init(const name& admin, const name& fallback_sink);

   ACTION startsale();
   ACTION starttrade();

   ACTION removeorder(const name& owner, const uint64_t& order_id);

   ACTION signup(const name& user, const name& sponsor);

   //admin
   ACTION withdraw(const name& to, const asset& quantity);
   ACTION setrefrates(const uint8_t& round_type, const uint16_t& l1_rate, const uint16_t& l2_rate);
   ACTION setduration(const uint32_t& seconds);
   ACTION setsink(const name& sink);
   ACTION setrootl2(const bool& enabled);

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   // ========= notifications =========
   ACTION roundstart(const uint8_t& round_type, const asset& price, const asset& quantity);
   using roundstart_action    = action_wrapper<"roundstart"_n,    &acdm_market::roundstart>;
   ACTION salebought(const name& buyer, const asset& quantity, const asset& cost);
   using salebought_action    = action_wrapper<"salebought"_n,    &acdm_market::salebought>;
   ACTION orderadded(const uint64_t& order_id, const name& owner, const asset& quantity, const asset& price);
   using orderadded_action    = action_wrapper<"orderadded"_n,    &acdm_market::orderadded>;
   ACTION orderremoved(const uint64_t& order_id, const asset& quantity);
   using orderremoved_action  = action_wrapper<"orderremoved"_n,  &acdm_market::orderremoved>;
   ACTION orderredeem(const uint64_t& order_id, const name& buyer, const asset& quantity, const asset& price);
   using orderredeem_action   = action_wrapper<"orderredeem"_n,   &acdm_market::orderredeem>;
   ACTION userreg(const name& user, const name& sponsor);
   using userreg_action       = action_wrapper<"userreg"_n,       &acdm_market::userreg>;
   ACTION refcfgupdate(const uint8_t& round_type, const uint16_t& l1_rate, const uint16_t& l2_rate);
   using refcfgupdate_action  = action_wrapper<"refcfgupdate"_n,  &acdm_market::refcfgupdate>;
   ACTION cfgupdate(const name& param, const string& value);
   using cfgupdate_action     = action_wrapper<"cfgupdate"_n,     &acdm_market::cfgupdate>;
   ACTION rewardpaid(const name& principal, const name& receiver, const uint8_t& level, const asset& quantity);
   using rewardpaid_action    = action_wrapper<"rewardpaid"_n,    &acdm_market::rewardpaid>;

private:
   global_singleton _global;
   global_t _gstate;

   // holds the in-progress flag for the lifetime of one call
   class reentrancy_guard {
   public:
      explicit reentrancy_guard(global_t& g): _g(g) {
         CHECKC(!_g.locked, err::REENTRANT_CALL, "reentrant call")
         _g.locked = true;
      }
      ~reentrancy_guard() { _g.locked = false; }

   private:
      global_t& _g;
   };

   // ========= core flows =========
   void _on_buy(const name& buyer, const asset& payment);
   void _on_add_order(const name& owner, const asset& quantity, const uint64_t& price_amount);
   void _on_redeem(const name& buyer, const asset& payment, const uint64_t& order_id);

   // ========= referral =========
   std::optional<name> _sponsor_of(const name& user) const;
   asset _route_referral_rewards(const name& principal, const asset& base,
                                 const uint16_t& l1_rate, const uint16_t& l2_rate);
   void _pay_reward(const name& principal, const name& receiver, const uint8_t& level, const asset& quantity);

   // ========= helpers =========
   void _check_initialized() const;
   void _check_trade_active() const;
   uint32_t _now() const;
   int64_t _token_scale() const;
   int64_t _checked_amount(const rules::uint128& value, const char* title) const;
   asset _pay_balance() const;

   void _transfer_out(const extended_symbol& token, const name& to, const asset& quantity, const string& memo);
};

} // namespace acdm
