#include <acdm.market/acdm.market.hpp>
#include <acdm.token/acdm.token.hpp>
#include "acdm.market.utils.hpp"

#include <algorithm>

namespace acdm {

using namespace std;

static constexpr eosio::name active_perm{"active"_n};

#define NOTIFY(action_type, ...) \
    {   acdm_market::action_type act{ _self, { {_self, active_perm} } };\
            act.send( __VA_ARGS__ ); }

void acdm_market::init(const name& admin, const name& fallback_sink) {
      require_auth(get_self());
      CHECKC(!_gstate.initialized, err::RECORD_EXISTING, "market already initialized")
      CHECKC(is_account(admin), err::ACCOUNT_INVALID, "admin not exist")
      CHECKC(is_account(fallback_sink), err::ACCOUNT_INVALID, "fallback sink not exist")

      _gstate.admin           = admin;
      _gstate.fallback_sink   = fallback_sink;

      // seeded trade round, already expired, so the first sale round has a real volume
      _gstate.round           = round_t{};
      _gstate.round.ended_at  = time_point_sec(_now());
      _gstate.initialized     = true;

      // the contract is the referral root and its own sponsor
      referrals_t referrals(get_self(), get_self().value);
      referrals.emplace(get_self(), [&](auto& row) {
            row.user       = get_self();
            row.sponsor    = get_self();
            row.created_at = time_point_sec(_now());
      });
}

void acdm_market::startsale() {
      _check_initialized();

      auto& round = _gstate.round;
      auto now    = _now();
      CHECKC(rules::can_start_sale(round.current_type(), now, round.ended_at.sec_since_epoch()),
             err::INAPPROPRIATE_ROUND, "InappropriateRound")

      const auto& pay_sym     = _gstate.pay_token.get_symbol();
      const auto& market_sym  = _gstate.market_token.get_symbol();

      asset price = _gstate.seed_price;
      if (round.sale_round_count > 0) {
            price = asset(_checked_amount(rules::next_price(round.sale_price.amount, _gstate.price_increment.amount), "sale price"), pay_sym);
      }
      CHECKC(price.amount > 0, err::NOT_POSITIVE, "sale price must be positive")

      auto amount = asset(_checked_amount(rules::tokens_for(round.trade_volume.amount, price.amount, _token_scale()), "sale amount"), market_sym);

      round.type                    = (uint8_t)rules::round_type::sale;
      round.sale_round_count       += 1;
      round.ended_at                = time_point_sec(now + _gstate.round_duration);
      round.sale_tokens_remaining   = amount;
      round.sale_price              = price;
      round.trade_volume            = asset(0, pay_sym);

      if (amount.amount > 0) {
            ISSUE(_gstate.market_token.get_contract(), get_self(), amount, "sale round: " + to_string(round.sale_round_count))
      }

      NOTIFY(roundstart_action, (uint8_t)rules::round_type::sale, price, amount)
}

void acdm_market::starttrade() {
      _check_initialized();

      auto& round = _gstate.round;
      auto now    = _now();
      CHECKC(rules::can_start_trade(round.current_type(), now, round.ended_at.sec_since_epoch(), round.sale_tokens_remaining.amount),
             err::INAPPROPRIATE_ROUND, "InappropriateRound")

      if (round.sale_tokens_remaining.amount > 0) {
            BURN(_gstate.market_token.get_contract(), round.sale_tokens_remaining, "burn unsold sale tokens")
            round.sale_tokens_remaining.amount = 0;
      }

      round.type     = (uint8_t)rules::round_type::trade;
      round.ended_at = time_point_sec(now + _gstate.round_duration);

      NOTIFY(roundstart_action, (uint8_t)rules::round_type::trade,
             asset(0, _gstate.pay_token.get_symbol()), asset(0, _gstate.market_token.get_symbol()))
}

void acdm_market::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
      if (from == get_self() || to != get_self()) return;

      _check_initialized();
      reentrancy_guard guard(_gstate);

      CHECKC(quant.amount > 0, err::NOT_POSITIVE, "quantity must be positive")

      auto bank  = get_first_receiver();
      auto parts = split(memo, ":");
      const auto& cmd = parts[0];

      // ---- buy ----
      if (cmd == "buy") {
            CHECKC(parts.size() == 1, err::MEMO_FORMAT_ERROR, "invalid buy memo")
            CHECKC(bank == _gstate.pay_token.get_contract(), err::CONTRACT_MISMATCH, "payment token contract mismatch: " + bank.to_string())
            CHECKC(quant.symbol == _gstate.pay_token.get_symbol(), err::SYMBOL_MISMATCH, "payment symbol mismatch: " + quant.to_string())
            _on_buy(from, quant);
            return;
      }

      // ---- order:price ----
      if (cmd == "order") {
            CHECKC(parts.size() == 2, err::MEMO_FORMAT_ERROR, "invalid order memo")
            CHECKC(bank == _gstate.market_token.get_contract(), err::CONTRACT_MISMATCH, "market token contract mismatch: " + bank.to_string())
            CHECKC(quant.symbol == _gstate.market_token.get_symbol(), err::SYMBOL_MISMATCH, "market token symbol mismatch: " + quant.to_string())
            uint64_t price_amount = 0;
            CHECKC(str_to_uint64(parts[1], price_amount), err::MEMO_FORMAT_ERROR, "invalid order price: " + string(parts[1]))
            _on_add_order(from, quant, price_amount);
            return;
      }

      // ---- redeem:order_id ----
      if (cmd == "redeem") {
            CHECKC(parts.size() == 2, err::MEMO_FORMAT_ERROR, "invalid redeem memo")
            CHECKC(bank == _gstate.pay_token.get_contract(), err::CONTRACT_MISMATCH, "payment token contract mismatch: " + bank.to_string())
            CHECKC(quant.symbol == _gstate.pay_token.get_symbol(), err::SYMBOL_MISMATCH, "payment symbol mismatch: " + quant.to_string())
            uint64_t order_id = 0;
            CHECKC(str_to_uint64(parts[1], order_id), err::MEMO_FORMAT_ERROR, "invalid order id: " + string(parts[1]))
            _on_redeem(from, quant, order_id);
            return;
      }

      CHECKC(false, err::MEMO_FORMAT_ERROR, "invalid memo command")
}

void acdm_market::_on_buy(const name& buyer, const asset& payment) {
      auto& round = _gstate.round;
      CHECKC(round.current_type() == rules::round_type::sale && rules::round_active(_now(), round.ended_at.sec_since_epoch()),
             err::INAPPROPRIATE_ROUND, "InappropriateRound")
      CHECKC(round.sale_tokens_remaining.amount > 0, err::INSUFFICIENT_FUNDS, "No tokens left")

      const auto scale = _token_scale();
      const auto price = round.sale_price;

      auto want = _checked_amount(rules::tokens_for(payment.amount, price.amount, scale), "tokens wanted");
      CHECKC(want > 0, err::NOT_POSITIVE, "Not enough payment to buy a token")

      auto granted = asset(std::min(want, round.sale_tokens_remaining.amount), round.sale_tokens_remaining.symbol);
      auto cost    = asset(_checked_amount(rules::cost_for(granted.amount, price.amount, scale), "sale cost"), payment.symbol);
      // a zero cost is either too small a payment or a leftover too small to price
      CHECKC(cost.amount > 0 || granted.amount < want, err::NOT_POSITIVE, "Not enough payment to buy a token")
      CHECKC(cost.amount > 0, err::INSUFFICIENT_FUNDS, "remaining inventory below one priced unit")

      round.sale_tokens_remaining -= granted;

      const auto memo = "sale round: " + to_string(round.sale_round_count);
      _transfer_out(_gstate.market_token, buyer, granted, memo);
      if (payment > cost) {
            _transfer_out(_gstate.pay_token, buyer, payment - cost, "sale change");
      }

      // the net share stays with the market
      _route_referral_rewards(buyer, cost, _gstate.ref_rates.sale_l1, _gstate.ref_rates.sale_l2);

      NOTIFY(salebought_action, buyer, granted, cost)
}

void acdm_market::_on_add_order(const name& owner, const asset& quantity, const uint64_t& price_amount) {
      _check_trade_active();
      CHECKC(price_amount > 0 && price_amount <= (uint64_t)asset::max_amount, err::PARAM_ERROR, "Not valid price")
      CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "Not enough tokens")

      auto price    = asset((int64_t)price_amount, _gstate.pay_token.get_symbol());
      auto order_id = ++_gstate.last_order_id;

      orders_t orders(get_self(), get_self().value);
      orders.emplace(get_self(), [&](auto& row) {
            row.id         = order_id;
            row.owner      = owner;
            row.price      = price;
            row.quantity   = quantity;
            row.remaining  = quantity;
            row.created_at = time_point_sec(_now());
      });

      NOTIFY(orderadded_action, order_id, owner, quantity, price)
}

void acdm_market::removeorder(const name& owner, const uint64_t& order_id) {
      require_auth(owner);
      _check_initialized();
      reentrancy_guard guard(_gstate);

      orders_t orders(get_self(), get_self().value);
      auto itr = orders.find(order_id);
      CHECKC(itr != orders.end() && itr->owner == owner, err::RECORD_NOT_FOUND, "Not valid order id")

      auto remaining = itr->remaining;
      orders.erase(itr);

      _transfer_out(_gstate.market_token, owner, remaining, "order removed: " + to_string(order_id));

      NOTIFY(orderremoved_action, order_id, remaining)
}

void acdm_market::_on_redeem(const name& buyer, const asset& payment, const uint64_t& order_id) {
      _check_trade_active();

      orders_t orders(get_self(), get_self().value);
      auto itr = orders.find(order_id);
      CHECKC(itr != orders.end() && itr->remaining.amount > 0, err::RECORD_NOT_FOUND, "Order doesn't exist or filled")

      const auto scale = _token_scale();
      const auto price = itr->price;
      const auto owner = itr->owner;

      auto want = _checked_amount(rules::tokens_for(payment.amount, price.amount, scale), "tokens wanted");
      CHECKC(want > 0, err::NOT_POSITIVE, "Not enough payment to buy a token")

      auto granted = asset(std::min(want, itr->remaining.amount), itr->remaining.symbol);
      auto cost    = asset(_checked_amount(rules::cost_for(granted.amount, price.amount, scale), "order cost"), payment.symbol);
      CHECKC(cost.amount > 0 || granted.amount < want, err::NOT_POSITIVE, "Not enough payment to buy a token")
      CHECKC(cost.amount > 0, err::INSUFFICIENT_FUNDS, "remaining order amount below one priced unit")

      orders.modify(itr, same_payer, [&](auto& row) {
            row.remaining -= granted;
      });

      const auto memo = "order: " + to_string(order_id);
      _transfer_out(_gstate.market_token, buyer, granted, memo);

      // referral credit follows the seller's sponsor chain
      auto net = _route_referral_rewards(owner, cost, _gstate.ref_rates.trade_l1, _gstate.ref_rates.trade_l2);
      _transfer_out(_gstate.pay_token, owner, net, memo);

      if (payment > cost) {
            _transfer_out(_gstate.pay_token, buyer, payment - cost, "order change: " + to_string(order_id));
      }

      _gstate.round.trade_volume += cost;

      NOTIFY(orderredeem_action, order_id, buyer, granted, price)
}

void acdm_market::signup(const name& user, const name& sponsor) {
      require_auth(user);
      _check_initialized();

      CHECKC(sponsor.value != 0, err::ACCOUNT_INVALID, "Not valid sponsor")
      CHECKC(sponsor != user, err::ACCOUNT_INVALID, "Cannot refer yourself")

      referrals_t referrals(get_self(), get_self().value);
      CHECKC(referrals.find(sponsor.value) != referrals.end(), err::PARAM_ERROR, "Referrer should be registered")
      CHECKC(referrals.find(user.value) == referrals.end(), err::RECORD_EXISTING, "Reference already exists")

      referrals.emplace(user, [&](auto& row) {
            row.user       = user;
            row.sponsor    = sponsor;
            row.created_at = time_point_sec(_now());
      });

      NOTIFY(userreg_action, user, sponsor)
}

void acdm_market::withdraw(const name& to, const asset& quantity) {
      _check_initialized();
      require_auth(_gstate.admin);
      reentrancy_guard guard(_gstate);

      CHECKC(to != get_self() && is_account(to), err::ACCOUNT_INVALID, "Not valid recipient address")
      CHECKC(quantity.symbol == _gstate.pay_token.get_symbol(), err::SYMBOL_MISMATCH, "withdraw symbol mismatch: " + quantity.to_string())
      CHECKC(quantity.amount > 0 && quantity <= _pay_balance(), err::INSUFFICIENT_FUNDS, "Insufficient amount to transfer")

      _transfer_out(_gstate.pay_token, to, quantity, "withdraw");
}

void acdm_market::setrefrates(const uint8_t& round_type, const uint16_t& l1_rate, const uint16_t& l2_rate) {
      _check_initialized();
      require_auth(_gstate.admin);
      CHECKC(round_type <= (uint8_t)rules::round_type::trade, err::PARAM_ERROR, "invalid round type: " + to_string(round_type))
      CHECKC(rules::valid_rates(l1_rate, l2_rate), err::PARAM_ERROR, "referral rates must be within 0-100% in bps")

      auto& rates = _gstate.ref_rates;
      if ((rules::round_type)round_type == rules::round_type::sale) {
            rates.sale_l1  = l1_rate;
            rates.sale_l2  = l2_rate;
      } else {
            rates.trade_l1 = l1_rate;
            rates.trade_l2 = l2_rate;
      }

      NOTIFY(refcfgupdate_action, round_type, l1_rate, l2_rate)
}

void acdm_market::setduration(const uint32_t& seconds) {
      _check_initialized();
      require_auth(_gstate.admin);
      CHECKC(seconds > 0, err::NOT_POSITIVE, "round duration must be positive")

      _gstate.round_duration = seconds;

      NOTIFY(cfgupdate_action, "duration"_n, to_string(seconds))
}

void acdm_market::setsink(const name& sink) {
      _check_initialized();
      require_auth(_gstate.admin);
      CHECKC(is_account(sink), err::ACCOUNT_INVALID, "fallback sink not exist")

      _gstate.fallback_sink = sink;

      NOTIFY(cfgupdate_action, "sink"_n, sink.to_string())
}

void acdm_market::setrootl2(const bool& enabled) {
      _check_initialized();
      require_auth(_gstate.admin);

      _gstate.root_takes_l2 = enabled;

      NOTIFY(cfgupdate_action, "rootl2"_n, string(enabled ? "true" : "false"))
}

// ========= notifications =========

void acdm_market::roundstart(const uint8_t& round_type, const asset& price, const asset& quantity) {
      require_auth(get_self());
}

void acdm_market::salebought(const name& buyer, const asset& quantity, const asset& cost) {
      require_auth(get_self());
}

void acdm_market::orderadded(const uint64_t& order_id, const name& owner, const asset& quantity, const asset& price) {
      require_auth(get_self());
}

void acdm_market::orderremoved(const uint64_t& order_id, const asset& quantity) {
      require_auth(get_self());
}

void acdm_market::orderredeem(const uint64_t& order_id, const name& buyer, const asset& quantity, const asset& price) {
      require_auth(get_self());
}

void acdm_market::userreg(const name& user, const name& sponsor) {
      require_auth(get_self());
}

void acdm_market::refcfgupdate(const uint8_t& round_type, const uint16_t& l1_rate, const uint16_t& l2_rate) {
      require_auth(get_self());
}

void acdm_market::cfgupdate(const name& param, const string& value) {
      require_auth(get_self());
}

void acdm_market::rewardpaid(const name& principal, const name& receiver, const uint8_t& level, const asset& quantity) {
      require_auth(get_self());
}

// ========= referral =========

std::optional<name> acdm_market::_sponsor_of(const name& user) const {
      referrals_t referrals(get_self(), get_self().value);
      auto itr = referrals.find(user.value);
      if (itr == referrals.end()) return std::nullopt;
      return itr->sponsor;
}

asset acdm_market::_route_referral_rewards(const name& principal, const asset& base,
                                           const uint16_t& l1_rate, const uint16_t& l2_rate) {
      auto route = rules::route_rewards<name>(principal, base.amount, l1_rate, l2_rate,
                                              _gstate.fallback_sink, _gstate.root_takes_l2,
                                              [&](const name& user) { return _sponsor_of(user); });

      auto l1_reward = asset((int64_t)route.shares.l1, base.symbol);
      auto l2_reward = asset((int64_t)route.shares.l2, base.symbol);

      if (!route.sponsored) {
            // no sponsor chain: both shares go to the fallback sink in one payment
            _pay_reward(principal, route.l1_receiver, 0, l1_reward + l2_reward);
      } else {
            _pay_reward(principal, route.l1_receiver, 1, l1_reward);
            _pay_reward(principal, route.l2_receiver, 2, l2_reward);
      }

      return asset((int64_t)route.shares.net, base.symbol);
}

void acdm_market::_pay_reward(const name& principal, const name& receiver, const uint8_t& level, const asset& quantity) {
      if (quantity.amount == 0) return;

      _transfer_out(_gstate.pay_token, receiver, quantity, "referral reward L" + to_string(level) + ": " + principal.to_string());

      NOTIFY(rewardpaid_action, principal, receiver, level, quantity)
}

// ========= helpers =========

void acdm_market::_check_initialized() const {
      CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "market not initialized")
}

void acdm_market::_check_trade_active() const {
      const auto& round = _gstate.round;
      CHECKC(round.current_type() == rules::round_type::trade && rules::round_active(_now(), round.ended_at.sec_since_epoch()),
             err::INAPPROPRIATE_ROUND, "InappropriateRound")
}

uint32_t acdm_market::_now() const {
      return current_time_point().sec_since_epoch();
}

int64_t acdm_market::_token_scale() const {
      return get_precision(_gstate.market_token.get_symbol());
}

int64_t acdm_market::_checked_amount(const rules::uint128& value, const char* title) const {
      CHECKC(value <= (rules::uint128)asset::max_amount, err::OVERFLOWED, string(title) + " overflow")
      return (int64_t)value;
}

asset acdm_market::_pay_balance() const {
      return acdm_token::token::get_balance(_gstate.pay_token.get_contract(), get_self(), _gstate.pay_token.get_symbol());
}

// a payout to the market itself stays in its balance
void acdm_market::_transfer_out(const extended_symbol& token, const name& to, const asset& quantity, const string& memo) {
      if (quantity.amount <= 0 || to == get_self()) return;

      acdm_token::token::transfer_action act{ token.get_contract(), { {get_self(), active_perm} } };
      act.send(get_self(), to, quantity, memo);
}

} // namespace acdm
