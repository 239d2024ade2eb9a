#pragma once

#include <cstdint>
#include <optional>
#include <utility>

namespace acdm { namespace rules {

using uint128 = unsigned __int128;

static constexpr uint64_t RATE_SCALE        = 10'000;     // basis points
static constexpr uint64_t PRICE_GROWTH_NUM  = 103;
static constexpr uint64_t PRICE_GROWTH_DEN  = 100;

enum class round_type: uint8_t {
   sale  = 0,
   trade = 1
};

// =====================================================
// pricing
// =====================================================

// floor(native_amount * token_scale / price), 0 when price is 0
inline uint128 tokens_for(uint64_t native_amount, uint64_t price, uint64_t token_scale) {
   if (price == 0) return 0;
   return (uint128)native_amount * token_scale / price;
}

// floor(token_amount * price / token_scale)
inline uint128 cost_for(uint64_t token_amount, uint64_t price, uint64_t token_scale) {
   if (token_scale == 0) return 0;
   return (uint128)token_amount * price / token_scale;
}

// floor(previous * 1.03) + increment
inline uint128 next_price(uint64_t previous, uint64_t increment) {
   return (uint128)previous * PRICE_GROWTH_NUM / PRICE_GROWTH_DEN + increment;
}

// =====================================================
// rounds
// =====================================================

inline bool round_active(uint32_t now, uint32_t ended_at) {
   return now < ended_at;
}

/**
 * A sale round may only follow a trade round whose clock has run out.
 */
inline bool can_start_sale(round_type current, uint32_t now, uint32_t ended_at) {
   return current != round_type::sale
       && (current != round_type::trade || !round_active(now, ended_at));
}

/**
 * A trade round may follow a sale round once its clock has run out or its inventory
 * is sold out, whichever comes first.
 */
inline bool can_start_trade(round_type current, uint32_t now, uint32_t ended_at, uint64_t tokens_remaining) {
   return current != round_type::trade
       && (!round_active(now, ended_at) || tokens_remaining == 0);
}

// =====================================================
// referral rewards
// =====================================================

inline bool valid_rates(uint64_t l1_rate, uint64_t l2_rate) {
   return l1_rate <= RATE_SCALE && l2_rate <= RATE_SCALE && l1_rate + l2_rate <= RATE_SCALE;
}

struct reward_shares {
   uint64_t net   = 0;
   uint64_t l1    = 0;
   uint64_t l2    = 0;
};

// net + l1 + l2 == base for any rates accepted by valid_rates()
inline reward_shares split_shares(uint64_t base, uint64_t l1_rate, uint64_t l2_rate) {
   reward_shares shares;
   shares.l1  = (uint64_t)((uint128)base * l1_rate / RATE_SCALE);
   shares.l2  = (uint64_t)((uint128)base * l2_rate / RATE_SCALE);
   shares.net = base - shares.l1 - shares.l2;
   return shares;
}

template<typename Account>
struct reward_route {
   bool           sponsored = false;    // false: principal has no upstream edge
   Account        l1_receiver{};
   Account        l2_receiver{};
   reward_shares  shares;
};

/**
 * Resolve who receives the two referral shares of `base`.
 *
 * The L1 share goes to the principal's sponsor and the L2 share to the sponsor's sponsor.
 * A principal without a sponsor sends both shares to `fallback_sink`. The referral root is
 * its own sponsor: when it is someone's L1, the L2 share goes back to the root only if
 * `root_takes_l2` is set and to `fallback_sink` otherwise.
 *
 * @param sponsor_of - callable `std::optional<Account>(const Account&)`
 */
template<typename Account, typename SponsorOf>
reward_route<Account> route_rewards(const Account& principal,
                                    uint64_t base,
                                    uint64_t l1_rate,
                                    uint64_t l2_rate,
                                    const Account& fallback_sink,
                                    bool root_takes_l2,
                                    SponsorOf&& sponsor_of) {
   reward_route<Account> route;
   route.shares = split_shares(base, l1_rate, l2_rate);

   std::optional<Account> l1 = sponsor_of(principal);
   if (!l1) {
      route.l1_receiver = fallback_sink;
      route.l2_receiver = fallback_sink;
      return route;
   }

   route.sponsored   = true;
   route.l1_receiver = *l1;

   std::optional<Account> l2 = sponsor_of(*l1);
   const bool self_sponsored = l2 && *l2 == *l1;
   if (!l2 || (self_sponsored && !root_takes_l2)) {
      route.l2_receiver = fallback_sink;
   } else {
      route.l2_receiver = *l2;
   }
   return route;
}

} } // namespace acdm::rules
