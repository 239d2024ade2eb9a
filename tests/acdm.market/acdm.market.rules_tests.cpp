#define BOOST_TEST_MODULE acdm_rules
#include <boost/test/unit_test.hpp>

#include <acdm.market/acdm.market.rules.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <vector>

using namespace acdm::rules;

namespace {

constexpr uint64_t ACDM_SCALE       = 1'000'000;        // 6 decimals
constexpr uint64_t SEED_PRICE       = 1000;             // 0.00001000 AMAX
constexpr uint64_t SEED_VOLUME      = 1'0000'0000;      // 1.00000000 AMAX
constexpr uint64_t PRICE_INCREMENT  = 400;              // 0.00000400 AMAX

constexpr uint64_t ROOT  = 1;
constexpr uint64_t BOB   = 2;
constexpr uint64_t CAROL = 3;
constexpr uint64_t DAVE  = 4;
constexpr uint64_t SINK  = 99;

struct referral_graph {
   std::map<uint64_t, uint64_t> edges = { { ROOT, ROOT } };

   std::optional<uint64_t> operator()(const uint64_t& user) const {
      auto itr = edges.find(user);
      if (itr == edges.end()) return std::nullopt;
      return itr->second;
   }
};

uint64_t u64(const uint128& v) { return (uint64_t)v; }

} // namespace

BOOST_AUTO_TEST_SUITE(pricing_tests)

BOOST_AUTO_TEST_CASE(first_sale_round_amount) {
   // 1 AMAX of volume at 0.00001 AMAX per token
   BOOST_CHECK_EQUAL(u64(tokens_for(SEED_VOLUME, SEED_PRICE, ACDM_SCALE)), 100'000'000'000ULL);
   BOOST_CHECK_EQUAL(u64(cost_for(100'000'000'000ULL, SEED_PRICE, ACDM_SCALE)), SEED_VOLUME);
}

BOOST_AUTO_TEST_CASE(price_sequence_is_exact) {
   BOOST_CHECK_EQUAL(u64(next_price(SEED_PRICE, PRICE_INCREMENT)), 1430u);
   BOOST_CHECK_EQUAL(u64(next_price(1430, PRICE_INCREMENT)), 1872u);
   BOOST_CHECK_EQUAL(u64(next_price(1872, PRICE_INCREMENT)), 2328u);

   uint64_t price = SEED_PRICE;
   for (int round = 0; round < 200; ++round) {
      uint64_t expected = price * 103 / 100 + PRICE_INCREMENT;
      uint64_t next = u64(next_price(price, PRICE_INCREMENT));
      BOOST_REQUIRE_EQUAL(next, expected);
      BOOST_REQUIRE_GT(next, price);
      price = next;
   }
}

BOOST_AUTO_TEST_CASE(conversions_truncate) {
   BOOST_CHECK_EQUAL(u64(tokens_for(1, SEED_PRICE, ACDM_SCALE)), 1000u);
   BOOST_CHECK_EQUAL(u64(tokens_for(0, SEED_PRICE, ACDM_SCALE)), 0u);
   BOOST_CHECK_EQUAL(u64(tokens_for(99, 100'000'000, ACDM_SCALE)), 0u);
   BOOST_CHECK_EQUAL(u64(tokens_for(1'0000'0000, 0, ACDM_SCALE)), 0u);

   BOOST_CHECK_EQUAL(u64(cost_for(999, SEED_PRICE, ACDM_SCALE)), 0u);
   BOOST_CHECK_EQUAL(u64(cost_for(1999, SEED_PRICE, ACDM_SCALE)), 1u);
}

BOOST_AUTO_TEST_CASE(nonzero_tokens_can_cost_nothing) {
   // callers must reject these, the token amount alone is not enough
   BOOST_CHECK_EQUAL(u64(tokens_for(1, 999, ACDM_SCALE)), 1001u);
   BOOST_CHECK_EQUAL(u64(cost_for(1001, 999, ACDM_SCALE)), 0u);

   BOOST_CHECK_EQUAL(u64(tokens_for(1, 1430, ACDM_SCALE)), 699u);
   BOOST_CHECK_EQUAL(u64(cost_for(699, 1430, ACDM_SCALE)), 0u);
   BOOST_CHECK_EQUAL(u64(cost_for(1398, 1430, ACDM_SCALE)), 1u);
}

BOOST_AUTO_TEST_CASE(cost_never_exceeds_payment) {
   const std::vector<uint64_t> prices   = { 1, 7, 999, 1000, 1430, 123'457, 100'000'000 };
   const std::vector<uint64_t> payments = { 1, 3, 99, 1000, 7'000'001, 250'000'000, 999'999'999'999 };
   for (auto price : prices) {
      for (auto payment : payments) {
         uint64_t tokens = u64(tokens_for(payment, price, ACDM_SCALE));
         BOOST_CHECK_LE(u64(cost_for(tokens, price, ACDM_SCALE)), payment);
      }
   }
}

BOOST_AUTO_TEST_CASE(purchase_clamps_to_inventory) {
   const uint64_t inventory = 100'000'000'000ULL;
   const uint64_t payment   = 2'5000'0000;              // 2.5 AMAX

   uint64_t want    = u64(tokens_for(payment, SEED_PRICE, ACDM_SCALE));
   uint64_t granted = std::min(want, inventory);
   uint64_t cost    = u64(cost_for(granted, SEED_PRICE, ACDM_SCALE));

   BOOST_CHECK_EQUAL(want, 250'000'000'000ULL);
   BOOST_CHECK_EQUAL(granted, inventory);
   BOOST_CHECK_EQUAL(cost, 1'0000'0000u);
   BOOST_CHECK_EQUAL(payment - cost, 1'5000'0000u);
}

BOOST_AUTO_TEST_CASE(partial_fills_deliver_whole_order) {
   const uint64_t order_amount = 50'000'000'000ULL;     // 50000 ACDM
   const uint64_t price        = 10'000;                // 0.0001 AMAX
   const std::vector<uint64_t> payments = { 5000'0000, 1, 3333'3333, 1'5000'0000, 7, 9'0000'0000, 2'0000'0000 };

   uint64_t remaining = order_amount;
   uint64_t delivered = 0;
   for (auto payment : payments) {
      if (remaining == 0) break;
      uint64_t want = u64(tokens_for(payment, price, ACDM_SCALE));
      if (want == 0) continue;
      uint64_t granted = std::min(want, remaining);
      BOOST_REQUIRE_LE(granted, remaining);
      remaining -= granted;
      delivered += granted;
   }
   BOOST_CHECK_EQUAL(remaining, 0u);
   BOOST_CHECK_EQUAL(delivered, order_amount);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(round_guard_tests)

BOOST_AUTO_TEST_CASE(sale_needs_expired_trade) {
   BOOST_CHECK(can_start_sale(round_type::trade, 100, 100));
   BOOST_CHECK(can_start_sale(round_type::trade, 150, 100));
   BOOST_CHECK(!can_start_sale(round_type::trade, 99, 100));
   BOOST_CHECK(!can_start_sale(round_type::sale, 150, 100));
   BOOST_CHECK(!can_start_sale(round_type::sale, 50, 100));
}

BOOST_AUTO_TEST_CASE(trade_after_expiry_or_sell_out) {
   BOOST_CHECK(!can_start_trade(round_type::sale, 50, 100, 10));
   BOOST_CHECK(can_start_trade(round_type::sale, 50, 100, 0));
   BOOST_CHECK(can_start_trade(round_type::sale, 100, 100, 10));
   BOOST_CHECK(!can_start_trade(round_type::trade, 150, 100, 0));
   BOOST_CHECK(!can_start_trade(round_type::trade, 50, 100, 0));
}

BOOST_AUTO_TEST_CASE(round_expiry_boundary) {
   BOOST_CHECK(round_active(99, 100));
   BOOST_CHECK(!round_active(100, 100));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(referral_tests)

BOOST_AUTO_TEST_CASE(rate_limits) {
   BOOST_CHECK(valid_rates(0, 0));
   BOOST_CHECK(valid_rates(10000, 0));
   BOOST_CHECK(valid_rates(5000, 5000));
   BOOST_CHECK(!valid_rates(5001, 5000));
   BOOST_CHECK(!valid_rates(10001, 0));
}

BOOST_AUTO_TEST_CASE(split_identity_holds) {
   const std::vector<uint64_t> rates = { 0, 1, 250, 300, 333, 500, 2500, 4999, 5000, 9999, 10000 };
   const std::vector<uint64_t> bases = { 0, 1, 3, 7, 99, 10'001, 5000'0000, 1'0000'0000, 4'611'686'018'427'387'903ULL };
   for (auto base : bases) {
      for (auto l1 : rates) {
         for (auto l2 : rates) {
            if (!valid_rates(l1, l2)) continue;
            auto shares = split_shares(base, l1, l2);
            BOOST_REQUIRE_EQUAL(shares.net + shares.l1 + shares.l2, base);
            BOOST_REQUIRE_EQUAL(shares.l1, u64((uint128)base * l1 / RATE_SCALE));
         }
      }
   }
}

BOOST_AUTO_TEST_CASE(sponsor_chain_routes_two_levels) {
   referral_graph graph;
   graph.edges[BOB]   = ROOT;
   graph.edges[CAROL] = BOB;

   auto route = route_rewards<uint64_t>(CAROL, 1'0000'0000, 500, 300, SINK, false, graph);
   BOOST_CHECK(route.sponsored);
   BOOST_CHECK_EQUAL(route.l1_receiver, BOB);
   BOOST_CHECK_EQUAL(route.l2_receiver, ROOT);
   BOOST_CHECK_EQUAL(route.shares.l1, 500'0000u);
   BOOST_CHECK_EQUAL(route.shares.l2, 300'0000u);
   BOOST_CHECK_EQUAL(route.shares.net, 9200'0000u);
}

BOOST_AUTO_TEST_CASE(root_as_first_level) {
   referral_graph graph;
   graph.edges[BOB] = ROOT;

   auto to_sink = route_rewards<uint64_t>(BOB, 1'0000'0000, 500, 300, SINK, false, graph);
   BOOST_CHECK(to_sink.sponsored);
   BOOST_CHECK_EQUAL(to_sink.l1_receiver, ROOT);
   BOOST_CHECK_EQUAL(to_sink.l2_receiver, SINK);

   auto to_root = route_rewards<uint64_t>(BOB, 1'0000'0000, 500, 300, SINK, true, graph);
   BOOST_CHECK_EQUAL(to_root.l1_receiver, ROOT);
   BOOST_CHECK_EQUAL(to_root.l2_receiver, ROOT);
   BOOST_CHECK_EQUAL(to_root.shares.net + to_root.shares.l1 + to_root.shares.l2, 1'0000'0000u);
}

BOOST_AUTO_TEST_CASE(unregistered_principal_pays_fallback) {
   referral_graph graph;
   graph.edges[BOB] = ROOT;

   auto route = route_rewards<uint64_t>(DAVE, 5000'0000, 250, 250, SINK, true, graph);
   BOOST_CHECK(!route.sponsored);
   BOOST_CHECK_EQUAL(route.l1_receiver, SINK);
   BOOST_CHECK_EQUAL(route.l2_receiver, SINK);
   BOOST_CHECK_EQUAL(route.shares.l1 + route.shares.l2, 250'0000u);
   BOOST_CHECK_EQUAL(route.shares.net, 4750'0000u);
}

BOOST_AUTO_TEST_CASE(identity_across_registration_states) {
   referral_graph graph;
   graph.edges[BOB]   = ROOT;
   graph.edges[CAROL] = BOB;

   for (auto principal : { ROOT, BOB, CAROL, DAVE }) {
      for (bool root_takes_l2 : { false, true }) {
         auto route = route_rewards<uint64_t>(principal, 12'345'679, 333, 4999, SINK, root_takes_l2, graph);
         BOOST_CHECK_EQUAL(route.shares.net + route.shares.l1 + route.shares.l2, 12'345'679u);
      }
   }
}

BOOST_AUTO_TEST_SUITE_END()
