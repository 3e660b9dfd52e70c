#include <gtest/gtest.h>
#include <stdexcept>
#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/error.hpp"
#include "stepgraph/core/stepper.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

namespace {

Stepper dijkstra_stepper(const Graph& g) { return Stepper(make_dijkstra(g, 0, g.num_nodes() - 1)); }

} // namespace

TEST(Stepper, StartsBeforeTheFirstStep) {
  auto g = make_line_graph(4);
  auto st = dijkstra_stepper(g);
  EXPECT_EQ(st.position(), 0u);
  EXPECT_EQ(st.current(), nullptr);
  EXPECT_EQ(st.buffered(), 0u);
  EXPECT_EQ(st.producer_calls(), 0);
  // prev at position 0 is a no-op
  EXPECT_EQ(st.prev(), nullptr);
  EXPECT_EQ(st.position(), 0u);
}

TEST(Stepper, NextPullsOnlyAtTheEndOfTheBuffer) {
  auto g = make_line_graph(4);
  auto st = dijkstra_stepper(g);
  const Step* s0 = st.next();
  ASSERT_NE(s0, nullptr);
  EXPECT_EQ(s0->step_number, 0);
  const Step* s1 = st.next();
  ASSERT_NE(s1, nullptr);
  EXPECT_EQ(s1->step_number, 1);
  EXPECT_EQ(st.producer_calls(), 2);

  EXPECT_EQ(st.prev(), s0);
  EXPECT_EQ(st.next(), s1);
  EXPECT_EQ(st.producer_calls(), 2);
  EXPECT_EQ(st.buffered(), 2u);
}

TEST(Stepper, RewindFidelity) {
  RandomGraphParams p;
  p.num_nodes = 12;
  auto g = generate_random(p, 5);
  for (std::size_t k : {1u, 3u, 7u}) {
    SCOPED_TRACE(k);
    Stepper reference(make_dijkstra(g, 0, 11));
    const Step* direct = reference.seek(k);
    ASSERT_NE(direct, nullptr);
    Step expected = *direct;

    Stepper st(make_dijkstra(g, 0, 11));
    st.seek(k);
    auto calls = st.producer_calls();
    st.rewind();
    EXPECT_EQ(st.current(), nullptr);
    const Step* again = st.seek(k);
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(*again, expected);
    EXPECT_EQ(st.producer_calls(), calls);
    EXPECT_EQ(calls, static_cast<std::int64_t>(k));
  }
}

TEST(Stepper, BufferNeverShrinks) {
  auto g = make_open_grid(4, 4);
  Stepper st(make_bfs(g, 0, 15));
  std::size_t high = 0;
  auto check = [&]() {
    EXPECT_GE(st.buffered(), high);
    high = st.buffered();
    EXPECT_LE(st.position(), st.buffered());
  };
  st.seek(6); check();
  st.prev(); check();
  st.prev(); check();
  st.rewind(); check();
  st.next(); check();
  st.seek(3); check();
  st.seek(10); check();
  st.run_to_end(); check();
  st.seek(2); check();
  EXPECT_EQ(st.position(), 2u);
}

TEST(Stepper, ExhaustionIsIdempotent) {
  auto g = make_line_graph(3);
  Stepper st(make_bfs(g, 0, 2));
  const Step* last = st.run_to_end();
  ASSERT_NE(last, nullptr);
  EXPECT_TRUE(last->is_final());
  EXPECT_TRUE(st.exhausted());
  auto calls = st.producer_calls();
  const auto end = st.position();
  EXPECT_EQ(st.next(), nullptr);
  EXPECT_EQ(st.next(), nullptr);
  EXPECT_EQ(st.position(), end);
  EXPECT_EQ(st.run_to_end(), last);
  EXPECT_EQ(st.producer_calls(), calls);
  EXPECT_EQ(st.current(), last);
}

TEST(Stepper, SeekPastTheEndStopsOnTheLastStep) {
  auto g = make_line_graph(3);
  Stepper st(make_bfs(g, 0, 2));
  const Step* s = st.seek(10000);
  ASSERT_NE(s, nullptr);
  EXPECT_TRUE(s->is_final());
  EXPECT_EQ(st.position(), st.buffered());
  EXPECT_EQ(st.seek(0), nullptr);
  EXPECT_EQ(&st.at(0), st.seek(1));
  EXPECT_THROW((void)st.at(st.buffered()), std::out_of_range);
}

TEST(Stepper, StepReferencesStayValidWhileBuffering) {
  auto g = make_open_grid(5, 5);
  Stepper st(make_dijkstra(g, 0, 24));
  const Step* first = st.next();
  Step copy = *first;
  st.run_to_end();
  EXPECT_EQ(*first, copy);
}

TEST(Stepper, NullProducerRejected) {
  EXPECT_THROW({ Stepper st(StepProducerPtr{}); }, RuntimeError);
}
