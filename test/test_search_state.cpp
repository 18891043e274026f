#include "search_state.hpp"
#include "gtest/gtest.h"

namespace {


TEST(SearchState, sequences_stay_parallel) {
    SearchOptions opts;
    SearchState st(5, 12, opts);
    EXPECT_EQ(0u, st.steps());
    EXPECT_EQ(5ull, st.seed());
    EXPECT_EQ(5ull, st.last_remainder());

    st.push_step(3, 3);
    st.push_step(5, 3);
    EXPECT_EQ(2u, st.steps());
    EXPECT_EQ(st.multipliers().size() + 1, st.remainders().size());
    EXPECT_EQ(0u, st.generation());

    st.truncate(0);
    EXPECT_EQ(0u, st.steps());
    EXPECT_EQ(1u, st.remainders().size());
    EXPECT_EQ(5ull, st.last_remainder());
    EXPECT_EQ(1u, st.generation());

    // no-op truncation keeps the generation
    st.truncate(4);
    EXPECT_EQ(1u, st.generation());
}

TEST(SearchState, earliest_odd_multiplier) {
    SearchOptions opts;
    SearchState st(7, 16, opts);
    EXPECT_EQ(-1, st.earliest_odd_multiplier());
    st.push_step(4, 12);
    EXPECT_EQ(-1, st.earliest_odd_multiplier());
    st.push_step(3, 4);
    st.push_step(5, 4);
    EXPECT_EQ(1, st.earliest_odd_multiplier());
}

TEST(SearchBudget, visit_and_backtrack_limits) {
    SearchBudget b(3, 1);
    EXPECT_TRUE(b.can_backtrack());
    EXPECT_TRUE(b.visit());
    EXPECT_TRUE(b.visit());
    b.note_backtrack();
    EXPECT_FALSE(b.can_backtrack());
    EXPECT_TRUE(b.visit());
    EXPECT_FALSE(b.visit());
    EXPECT_TRUE(b.nodes_exhausted());
    EXPECT_EQ(3, b.nodes);
}


}  // end unnamed namespace
