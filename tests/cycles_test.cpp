#include <random>
#include <set>

#include <gtest/gtest.h>

#include "cycles.hpp"
#include "fixtures.hpp"

using namespace seatswap;
using namespace seatswap::testing;
using enum BerthType;

namespace {

WeightMatrix zeros(int n){ return WeightMatrix(n, std::vector<double>(n, 0.0)); }

} // namespace

TEST(SmallCyclesTest, FindsForwardTriangle) {
    WeightMatrix W = zeros(3);
    W[0][1] = 40; W[1][2] = 35; W[2][0] = 30;

    auto cycles = packSmallCycles(W);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].members, (std::vector<int>{0, 1, 2}));
    EXPECT_DOUBLE_EQ(cycles[0].total, 105.0);

    Cycle c = describeCycle({"T0", "T1", "T2"}, cycles[0].members, W);
    EXPECT_EQ(c.ticket_ids, (std::vector<std::string>{"T0", "T1", "T2"}));
    EXPECT_EQ(c.edge_scores, (std::vector<double>{40, 35, 30}));
    EXPECT_DOUBLE_EQ(c.total_score, 105.0);
    EXPECT_EQ(c.description, "3-way cycle: T0 -> T1 -> T2");
}

// Only the i -> j -> k -> i rotation is enumerated, so a triangle running i -> k -> j -> i is missed.
TEST(SmallCyclesTest, ReverseRotationTriangleIsNotEnumerated) {
    WeightMatrix W = zeros(3);
    W[0][2] = 40; W[2][1] = 35; W[1][0] = 30;
    EXPECT_TRUE(packSmallCycles(W).empty());
}

TEST(SmallCyclesTest, TwoCycleNeedsBothDirections) {
    WeightMatrix W = zeros(2);
    W[0][1] = 50;
    EXPECT_TRUE(packSmallCycles(W).empty());

    W[1][0] = 20;
    auto cycles = packSmallCycles(W);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_DOUBLE_EQ(cycles[0].total, 70.0);
    EXPECT_EQ(describeCycle({"A", "B"}, cycles[0].members, W).description, "2-way swap: A <-> B");
}

TEST(SmallCyclesTest, GreedyNeverDisplacesAcceptedCycle) {
    WeightMatrix W = zeros(4);
    W[0][1] = W[1][0] = 50;   // {0,1} = 100
    W[1][2] = W[2][1] = 45;   // {1,2} = 90
    W[0][3] = W[3][0] = 45;   // {0,3} = 90

    auto cycles = packSmallCycles(W);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].members, (std::vector<int>{0, 1}));
}

TEST(SmallCyclesTest, MaxLengthTwoSkipsTriangles) {
    WeightMatrix W = zeros(3);
    W[0][1] = 40; W[1][2] = 35; W[2][0] = 30;
    EXPECT_TRUE(packSmallCycles(W, 2).empty());
}

TEST(SmallCyclesTest, AcceptedCyclesAreDisjoint) {
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> weight(-20, 60);

    for(int round = 0; round < 20; round++){
        int n = 14;
        WeightMatrix W = zeros(n);
        for(int i = 0; i < n; i++)
            for(int j = 0; j < n; j++) if(i != j) W[i][j] = std::max(0, weight(rng));

        std::set<int> seen;
        double previous = 1e18;
        for(const auto& c : packSmallCycles(W)){
            EXPECT_LE(c.total, previous);
            previous = c.total;
            for(int v : c.members) EXPECT_TRUE(seen.insert(v).second) << "node " << v << " used twice";
        }
    }
}

TEST(SmallCyclesTest, FindsSwapBetweenTickets) {
    std::vector<Ticket> tickets = {
        makeTicket("T1", "u1", {{"B2", 1, UB}}),
        makeTicket("T2", "u2", {{"B2", 2, LB}}),
        makeTicket("T3", "u3", {{"A1", 70, UB}}),
    };

    auto cycles = findSmallCycles(tickets, {}, 60);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].ticket_ids, (std::vector<std::string>{"T1", "T2"}));
    EXPECT_DOUBLE_EQ(cycles[0].total_score, 140.0);

    EXPECT_TRUE(findSmallCycles(tickets, {}, 1).empty());
}
