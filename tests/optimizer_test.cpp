#include <algorithm>
#include <map>
#include <random>
#include <set>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "optimizer.hpp"

using namespace seatswap;
using namespace seatswap::testing;
using enum BerthType;

namespace {

ScaledMatrix zeros(int n){ return ScaledMatrix(n, std::vector<long long>(n, 0)); }

std::vector<Ticket> randomTickets(unsigned seed, int count){
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> coach(1, 3), seat(1, 40), berth(0, 4), size(1, 3);
    const BerthType berths[] = {LB, MB, UB, SL, SU};

    std::vector<Ticket> out;
    for(int t = 0; t < count; t++){
        std::vector<SeatSpec> seats;
        std::set<std::pair<std::string,int>> used;
        for(int i = size(rng); i > 0; i--){
            SeatSpec s{"B" + std::to_string(coach(rng)), seat(rng), berths[berth(rng)]};
            if(used.insert({s.coach, s.seat}).second) seats.push_back(s);
        }
        out.push_back(makeTicket("T" + std::to_string(t), "u" + std::to_string(t), seats));
    }
    return out;
}

void expectCycleCover(const GlobalMatchResult& r){
    std::map<int,int> out, in;
    for(auto [from, to] : r.selected_edges){
        EXPECT_NE(from, to);
        out[from]++;
        in[to]++;
    }
    std::set<int> nodes;
    for(auto [v, d] : out) nodes.insert(v);
    for(auto [v, d] : in) nodes.insert(v);
    for(int v : nodes){
        EXPECT_LE(out[v], 1) << "node " << v;
        EXPECT_EQ(out[v], in[v]) << "node " << v;
    }

    std::set<std::string> seen;
    for(const auto& c : r.cycles)
        for(const auto& id : c.ticket_ids) EXPECT_TRUE(seen.insert(id).second) << id << " in two cycles";
}

// The parameter is HEURISTIC-ONLY.
std::unique_ptr<CycleOptimizer> optimizerFor(bool heuristicOnly){
    Settings settings;
    settings.HEURISTIC_ONLY = heuristicOnly;
    return makeCycleOptimizer(settings);
}

// Named after the backend the factory resolved to, so a build without the solver does not report it.
std::string backendName(const ::testing::TestParamInfo<bool>& info){
    std::string name = (info.param ? "HeuristicOnly_" : "Default_") + optimizerFor(info.param)->name();
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

class OptimizerTest : public ::testing::TestWithParam<bool> {
protected:
    std::unique_ptr<CycleOptimizer> optimizer(){ return optimizerFor(GetParam()); }
};

} // namespace

TEST_P(OptimizerTest, SelectsTheOnlyTriangle) {
    ScaledMatrix scaled = zeros(3);
    scaled[0][1] = 400; scaled[1][2] = 350; scaled[2][0] = 300;

    auto selection = optimizer()->selectEdges(scaled, std::chrono::seconds(5));
    EXPECT_NE(selection.status, SolveStatus::NO_SOLUTION);
    EXPECT_EQ(selection.successor, (std::vector<int>{1, 2, 0}));
}

TEST_P(OptimizerTest, SolvesSwapAndLeavesOneWayEdgeOut) {
    std::vector<Ticket> tickets = {
        makeTicket("T1", "u1", {{"B2", 1, UB}}),
        makeTicket("T2", "u2", {{"B2", 2, LB}}),
        makeTicket("T3", "u3", {{"A1", 70, UB}}), // only T3 -> T2 has weight
    };

    GlobalMatchResult r = optimizer()->solve(tickets, {}, std::chrono::seconds(5));
    ASSERT_EQ(r.cycles.size(), 1u);
    EXPECT_EQ(r.cycles[0].ticket_ids, (std::vector<std::string>{"T1", "T2"}));
    EXPECT_EQ(r.cycles[0].edge_scores, (std::vector<double>{75, 65}));
    EXPECT_DOUBLE_EQ(r.cycles[0].total_score, 140.0);
    EXPECT_EQ(r.selected_edges, (std::vector<std::pair<int,int>>{{0, 1}, {1, 0}}));
    EXPECT_EQ(r.traded_tickets, 2);
    EXPECT_EQ(r.sum_squares, 4);
    EXPECT_EQ(r.group_sizes, (std::vector<size_t>{2}));
    EXPECT_EQ(r.backend, optimizer()->name());
}

TEST_P(OptimizerTest, NoPositiveEdgeReturnsEmptyWithoutSolving) {
    std::vector<Ticket> tickets = {
        makeTicket("T1", "u1", {{"A1", 3, UB}}),
        makeTicket("T2", "u2", {{"B5", 3, UB}}),
    };
    GlobalMatchResult r = optimizer()->solve(tickets, {}, std::chrono::seconds(5));
    EXPECT_EQ(r.status, SolveStatus::NO_EDGES);
    EXPECT_TRUE(r.cycles.empty());
    EXPECT_TRUE(r.selected_edges.empty());

    EXPECT_EQ(optimizer()->solve({}, {}, std::chrono::seconds(5)).status, SolveStatus::NO_EDGES);
}

TEST_P(OptimizerTest, SelectedEdgesFormDisjointCycles) {
    for(unsigned seed = 1; seed <= 8; seed++){
        GlobalMatchResult r = optimizer()->solve(randomTickets(seed, 18), {}, std::chrono::seconds(5));
        expectCycleCover(r);

        double sum = 0;
        for(const auto& c : r.cycles) sum += c.ticket_ids.size();
        EXPECT_EQ(r.traded_tickets, int(sum));
    }
}

TEST_P(OptimizerTest, OneUsersTicketsNeverTradeWithEachOther) {
    std::vector<Ticket> tickets = {
        makeTicket("T1", "u1", {{"B2", 1, LB}}),
        makeTicket("T2", "u1", {{"B2", 2, LB}}),
    };
    GlobalMatchResult r = optimizer()->solve(tickets, {}, std::chrono::seconds(5));
    EXPECT_EQ(r.status, SolveStatus::NO_EDGES);
    EXPECT_TRUE(r.cycles.empty());

    tickets.push_back(makeTicket("T3", "u2", {{"B2", 3, LB}}));
    r = optimizer()->solve(tickets, {}, std::chrono::seconds(5));
    for(const auto& c : r.cycles){
        int own = std::count(c.ticket_ids.begin(), c.ticket_ids.end(), "T1") + std::count(c.ticket_ids.begin(), c.ticket_ids.end(), "T2");
        EXPECT_LE(own, 1);
    }
}

INSTANTIATE_TEST_SUITE_P(Backends, OptimizerTest, ::testing::Bool(), backendName);

TEST(OptimizerFactoryTest, HeuristicOnlyForcesFallback) {
    Settings settings;
    settings.HEURISTIC_ONLY = true;
    EXPECT_EQ(makeCycleOptimizer(settings)->name(), "heuristic");

    settings.HEURISTIC_ONLY = false;
    EXPECT_EQ(makeCycleOptimizer(settings)->name(), hasSolverBackend() ? "network-simplex" : "heuristic");
}

TEST(HeuristicOptimizerTest, ReportsHeuristicStatus) {
    ScaledMatrix scaled = zeros(2);
    scaled[0][1] = 100; scaled[1][0] = 50;
    auto selection = HeuristicCycleOptimizer(60).selectEdges(scaled, std::chrono::seconds(1));
    EXPECT_EQ(selection.status, SolveStatus::HEURISTIC);
    EXPECT_EQ(selection.successor, (std::vector<int>{1, 0}));
}

TEST(HeuristicOptimizerTest, IgnoresNodesBeyondPool) {
    ScaledMatrix scaled = zeros(3);
    scaled[1][2] = 100; scaled[2][1] = 50;
    auto selection = HeuristicCycleOptimizer(2).selectEdges(scaled, std::chrono::seconds(1));
    EXPECT_EQ(selection.successor, (std::vector<int>{-1, -1, -1}));
}

#ifdef SEATSWAP_HAVE_NETWORK_SIMPLEX
TEST(NetworkOptimizerTest, FindsReverseRotationTriangle) {
    ScaledMatrix scaled = zeros(3);
    scaled[0][2] = 400; scaled[2][1] = 350; scaled[1][0] = 300;

    auto selection = NetworkCycleOptimizer().selectEdges(scaled, std::chrono::seconds(5));
    EXPECT_EQ(selection.status, SolveStatus::OPTIMAL);
    EXPECT_EQ(selection.successor, (std::vector<int>{2, 0, 1}));
}

TEST(NetworkOptimizerTest, BeatsGreedyPacking) {
    ScaledMatrix scaled = zeros(4);
    scaled[0][1] = scaled[1][0] = 500;
    scaled[1][2] = scaled[2][1] = 450;
    scaled[0][3] = scaled[3][0] = 450;

    auto selection = NetworkCycleOptimizer().selectEdges(scaled, std::chrono::seconds(5));
    EXPECT_EQ(selection.successor, (std::vector<int>{3, 2, 1, 0}));
}

TEST(NetworkOptimizerTest, FindsLongCycles) {
    ScaledMatrix scaled = zeros(5);
    for(int v = 0; v < 5; v++) scaled[v][(v + 1) % 5] = 100;

    auto selection = NetworkCycleOptimizer().selectEdges(scaled, std::chrono::seconds(5));
    EXPECT_EQ(selection.successor, (std::vector<int>{1, 2, 3, 4, 0}));
}
#endif
