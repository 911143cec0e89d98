#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace seatswap {

enum class SolveStatus { OPTIMAL, FEASIBLE, HEURISTIC, NO_EDGES, NO_SOLUTION };
std::string toString(SolveStatus status);

// Scores are scaled to integers before solving and divided back when decoding.
constexpr long long WEIGHT_SCALE = 10;

using ScaledMatrix = std::vector<std::vector<long long>>;

struct GlobalMatchResult {
    std::vector<Cycle> cycles;                      // largest groups first
    std::vector<std::pair<int,int>> selected_edges; // (taker, source) indices into the input tickets
    SolveStatus status = SolveStatus::NO_EDGES;
    std::string backend;
    long long elapsed_ms = 0;

    int traded_tickets = 0;
    long long sum_squares = 0;
    std::vector<size_t> group_sizes;
};

// Maximum-weight set of vertex-disjoint directed cycles over a ticket pool. An edge i -> j means
// ticket i takes the seats of ticket j and is worth score(i, j).
class CycleOptimizer {
public:
    virtual ~CycleOptimizer() = default;

    virtual std::string name() const = 0;

    // The time limit is advisory: a backend may overrun it, and a result reached at the limit need not
    // be optimal.
    GlobalMatchResult solve(const std::vector<Ticket>& tickets, const MatchPreferences& prefs,
                            std::chrono::seconds timeLimit) const;

    struct Selection {
        SolveStatus status = SolveStatus::NO_SOLUTION;
        std::vector<int> successor; // -1 when a node keeps its own seats
    };

    // Chooses edges so that every node has out-degree == in-degree <= 1. Only positive entries of
    // `scaled` are edges.
    virtual Selection selectEdges(const ScaledMatrix& scaled, std::chrono::seconds timeLimit) const = 0;
};

// Greedy 2- and 3-cycle packing over the first `poolLimit` tickets.
class HeuristicCycleOptimizer : public CycleOptimizer {
public:
    explicit HeuristicCycleOptimizer(size_t poolLimit, size_t maxLength = 3): poolLimit(poolLimit), maxLength(maxLength) {}

    std::string name() const override { return "heuristic"; }
    Selection selectEdges(const ScaledMatrix& scaled, std::chrono::seconds timeLimit) const override;

private:
    size_t poolLimit, maxLength;
};

#ifdef SEATSWAP_HAVE_NETWORK_SIMPLEX
// Exact solver: min-cost circulation on a sender/receiver split of the tickets, solved by network simplex.
class NetworkCycleOptimizer : public CycleOptimizer {
public:
    std::string name() const override { return "network-simplex"; }
    Selection selectEdges(const ScaledMatrix& scaled, std::chrono::seconds timeLimit) const override;
};
#endif

bool hasSolverBackend();

// The solver-backed optimizer when the build found one and HEURISTIC-ONLY is unset, otherwise the
// heuristic fallback.
std::unique_ptr<CycleOptimizer> makeCycleOptimizer(const Settings& settings);

} // namespace seatswap
