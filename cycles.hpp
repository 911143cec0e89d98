#pragma once

#include <string>
#include <vector>

#include "scorer.hpp"
#include "types.hpp"

namespace seatswap {

// Node indices into a weight matrix, in cycle order.
struct CycleCandidate {
    std::vector<int> members;
    double total = 0.0;
};

// Greedy packing of disjoint 2- and 3-cycles over W, best total first. Not optimal: a cycle accepted
// early is never displaced by a better combination of later ones.
std::vector<CycleCandidate> packSmallCycles(const WeightMatrix& W, size_t maxLength = 3);

// Runs the packing over at most `poolLimit` tickets, taken in input order.
std::vector<Cycle> findSmallCycles(const std::vector<Ticket>& tickets, const MatchPreferences& prefs,
                                   size_t poolLimit, size_t maxLength = 3);

Cycle describeCycle(const std::vector<std::string>& ids, const std::vector<int>& members, const WeightMatrix& W);

} // namespace seatswap
