#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace seatswap {

struct ScoreResult {
    double value = 0.0; // in [0, 100]
    std::string description;
};

using WeightMatrix = std::vector<std::vector<double>>;

constexpr int    BAY_SIZE = 8;
constexpr double MAX_SCORE = 100.0;

// How much `beneficiary` gains by taking the seats of `source`. Not symmetric, never fails.
ScoreResult score(const Ticket& beneficiary, const Ticket& source, const MatchPreferences& prefs);

// W[i][j] = score(tickets[i], tickets[j]) with each row using the ticket's stored preferences merged
// with `prefs`. The diagonal is 0, and so is every entry between two tickets of the same user.
WeightMatrix weightMatrix(const std::vector<Ticket>& tickets, const MatchPreferences& prefs);

} // namespace seatswap
