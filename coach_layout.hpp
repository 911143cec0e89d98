#pragma once

#include <vector>

#include "types.hpp"

namespace seatswap::layout {

int baySize(ClassType cls);
int totalBerths(ClassType cls);

// Berth type printed on the ticket for a seat in a coach of the given class.
BerthType berthTypeFor(int seat, ClassType cls);

// 1-based bay index of a seat.
int bayNumber(int seat, ClassType cls);

std::vector<int> baySeats(int bay, ClassType cls);

// Seats facing each other in one bay: the vertical pairs (1,4), (2,5), (3,6) and the side pair (7,8) in
// sleeper/3-tier coaches, neighbouring positions elsewhere.
bool areSeatsAdjacent(int seat1, int seat2, ClassType cls);

std::vector<int> lowerBerthsInBay(int bay, ClassType cls);

} // namespace seatswap::layout
