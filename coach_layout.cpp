#include "coach_layout.hpp"

#include <algorithm>
#include <cstdlib>

using namespace std;

namespace seatswap::layout {

namespace {

struct CoachConfig { int total_berths, bay_size; };

CoachConfig configFor(ClassType cls){
    switch(cls){
        case ClassType::SL:  return {72, 8};
        case ClassType::AC3: return {64, 8};
        case ClassType::AC2: return {48, 6};
        case ClassType::AC1: return {24, 4};
        case ClassType::CC:  return {78, 5};
        default:             return {72, 8};
    }
}

int positionInBay(int seat, int bay){ return seat % bay ? seat % bay : bay; }

} // namespace

int baySize(ClassType cls){ return configFor(cls).bay_size; }
int totalBerths(ClassType cls){ return configFor(cls).total_berths; }

BerthType berthTypeFor(int seat, ClassType cls){
    using enum BerthType;
    int pos = positionInBay(seat, baySize(cls));

    switch(cls){
        case ClassType::SL:
        case ClassType::AC3: {
            static const BerthType order[] = {LB, MB, UB, LB, MB, UB, SL, SU};
            return order[pos - 1];
        }
        case ClassType::AC2: {
            static const BerthType order[] = {LB, UB, LB, UB, SL, SU};
            return order[pos - 1];
        }
        case ClassType::AC1: {
            static const BerthType order[] = {LB, UB, LB, UB};
            return order[pos - 1];
        }
        default: return LB;
    }
}

int bayNumber(int seat, ClassType cls){ return (seat - 1) / baySize(cls) + 1; }

vector<int> baySeats(int bay, ClassType cls){
    auto [total, size] = configFor(cls);
    vector<int> seats;
    int start = (bay - 1) * size + 1;
    for(int s = start; s < start + size and s <= total; s++) seats.push_back(s);
    return seats;
}

bool areSeatsAdjacent(int seat1, int seat2, ClassType cls){
    if(bayNumber(seat1, cls) != bayNumber(seat2, cls)) return false;

    int size = baySize(cls);
    int p1 = positionInBay(seat1, size), p2 = positionInBay(seat2, size);
    if(cls == ClassType::SL or cls == ClassType::AC3){
        auto [lo, hi] = minmax(p1, p2);
        return (hi - lo == 3 and hi <= 6) or (lo == 7 and hi == 8);
    }
    return abs(p1 - p2) <= 1;
}

vector<int> lowerBerthsInBay(int bay, ClassType cls){
    vector<int> out;
    for(int s : baySeats(bay, cls)){
        BerthType b = berthTypeFor(s, cls);
        if(b == BerthType::LB or b == BerthType::SL) out.push_back(s);
    }
    return out;
}

} // namespace seatswap::layout
