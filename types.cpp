#include "types.hpp"

#include <algorithm>
#include <map>

using namespace std;

namespace seatswap {

int berthRank(BerthType berth){
    switch(berth){
        case BerthType::LB: return 5;
        case BerthType::SL: return 4;
        case BerthType::MB: return 3;
        case BerthType::SU: return 2;
        case BerthType::UB: return 1;
        default:            return 0;
    }
}

string toString(BerthType berth){
    switch(berth){
        case BerthType::LB: return "LB";
        case BerthType::MB: return "MB";
        case BerthType::UB: return "UB";
        case BerthType::SL: return "SL";
        case BerthType::SU: return "SU";
        default:            return "??";
    }
}

string toString(ClassType cls){
    switch(cls){
        case ClassType::SL:  return "SL";
        case ClassType::AC3: return "3A";
        case ClassType::AC2: return "2A";
        case ClassType::AC1: return "1A";
        case ClassType::CC:  return "CC";
        case ClassType::EC:  return "EC";
        case ClassType::S2:  return "2S";
        default:             return "??";
    }
}

string toString(BookingStatus status){
    switch(status){
        case BookingStatus::CNF:  return "CNF";
        case BookingStatus::RAC:  return "RAC";
        case BookingStatus::WL:   return "WL";
        case BookingStatus::RLWL: return "RLWL";
        case BookingStatus::PQWL: return "PQWL";
    }
    return "??";
}

string toString(TicketStatus status){
    switch(status){
        case TicketStatus::ACTIVE:    return "active";
        case TicketStatus::COMPLETED: return "completed";
        case TicketStatus::CANCELLED: return "cancelled";
    }
    return "??";
}

string toString(ExchangeStatus status){
    switch(status){
        case ExchangeStatus::PENDING:   return "pending";
        case ExchangeStatus::ACCEPTED:  return "accepted";
        case ExchangeStatus::DECLINED:  return "declined";
        case ExchangeStatus::COMPLETED: return "completed";
        case ExchangeStatus::EXPIRED:   return "expired";
    }
    return "??";
}

string toString(SuggestionSource source){
    switch(source){
        case SuggestionSource::AUTO:             return "auto";
        case SuggestionSource::ADMIN_RUN:        return "admin_run";
        case SuggestionSource::ADMIN_GLOBAL_ILP: return "admin_global_ilp";
    }
    return "??";
}

optional<BerthType> parseBerthType(const string& s){
    static const map<string, BerthType> names = {
        {"LB", BerthType::LB}, {"MB", BerthType::MB}, {"UB", BerthType::UB},
        {"SL", BerthType::SL}, {"SU", BerthType::SU},
    };
    auto it = names.find(s);
    if(it == names.end()) return nullopt;
    return it->second;
}

optional<ClassType> parseClassType(const string& s){
    static const map<string, ClassType> names = {
        {"SL", ClassType::SL}, {"3A", ClassType::AC3}, {"2A", ClassType::AC2}, {"1A", ClassType::AC1},
        {"CC", ClassType::CC}, {"EC", ClassType::EC},  {"2S", ClassType::S2},
    };
    auto it = names.find(s);
    if(it == names.end()) return nullopt;
    return it->second;
}

optional<BookingStatus> parseBookingStatus(const string& s){
    static const map<string, BookingStatus> names = {
        {"CNF", BookingStatus::CNF}, {"RAC", BookingStatus::RAC}, {"WL", BookingStatus::WL},
        {"RLWL", BookingStatus::RLWL}, {"PQWL", BookingStatus::PQWL},
    };
    auto it = names.find(s);
    if(it == names.end()) return nullopt;
    return it->second;
}

MatchPreferences MatchPreferences::merged(const MatchPreferences& other) const {
    MatchPreferences out = *this;
    out.same_coach_only = same_coach_only or other.same_coach_only;
    out.same_bay_only   = same_bay_only or other.same_bay_only;
    out.allow_cyclic    = allow_cyclic or other.allow_cyclic;
    out.preferred_berth.insert(other.preferred_berth.begin(), other.preferred_berth.end());
    out.min_store_score = max(min_store_score, other.min_store_score);
    return out;
}

set<string> Ticket::coaches() const {
    set<string> out;
    for(const auto& p : passengers) out.insert(p.coach);
    return out;
}

double Ticket::togethernessScore() const {
    if(passengers.size() <= 1) return 100.0;

    map<string, set<int>> bays; // coach -> occupied bays
    for(const auto& p : passengers) bays[p.coach].insert((p.seat_number - 1) / 8);

    double score = 100.0;
    score -= 30.0 * (bays.size() - 1);
    for(const auto& [coach, b] : bays) score -= 10.0 * (b.size() - 1);
    return max(score, 0.0);
}

void User::updateRating(double newRating){
    double total = rating * total_ratings + newRating;
    total_ratings++;
    rating = total / total_ratings;
}

SeatInfo SeatInfo::of(const Passenger& p){
    return SeatInfo{.passenger_id = p.id, .passenger_name = p.name, .coach = p.coach,
                    .seat_number = p.seat_number, .berth_type = p.berth_type};
}

} // namespace seatswap
