#include "scorer.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>

#include "utils.hpp"

using namespace std;

namespace seatswap {

ScoreResult score(const Ticket& mine, const Ticket& other, const MatchPreferences& prefs){
    double total = 0;
    vector<string> benefits;

    set<string> myCoaches = mine.coaches(), otherCoaches = other.coaches();
    vector<string> common;
    set_intersection(myCoaches.begin(), myCoaches.end(), otherCoaches.begin(), otherCoaches.end(), back_inserter(common));

    if(not common.empty()){
        total += 30;
        benefits.push_back("Same coach (" + utils::join(common, ", ") + ")");
    }

    bool sharedBay = false;
    for(const auto& mp : mine.passengers){
        for(const auto& op : other.passengers){
            if(mp.coach != op.coach) continue;

            if((mp.seat_number - 1) / BAY_SIZE == (op.seat_number - 1) / BAY_SIZE){
                sharedBay = true;
                total += 20;
                benefits.push_back("Same bay as seat " + to_string(op.seat_number));
            }
            if(abs(mp.seat_number - op.seat_number) <= 1){
                total += 15;
                benefits.push_back("Adjacent to seat " + to_string(op.seat_number));
            }
        }
    }

    for(const auto& op : other.passengers){
        int otherRank = berthRank(op.berth_type);
        for(const auto& mp : mine.passengers){
            if(otherRank <= berthRank(mp.berth_type)) continue;

            total += 10;
            benefits.push_back("Better berth: " + toString(op.berth_type));
            if(prefs.preferred_berth.count(op.berth_type)){
                total += 8;
                benefits.push_back("Preferred berth: " + toString(op.berth_type));
            }
        }
    }

    // Vetoes are applied after scoring so they override every bonus.
    if(prefs.same_coach_only and common.empty()) return {0.0, "No matching coaches"};
    if(prefs.same_bay_only and not sharedBay)    return {0.0, "No matching bays"};

    total = clamp(total, 0.0, MAX_SCORE);
    string description = benefits.empty() ? "Potential exchange available" : utils::join(benefits, " • ");
    return {total, description};
}

WeightMatrix weightMatrix(const vector<Ticket>& tickets, const MatchPreferences& prefs){
    size_t n = tickets.size();
    WeightMatrix W(n, vector<double>(n, 0.0));
    for(size_t i = 0; i < n; i++){
        MatchPreferences rowPrefs = tickets[i].preferences.merged(prefs);
        for(size_t j = 0; j < n; j++){
            // A user cannot exchange seats with themselves.
            if(i != j and tickets[i].user_id != tickets[j].user_id) W[i][j] = score(tickets[i], tickets[j], rowPrefs).value;
        }
    }
    return W;
}

} // namespace seatswap
