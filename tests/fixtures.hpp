#pragma once

#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace seatswap::testing {

struct SeatSpec { std::string coach; int seat; BerthType berth; };

inline Ticket makeTicket(const std::string& id, const std::string& user, std::vector<SeatSpec> seats,
                         const std::string& train = "12951", const std::string& date = "2025-01-10"){
    Ticket t;
    t.id = id;
    t.user_id = user;
    t.pnr = "PNR" + id;
    t.train_number = train;
    t.train_name = "Rajdhani";
    t.travel_date = date;
    for(size_t i = 0; i < seats.size(); i++){
        Passenger p;
        p.id = id + "#" + std::to_string(i + 1);
        p.name = "Passenger " + std::to_string(i + 1);
        p.coach = seats[i].coach;
        p.seat_number = seats[i].seat;
        p.berth_type = seats[i].berth;
        t.passengers.push_back(std::move(p));
    }
    return t;
}

inline User makeUser(const std::string& id, double rating = 4.0){
    return User{.id = id, .name = "User " + id, .rating = rating};
}

} // namespace seatswap::testing
