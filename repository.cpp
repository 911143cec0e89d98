#include "repository.hpp"

#include <set>
#include <utility>

using namespace std;

namespace seatswap {

absl::Status InMemoryRepository::addTicket(Ticket ticket){
    if(ticket.id.empty()) return absl::InvalidArgumentError("Ticket id is required");

    set<pair<string,int>> seats;
    for(const auto& p : ticket.passengers){
        if(not seats.insert({p.coach, p.seat_number}).second){
            return absl::InvalidArgumentError("Ticket " + ticket.id + " repeats seat " + p.coach + "/" + to_string(p.seat_number));
        }
    }

    lock_guard lock(mtx);
    if(not tickets.count(ticket.id)) insertionOrder.push_back(ticket.id);
    tickets[ticket.id] = std::move(ticket);
    return absl::OkStatus();
}

void InMemoryRepository::addUser(User user){
    lock_guard lock(mtx);
    users[user.id] = std::move(user);
}

vector<Ticket> InMemoryRepository::findTickets(const string& train_number, const string& travel_date,
                                               TicketStatus status, const string& exclude_owner) const {
    lock_guard lock(mtx);
    vector<Ticket> out;
    for(const auto& id : insertionOrder){
        const Ticket& t = tickets.at(id);
        if(t.train_number == train_number and t.travel_date == travel_date and t.status == status and t.user_id != exclude_owner){
            out.push_back(t);
        }
    }
    return out;
}

vector<Ticket> InMemoryRepository::findActiveTickets(const optional<string>& train_number,
                                                     const optional<string>& travel_date) const {
    lock_guard lock(mtx);
    vector<Ticket> out;
    for(const auto& id : insertionOrder){
        const Ticket& t = tickets.at(id);
        if(t.status != TicketStatus::ACTIVE) continue;
        if(train_number and t.train_number != *train_number) continue;
        if(travel_date and t.travel_date != *travel_date) continue;
        out.push_back(t);
    }
    return out;
}

optional<Ticket> InMemoryRepository::findUserTicket(const string& user_id, const string& train_number,
                                                    const string& travel_date) const {
    lock_guard lock(mtx);
    for(const auto& id : insertionOrder){
        const Ticket& t = tickets.at(id);
        if(t.user_id == user_id and t.train_number == train_number and t.travel_date == travel_date
           and t.status == TicketStatus::ACTIVE) return t;
    }
    return nullopt;
}

optional<Ticket> InMemoryRepository::getTicket(const string& id) const {
    lock_guard lock(mtx);
    auto it = tickets.find(id);
    if(it == tickets.end()) return nullopt;
    return it->second;
}

optional<User> InMemoryRepository::getUser(const string& id) const {
    lock_guard lock(mtx);
    auto it = users.find(id);
    if(it == users.end()) return nullopt;
    return it->second;
}

absl::Status InMemoryRepository::incrementExchangeCount(const string& user_id){
    lock_guard lock(mtx);
    auto it = users.find(user_id);
    if(it == users.end()) return absl::NotFoundError("User " + user_id + " not found");
    it->second.total_exchanges++;
    return absl::OkStatus();
}

} // namespace seatswap
