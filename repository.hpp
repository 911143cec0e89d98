#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include "types.hpp"

namespace seatswap {

// Ticket and user lookups the matching core consumes. Storage lives elsewhere.
class TicketRepository {
public:
    virtual ~TicketRepository() = default;

    // Tickets on a train and date with the given status, skipping those owned by `exclude_owner`.
    virtual std::vector<Ticket> findTickets(const std::string& train_number, const std::string& travel_date,
                                            TicketStatus status, const std::string& exclude_owner) const = 0;

    // Active tickets, optionally narrowed to one train and/or date.
    virtual std::vector<Ticket> findActiveTickets(const std::optional<std::string>& train_number,
                                                  const std::optional<std::string>& travel_date) const = 0;

    virtual std::optional<Ticket> findUserTicket(const std::string& user_id, const std::string& train_number,
                                                 const std::string& travel_date) const = 0;

    virtual std::optional<Ticket> getTicket(const std::string& id) const = 0;
    virtual std::optional<User>   getUser(const std::string& id) const = 0;

    virtual absl::Status incrementExchangeCount(const std::string& user_id) = 0;
};

class InMemoryRepository : public TicketRepository {
public:
    // Rejects tickets whose passengers repeat a (coach, seat) pair.
    absl::Status addTicket(Ticket ticket);
    void addUser(User user);

    std::vector<Ticket> findTickets(const std::string& train_number, const std::string& travel_date,
                                    TicketStatus status, const std::string& exclude_owner) const override;
    std::vector<Ticket> findActiveTickets(const std::optional<std::string>& train_number,
                                          const std::optional<std::string>& travel_date) const override;
    std::optional<Ticket> findUserTicket(const std::string& user_id, const std::string& train_number,
                                         const std::string& travel_date) const override;
    std::optional<Ticket> getTicket(const std::string& id) const override;
    std::optional<User>   getUser(const std::string& id) const override;
    absl::Status incrementExchangeCount(const std::string& user_id) override;

private:
    mutable std::mutex mtx;
    std::map<std::string, Ticket> tickets;
    std::map<std::string, User> users;
    std::vector<std::string> insertionOrder; // keeps scans in entry order
};

} // namespace seatswap
