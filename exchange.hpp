#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "repository.hpp"
#include "types.hpp"

namespace seatswap {

struct ConfirmResult {
    ExchangeStatus status;
    bool requester_confirmed, target_confirmed;
};

struct UserRequests {
    std::vector<ExchangeRequest> received, sent;
};

// Bilateral exchange requests: pending -> accepted -> completed, or pending -> declined. EXPIRED is
// declared on the model but nothing moves a request into it.
//
// Errors: NOT_FOUND for a missing request, ticket or user, PERMISSION_DENIED when the caller is not
// the party allowed to act, FAILED_PRECONDITION for a transition the current status forbids and
// INVALID_ARGUMENT for malformed proposals.
class ExchangeService {
public:
    explicit ExchangeService(TicketRepository& repository): repository(repository) {}

    absl::StatusOr<std::string> create(const std::string& requester_id, const std::string& target_user_id,
                                       const std::string& target_ticket_id, std::vector<SeatInfo> give,
                                       std::vector<SeatInfo> receive, const std::string& message = "");

    absl::Status accept(const std::string& request_id, const std::string& user_id);
    absl::Status decline(const std::string& request_id, const std::string& user_id);

    // Records the caller's confirmation. The call that makes both confirmations true completes the
    // request and bumps both users' exchange counters; any later call is a no-op.
    absl::StatusOr<ConfirmResult> confirm(const std::string& request_id, const std::string& user_id);

    absl::StatusOr<ExchangeRequest> get(const std::string& request_id) const;
    UserRequests requestsFor(const std::string& user_id) const;

private:
    struct Record {
        std::mutex mtx;
        ExchangeRequest request;
    };

    std::shared_ptr<Record> find(const std::string& request_id) const;

    TicketRepository& repository;
    mutable std::mutex mtx; // guards `records` and `nextId`
    std::map<std::string, std::shared_ptr<Record>> records;
    long long nextId = 1;
};

} // namespace seatswap
