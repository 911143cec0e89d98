#include "exchange.hpp"

#include <utility>

#include "scorer.hpp"
#include "utils.hpp"

using namespace std;

namespace seatswap {

shared_ptr<ExchangeService::Record> ExchangeService::find(const string& request_id) const {
    lock_guard lock(mtx);
    auto it = records.find(request_id);
    return it == records.end() ? nullptr : it->second;
}

absl::StatusOr<string> ExchangeService::create(const string& requester_id, const string& target_user_id,
                                               const string& target_ticket_id, vector<SeatInfo> give,
                                               vector<SeatInfo> receive, const string& message){
    if(requester_id == target_user_id) return absl::InvalidArgumentError("Cannot request an exchange with yourself");
    if(give.empty() or receive.empty()) return absl::InvalidArgumentError("A proposal needs seats to give and to receive");

    optional<User> target = repository.getUser(target_user_id);
    if(not target) return absl::NotFoundError("Target user not found");

    optional<Ticket> targetTicket = repository.getTicket(target_ticket_id);
    if(not targetTicket or targetTicket->user_id != target->id) return absl::NotFoundError("Target ticket not found");

    optional<Ticket> requesterTicket = repository.findUserTicket(requester_id, targetTicket->train_number, targetTicket->travel_date);
    if(not requesterTicket) return absl::FailedPreconditionError("You don't have a ticket for this train");

    auto record = make_shared<Record>();
    ExchangeRequest& req = record->request;
    req.requester_id        = requester_id;
    req.requester_ticket_id = requesterTicket->id;
    req.target_user_id      = target->id;
    req.target_ticket_id    = targetTicket->id;
    req.train_number        = targetTicket->train_number;
    req.travel_date         = targetTicket->travel_date;
    req.proposal = ExchangeProposal{
        .give = std::move(give),
        .receive = std::move(receive),
        .improvement_score = score(*requesterTicket, *targetTicket, requesterTicket->preferences).value,
    };
    req.message    = message;
    req.created_at = req.updated_at = Clock::now();

    lock_guard lock(mtx);
    req.id = "XR" + to_string(nextId++);
    records[req.id] = record;
    utils::log() << "exchange " << req.id << ": " << requester_id << " -> " << target_user_id << " on " << req.train_number << endl;
    return req.id;
}

absl::Status ExchangeService::accept(const string& request_id, const string& user_id){
    auto record = find(request_id);
    if(not record) return absl::NotFoundError("Exchange request not found");

    lock_guard lock(record->mtx);
    ExchangeRequest& req = record->request;
    if(req.target_user_id != user_id) return absl::PermissionDeniedError("Only the target user can accept");
    if(req.status != ExchangeStatus::PENDING){
        return absl::FailedPreconditionError("Cannot accept request with status: " + toString(req.status));
    }

    req.status = ExchangeStatus::ACCEPTED;
    req.updated_at = Clock::now();
    return absl::OkStatus();
}

absl::Status ExchangeService::decline(const string& request_id, const string& user_id){
    auto record = find(request_id);
    if(not record) return absl::NotFoundError("Exchange request not found");

    lock_guard lock(record->mtx);
    ExchangeRequest& req = record->request;
    if(req.target_user_id != user_id) return absl::PermissionDeniedError("Only the target user can decline");
    if(req.status == ExchangeStatus::DECLINED) return absl::OkStatus();
    if(req.status == ExchangeStatus::COMPLETED){
        return absl::FailedPreconditionError("Cannot decline request with status: " + toString(req.status));
    }

    // An accepted request can still be declined until both sides confirm.
    req.status = ExchangeStatus::DECLINED;
    req.updated_at = Clock::now();
    return absl::OkStatus();
}

absl::StatusOr<ConfirmResult> ExchangeService::confirm(const string& request_id, const string& user_id){
    auto record = find(request_id);
    if(not record) return absl::NotFoundError("Exchange request not found");

    lock_guard lock(record->mtx);
    ExchangeRequest& req = record->request;
    if(req.requester_id != user_id and req.target_user_id != user_id) return absl::PermissionDeniedError("Not authorized");

    auto current = [&]{ return ConfirmResult{req.status, req.requester_confirmed, req.target_confirmed}; };

    if(req.status == ExchangeStatus::COMPLETED) return current();
    if(req.status != ExchangeStatus::ACCEPTED){
        return absl::FailedPreconditionError("Cannot confirm request with status: " + toString(req.status));
    }

    if(req.requester_id == user_id) req.requester_confirmed = true;
    else                            req.target_confirmed = true;
    req.updated_at = Clock::now();

    // Status is ACCEPTED here and the record lock is held, so this runs once per request.
    if(req.canComplete()){
        req.status = ExchangeStatus::COMPLETED;
        for(const auto& uid : {req.requester_id, req.target_user_id}){
            absl::Status status = repository.incrementExchangeCount(uid);
            if(not status.ok()) utils::warn() << "exchange " << req.id << ": " << status.message() << endl;
        }
        utils::log() << "exchange " << req.id << " completed" << endl;
    }
    return current();
}

absl::StatusOr<ExchangeRequest> ExchangeService::get(const string& request_id) const {
    auto record = find(request_id);
    if(not record) return absl::NotFoundError("Exchange request not found");
    lock_guard lock(record->mtx);
    return record->request;
}

UserRequests ExchangeService::requestsFor(const string& user_id) const {
    vector<shared_ptr<Record>> all;
    {
        lock_guard lock(mtx);
        for(const auto& [id, r] : records) all.push_back(r);
    }

    UserRequests out;
    for(const auto& r : all){
        lock_guard lock(r->mtx);
        if(r->request.target_user_id == user_id) out.received.push_back(r->request);
        if(r->request.requester_id == user_id)   out.sent.push_back(r->request);
    }
    return out;
}

} // namespace seatswap
