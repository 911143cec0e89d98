#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace seatswap {

using Clock = std::chrono::system_clock;

enum class BerthType { LB, MB, UB, SL, SU, UNKNOWN };
enum class ClassType { SL, AC3, AC2, AC1, CC, EC, S2, UNKNOWN };
enum class BookingStatus { CNF, RAC, WL, RLWL, PQWL };
enum class TicketStatus { ACTIVE, COMPLETED, CANCELLED };
enum class ExchangeStatus { PENDING, ACCEPTED, DECLINED, COMPLETED, EXPIRED };
enum class SuggestionSource { AUTO, ADMIN_RUN, ADMIN_GLOBAL_ILP };

// Desirability used by the scorer: LB(5) > SL(4) > MB(3) > SU(2) > UB(1), unknown berths rank 0.
int berthRank(BerthType berth);

std::string toString(BerthType berth);
std::string toString(ClassType cls);
std::string toString(BookingStatus status);
std::string toString(TicketStatus status);
std::string toString(ExchangeStatus status);
std::string toString(SuggestionSource source);

std::optional<BerthType>     parseBerthType(const std::string& s);
std::optional<ClassType>     parseClassType(const std::string& s);
std::optional<BookingStatus> parseBookingStatus(const std::string& s);

struct Passenger {
    std::string id, name;
    int age = 0;
    char gender = 'O';
    std::string coach;
    int seat_number = 0;
    BerthType berth_type = BerthType::UNKNOWN;
    BookingStatus booking_status = BookingStatus::CNF, current_status = BookingStatus::CNF;
};

struct MatchPreferences {
    bool same_coach_only = false;
    bool same_bay_only   = false;
    std::set<BerthType> preferred_berth;
    bool allow_cyclic    = false; // recorded for clients, matching does not read it
    double min_store_score = 0.0;  // per-ticket floor on the store threshold of admin runs

    // Flags are OR-ed and berth sets united; the threshold of `other` wins when it is stricter.
    MatchPreferences merged(const MatchPreferences& other) const;
};

struct Ticket {
    std::string id, user_id, pnr;
    std::string train_number, train_name, travel_date;
    ClassType class_type = ClassType::SL;
    std::vector<Passenger> passengers;
    TicketStatus status = TicketStatus::ACTIVE;

    MatchPreferences preferences;
    std::optional<double> min_match_score;

    std::set<std::string> coaches() const;
    bool isScattered() const { return coaches().size() > 1; }
    // 100 for a group seated together, minus 30 per extra coach and 10 per extra bay inside a coach.
    double togethernessScore() const;
};

struct User {
    std::string id, name;
    double rating = 0.0;
    int total_ratings = 0, total_exchanges = 0;
    bool is_active = true;

    void updateRating(double rating);
};

// A snapshot of a passenger's seat, independent of later edits to the Passenger.
struct SeatInfo {
    std::string passenger_id, passenger_name, coach;
    int seat_number = 0;
    BerthType berth_type = BerthType::UNKNOWN;

    static SeatInfo of(const Passenger& p);
    bool operator==(const SeatInfo&) const = default;
};

struct ExchangeProposal {
    std::vector<SeatInfo> give, receive;
    double improvement_score = 0.0;
};

struct ExchangeRequest {
    std::string id;
    std::string requester_id, requester_ticket_id;
    std::string target_user_id, target_ticket_id;
    std::string train_number, travel_date;
    ExchangeProposal proposal;
    ExchangeStatus status = ExchangeStatus::PENDING;
    bool requester_confirmed = false, target_confirmed = false;
    std::string message;
    Clock::time_point created_at, updated_at;
    std::optional<Clock::time_point> expires_at; // reserved, nothing sets or enforces it

    bool canComplete() const { return requester_confirmed and target_confirmed; }
};

struct Match {
    std::string user_id, user_name;
    double user_rating = 0.0;
    std::string ticket_id;
    std::vector<SeatInfo> available_seats;
    double score = 0.0;
    std::string description;

    bool operator==(const Match&) const = default;
};

// Ticket ids in cycle order: each member takes the seats of the next one.
struct Cycle {
    std::vector<std::string> ticket_ids;
    std::vector<double> edge_scores;
    double total_score = 0.0;
    std::string description;

    bool operator==(const Cycle&) const = default;
};

struct SuggestionEntry {
    std::variant<Match, Cycle> item;
    double score = 0.0;

    bool isCycle() const { return std::holds_alternative<Cycle>(item); }
    bool operator==(const SuggestionEntry&) const = default;
};

struct MatchSuggestion {
    std::string ticket_id, train_number, travel_date;
    std::vector<SuggestionEntry> suggestions;
    SuggestionSource source = SuggestionSource::AUTO;
    Clock::time_point created_at;
};

} // namespace seatswap
