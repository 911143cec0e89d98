#include "matching_service.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

#include "scorer.hpp"
#include "utils.hpp"

using namespace std;

namespace seatswap {

namespace {

constexpr double TRADITIONAL_WEIGHT = 0.6, EXTERNAL_WEIGHT = 0.4;

// A ticket may ask for a stricter store threshold than the run's.
double storeThreshold(const Ticket& ticket, double min_store_score){
    return max(min_store_score, ticket.preferences.min_store_score);
}

vector<SuggestionEntry> asEntries(const vector<Match>& matches){
    vector<SuggestionEntry> out;
    for(const auto& m : matches) out.push_back(SuggestionEntry{.item = m, .score = m.score});
    return out;
}

} // namespace

MatchingService::MatchingService(TicketRepository& repository, SuggestionStore& store, const Settings& settings,
                                 ExternalScorer externalScorer)
    : repository(repository), store(store), settings(settings), externalScorer(std::move(externalScorer)),
      cycleOptimizer(makeCycleOptimizer(settings)), pool(settings.WORKER_THREADS) {}

MatchingService::~MatchingService(){ pool.join(); }

template <typename Item>
void MatchingService::forEachInGroups(const vector<Item>& items, const function<void(const Item&)>& work){
    size_t group = settings.BATCH_GROUP;
    for(size_t begin = 0; begin < items.size(); begin += group){
        vector<future<void>> pending;
        for(size_t i = begin; i < min(items.size(), begin + group); i++){
            pending.push_back(submit([&work, &item = items[i]]{ work(item); }));
        }
        // Every task of the group must finish before this frame can unwind: they all reference `work`.
        exception_ptr failure;
        for(auto& f : pending){
            try { f.get(); }
            catch(...) { if(not failure) failure = current_exception(); }
        }
        if(failure) rethrow_exception(failure);
    }
}

vector<Match> MatchingService::liveMatches(const Ticket& ticket, const MatchPreferences& prefs, bool use_ai) const {
    MatchPreferences effective = ticket.preferences.merged(prefs);
    vector<Match> matches;

    for(const auto& other : repository.findTickets(ticket.train_number, ticket.travel_date, TicketStatus::ACTIVE, ticket.user_id)){
        optional<User> owner = repository.getUser(other.user_id);
        if(not owner) continue; // stale owner reference, not worth failing the whole list

        ScoreResult result = score(ticket, other, effective);
        if(result.value <= 0) continue;

        double value = result.value;
        if(use_ai and externalScorer){
            if(optional<double> external = externalScorer(ticket, other)){
                value = clamp(TRADITIONAL_WEIGHT * value + EXTERNAL_WEIGHT * *external, 0.0, MAX_SCORE);
            }
        }
        if(ticket.min_match_score and value < *ticket.min_match_score) continue;

        Match m{.user_id = owner->id, .user_name = owner->name, .user_rating = owner->rating, .ticket_id = other.id,
                .score = value, .description = result.description};
        for(const auto& p : other.passengers) m.available_seats.push_back(SeatInfo::of(p));
        matches.push_back(std::move(m));
    }

    stable_sort(matches.begin(), matches.end(), [](const Match& a, const Match& b){ return a.score > b.score; });
    if(matches.size() > size_t(settings.MAX_MATCHES)) matches.resize(settings.MAX_MATCHES);
    return matches;
}

absl::StatusOr<MatchResponse> MatchingService::findMatches(const string& ticket_id, const string& user_id,
                                                           const MatchPreferences& prefs, bool use_ai){
    optional<Ticket> ticket = repository.getTicket(ticket_id);
    if(not ticket or ticket->user_id != user_id) return absl::NotFoundError("Ticket not found");

    MatchResponse response{.ticket_id = ticket_id};

    bool forceLive = not prefs.preferred_berth.empty();
    if(not forceLive){
        if(optional<MatchSuggestion> cached = store.get(ticket_id)){
            response.matches = cached->suggestions;
            response.total = response.matches.size();
            response.prepopulated = true;
            return response;
        }
    }

    response.matches = asEntries(liveMatches(*ticket, prefs, use_ai));
    response.total = response.matches.size();
    return response;
}

map<string, vector<SuggestionEntry>> MatchingService::batchFindMatches(const vector<string>& ticket_ids, const string& user_id, bool use_ai){
    map<string, vector<SuggestionEntry>> out;
    mutex outMtx;
    for(const auto& id : ticket_ids) out[id];

    forEachInGroups<string>(ticket_ids, [&](const string& id){
        absl::StatusOr<MatchResponse> response = findMatches(id, user_id, {}, use_ai);
        if(not response.ok()){
            utils::log() << "batch: skipping " << id << ": " << response.status().message() << endl;
            return;
        }
        lock_guard lock(outMtx);
        out[id] = std::move(response->matches);
    });
    return out;
}

RunSummary MatchingService::runMatching(const optional<string>& train_number, const optional<string>& travel_date, double min_store_score){
    vector<Ticket> tickets = repository.findActiveTickets(train_number, travel_date);
    RunSummary summary;
    mutex summaryMtx;

    forEachInGroups<Ticket>(tickets, [&](const Ticket& ticket){
        vector<SuggestionEntry> entries = asEntries(liveMatches(ticket, {}, false));
        bool stored = store.storeQualifying(ticket, entries, SuggestionSource::ADMIN_RUN, storeThreshold(ticket, min_store_score));

        lock_guard lock(summaryMtx);
        summary.processed++;
        (stored ? summary.stored : summary.cleared)++;
    });

    utils::log() << "run-matching: " << summary.processed << " tickets, " << summary.stored << " stored, "
                 << summary.cleared << " cleared" << endl;
    return summary;
}

absl::StatusOr<GlobalRunReport> MatchingService::globalMatching(const string& train_number, const string& travel_date, chrono::seconds time_limit){
    if(train_number.empty() or travel_date.empty()) return absl::InvalidArgumentError("Global matching needs a train number and a travel date");
    if(time_limit.count() <= 0) return absl::InvalidArgumentError("Time limit must be positive");

    GlobalRunReport report{.train_number = train_number, .travel_date = travel_date};
    vector<Ticket> tickets = repository.findActiveTickets(train_number, travel_date);
    report.tickets = tickets.size();

    const CycleOptimizer& solver = *cycleOptimizer;
    report.result = submit([&solver, &tickets, time_limit]{ return solver.solve(tickets, {}, time_limit); }).get();
    return report;
}

absl::StatusOr<GlobalRunReport> MatchingService::runGlobalMatching(const string& train_number, const string& travel_date,
                                                                   double min_store_score, chrono::seconds time_limit){
    absl::StatusOr<GlobalRunReport> report = globalMatching(train_number, travel_date, time_limit);
    if(not report.ok()) return report;

    map<string, vector<SuggestionEntry>> entries;
    for(const auto& c : report->result.cycles){
        for(const auto& id : c.ticket_ids) entries[id].push_back(SuggestionEntry{.item = c, .score = c.total_score});
    }

    for(const auto& ticket : repository.findActiveTickets(train_number, travel_date)){
        if(store.storeQualifying(ticket, entries[ticket.id], SuggestionSource::ADMIN_GLOBAL_ILP,
                                storeThreshold(ticket, min_store_score))) report->stored++;
        else report->cleared++;
    }
    report->persisted = true;

    utils::log() << "run-global-matching " << train_number << " " << travel_date << ": " << report->result.cycles.size()
                 << " cycles (" << toString(report->result.status) << "), " << report->stored << " stored" << endl;
    return report;
}

absl::StatusOr<GlobalRunReport> MatchingService::previewGlobalMatching(const string& train_number, const string& travel_date,
                                                                       chrono::seconds time_limit){
    return globalMatching(train_number, travel_date, time_limit);
}

} // namespace seatswap
