#include "suggestion_store.hpp"

#include <utility>

using namespace std;

namespace seatswap {

SuggestionStore::SuggestionStore(const Settings& settings)
    : store(chrono::seconds(settings.SUGGESTION_TTL), settings.SUGGESTION_CAPACITY) {}

optional<MatchSuggestion> SuggestionStore::get(const string& ticket_id){ return store.get(ticket_id); }

void SuggestionStore::put(const Ticket& ticket, vector<SuggestionEntry> suggestions, SuggestionSource source){
    store.put(ticket.id, MatchSuggestion{
        .ticket_id = ticket.id,
        .train_number = ticket.train_number,
        .travel_date = ticket.travel_date,
        .suggestions = std::move(suggestions),
        .source = source,
        .created_at = Clock::now(),
    });
}

bool SuggestionStore::erase(const string& ticket_id){ return store.remove(ticket_id); }

bool SuggestionStore::storeQualifying(const Ticket& ticket, const vector<SuggestionEntry>& suggestions,
                                      SuggestionSource source, double minScore){
    vector<SuggestionEntry> kept;
    for(const auto& s : suggestions) if(s.score >= minScore) kept.push_back(s);

    if(kept.empty()){
        erase(ticket.id);
        return false;
    }
    put(ticket, std::move(kept), source);
    return true;
}

} // namespace seatswap
