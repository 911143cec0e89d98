#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "ttl_store.hpp"
#include "types.hpp"

namespace seatswap {

// Per-ticket cache of computed matches and cycles. Writes replace the previous entry whole. There is no
// transaction: concurrent writers for one ticket race and the last one wins.
class SuggestionStore {
public:
    explicit SuggestionStore(const Settings& settings);

    std::optional<MatchSuggestion> get(const std::string& ticket_id);
    void put(const Ticket& ticket, std::vector<SuggestionEntry> suggestions, SuggestionSource source);
    bool erase(const std::string& ticket_id);

    // Keeps the entries scoring at least `minScore`; clears the ticket's cache instead of storing an empty list.
    // Returns whether anything was stored.
    bool storeQualifying(const Ticket& ticket, const std::vector<SuggestionEntry>& suggestions,
                         SuggestionSource source, double minScore);

    size_t size() const { return store.size(); }

private:
    TtlStore<std::string, MatchSuggestion> store;
};

} // namespace seatswap
