#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "absl/status/statusor.h"

#include "config.hpp"
#include "optimizer.hpp"
#include "repository.hpp"
#include "suggestion_store.hpp"
#include "types.hpp"

namespace seatswap {

struct MatchResponse {
    std::string ticket_id;
    std::vector<SuggestionEntry> matches;
    size_t total = 0;
    bool prepopulated = false; // served from the suggestion store
};

struct RunSummary {
    int processed = 0, stored = 0, cleared = 0;
};

struct GlobalRunReport {
    std::string train_number, travel_date;
    size_t tickets = 0;
    GlobalMatchResult result;
    bool persisted = false;
    int stored = 0, cleared = 0;
};

// Optional external opinion on how well `other` suits `mine`, in [0, 100]. Blended 60/40 with the
// traditional score when asked for.
using ExternalScorer = std::function<std::optional<double>(const Ticket& mine, const Ticket& other)>;

// Matching entry points. Global solves and batch work run on an internal worker pool; call these from
// outside that pool.
class MatchingService {
public:
    MatchingService(TicketRepository& repository, SuggestionStore& store, const Settings& settings,
                    ExternalScorer externalScorer = nullptr);
    ~MatchingService();

    // Cached suggestions unless `prefs` names preferred berths, otherwise a live computation that
    // leaves the cache untouched.
    absl::StatusOr<MatchResponse> findMatches(const std::string& ticket_id, const std::string& user_id,
                                              const MatchPreferences& prefs = {}, bool use_ai = false);

    // Missing or foreign tickets map to an empty list.
    std::map<std::string, std::vector<SuggestionEntry>> batchFindMatches(const std::vector<std::string>& ticket_ids,
                                                                        const std::string& user_id, bool use_ai = false);

    RunSummary runMatching(const std::optional<std::string>& train_number, const std::optional<std::string>& travel_date,
                           double min_store_score);

    absl::StatusOr<GlobalRunReport> runGlobalMatching(const std::string& train_number, const std::string& travel_date,
                                                      double min_store_score, std::chrono::seconds time_limit);

    absl::StatusOr<GlobalRunReport> previewGlobalMatching(const std::string& train_number, const std::string& travel_date,
                                                          std::chrono::seconds time_limit);

    const CycleOptimizer& optimizer() const { return *cycleOptimizer; }

private:
    std::vector<Match> liveMatches(const Ticket& ticket, const MatchPreferences& prefs, bool use_ai) const;
    absl::StatusOr<GlobalRunReport> globalMatching(const std::string& train_number, const std::string& travel_date,
                                                   std::chrono::seconds time_limit);

    // Runs `work` on each item, at most BATCH-GROUP at a time.
    template <typename Item>
    void forEachInGroups(const std::vector<Item>& items, const std::function<void(const Item&)>& work);

    template <typename F>
    auto submit(F work) -> std::future<decltype(work())> {
        auto task = std::make_shared<std::packaged_task<decltype(work())()>>(std::move(work));
        auto future = task->get_future();
        boost::asio::post(pool, [task]{ (*task)(); });
        return future;
    }

    TicketRepository& repository;
    SuggestionStore& store;
    Settings settings;
    ExternalScorer externalScorer;
    std::unique_ptr<CycleOptimizer> cycleOptimizer;
    boost::asio::thread_pool pool;
};

} // namespace seatswap
