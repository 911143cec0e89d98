#include "optimizer.hpp"

#include <algorithm>
#include <cmath>

#include "cycles.hpp"
#include "scorer.hpp"
#include "utils.hpp"

using namespace std;

namespace seatswap {

string toString(SolveStatus status){
    switch(status){
        case SolveStatus::OPTIMAL:     return "optimal";
        case SolveStatus::FEASIBLE:    return "feasible";
        case SolveStatus::HEURISTIC:   return "heuristic";
        case SolveStatus::NO_EDGES:    return "no-edges";
        case SolveStatus::NO_SOLUTION: return "no-solution";
    }
    return "??";
}

GlobalMatchResult CycleOptimizer::solve(const vector<Ticket>& tickets, const MatchPreferences& prefs, chrono::seconds timeLimit) const {
    utils::timer Timer;
    GlobalMatchResult result;
    result.backend = name();

    int n = tickets.size();
    WeightMatrix W = weightMatrix(tickets, prefs);

    ScaledMatrix scaled(n, vector<long long>(n, 0));
    bool anyEdge = false;
    for(int i = 0; i < n; i++)
        for(int j = 0; j < n; j++){
            if(i == j) continue;
            scaled[i][j] = llround(W[i][j] * WEIGHT_SCALE);
            anyEdge |= scaled[i][j] > 0;
        }

    if(not anyEdge){
        result.status = SolveStatus::NO_EDGES;
        result.elapsed_ms = Timer.elapsed_time();
        return result;
    }

    utils::log() << name() << ": solving " << n << " tickets, time limit " << timeLimit.count() << "s" << endl;
    Selection selection = selectEdges(scaled, timeLimit);
    result.status = selection.status;

    if(selection.status != SolveStatus::OPTIMAL and selection.status != SolveStatus::FEASIBLE and selection.status != SolveStatus::HEURISTIC){
        result.elapsed_ms = Timer.elapsed_time();
        return result;
    }

    WeightMatrix rescaled(n, vector<double>(n, 0.0));
    for(int i = 0; i < n; i++)
        for(int j = 0; j < n; j++) rescaled[i][j] = double(scaled[i][j]) / WEIGHT_SCALE;

    vector<string> ids;
    for(const auto& t : tickets) ids.push_back(t.id);

    // Walk successors from every unvisited node; a walk that stalls before closing is not a cycle.
    vector<bool> visit(n, false);
    for(int start = 0; start < n; start++){
        if(visit[start] or selection.successor[start] < 0) continue;

        vector<int> group = {start};
        visit[start] = true;
        int u = selection.successor[start];
        while(u >= 0 and u != start and not visit[u]){
            visit[u] = true;
            group.push_back(u);
            u = selection.successor[u];
        }
        if(u != start) continue;

        for(size_t k = 0; k < group.size(); k++) result.selected_edges.push_back({group[k], group[(k + 1) % group.size()]});
        result.cycles.push_back(describeCycle(ids, group, rescaled));
    }

    stable_sort(result.cycles.begin(), result.cycles.end(), [](const Cycle& a, const Cycle& b){
        if(a.ticket_ids.size() != b.ticket_ids.size()) return a.ticket_ids.size() > b.ticket_ids.size();
        return a.total_score > b.total_score;
    });

    for(const auto& c : result.cycles){
        result.traded_tickets += c.ticket_ids.size();
        result.sum_squares    += c.ticket_ids.size() * c.ticket_ids.size();
        result.group_sizes.push_back(c.ticket_ids.size());
    }

    result.elapsed_ms = Timer.elapsed_time();
    if(result.elapsed_ms > timeLimit.count() * 1000){
        utils::warn() << name() << " ran " << result.elapsed_ms << "ms, past its " << timeLimit.count() << "s limit" << endl;
    }
    utils::log() << name() << ": " << result.cycles.size() << " cycles, " << result.traded_tickets << " tickets trading" << endl;
    return result;
}

CycleOptimizer::Selection HeuristicCycleOptimizer::selectEdges(const ScaledMatrix& scaled, chrono::seconds) const {
    size_t n = min(poolLimit, scaled.size());
    WeightMatrix W(n, vector<double>(n, 0.0));
    for(size_t i = 0; i < n; i++)
        for(size_t j = 0; j < n; j++) W[i][j] = double(scaled[i][j]);

    Selection selection{.status = SolveStatus::HEURISTIC, .successor = vector<int>(scaled.size(), -1)};
    for(const auto& c : packSmallCycles(W, maxLength)){
        for(size_t k = 0; k < c.members.size(); k++) selection.successor[c.members[k]] = c.members[(k + 1) % c.members.size()];
    }
    return selection;
}

bool hasSolverBackend(){
#ifdef SEATSWAP_HAVE_NETWORK_SIMPLEX
    return true;
#else
    return false;
#endif
}

unique_ptr<CycleOptimizer> makeCycleOptimizer(const Settings& settings){
#ifdef SEATSWAP_HAVE_NETWORK_SIMPLEX
    if(not settings.HEURISTIC_ONLY) return make_unique<NetworkCycleOptimizer>();
#endif
    utils::log() << "global matching uses the small-cycle heuristic" << endl;
    return make_unique<HeuristicCycleOptimizer>(settings.HEURISTIC_POOL);
}

} // namespace seatswap
