#include "cycles.hpp"

#include <algorithm>
#include <set>

#include "utils.hpp"

using namespace std;

namespace seatswap {

vector<CycleCandidate> packSmallCycles(const WeightMatrix& W, size_t maxLength){
    int n = W.size();
    vector<CycleCandidate> candidates;

    if(maxLength >= 2){
        for(int i = 0; i < n; i++)
            for(int j = i + 1; j < n; j++)
                if(W[i][j] > 0 and W[j][i] > 0) candidates.push_back({{i, j}, W[i][j] + W[j][i]});
    }

    // Only the i -> j -> k -> i rotation of each triple is tried, i -> k -> j -> i never is. A triangle
    // whose benefit runs the other way is left to the global optimizer.
    if(maxLength >= 3){
        for(int i = 0; i < n; i++)
            for(int j = i + 1; j < n; j++){
                if(W[i][j] <= 0) continue;
                for(int k = j + 1; k < n; k++)
                    if(W[j][k] > 0 and W[k][i] > 0) candidates.push_back({{i, j, k}, W[i][j] + W[j][k] + W[k][i]});
            }
    }

    stable_sort(candidates.begin(), candidates.end(), [](const CycleCandidate& a, const CycleCandidate& b){ return a.total > b.total; });

    vector<CycleCandidate> accepted;
    set<int> used;
    for(auto& c : candidates){
        bool disjoint = none_of(c.members.begin(), c.members.end(), [&](int v){ return used.count(v); });
        if(not disjoint) continue;
        used.insert(c.members.begin(), c.members.end());
        accepted.push_back(std::move(c));
    }
    return accepted;
}

Cycle describeCycle(const vector<string>& ids, const vector<int>& members, const WeightMatrix& W){
    Cycle c;
    for(size_t k = 0; k < members.size(); k++){
        int from = members[k], to = members[(k + 1) % members.size()];
        c.ticket_ids.push_back(ids[from]);
        c.edge_scores.push_back(W[from][to]);
        c.total_score += W[from][to];
    }

    if(members.size() == 2) c.description = "2-way swap: " + c.ticket_ids[0] + " <-> " + c.ticket_ids[1];
    else c.description = to_string(members.size()) + "-way cycle: " + utils::join(c.ticket_ids, " -> ");
    return c;
}

vector<Cycle> findSmallCycles(const vector<Ticket>& tickets, const MatchPreferences& prefs, size_t poolLimit, size_t maxLength){
    vector<Ticket> pool(tickets.begin(), tickets.begin() + min(poolLimit, tickets.size()));
    if(pool.size() < tickets.size()){
        utils::log() << "small-cycle pool truncated to " << pool.size() << " of " << tickets.size() << " tickets" << endl;
    }

    vector<string> ids;
    for(const auto& t : pool) ids.push_back(t.id);

    WeightMatrix W = weightMatrix(pool, prefs);
    vector<Cycle> out;
    for(const auto& c : packSmallCycles(W, maxLength)) out.push_back(describeCycle(ids, c.members, W));
    return out;
}

} // namespace seatswap
