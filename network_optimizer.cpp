#include "optimizer.hpp"

#include "network_simplex.hpp"
#include "scorer.hpp"
#include "utils.hpp"

using namespace std;
using ll = long long;

namespace seatswap {

// Ticket i is split into a "Sender" node i and a "Receiver" node i + N. Each Sender ships one unit
// and each Receiver takes one, so a flow is an assignment of every ticket to the ticket whose seats it
// takes. The self-loop i -> i + N means the ticket keeps its own seats. It costs NONTRADE_COST and a
// real edge costs NONTRADE_COST minus its weight, so the cheapest circulation is the heaviest set of
// disjoint cycles, with every node at out-degree == in-degree <= 1 once self-loops are dropped.
CycleOptimizer::Selection NetworkCycleOptimizer::selectEdges(const ScaledMatrix& scaled, chrono::seconds) const {
    const ll NONTRADE_COST = ll(MAX_SCORE) * WEIGHT_SCALE;
    int n = scaled.size();

    network_simplex<ll, ll> ns(2 * n);
    for(int v = 0; v < n; v++){
        ns.add_supply(v, 1);
        ns.add_supply(v + n, -1);
    }

    vector<pair<int,int>> Edges;
    for(int i = 0; i < n; i++)
        for(int j = 0; j < n; j++){
            if(i == j or scaled[i][j] <= 0) continue;
            Edges.push_back({i, j});
            ns.add(i, j + n, 0, 1, NONTRADE_COST - scaled[i][j]);
        }

    for(int v = 0; v < n; v++){ // Self-matching loop idea
        Edges.push_back({v, v});
        ns.add(v, v + n, 0, 1, NONTRADE_COST);
    }

    Selection selection{.status = SolveStatus::NO_SOLUTION, .successor = vector<int>(n, -1)};
    if(not ns.mincost_circulation()){
        utils::warn() << "network simplex found no circulation for " << n << " tickets" << endl;
        return selection;
    }

    for(size_t e = 0; e < Edges.size(); e++){
        auto [from, to] = Edges[e];
        if(ns.get_flow(e) and from != to) selection.successor[from] = to;
    }
    selection.status = SolveStatus::OPTIMAL;
    return selection;
}

} // namespace seatswap
