#include "planning/astar_search.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <tuple>

#define LOG_TAG "uav.astar"
#include "elog.h"

namespace uav_planner {

namespace {

// (f, 入队序号, 节点 id), 小顶堆
using QueueEntry = std::tuple<double, unsigned long, int>;

}  // namespace

PlanStatus searchGraph(const Graph &graph, int start, int goal, SearchResult &result) {
    result = SearchResult();

    if (!graph.hasNode(start) || !graph.hasNode(goal)) {
        log_e("search: start %d or goal %d is not a vertex of the graph (%zu nodes)",
              start, goal, graph.nodeCount());
        return PlanStatus::VertexNotFound;
    }

    const Point3 goal_pos = graph.node(goal).position;
    const size_t n = graph.nodeCount();
    std::vector<double> best_cost(n, std::numeric_limits<double>::infinity());
    std::vector<int> predecessor(n, -1);
    std::vector<char> closed(n, 0);

    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> frontier;
    unsigned long sequence = 0;

    best_cost[start] = 0.0;
    frontier.emplace((graph.node(start).position - goal_pos).norm(), sequence++, start);

    bool found = false;
    while (!frontier.empty()) {
        int current = std::get<2>(frontier.top());
        frontier.pop();
        if (closed[current]) continue;  // 过期条目
        closed[current] = 1;
        ++result.expansions;

        if (current == goal) {
            found = true;
            break;
        }

        for (const auto &edge : graph.neighbors(current)) {
            if (closed[edge.to]) continue;
            double g = best_cost[current] + edge.weight;
            if (g < best_cost[edge.to]) {
                best_cost[edge.to] = g;
                predecessor[edge.to] = current;
                double h = (graph.node(edge.to).position - goal_pos).norm();
                frontier.emplace(g + h, sequence++, edge.to);
            }
        }
    }

    if (!found) {
        log_w("search: no path from node %d to node %d (%zu expansions)", start, goal, result.expansions);
        return PlanStatus::NoPathFound;
    }

    for (int id = goal; id >= 0; id = predecessor[id]) {
        result.nodeIds.push_back(id);
    }
    std::reverse(result.nodeIds.begin(), result.nodeIds.end());
    for (int id : result.nodeIds) {
        result.path.push_back(graph.node(id).position);
    }
    result.cost = best_cost[goal];

    log_i("search: path with %zu nodes, cost %.3f, %zu expansions",
          result.nodeIds.size(), result.cost, result.expansions);
    return PlanStatus::Success;
}

}  // namespace uav_planner
