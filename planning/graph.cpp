#include "planning/graph.hpp"

#include <limits>

namespace uav_planner {

int Graph::addNode(const Point3 &position) {
    int id = static_cast<int>(nodes_.size());
    nodes_.push_back({id, position});
    adjacency_.emplace_back();
    return id;
}

bool Graph::addEdge(int a, int b) {
    if (!hasNode(a) || !hasNode(b) || a == b || hasEdge(a, b)) {
        return false;
    }
    double weight = (nodes_[a].position - nodes_[b].position).norm();
    adjacency_[a].push_back({b, weight});
    adjacency_[b].push_back({a, weight});
    ++edge_count_;
    return true;
}

bool Graph::hasEdge(int a, int b) const {
    if (!hasNode(a) || !hasNode(b)) return false;
    // 从度数较小的一端查找
    const auto &list = adjacency_[a].size() <= adjacency_[b].size() ? adjacency_[a] : adjacency_[b];
    int other = adjacency_[a].size() <= adjacency_[b].size() ? b : a;
    for (const auto &e : list) {
        if (e.to == other) return true;
    }
    return false;
}

std::vector<std::pair<int, int>> Graph::edges() const {
    std::vector<std::pair<int, int>> result;
    result.reserve(edge_count_);
    for (size_t a = 0; a < adjacency_.size(); ++a) {
        for (const auto &e : adjacency_[a]) {
            if (static_cast<int>(a) < e.to) {
                result.emplace_back(static_cast<int>(a), e.to);
            }
        }
    }
    return result;
}

int Graph::nearestNode(const Point3 &p) const {
    int best = -1;
    double best_dist = std::numeric_limits<double>::infinity();
    for (const auto &n : nodes_) {
        double d = (n.position - p).squaredNorm();
        if (d < best_dist) {
            best_dist = d;
            best = n.id;
        }
    }
    return best;
}

}  // namespace uav_planner
