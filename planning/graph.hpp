#ifndef UAV_PLANNER_GRAPH_HPP_
#define UAV_PLANNER_GRAPH_HPP_

#include "planning/plan_types.hpp"

#include <utility>
#include <vector>

namespace uav_planner {

struct GraphNode {
    int id;
    Point3 position;
};

struct GraphEdge {
    int to;
    double weight;  // 两端点欧氏距离
};

/*!
 * 无向带权图, 节点 id 即插入顺序下标。
 * 邻接表保持插入顺序, 以保证搜索结果可复现。
 */
class Graph {
public:
    // 添加节点, 返回节点 id
    int addNode(const Point3 &position);

    /*!
     * 添加无向边, 权重为欧氏距离
     * @return 端点非法、自环或边已存在时返回 false
     */
    bool addEdge(int a, int b);

    bool hasNode(int id) const { return id >= 0 && id < static_cast<int>(nodes_.size()); }
    bool hasEdge(int a, int b) const;

    const GraphNode &node(int id) const { return nodes_[id]; }
    const std::vector<GraphNode> &nodes() const { return nodes_; }
    const std::vector<GraphEdge> &neighbors(int id) const { return adjacency_[id]; }

    // 所有边 (a < b), 按 a 升序、邻接表顺序列出
    std::vector<std::pair<int, int>> edges() const;

    // 与 p 最近的节点 id, 空图返回 -1
    int nearestNode(const Point3 &p) const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edge_count_; }
    bool empty() const { return nodes_.empty(); }

private:
    std::vector<GraphNode> nodes_;
    std::vector<std::vector<GraphEdge>> adjacency_;
    size_t edge_count_ = 0;
};

}  // namespace uav_planner

#endif
