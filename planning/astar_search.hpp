#ifndef UAV_PLANNER_ASTAR_SEARCH_HPP_
#define UAV_PLANNER_ASTAR_SEARCH_HPP_

#include "planning/graph.hpp"

#include <vector>

namespace uav_planner {

struct SearchResult {
    Path path;                  // 起点到终点的节点坐标
    std::vector<int> nodeIds;   // 与 path 对应的节点 id
    double cost = 0.0;          // 边权之和
    size_t expansions = 0;      // 出队扩展的节点数
};

/*!
 * A* 图搜索, 启发函数为到终点的欧氏距离
 * f 值相同时先入队的节点优先, 相同输入的结果完全一致。
 * @param graph 图
 * @param start 起点节点 id
 * @param goal 终点节点 id
 * @param result 输出, 失败时 path 为空
 * @return Success / NoPathFound / VertexNotFound (起点或终点 id 不在图中, 不进行搜索)
 */
PlanStatus searchGraph(const Graph &graph, int start, int goal, SearchResult &result);

}  // namespace uav_planner

#endif
