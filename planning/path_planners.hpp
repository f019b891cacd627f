#ifndef UAV_PLANNER_PATH_PLANNERS_HPP_
#define UAV_PLANNER_PATH_PLANNERS_HPP_

#include "planning/astar_search.hpp"
#include "planning/planner_config.hpp"

#include <memory>
#include <string>

namespace uav_planner {

/*!
 * 路径规划器统一接口, 轨迹生成只依赖这一接口
 */
class PathPlannerBase {
public:
    virtual ~PathPlannerBase() = default;

    /*!
     * 规划起点到终点的无碰撞路径
     * @param path 输出: 起点到终点 (含两端) 的航点序列, 无连续重复点
     */
    virtual PlanStatus plan(const Point3 &start, const Point3 &goal, Path &path) = 0;

    virtual std::string name() const = 0;
};

// 栅格图 + A*
class LatticePathPlanner : public PathPlannerBase {
public:
    LatticePathPlanner(const LatticeConfig &config, int connect_neighbors, const CollisionChecker &checker);

    PlanStatus plan(const Point3 &start, const Point3 &goal, Path &path) override;
    std::string name() const override { return "lattice"; }

    // 最近一次规划使用的图 (含接入的起终点)
    const Graph &graph() const { return graph_; }
    const SearchResult &lastSearch() const { return search_; }

private:
    LatticeConfig config_;
    int connect_neighbors_;
    const CollisionChecker &checker_;
    Graph base_;
    bool built_ = false;
    Graph graph_;
    SearchResult search_;
};

// 概率路图 + A*
class RoadmapPathPlanner : public PathPlannerBase {
public:
    RoadmapPathPlanner(const RoadmapConfig &config, unsigned int seed, const CollisionChecker &checker);

    PlanStatus plan(const Point3 &start, const Point3 &goal, Path &path) override;
    std::string name() const override { return "prm"; }

    const Graph &graph() const { return graph_; }
    const SearchResult &lastSearch() const { return search_; }

private:
    RoadmapConfig config_;
    std::mt19937 rng_;
    const CollisionChecker &checker_;
    Graph base_;
    bool built_ = false;
    Graph graph_;
    SearchResult search_;
};

// RRT
class TreePathPlanner : public PathPlannerBase {
public:
    TreePathPlanner(const RrtConfig &config, unsigned int seed, const CollisionChecker &checker);

    PlanStatus plan(const Point3 &start, const Point3 &goal, Path &path) override;
    std::string name() const override { return "rrt"; }

    const RrtPlanner &tree() const { return rrt_; }

private:
    RrtPlanner rrt_;
    std::mt19937 rng_;
};

/*!
 * 按 config.planner.algorithm 创建规划器
 * 未在配置中给出空间范围的算法使用障碍物包围盒
 * @return 算法名非法时返回 nullptr
 */
std::unique_ptr<PathPlannerBase> createPathPlanner(const PlannerConfig &config, const CollisionChecker &checker);

}  // namespace uav_planner

#endif
