#ifndef UAV_PLANNER_RRT_PLANNER_HPP_
#define UAV_PLANNER_RRT_PLANNER_HPP_

#include "planning/collision_checker.hpp"
#include "math_util/kd_tree.hpp"

#include <random>
#include <vector>

namespace uav_planner {

struct RrtConfig {
    Box3 volume;                  // 采样空间
    double stepSize = 1.0;        // 每次扩展的最大步长
    double goalTolerance = 1.0;   // 新节点距终点小于该值即认为到达
    int maxIterations = 5000;
    double goalBias = 0.0;        // 直接以终点为采样点的概率
    int maxSampleRetries = 100;   // 单次迭代内重采自由点的上限
};

// 树节点, parent 为节点数组下标, 根节点为 -1
struct TreeNode {
    Point3 position;
    int parent;
};

/*!
 * 快速扩展随机树 (RRT)
 * 从起点出发, 每次向随机自由采样点扩展固定步长, 直到有节点进入终点容差范围或迭代次数用尽。
 */
class RrtPlanner {
public:
    enum class State { Growing, GoalReached, Exhausted };

    RrtPlanner(const RrtConfig &config, const CollisionChecker &checker);

    /*!
     * 生长随机树并提取路径
     * @param start 起点
     * @param goal 终点
     * @param rng 随机数源
     * @param path 输出: 沿父节点回溯再反转得到的路径; 末端到终点的线段无碰撞时追加终点
     * @return Success / NoPathFound (迭代用尽) / ValidationError (参数非法或起终点在障碍物内)
     */
    PlanStatus growTree(const Point3 &start, const Point3 &goal, std::mt19937 &rng, Path &path);

    State state() const { return state_; }
    const std::vector<TreeNode> &nodes() const { return nodes_; }
    int iterations() const { return iterations_; }

private:
    bool validate(const Point3 &start, const Point3 &goal) const;
    bool sampleFree(const Point3 &goal, std::mt19937 &rng, Point3 &sample) const;
    Point3 steer(const Point3 &from, const Point3 &to) const;
    Path extractPath(int node_index) const;

    RrtConfig config_;
    const CollisionChecker &checker_;
    std::vector<TreeNode> nodes_;
    std::vector<Point3> positions_;  // 与 nodes_ 同序, 供 KD-Tree 索引
    math_util::KDTree3D tree_;
    State state_ = State::Growing;
    int iterations_ = 0;
};

const char *rrtStateToString(RrtPlanner::State state);

}  // namespace uav_planner

#endif
