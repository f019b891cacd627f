#ifndef UAV_PLANNER_ROADMAP_GRAPH_HPP_
#define UAV_PLANNER_ROADMAP_GRAPH_HPP_

#include "planning/collision_checker.hpp"
#include "planning/graph.hpp"

#include <random>

namespace uav_planner {

struct RoadmapConfig {
    Box3 volume;                    // 采样空间
    double density = 0.0;           // 每立方米采样点数, sampleCount 为 0 时使用
    int sampleCount = 0;            // 目标采样点数
    int neighbors = 10;             // 每个采样点连接的近邻数 k
    long maxSampleAttempts = 0;     // 采样总次数上限, 0 表示 50 倍目标点数
    double maxSamples = 2.0e6;      // 目标采样点数上限
};

// 目标采样点数: sampleCount > 0 时直接使用, 否则 round(density * volume). 不截断, 可能超过 int 范围
double roadmapTargetCount(const RoadmapConfig &config);

/*!
 * 构建概率路图 (PRM)
 * 在 volume 内均匀采样, 落在障碍物内的点丢弃重采; 每个点与 k 个最近点在线段无碰撞时连边。
 * @param config 采样参数
 * @param checker 碰撞检测
 * @param rng 随机数源, 相同种子得到相同路图
 * @param graph 输出 (先清空)
 * @return 参数非法或目标点数超过 maxSamples 返回 ValidationError; 采样次数用尽仍未达到目标点数返回 SamplingExhausted, 此时 graph 为空
 */
PlanStatus buildRoadmap(const RoadmapConfig &config, const CollisionChecker &checker,
                        std::mt19937 &rng, Graph &graph);

/*!
 * 把任意自由点接入图: 与已有节点重合时直接返回该节点, 否则新增节点并与 k 个最近节点连边 (线段无碰撞时)
 * @param node_id 输出, 点对应的节点 id
 * @return 点在障碍物内返回 ValidationError
 */
PlanStatus connectVertex(Graph &graph, const Point3 &point, int k,
                         const CollisionChecker &checker, int &node_id);

}  // namespace uav_planner

#endif
