#ifndef UAV_PLANNER_PLANNER_CONFIG_HPP_
#define UAV_PLANNER_PLANNER_CONFIG_HPP_

#include "planning/lattice_graph.hpp"
#include "planning/roadmap_graph.hpp"
#include "planning/rrt_planner.hpp"
#include "math_util/coordinate_transform.hpp"

#include <string>

namespace YAML {
class Node;
}

namespace uav_planner {

struct EnvironmentConfig {
    std::string obstacleFile = "data/colliders.csv";
    double marginOfSafety = 5.0;
};

struct PlannerSection {
    std::string algorithm = "lattice";  // lattice | prm | rrt
    bool shortcut = true;               // 搜索结果做贪心剪枝
};

// volumeFromObstacles 为 true 时 (配置中未给出空间范围) 使用障碍物整体包围盒
struct LatticeSection {
    LatticeConfig lattice;
    bool volumeFromObstacles = true;
    int connectNeighbors = 8;           // 起终点接入栅格图时连接的近邻数
};

struct RoadmapSection {
    RoadmapConfig roadmap;
    bool volumeFromObstacles = true;
    unsigned int seed = 0;
};

struct RrtSection {
    RrtConfig rrt;
    bool volumeFromObstacles = true;
    unsigned int seed = 0;
};

// 起终点: 经纬高 (需要障碍物文件的 home 转换) 或直接给出局部坐标
struct MissionConfig {
    bool useGps = false;
    math_util::WGS84Coord startGps{0.0, 0.0, 0.0};
    math_util::WGS84Coord goalGps{0.0, 0.0, 0.0};
    Point3 startLocal = Point3::Zero();
    Point3 goalLocal = Point3::Zero();
};

struct TrajectoryConfig {
    double averageSpeed = 2.0;      // m/s
    double minSegmentTime = 0.1;    // 单段最短时间 s
    double sampleDt = 0.1;          // 采样时间间隔 s
    int maxRefinements = 10;        // 轨迹碰撞时插入中点重新拟合的最大轮数
    std::string outputDirectory = "output";
};

/*!
 * 规划器全部配置, 对应 config/planner_config.yaml
 * 缺失的可选字段保留默认值; 类型错误或缺少必需字段 (mission 起终点) 时加载失败。
 */
struct PlannerConfig {
    EnvironmentConfig environment;
    PlannerSection planner;
    LatticeSection lattice;
    RoadmapSection prm;
    RrtSection rrt;
    MissionConfig mission;
    TrajectoryConfig trajectory;

    // 从 YAML 文件加载, 文件不存在或解析失败返回 false
    bool loadFromYAML(const std::string &yaml_path);
    // 从已解析的 YAML 节点加载
    bool loadFromNode(const YAML::Node &root);

    // 检查数值范围, 非法时返回 ValidationError
    PlanStatus validate() const;
};

}  // namespace uav_planner

#endif
