#ifndef UAV_PLANNER_LATTICE_GRAPH_HPP_
#define UAV_PLANNER_LATTICE_GRAPH_HPP_

#include "planning/collision_checker.hpp"
#include "planning/graph.hpp"

#include <string>

namespace uav_planner {

enum class LatticeConnectivity {
    Face,  // 6 邻域
    Full   // 26 邻域
};

// "full" -> Full; "face" / "partial" -> Face. 其它字符串返回 false
bool parseConnectivity(const std::string &text, LatticeConnectivity &connectivity);
const char *connectivityToString(LatticeConnectivity connectivity);

struct LatticeConfig {
    Point3 center = Point3::Zero();
    Point3 halfSizes = Point3::Zero();
    Point3 resolution = Point3::Constant(1.0);  // 各轴栅格间距
    LatticeConnectivity connectivity = LatticeConnectivity::Full;
    double maxCells = 2.0e6;                    // 栅格总数上限 (含被障碍物占据的栅格)
};

/*!
 * 生成规则三维栅格图
 *   各轴栅格点为 lower + k * res (lower + k * res <= upper), lower/upper = center -/+ halfSizes;
 *   被占据的栅格点丢弃, 相邻自由栅格点之间线段无碰撞时连边, 权重为欧氏距离。
 * 节点按 (x, y, z) 字典序编号, 相同输入得到完全相同的图。
 * @param config 栅格参数
 * @param checker 碰撞检测
 * @param graph 输出 (先清空)
 * @return 分辨率/半尺寸非法或栅格数超过 maxCells 时返回 ValidationError
 */
PlanStatus buildLattice(const LatticeConfig &config, const CollisionChecker &checker, Graph &graph);

}  // namespace uav_planner

#endif
