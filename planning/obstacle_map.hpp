#ifndef UAV_PLANNER_OBSTACLE_MAP_HPP_
#define UAV_PLANNER_OBSTACLE_MAP_HPP_

#include "planning/plan_types.hpp"
#include "math_util/coordinate_transform.hpp"

#include <string>
#include <vector>

namespace uav_planner {

// 轴对齐长方体障碍物: 中心 + 半尺寸
struct Obstacle {
    Point3 center = Point3::Zero();
    Point3 halfSize = Point3::Zero();
};

/*!
 * 障碍物模型: 持有全部障碍物、安全裕度和地理参考原点 (home)。
 * 加载后不可修改, 包围盒在加载时计算并缓存。
 */
class ObstacleMap {
public:
    ObstacleMap() = default;

    /*!
     * 校验并加载障碍物
     * @param records 原始障碍物记录
     * @param safety_margin 安全裕度, 必须 >= 0
     * @param home 局部坐标系原点的经纬高
     * @param map 输出
     * @return 半尺寸 <= 0、非有限数值或裕度非法时返回 ValidationError
     */
    static PlanStatus load(const std::vector<Obstacle> &records, double safety_margin,
                           const math_util::WGS84Coord &home, ObstacleMap &map);

    // 点是否落在某个 (未膨胀的) 障碍物内部或边界上
    bool isInsideObstacle(const Point3 &p) const;

    // 点是否在障碍物整体包围盒内
    bool isInsideBounds(const Point3 &p) const { return bounds_.contains(p); }

    const std::vector<Obstacle> &obstacles() const { return obstacles_; }
    const Box3 &bounds() const { return bounds_; }
    double safetyMargin() const { return safety_margin_; }
    const math_util::WGS84Coord &home() const { return home_; }
    size_t size() const { return obstacles_.size(); }
    bool empty() const { return obstacles_.empty(); }

    // 障碍物集合概要 (数量、包围盒、home), 用于日志
    std::string summary() const;

private:
    std::vector<Obstacle> obstacles_;
    Box3 bounds_;
    double safety_margin_ = 0.0;
    math_util::WGS84Coord home_{0.0, 0.0, 0.0};
};

}  // namespace uav_planner

#endif
