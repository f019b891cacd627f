#ifndef UAV_PLANNER_COLLISION_CHECKER_HPP_
#define UAV_PLANNER_COLLISION_CHECKER_HPP_

#include "planning/obstacle_map.hpp"

namespace uav_planner {

/*!
 * 碰撞检测: 障碍物按安全裕度膨胀后判断点和线段是否自由。
 * 只读引用 ObstacleMap, 调用方保证其生命周期。
 * 膨胀后边界上的点视为碰撞。
 */
class CollisionChecker {
public:
    explicit CollisionChecker(const ObstacleMap &map);

    // 点 p 在所有膨胀障碍物之外时返回 true
    bool isFree(const Point3 &p) const;

    /*!
     * 闭线段 a->b 与任何膨胀障碍物都不相交时返回 true (slab 法)
     * a == b 时退化为 isFree(a)
     */
    bool isSegmentFree(const Point3 &a, const Point3 &b) const;

    const ObstacleMap &map() const { return map_; }

private:
    const ObstacleMap &map_;
};

}  // namespace uav_planner

#endif
