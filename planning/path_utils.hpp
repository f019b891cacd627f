#ifndef UAV_PLANNER_PATH_UTILS_HPP_
#define UAV_PLANNER_PATH_UTILS_HPP_

#include "planning/collision_checker.hpp"

namespace uav_planner {

// 删除连续重复的航点
Path removeConsecutiveDuplicates(const Path &path);

/*!
 * 贪心剪枝: 从当前航点出发, 找到最远的可直连 (线段无碰撞) 航点, 跳过中间航点
 * 首末航点保持不变
 */
Path shortcutPath(const Path &path, const CollisionChecker &checker);

// 路径总长度
double pathLength(const Path &path);

// 路径上所有航点和相邻航点之间的线段都无碰撞
bool isPathFree(const Path &path, const CollisionChecker &checker);

}  // namespace uav_planner

#endif
