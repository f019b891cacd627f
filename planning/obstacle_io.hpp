#ifndef UAV_PLANNER_OBSTACLE_IO_HPP_
#define UAV_PLANNER_OBSTACLE_IO_HPP_

#include "planning/obstacle_map.hpp"

#include <istream>
#include <string>
#include <vector>

namespace uav_planner {

/*!
 * 解析障碍物 CSV
 *   第 1 行: "lat0 <纬度>, lon0 <经度>" (home 点, 高度取 0)
 *   第 2 行: 表头
 *   之后每行: posX,posY,posZ,halfSizeX,halfSizeY,halfSizeZ
 * 空行忽略。
 * @return 格式错误时返回 ValidationError, 日志中给出行号
 */
PlanStatus parseObstacleCsv(std::istream &in, std::vector<Obstacle> &records, math_util::WGS84Coord &home);

// 从文件读取, 文件无法打开时返回 ValidationError
PlanStatus readObstacleCsv(const std::string &path, std::vector<Obstacle> &records, math_util::WGS84Coord &home);

}  // namespace uav_planner

#endif
