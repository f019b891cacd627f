#ifndef UAV_MOTION_PLANNING_H
#define UAV_MOTION_PLANNING_H

#include <nlohmann/json.hpp>
#include "math_util/coordinate_transform.hpp"
#include "math_util/minimum_snap.hpp"
#include "planning/obstacle_io.hpp"
#include "planning/path_planners.hpp"
#include "planning/path_utils.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace uav_planner {

/*!
 * UavMotionPlanner: 串起整个流程
 *   读配置 -> 读障碍物 -> 图/树规划 -> (剪枝) -> minimum-snap 轨迹 -> 采样输出
 * 各阶段返回 PlanStatus, 失败时停止后续阶段。
 */
class UavMotionPlanner {
public:
    UavMotionPlanner() = default;
    ~UavMotionPlanner() = default;
    UavMotionPlanner(const UavMotionPlanner &) = delete;
    UavMotionPlanner &operator=(const UavMotionPlanner &) = delete;

    // 读取并校验 YAML 配置
    PlanStatus loadConfig(const std::string &yaml_path);
    PlanStatus setConfig(const PlannerConfig &config);
    const PlannerConfig &config() const { return config_; }

    // 从配置中的 obstacle_file 读取障碍物
    PlanStatus loadEnvironment();
    // 直接给定障碍物和 home 点
    PlanStatus loadEnvironment(const std::vector<Obstacle> &records, const math_util::WGS84Coord &home);

    /*!
     * 规划路径: 起终点取自配置 (经纬高按障碍物 home 转换为局部坐标), 规划器由 planner.algorithm 决定
     */
    PlanStatus planPath();
    PlanStatus planPath(const Point3 &start, const Point3 &goal);
    // 直接使用给定航线 (如人工勘测的航点) 作为规划路径, 航线须在膨胀障碍物之外
    PlanStatus setPath(const Path &path);

    /*!
     * 对当前路径拟合 minimum-snap 轨迹并按 sample_dt 采样
     * 采样点落入膨胀障碍物时在对应段插入中点重新拟合, 超过 max_refinements 轮返回 NoPathFound
     */
    PlanStatus generateTrajectory();

    // loadEnvironment + planPath + generateTrajectory
    PlanStatus run();

    // 主输出接口: 规划结果写入 output_json
    bool getPlan(json &output_json) const;

    bool putWGS84ToJson(json &j, const std::string &key, const Path &path) const;
    bool saveTrajectoryCsv(const std::string &filename) const;
    bool savePathCsv(const std::string &filename) const;

    // 保存 JSON
    static inline bool saveJsonToFile(const json &j, const std::string &filename) {
        try {
            std::ofstream file(filename);
            if (!file.is_open()) {
                std::cerr << "Error: Cannot open file " << filename << std::endl;
                return false;
            }
            file << j.dump(4);
            file.close();
            std::cout << "Successfully saved JSON to " << filename << std::endl;
            return true;
        } catch (const std::exception &e) {
            std::cerr << "Error saving JSON to file: " << e.what() << std::endl;
            return false;
        }
    }

    const ObstacleMap &map() const { return map_; }
    const Point3 &start() const { return start_; }
    const Point3 &goal() const { return goal_; }
    const Path &path() const { return path_; }
    // 轨迹实际经过的航点 (path 加上细化插入的中点)
    const Path &trajectoryWaypoints() const { return trajectory_waypoints_; }
    const std::vector<math_util::TrajectorySegment> &segments() const { return segments_; }
    const std::vector<math_util::MotionSample> &samples() const { return samples_; }
    PlanStatus lastStatus() const { return last_status_; }
    const std::string &plannerName() const { return planner_name_; }

private:
    PlanStatus fail(const char *stage, PlanStatus status);

    PlannerConfig config_;
    ObstacleMap map_;
    std::unique_ptr<CollisionChecker> checker_;
    math_util::TrajectoryGeneratorTool generator_;

    Point3 start_ = Point3::Zero();
    Point3 goal_ = Point3::Zero();
    Path raw_path_;
    Path path_;
    Path trajectory_waypoints_;
    std::vector<math_util::TrajectorySegment> segments_;
    std::vector<math_util::MotionSample> samples_;
    std::string planner_name_;
    PlanStatus last_status_ = PlanStatus::Success;
};

}  // namespace uav_planner

#endif
