#include "uavMotionPlanning.hpp"
#include <algorithm>
#include <iomanip>

#define LOG_TAG "uav.planner"
#include "elog.h"

namespace uav_planner {

PlanStatus UavMotionPlanner::fail(const char *stage, PlanStatus status) {
    last_status_ = status;
    log_e("%s failed: %s", stage, planStatusToString(status));
    return status;
}

PlanStatus UavMotionPlanner::loadConfig(const std::string &yaml_path) {
    PlannerConfig config;
    if (!config.loadFromYAML(yaml_path)) {
        return fail("load config", PlanStatus::ValidationError);
    }
    return setConfig(config);
}

PlanStatus UavMotionPlanner::setConfig(const PlannerConfig &config) {
    PlanStatus status = config.validate();
    if (status != PlanStatus::Success) {
        return fail("validate config", status);
    }
    config_ = config;
    last_status_ = PlanStatus::Success;
    return PlanStatus::Success;
}

PlanStatus UavMotionPlanner::loadEnvironment() {
    std::vector<Obstacle> records;
    math_util::WGS84Coord home(0.0, 0.0, 0.0);
    PlanStatus status = readObstacleCsv(config_.environment.obstacleFile, records, home);
    if (status != PlanStatus::Success) {
        return fail("read obstacles", status);
    }
    return loadEnvironment(records, home);
}

PlanStatus UavMotionPlanner::loadEnvironment(const std::vector<Obstacle> &records, const math_util::WGS84Coord &home) {
    checker_.reset();
    PlanStatus status = ObstacleMap::load(records, config_.environment.marginOfSafety, home, map_);
    if (status != PlanStatus::Success) {
        return fail("load obstacles", status);
    }
    checker_ = std::make_unique<CollisionChecker>(map_);
    last_status_ = PlanStatus::Success;
    return PlanStatus::Success;
}

PlanStatus UavMotionPlanner::planPath() {
    if (!checker_) {
        log_e("plan path: environment is not loaded");
        return fail("plan path", PlanStatus::ValidationError);
    }
    const MissionConfig &mission = config_.mission;
    if (mission.useGps) {
        Point3 start = math_util::geodetic_to_local(mission.startGps, map_.home());
        Point3 goal = math_util::geodetic_to_local(mission.goalGps, map_.home());
        return planPath(start, goal);
    }
    return planPath(mission.startLocal, mission.goalLocal);
}

PlanStatus UavMotionPlanner::planPath(const Point3 &start, const Point3 &goal) {
    raw_path_.clear();
    path_.clear();
    segments_.clear();
    samples_.clear();

    if (!checker_) {
        log_e("plan path: environment is not loaded");
        return fail("plan path", PlanStatus::ValidationError);
    }
    start_ = start;
    goal_ = goal;
    log_i("plan path: start (%.2f, %.2f, %.2f) -> goal (%.2f, %.2f, %.2f)",
          start.x(), start.y(), start.z(), goal.x(), goal.y(), goal.z());

    std::unique_ptr<PathPlannerBase> planner = createPathPlanner(config_, *checker_);
    if (!planner) {
        return fail("create planner", PlanStatus::ValidationError);
    }
    planner_name_ = planner->name();

    PlanStatus status = planner->plan(start, goal, raw_path_);
    if (status != PlanStatus::Success) {
        return fail("plan path", status);
    }

    path_ = config_.planner.shortcut ? shortcutPath(raw_path_, *checker_) : raw_path_;
    path_ = removeConsecutiveDuplicates(path_);
    if (!isPathFree(path_, *checker_)) {
        log_w("plan path: resulting path touches an inflated obstacle");
    }

    log_i("plan path (%s): %zu waypoints (%zu before shortcut), length %.2f m",
          planner_name_.c_str(), path_.size(), raw_path_.size(), pathLength(path_));
    last_status_ = PlanStatus::Success;
    return PlanStatus::Success;
}

PlanStatus UavMotionPlanner::setPath(const Path &path) {
    raw_path_.clear();
    path_.clear();
    trajectory_waypoints_.clear();
    segments_.clear();
    samples_.clear();

    if (!checker_) {
        log_e("set path: environment is not loaded");
        return fail("set path", PlanStatus::ValidationError);
    }
    for (const auto &p : path) {
        if (!p.allFinite()) {
            log_e("set path: waypoint is not finite");
            return fail("set path", PlanStatus::ValidationError);
        }
    }
    Path cleaned = removeConsecutiveDuplicates(path);
    if (cleaned.size() < 2) {
        log_e("set path: at least 2 distinct waypoints are required, got %zu", cleaned.size());
        return fail("set path", PlanStatus::ValidationError);
    }
    if (!isPathFree(cleaned, *checker_)) {
        log_e("set path: route crosses an inflated obstacle");
        return fail("set path", PlanStatus::ValidationError);
    }

    raw_path_ = path;
    path_ = cleaned;
    start_ = path_.front();
    goal_ = path_.back();
    planner_name_ = "waypoints";
    log_i("set path: %zu waypoints, length %.2f m", path_.size(), pathLength(path_));
    last_status_ = PlanStatus::Success;
    return PlanStatus::Success;
}

PlanStatus UavMotionPlanner::generateTrajectory() {
    segments_.clear();
    samples_.clear();
    trajectory_waypoints_ = path_;

    const TrajectoryConfig &tc = config_.trajectory;
    for (int round = 0; ; ++round) {
        if (!generator_.FitTrajectory(trajectory_waypoints_, tc.averageSpeed, tc.minSegmentTime, segments_)) {
            return fail("fit trajectory", PlanStatus::ValidationError);
        }
        if (!math_util::SampleTrajectory(segments_, tc.sampleDt, samples_)) {
            return fail("sample trajectory", PlanStatus::ValidationError);
        }
        if (!checker_) break;

        // 找出采样点落入膨胀障碍物的段
        std::vector<char> colliding(segments_.size(), 0);
        size_t hits = 0;
        for (const auto &s : samples_) {
            if (checker_->isFree(s.position)) continue;
            double local_t = 0.0;
            colliding[math_util::FindSegment(segments_, s.time, local_t)] = 1;
            ++hits;
        }
        if (hits == 0) break;

        if (round >= tc.maxRefinements) {
            log_e("trajectory: %zu samples still inside inflated obstacles after %d refinements", hits, round);
            segments_.clear();
            samples_.clear();
            return fail("refine trajectory", PlanStatus::NoPathFound);
        }

        // 碰撞段插入航点连线中点 (直线段无碰撞, 中点一定自由)
        Path refined;
        for (size_t k = 0; k < segments_.size(); ++k) {
            refined.push_back(trajectory_waypoints_[k]);
            if (colliding[k]) {
                refined.push_back((trajectory_waypoints_[k] + trajectory_waypoints_[k + 1]) / 2.0);
            }
        }
        refined.push_back(trajectory_waypoints_.back());
        log_d("trajectory: refinement %d, %zu colliding samples, %zu -> %zu waypoints",
              round + 1, hits, trajectory_waypoints_.size(), refined.size());
        trajectory_waypoints_ = refined;
    }

    log_i("trajectory: %zu segments, %.2f s, %zu samples",
          segments_.size(), math_util::TrajectoryDuration(segments_), samples_.size());
    last_status_ = PlanStatus::Success;
    return PlanStatus::Success;
}

PlanStatus UavMotionPlanner::run() {
    PlanStatus status = loadEnvironment();
    if (status != PlanStatus::Success) return status;
    status = planPath();
    if (status != PlanStatus::Success) return status;
    return generateTrajectory();
}

bool UavMotionPlanner::putWGS84ToJson(json &j, const std::string &key, const Path &path) const {
    try {
        json trajectory_array = json::array();
        for (const auto &p : path) {
            math_util::WGS84Coord g = math_util::local_to_geodetic(p, map_.home());
            // 每个点 [经度, 纬度, 高度]
            trajectory_array.push_back({g.lon, g.lat, g.alt});
        }
        j[key] = trajectory_array;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "Error saving WGS84 to JSON: " << e.what() << std::endl;
        return false;
    }
}

bool UavMotionPlanner::getPlan(json &output_json) const {
    try {
        output_json["planner"] = planner_name_;
        output_json["status"] = planStatusToString(last_status_);
        output_json["home"] = {map_.home().lon, map_.home().lat, map_.home().alt};
        output_json["obstacle_count"] = map_.size();
        output_json["start_local"] = {start_.x(), start_.y(), start_.z()};
        output_json["goal_local"] = {goal_.x(), goal_.y(), goal_.z()};

        json local = json::array();
        for (const auto &p : path_) local.push_back({p.x(), p.y(), p.z()});
        output_json["path_local"] = local;
        if (!putWGS84ToJson(output_json, "path_wgs84", path_)) return false;
        output_json["raw_waypoint_count"] = raw_path_.size();
        output_json["path_length"] = pathLength(path_);

        json durations = json::array();
        for (const auto &seg : segments_) durations.push_back(seg.duration);
        output_json["segment_durations"] = durations;
        json knots = json::array();
        for (const auto &p : trajectory_waypoints_) knots.push_back({p.x(), p.y(), p.z()});
        output_json["trajectory_waypoints_local"] = knots;

        double max_speed = 0.0, max_acc = 0.0;
        for (const auto &s : samples_) {
            max_speed = std::max(max_speed, s.velocity.norm());
            max_acc = std::max(max_acc, s.acceleration.norm());
        }
        output_json["trajectory"] = {
            {"total_time", math_util::TrajectoryDuration(segments_)},
            {"sample_dt", config_.trajectory.sampleDt},
            {"sample_count", samples_.size()},
            {"average_speed", config_.trajectory.averageSpeed},
            {"max_speed", max_speed},
            {"max_acceleration", max_acc}
        };
        return last_status_ == PlanStatus::Success;
    } catch (const std::exception &e) {
        std::cerr << "Error building plan JSON: " << e.what() << std::endl;
        return false;
    }
}

bool UavMotionPlanner::saveTrajectoryCsv(const std::string &filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open file " << filename << std::endl;
        return false;
    }
    file << "time,x,y,z,vx,vy,vz,ax,ay,az,jx,jy,jz,sx,sy,sz\n";
    file << std::fixed << std::setprecision(6);
    for (const auto &s : samples_) {
        file << s.time;
        for (const Eigen::Vector3d *v : {&s.position, &s.velocity, &s.acceleration, &s.jerk, &s.snap}) {
            file << "," << v->x() << "," << v->y() << "," << v->z();
        }
        file << "\n";
    }
    std::cout << "Successfully saved trajectory to " << filename << std::endl;
    return file.good();
}

bool UavMotionPlanner::savePathCsv(const std::string &filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open file " << filename << std::endl;
        return false;
    }
    file << "x,y,z\n";
    file << std::fixed << std::setprecision(6);
    for (const auto &p : path_) {
        file << p.x() << "," << p.y() << "," << p.z() << "\n";
    }
    std::cout << "Successfully saved path to " << filename << std::endl;
    return file.good();
}

}  // namespace uav_planner
