#include "planning/obstacle_map.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#define LOG_TAG "uav.obstacle"
#include "elog.h"

namespace uav_planner {

PlanStatus ObstacleMap::load(const std::vector<Obstacle> &records, double safety_margin,
                             const math_util::WGS84Coord &home, ObstacleMap &map) {
    if (!std::isfinite(safety_margin) || safety_margin < 0.0) {
        log_e("load obstacles: safety margin %f must be a finite non-negative number", safety_margin);
        return PlanStatus::ValidationError;
    }

    for (size_t i = 0; i < records.size(); ++i) {
        const Obstacle &ob = records[i];
        if (!ob.center.allFinite() || !ob.halfSize.allFinite()) {
            log_e("load obstacles: record %zu has a non-finite value", i);
            return PlanStatus::ValidationError;
        }
        if ((ob.halfSize.array() <= 0.0).any()) {
            log_e("load obstacles: record %zu is degenerate (half size %.3f, %.3f, %.3f)",
                  i, ob.halfSize.x(), ob.halfSize.y(), ob.halfSize.z());
            return PlanStatus::ValidationError;
        }
    }

    map.obstacles_ = records;
    map.safety_margin_ = safety_margin;
    map.home_ = home;

    if (records.empty()) {
        map.bounds_ = Box3();
    } else {
        map.bounds_.min = records.front().center - records.front().halfSize;
        map.bounds_.max = records.front().center + records.front().halfSize;
        for (const auto &ob : records) {
            map.bounds_.min = map.bounds_.min.cwiseMin(ob.center - ob.halfSize);
            map.bounds_.max = map.bounds_.max.cwiseMax(ob.center + ob.halfSize);
        }
    }

    log_i("%s", map.summary().c_str());
    return PlanStatus::Success;
}

bool ObstacleMap::isInsideObstacle(const Point3 &p) const {
    for (const auto &ob : obstacles_) {
        if (((p - ob.center).cwiseAbs().array() <= ob.halfSize.array()).all()) {
            return true;
        }
    }
    return false;
}

std::string ObstacleMap::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "obstacles: " << obstacles_.size()
        << ", margin: " << safety_margin_
        << ", home(lon,lat,alt): (" << std::setprecision(6) << home_.lon << ", " << home_.lat
        << ", " << std::setprecision(3) << home_.alt << ")";
    if (!obstacles_.empty()) {
        oss << ", bounds: [" << bounds_.min.x() << ", " << bounds_.max.x() << "] x ["
            << bounds_.min.y() << ", " << bounds_.max.y() << "] x ["
            << bounds_.min.z() << ", " << bounds_.max.z() << "]";
    }
    return oss.str();
}

}  // namespace uav_planner
