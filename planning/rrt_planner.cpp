#include "planning/rrt_planner.hpp"

#include <algorithm>
#include <cmath>

#define LOG_TAG "uav.rrt"
#include "elog.h"

namespace uav_planner {

const char *rrtStateToString(RrtPlanner::State state) {
    switch (state) {
        case RrtPlanner::State::Growing: return "growing";
        case RrtPlanner::State::GoalReached: return "goal-reached";
        case RrtPlanner::State::Exhausted: return "exhausted";
    }
    return "unknown";
}

RrtPlanner::RrtPlanner(const RrtConfig &config, const CollisionChecker &checker)
    : config_(config), checker_(checker) {}

bool RrtPlanner::validate(const Point3 &start, const Point3 &goal) const {
    const Box3 &vol = config_.volume;
    if (!vol.min.allFinite() || !vol.max.allFinite() || (vol.max.array() < vol.min.array()).any()) {
        log_e("grow tree: invalid sampling volume");
        return false;
    }
    if (!(config_.stepSize > 0.0) || !std::isfinite(config_.stepSize)) {
        log_e("grow tree: step size %f must be positive", config_.stepSize);
        return false;
    }
    if (!(config_.goalTolerance >= 0.0) || !std::isfinite(config_.goalTolerance)) {
        log_e("grow tree: goal tolerance %f must be non-negative", config_.goalTolerance);
        return false;
    }
    if (config_.maxIterations <= 0 || config_.maxSampleRetries <= 0) {
        log_e("grow tree: max iterations %d / sample retries %d must be positive",
              config_.maxIterations, config_.maxSampleRetries);
        return false;
    }
    if (!(config_.goalBias >= 0.0 && config_.goalBias <= 1.0)) {
        log_e("grow tree: goal bias %f must be within [0, 1]", config_.goalBias);
        return false;
    }
    if (!start.allFinite() || !checker_.isFree(start)) {
        log_e("grow tree: start (%.3f, %.3f, %.3f) is not free", start.x(), start.y(), start.z());
        return false;
    }
    if (!goal.allFinite() || !checker_.isFree(goal)) {
        log_e("grow tree: goal (%.3f, %.3f, %.3f) is not free", goal.x(), goal.y(), goal.z());
        return false;
    }
    return true;
}

PlanStatus RrtPlanner::growTree(const Point3 &start, const Point3 &goal, std::mt19937 &rng, Path &path) {
    path.clear();
    nodes_.clear();
    positions_.clear();
    iterations_ = 0;
    state_ = State::Growing;

    if (!validate(start, goal)) {
        return PlanStatus::ValidationError;
    }

    nodes_.push_back({start, -1});
    positions_.push_back(start);
    tree_.build(positions_);

    int reached = -1;
    if ((start - goal).norm() <= config_.goalTolerance) {
        reached = 0;
    }

    while (reached < 0 && iterations_ < config_.maxIterations) {
        ++iterations_;

        Point3 sample;
        if (!sampleFree(goal, rng, sample)) {
            continue;
        }

        int nearest = tree_.findNearest(sample);
        const Point3 from = nodes_[nearest].position;
        Point3 next = steer(from, sample);
        if (next == from) continue;
        if (!checker_.isSegmentFree(from, next)) continue;

        int index = static_cast<int>(nodes_.size());
        nodes_.push_back({next, nearest});
        positions_.push_back(next);
        tree_.addPoint(index);

        if ((next - goal).norm() <= config_.goalTolerance) {
            reached = index;
        }
    }

    if (reached < 0) {
        state_ = State::Exhausted;
        log_w("grow tree: goal not reached after %d iterations (%zu nodes)", iterations_, nodes_.size());
        return PlanStatus::NoPathFound;
    }

    state_ = State::GoalReached;
    path = extractPath(reached);
    if (path.back() != goal && checker_.isSegmentFree(path.back(), goal)) {
        path.push_back(goal);
    }
    log_i("grow tree: goal reached after %d iterations, %zu nodes, %zu waypoints",
          iterations_, nodes_.size(), path.size());
    return PlanStatus::Success;
}

bool RrtPlanner::sampleFree(const Point3 &goal, std::mt19937 &rng, Point3 &sample) const {
    if (config_.goalBias > 0.0) {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng) < config_.goalBias) {
            sample = goal;
            return true;
        }
    }

    const Box3 &vol = config_.volume;
    std::uniform_real_distribution<double> ux(vol.min.x(), vol.max.x());
    std::uniform_real_distribution<double> uy(vol.min.y(), vol.max.y());
    std::uniform_real_distribution<double> uz(vol.min.z(), vol.max.z());
    for (int retry = 0; retry < config_.maxSampleRetries; ++retry) {
        double x = ux(rng);
        double y = uy(rng);
        double z = uz(rng);
        sample = Point3(x, y, z);
        if (checker_.isFree(sample)) {
            return true;
        }
    }
    return false;
}

// 采样点在一个步长之内直接取采样点, 否则沿方向前进 stepSize
Point3 RrtPlanner::steer(const Point3 &from, const Point3 &to) const {
    Point3 direction = to - from;
    double dist = direction.norm();
    if (dist <= config_.stepSize) {
        return to;
    }
    return from + direction / dist * config_.stepSize;
}

Path RrtPlanner::extractPath(int node_index) const {
    Path path;
    int current = node_index;
    while (current >= 0) {
        path.push_back(nodes_[current].position);
        current = nodes_[current].parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

}  // namespace uav_planner
