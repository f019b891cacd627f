#include "planning/path_planners.hpp"

#include "planning/path_utils.hpp"

#define LOG_TAG "uav.planner"
#include "elog.h"

namespace uav_planner {

namespace {

// 起终点接入图后用 A* 搜索
PlanStatus searchWithEndpoints(Graph &graph, const Point3 &start, const Point3 &goal, int k,
                               const CollisionChecker &checker, SearchResult &search, Path &path) {
    int start_id = -1;
    int goal_id = -1;
    PlanStatus status = connectVertex(graph, start, k, checker, start_id);
    if (status != PlanStatus::Success) {
        log_e("plan: start vertex could not be inserted (%s)", planStatusToString(status));
        return status;
    }
    status = connectVertex(graph, goal, k, checker, goal_id);
    if (status != PlanStatus::Success) {
        log_e("plan: goal vertex could not be inserted (%s)", planStatusToString(status));
        return status;
    }

    status = searchGraph(graph, start_id, goal_id, search);
    if (status != PlanStatus::Success) {
        return status;
    }
    path = removeConsecutiveDuplicates(search.path);
    return PlanStatus::Success;
}

}  // namespace

LatticePathPlanner::LatticePathPlanner(const LatticeConfig &config, int connect_neighbors,
                                       const CollisionChecker &checker)
    : config_(config), connect_neighbors_(connect_neighbors), checker_(checker) {}

PlanStatus LatticePathPlanner::plan(const Point3 &start, const Point3 &goal, Path &path) {
    path.clear();
    if (!built_) {
        PlanStatus status = buildLattice(config_, checker_, base_);
        if (status != PlanStatus::Success) return status;
        built_ = true;
    }
    graph_ = base_;
    return searchWithEndpoints(graph_, start, goal, connect_neighbors_, checker_, search_, path);
}

RoadmapPathPlanner::RoadmapPathPlanner(const RoadmapConfig &config, unsigned int seed,
                                       const CollisionChecker &checker)
    : config_(config), rng_(seed), checker_(checker) {}

PlanStatus RoadmapPathPlanner::plan(const Point3 &start, const Point3 &goal, Path &path) {
    path.clear();
    if (!built_) {
        PlanStatus status = buildRoadmap(config_, checker_, rng_, base_);
        if (status != PlanStatus::Success) return status;
        built_ = true;
    }
    graph_ = base_;
    return searchWithEndpoints(graph_, start, goal, config_.neighbors, checker_, search_, path);
}

TreePathPlanner::TreePathPlanner(const RrtConfig &config, unsigned int seed, const CollisionChecker &checker)
    : rrt_(config, checker), rng_(seed) {}

PlanStatus TreePathPlanner::plan(const Point3 &start, const Point3 &goal, Path &path) {
    PlanStatus status = rrt_.growTree(start, goal, rng_, path);
    if (status == PlanStatus::Success) {
        path = removeConsecutiveDuplicates(path);
    }
    return status;
}

std::unique_ptr<PathPlannerBase> createPathPlanner(const PlannerConfig &config, const CollisionChecker &checker) {
    const Box3 &bounds = checker.map().bounds();

    if (config.planner.algorithm == "lattice") {
        LatticeConfig lc = config.lattice.lattice;
        if (config.lattice.volumeFromObstacles) {
            lc.center = (bounds.min + bounds.max) / 2.0;
            lc.halfSizes = (bounds.max - bounds.min) / 2.0;
        }
        return std::make_unique<LatticePathPlanner>(lc, config.lattice.connectNeighbors, checker);
    }
    if (config.planner.algorithm == "prm") {
        RoadmapConfig rc = config.prm.roadmap;
        if (config.prm.volumeFromObstacles) rc.volume = bounds;
        return std::make_unique<RoadmapPathPlanner>(rc, config.prm.seed, checker);
    }
    if (config.planner.algorithm == "rrt") {
        RrtConfig tc = config.rrt.rrt;
        if (config.rrt.volumeFromObstacles) tc.volume = bounds;
        return std::make_unique<TreePathPlanner>(tc, config.rrt.seed, checker);
    }

    log_e("unknown planner algorithm '%s'", config.planner.algorithm.c_str());
    return nullptr;
}

}  // namespace uav_planner
