#include "planning/roadmap_graph.hpp"

#include "math_util/kd_tree.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#define LOG_TAG "uav.prm"
#include "elog.h"

namespace uav_planner {

double roadmapTargetCount(const RoadmapConfig &config) {
    if (config.sampleCount > 0) return config.sampleCount;
    return std::round(config.density * config.volume.volume());
}

PlanStatus buildRoadmap(const RoadmapConfig &config, const CollisionChecker &checker,
                        std::mt19937 &rng, Graph &graph) {
    graph = Graph();

    const Box3 &vol = config.volume;
    if (!vol.min.allFinite() || !vol.max.allFinite() || (vol.max.array() < vol.min.array()).any()) {
        log_e("build roadmap: invalid sampling volume");
        return PlanStatus::ValidationError;
    }
    if (config.sampleCount < 0 || !std::isfinite(config.density) || config.density < 0.0) {
        log_e("build roadmap: sample count %d / density %f must be non-negative",
              config.sampleCount, config.density);
        return PlanStatus::ValidationError;
    }
    if (config.neighbors <= 0) {
        log_e("build roadmap: neighbor count %d must be positive", config.neighbors);
        return PlanStatus::ValidationError;
    }

    const double wanted = roadmapTargetCount(config);
    if (!(wanted > 0.0)) {
        log_e("build roadmap: target sample count is zero (density %f, volume %.3f)",
              config.density, vol.volume());
        return PlanStatus::ValidationError;
    }
    if (!(wanted <= config.maxSamples)) {
        log_e("build roadmap: %.0f samples exceed the budget of %.0f samples", wanted, config.maxSamples);
        return PlanStatus::ValidationError;
    }
    const int target = static_cast<int>(wanted);
    const long budget = config.maxSampleAttempts > 0 ? config.maxSampleAttempts : 50L * target;

    std::uniform_real_distribution<double> ux(vol.min.x(), vol.max.x());
    std::uniform_real_distribution<double> uy(vol.min.y(), vol.max.y());
    std::uniform_real_distribution<double> uz(vol.min.z(), vol.max.z());

    std::vector<Point3> samples;
    samples.reserve(target);
    long attempts = 0;
    while (static_cast<int>(samples.size()) < target) {
        if (attempts >= budget) {
            log_e("build roadmap: only %zu of %d free samples after %ld attempts",
                  samples.size(), target, attempts);
            return PlanStatus::SamplingExhausted;
        }
        ++attempts;
        // 分开求值保证 x, y, z 的抽取顺序固定
        double x = ux(rng);
        double y = uy(rng);
        double z = uz(rng);
        Point3 p(x, y, z);
        if (checker.isFree(p)) {
            samples.push_back(p);
        }
    }

    for (const auto &p : samples) {
        graph.addNode(p);
    }

    math_util::KDTree3D tree;
    tree.build(samples);
    for (int i = 0; i < static_cast<int>(samples.size()); ++i) {
        // 多取一个, 结果中包含自身
        std::vector<int> near = tree.findKNearest(samples[i], config.neighbors + 1);
        for (int j : near) {
            if (j == i || graph.hasEdge(i, j)) continue;
            if (checker.isSegmentFree(samples[i], samples[j])) {
                graph.addEdge(i, j);
            }
        }
    }

    log_i("roadmap: %zu nodes, %zu edges (%ld sampling attempts, k = %d)",
          graph.nodeCount(), graph.edgeCount(), attempts, config.neighbors);
    return PlanStatus::Success;
}

PlanStatus connectVertex(Graph &graph, const Point3 &point, int k,
                         const CollisionChecker &checker, int &node_id) {
    if (!checker.isFree(point)) {
        log_e("connect vertex: (%.3f, %.3f, %.3f) is inside an obstacle", point.x(), point.y(), point.z());
        return PlanStatus::ValidationError;
    }

    for (const auto &n : graph.nodes()) {
        if (n.position == point) {
            node_id = n.id;
            return PlanStatus::Success;
        }
    }

    std::vector<std::pair<double, int>> candidates;
    candidates.reserve(graph.nodeCount());
    for (const auto &n : graph.nodes()) {
        candidates.emplace_back((n.position - point).norm(), n.id);
    }
    size_t count = std::min(candidates.size(), static_cast<size_t>(std::max(k, 0)));
    std::partial_sort(candidates.begin(), candidates.begin() + count, candidates.end());

    node_id = graph.addNode(point);
    size_t connected = 0;
    for (size_t i = 0; i < count; ++i) {
        int other = candidates[i].second;
        if (checker.isSegmentFree(point, graph.node(other).position)) {
            graph.addEdge(node_id, other);
            ++connected;
        }
    }
    if (connected == 0) {
        log_w("connect vertex: (%.3f, %.3f, %.3f) has no collision-free edge to its %zu nearest nodes",
              point.x(), point.y(), point.z(), count);
    }
    return PlanStatus::Success;
}

}  // namespace uav_planner
