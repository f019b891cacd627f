#include "planning/lattice_graph.hpp"

#include <array>
#include <cmath>

#define LOG_TAG "uav.lattice"
#include "elog.h"

namespace uav_planner {

namespace {

// 每条边只需从一端生成: 只取字典序为正的偏移 (第一个非零分量 > 0)
std::vector<std::array<int, 3>> halfNeighborOffsets(LatticeConnectivity connectivity) {
    std::vector<std::array<int, 3>> offsets;
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dz = -1; dz <= 1; ++dz) {
                int nonzero = (dx != 0) + (dy != 0) + (dz != 0);
                if (nonzero == 0) continue;
                if (connectivity == LatticeConnectivity::Face && nonzero != 1) continue;
                int first = dx != 0 ? dx : (dy != 0 ? dy : dz);
                if (first > 0) {
                    offsets.push_back({dx, dy, dz});
                }
            }
        }
    }
    return offsets;
}

}  // namespace

bool parseConnectivity(const std::string &text, LatticeConnectivity &connectivity) {
    if (text == "full") {
        connectivity = LatticeConnectivity::Full;
        return true;
    }
    if (text == "face" || text == "partial") {
        connectivity = LatticeConnectivity::Face;
        return true;
    }
    return false;
}

const char *connectivityToString(LatticeConnectivity connectivity) {
    return connectivity == LatticeConnectivity::Full ? "full" : "face";
}

PlanStatus buildLattice(const LatticeConfig &config, const CollisionChecker &checker, Graph &graph) {
    graph = Graph();

    if (!config.center.allFinite() || !config.halfSizes.allFinite() || (config.halfSizes.array() < 0.0).any()) {
        log_e("build lattice: half sizes (%.3f, %.3f, %.3f) must be finite and non-negative",
              config.halfSizes.x(), config.halfSizes.y(), config.halfSizes.z());
        return PlanStatus::ValidationError;
    }
    if (!config.resolution.allFinite() || (config.resolution.array() <= 0.0).any()) {
        log_e("build lattice: resolution (%.3f, %.3f, %.3f) must be positive",
              config.resolution.x(), config.resolution.y(), config.resolution.z());
        return PlanStatus::ValidationError;
    }

    const Point3 lower = config.center - config.halfSizes;
    std::array<int, 3> counts{};
    double total = 1.0;
    for (int axis = 0; axis < 3; ++axis) {
        double steps = std::floor(2.0 * config.halfSizes[axis] / config.resolution[axis] + 1e-9);
        total *= steps + 1.0;
        if (total > config.maxCells) {
            log_e("build lattice: lattice exceeds the cell budget of %.0f cells", config.maxCells);
            return PlanStatus::ValidationError;
        }
        counts[axis] = static_cast<int>(steps) + 1;
    }

    const int nx = counts[0], ny = counts[1], nz = counts[2];
    auto linear = [ny, nz](int i, int j, int k) { return (static_cast<size_t>(i) * ny + j) * nz + k; };

    // 栅格下标 -> 节点 id, 被占据为 -1
    std::vector<int> cellToNode(static_cast<size_t>(nx) * ny * nz, -1);
    for (int i = 0; i < nx; ++i) {
        for (int j = 0; j < ny; ++j) {
            for (int k = 0; k < nz; ++k) {
                Point3 p(lower.x() + i * config.resolution.x(),
                         lower.y() + j * config.resolution.y(),
                         lower.z() + k * config.resolution.z());
                if (checker.isFree(p)) {
                    cellToNode[linear(i, j, k)] = graph.addNode(p);
                }
            }
        }
    }

    const auto offsets = halfNeighborOffsets(config.connectivity);
    size_t rejected = 0;
    for (int i = 0; i < nx; ++i) {
        for (int j = 0; j < ny; ++j) {
            for (int k = 0; k < nz; ++k) {
                int from = cellToNode[linear(i, j, k)];
                if (from < 0) continue;
                for (const auto &off : offsets) {
                    int ni = i + off[0], nj = j + off[1], nk = k + off[2];
                    if (ni < 0 || nj < 0 || nk < 0 || ni >= nx || nj >= ny || nk >= nz) continue;
                    int to = cellToNode[linear(ni, nj, nk)];
                    if (to < 0) continue;
                    if (checker.isSegmentFree(graph.node(from).position, graph.node(to).position)) {
                        graph.addEdge(from, to);
                    } else {
                        ++rejected;
                    }
                }
            }
        }
    }

    log_i("lattice %dx%dx%d (%s): %zu free nodes, %zu edges, %zu edges clipped by obstacles",
          nx, ny, nz, connectivityToString(config.connectivity),
          graph.nodeCount(), graph.edgeCount(), rejected);
    return PlanStatus::Success;
}

}  // namespace uav_planner
