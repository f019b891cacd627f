#include "planning/path_utils.hpp"

namespace uav_planner {

Path removeConsecutiveDuplicates(const Path &path) {
    Path result;
    result.reserve(path.size());
    for (const auto &p : path) {
        if (result.empty() || result.back() != p) {
            result.push_back(p);
        }
    }
    return result;
}

Path shortcutPath(const Path &path, const CollisionChecker &checker) {
    if (path.size() <= 2) return path;

    Path result;
    result.push_back(path.front());
    size_t i = 0;
    while (i + 1 < path.size()) {
        size_t j = path.size() - 1;
        while (j > i + 1 && !checker.isSegmentFree(path[i], path[j])) {
            --j;
        }
        result.push_back(path[j]);
        i = j;
    }
    return result;
}

double pathLength(const Path &path) {
    double length = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        length += (path[i] - path[i - 1]).norm();
    }
    return length;
}

bool isPathFree(const Path &path, const CollisionChecker &checker) {
    if (path.empty()) return true;
    if (!checker.isFree(path.front())) return false;
    for (size_t i = 1; i < path.size(); ++i) {
        if (!checker.isSegmentFree(path[i - 1], path[i])) return false;
    }
    return true;
}

}  // namespace uav_planner
