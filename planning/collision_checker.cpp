#include "planning/collision_checker.hpp"

#include <algorithm>
#include <cmath>

namespace uav_planner {

namespace {

// 线段 a + t*(b-a), t in [0,1] 与闭合长方体 [lo, hi] 是否相交
bool segmentHitsBox(const Point3 &a, const Point3 &b, const Point3 &lo, const Point3 &hi) {
    double t_enter = 0.0;
    double t_exit = 1.0;
    Point3 d = b - a;

    for (int axis = 0; axis < 3; ++axis) {
        if (d[axis] == 0.0) {
            // 平行于该轴的 slab, 起点不在 slab 内则不可能相交
            if (a[axis] < lo[axis] || a[axis] > hi[axis]) return false;
            continue;
        }
        double t0 = (lo[axis] - a[axis]) / d[axis];
        double t1 = (hi[axis] - a[axis]) / d[axis];
        if (t0 > t1) std::swap(t0, t1);
        t_enter = std::max(t_enter, t0);
        t_exit = std::min(t_exit, t1);
        if (t_enter > t_exit) return false;
    }
    return true;
}

}  // namespace

CollisionChecker::CollisionChecker(const ObstacleMap &map) : map_(map) {}

bool CollisionChecker::isFree(const Point3 &p) const {
    const double margin = map_.safetyMargin();
    for (const auto &ob : map_.obstacles()) {
        Point3 reach = (ob.halfSize.array() + margin).matrix();
        if (((p - ob.center).cwiseAbs().array() <= reach.array()).all()) {
            return false;
        }
    }
    return true;
}

bool CollisionChecker::isSegmentFree(const Point3 &a, const Point3 &b) const {
    if (a == b) return isFree(a);

    const double margin = map_.safetyMargin();
    for (const auto &ob : map_.obstacles()) {
        Point3 reach = (ob.halfSize.array() + margin).matrix();
        if (segmentHitsBox(a, b, ob.center - reach, ob.center + reach)) {
            return false;
        }
    }
    return true;
}

}  // namespace uav_planner
