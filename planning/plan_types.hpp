#ifndef UAV_PLANNER_PLAN_TYPES_HPP_
#define UAV_PLANNER_PLAN_TYPES_HPP_

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace uav_planner {

// 局部坐标系下的三维点 (x = north, y = east, z = up), 相对于障碍物文件的 home 点
using Point3 = Eigen::Vector3d;

// 起点到终点 (含两端) 的有序航点序列
using Path = std::vector<Point3>;

// 规划各阶段的返回状态
enum class PlanStatus {
    Success,
    ValidationError,    // 障碍物/配置数据非法, 当前阶段终止
    VertexNotFound,     // 起点或终点不在图中
    NoPathFound,        // 搜索正常结束但没有可行路径
    SamplingExhausted   // PRM 在重采样预算内无法达到目标采样数
};

inline const char *planStatusToString(PlanStatus status) {
    switch (status) {
        case PlanStatus::Success: return "Success";
        case PlanStatus::ValidationError: return "ValidationError";
        case PlanStatus::VertexNotFound: return "VertexNotFound";
        case PlanStatus::NoPathFound: return "NoPathFound";
        case PlanStatus::SamplingExhausted: return "SamplingExhausted";
    }
    return "Unknown";
}

// 轴对齐包围盒
struct Box3 {
    Point3 min = Point3::Zero();
    Point3 max = Point3::Zero();

    bool contains(const Point3 &p) const {
        return (p.array() >= min.array()).all() && (p.array() <= max.array()).all();
    }
    double volume() const {
        Point3 ext = (max - min).cwiseMax(0.0);
        return ext.x() * ext.y() * ext.z();
    }
};

}  // namespace uav_planner

#endif
