#ifndef UAV_PLANNER_COORDINATE_TRANSFORM_HPP_
#define UAV_PLANNER_COORDINATE_TRANSFORM_HPP_
#include <cmath>
#include <Eigen/Dense>
#define _USE_MATH_DEFINES // 用于启用M_PI常量
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif
namespace math_util
{

struct WGS84Coord {
    double lon; // 经度（度）
    double lat; // 纬度（度）
    double alt; // 高度（米）

    WGS84Coord(double lon, double lat, double alt) : lon(lon), lat(lat), alt(alt) {}
};

// WGS84 椭球参数
const double kWgs84A = 6378137.0;           // 长半轴
const double kWgs84ESq = 0.00669437999013;  // 第一偏心率的平方

inline double deg2rad(double deg) { return deg * M_PI / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / M_PI; }

// 经纬高 -> ECEF (地心地固坐标系)
inline Eigen::Vector3d wgs84_to_ecef(const WGS84Coord &coord) {
    const double lon = deg2rad(coord.lon);
    const double lat = deg2rad(coord.lat);
    const double N = kWgs84A / std::sqrt(1.0 - kWgs84ESq * std::sin(lat) * std::sin(lat));

    return Eigen::Vector3d((N + coord.alt) * std::cos(lat) * std::cos(lon),
                           (N + coord.alt) * std::cos(lat) * std::sin(lon),
                           (N * (1.0 - kWgs84ESq) + coord.alt) * std::sin(lat));
}

// ECEF -> 经纬高, 纬度迭代到 1e-12 rad
inline WGS84Coord ecef_to_wgs84(const Eigen::Vector3d &ecef) {
    const double p = ecef.head<2>().norm();
    const double lon = std::atan2(ecef.y(), ecef.x());

    double lat = std::atan2(ecef.z(), p * (1.0 - kWgs84ESq));
    double h = 0.0;
    for (int iter = 0; iter < 100; ++iter) {
        const double N = kWgs84A / std::sqrt(1.0 - kWgs84ESq * std::sin(lat) * std::sin(lat));
        h = p / std::cos(lat) - N;
        const double next = std::atan2(ecef.z(), p * (1.0 - kWgs84ESq * N / (N + h)));
        const bool converged = std::fabs(next - lat) <= 1e-12;
        lat = next;
        if (converged) break;
    }

    return WGS84Coord(rad2deg(lon), rad2deg(lat), h);
}

/*!
 * ECEF 增量 -> 局部坐标 (x = north, y = east, z = up) 的旋转矩阵
 * 各行依次为参考点处北, 东, 天方向在 ECEF 中的单位向量
 */
inline Eigen::Matrix3d ecef_to_local_rotation(const WGS84Coord &ref) {
    const double sin_lon = std::sin(deg2rad(ref.lon));
    const double cos_lon = std::cos(deg2rad(ref.lon));
    const double sin_lat = std::sin(deg2rad(ref.lat));
    const double cos_lat = std::cos(deg2rad(ref.lat));

    Eigen::Matrix3d R;
    R << -sin_lat * cos_lon, -sin_lat * sin_lon, cos_lat,
         -sin_lon,            cos_lon,           0.0,
          cos_lat * cos_lon,  cos_lat * sin_lon, sin_lat;
    return R;
}

/*!
 * 经纬高 -> 障碍物局部坐标 (x = north, y = east, z = up)
 * @param coord 目标点
 * @param home 局部坐标系原点
 */
inline Eigen::Vector3d geodetic_to_local(const WGS84Coord &coord, const WGS84Coord &home) {
    return ecef_to_local_rotation(home) * (wgs84_to_ecef(coord) - wgs84_to_ecef(home));
}

// 障碍物局部坐标 -> 经纬高
inline WGS84Coord local_to_geodetic(const Eigen::Vector3d &local, const WGS84Coord &home) {
    // 旋转矩阵正交, 逆即转置
    return ecef_to_wgs84(wgs84_to_ecef(home) + ecef_to_local_rotation(home).transpose() * local);
}

}

#endif
