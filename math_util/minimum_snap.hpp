#ifndef UAV_PLANNER_MINIMUM_SNAP_HPP_
#define UAV_PLANNER_MINIMUM_SNAP_HPP_

#include <Eigen/Dense>
#include <vector>

namespace math_util
{

// 每段 7 次多项式, 8 个系数
constexpr int kSnapPolyCoeffs = 8;

/*!
 * 一段轨迹: 起止航点、时长、x/y/z 三个方向的多项式系数
 * 系数以归一化时间 tau = t / duration 表示, 按次数升序: p(tau) = sum coeffs(i, axis) * tau^i
 */
struct TrajectorySegment {
    Eigen::Vector3d start;
    Eigen::Vector3d end;
    double duration;
    Eigen::Matrix<double, kSnapPolyCoeffs, 3> coeffs;

    // 段内时刻 t (0 <= t <= duration) 处的 order 阶导数
    Eigen::Vector3d Evaluate(double t, int order) const;
};

// 采样输出的一行
struct MotionSample {
    double time;
    Eigen::Vector3d position;
    Eigen::Vector3d velocity;
    Eigen::Vector3d acceleration;
    Eigen::Vector3d jerk;
    Eigen::Vector3d snap;
};

// Minimum-snap 轨迹生成 (闭式解)
class TrajectoryGeneratorTool {
private:
    int Factorial(int x);
    // tau in [0,1] 下 0~3 阶导数在两端的取值矩阵, 行: [起点 d0..d3, 终点 d0..d3]
    Eigen::Matrix<double, kSnapPolyCoeffs, kSnapPolyCoeffs> BoundaryMatrix();
    // tau in [0,1] 下 snap 平方积分的 Hessian
    Eigen::Matrix<double, kSnapPolyCoeffs, kSnapPolyCoeffs> SnapCostMatrix();

public:
    TrajectoryGeneratorTool() = default;
    ~TrajectoryGeneratorTool() = default;

    /*!
     * 按平均速度分配每段时间: T_i = max(len_i / average_speed, min_segment_time)
     * @return 各段时长 (航点数 - 1)
     */
    Eigen::VectorXd AllocateTime(const std::vector<Eigen::Vector3d> &waypoints,
                                 double average_speed, double min_segment_time);

    /*!
     * 闭式求解 minimum-snap QP, 得到每段的多项式系数
     * @param Path 航点 (M x 3)
     * @param Time 各段时长 (M - 1)
     * @return PolyCoeff, 每一行是一段轨迹: | x c0..c7 | y c0..c7 | z c0..c7 |, 系数对应归一化时间
     *
     * 首末航点速度/加速度/jerk 为 0, 中间航点的 1~3 阶导数是自由变量, 两侧共用。
     */
    Eigen::MatrixXd SolveQPClosedForm(const Eigen::MatrixXd &Path, const Eigen::VectorXd &Time);

    /*!
     * 拟合整条轨迹
     * @param waypoints 航点 (至少 2 个)
     * @param average_speed 平均速度, > 0
     * @param min_segment_time 单段最短时间, > 0 (重合航点不会得到零时长段)
     * @param segments 输出
     * @return 输入非法时返回 false
     */
    bool FitTrajectory(const std::vector<Eigen::Vector3d> &waypoints, double average_speed,
                       double min_segment_time, std::vector<TrajectorySegment> &segments);
};

// 轨迹总时长
double TrajectoryDuration(const std::vector<TrajectorySegment> &segments);

/*!
 * 全局时刻 t 所在的段, t 截断到 [0, 总时长], 段边界处取前一段
 * @param local_t 输出, 段内时刻
 * @return 段下标, segments 为空时返回 -1
 */
int FindSegment(const std::vector<TrajectorySegment> &segments, double t, double &local_t);

/*!
 * 在全局时刻 t 处求位置到 snap, t 超出范围时截断到 [0, 总时长]
 * @return segments 为空时返回 false
 */
bool EvaluateTrajectory(const std::vector<TrajectorySegment> &segments, double t, MotionSample &sample);

/*!
 * 以固定时间间隔采样: t = 0, dt, 2dt, ..., 最后一个采样点恰好是总时长
 * 无状态, 可对同一组系数重复调用
 * @return segments 为空或 dt <= 0 时返回 false
 */
bool SampleTrajectory(const std::vector<TrajectorySegment> &segments, double dt,
                      std::vector<MotionSample> &samples);

}  // namespace math_util

#endif
