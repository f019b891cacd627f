#include "math_util/minimum_snap.hpp"
#include <algorithm>
#include <cmath>

#define LOG_TAG "uav.traj"
#include "elog.h"

using namespace std;
using namespace Eigen;

namespace math_util
{

namespace {

typedef Matrix<double, kSnapPolyCoeffs, kSnapPolyCoeffs> Matrix8d;

// 最小化 snap: 每个航点有 0~3 阶共 4 个导数量
const int kKnotDerivatives = 4;

// i * (i-1) * ... * (i-r+1)
double FallingFactorial(int i, int r) {
    double v = 1.0;
    for (int k = 0; k < r; ++k) v *= (i - k);
    return v;
}

}  // namespace

/*!
 * 计算x的阶乘
 * @param x
 * @return x!
 */
int TrajectoryGeneratorTool::Factorial(int x) {
    int fac = 1;
    for (int i = x; i > 0; i--)
        fac = fac * i;
    return fac;
}

Matrix8d TrajectoryGeneratorTool::BoundaryMatrix() {
    Matrix8d A = Matrix8d::Zero();
    for (int j = 0; j < kKnotDerivatives; ++j) {
        // tau = 0 处只有 c_j 项非零
        A(j, j) = Factorial(j);
        // tau = 1 处
        for (int i = j; i < kSnapPolyCoeffs; ++i) {
            A(j + kKnotDerivatives, i) = Factorial(i) / Factorial(i - j);
        }
    }
    return A;
}

Matrix8d TrajectoryGeneratorTool::SnapCostMatrix() {
    Matrix8d Q = Matrix8d::Zero();
    for (int i = 4; i < kSnapPolyCoeffs; ++i) {
        for (int l = 4; l < kSnapPolyCoeffs; ++l) {
            Q(i, l) = (Factorial(i) / Factorial(i - 4)) * (Factorial(l) / Factorial(l - 4)) / double(i + l - 7);
        }
    }
    return Q;
}

VectorXd TrajectoryGeneratorTool::AllocateTime(const std::vector<Vector3d> &waypoints,
                                               double average_speed, double min_segment_time) {
    const int number_segments = static_cast<int>(waypoints.size()) - 1;
    VectorXd Time = VectorXd::Zero(std::max(number_segments, 0));
    for (int i = 0; i < number_segments; ++i) {
        double len = (waypoints[i + 1] - waypoints[i]).norm();
        Time(i) = std::max(len / average_speed, min_segment_time);
    }
    return Time;
}

/*!
 * 闭式求解 QP
 *
 * 每段在归一化时间下 A * c = S * b, b 为该段两端的 0~3 阶导数, S = diag(T^j)
 * 该段 snap 代价 = T^-7 * c^T Q c = b^T H b, H = T^-7 * S A^-T Q A^-1 S
 * 相邻段共用航点导数量, 所有航点导数量 d 的总代价为 d^T R d (R 由各段 H 叠加)
 * 将 d 分为固定量 d_F (首末航点全部导数 + 中间航点位置) 和自由量 d_P (中间航点 1~3 阶导数)
 * 最优解: R_PP d_P = -R_FP^T d_F
 */
MatrixXd TrajectoryGeneratorTool::SolveQPClosedForm(const MatrixXd &Path, const VectorXd &Time) {
    const int number_segments = Time.size();
    const int number_knots = number_segments + 1;
    MatrixXd PolyCoeff = MatrixXd::Zero(number_segments, 3 * kSnapPolyCoeffs);

    const Matrix8d A = BoundaryMatrix();
    const PartialPivLU<Matrix8d> lu(A);
    const Matrix8d A_inv = lu.inverse();
    const Matrix8d Q = SnapCostMatrix();

    // 叠加各段代价矩阵
    const int number_variables = number_knots * kKnotDerivatives;
    MatrixXd R = MatrixXd::Zero(number_variables, number_variables);
    std::vector<Matrix8d> segment_maps(number_segments);
    for (int k = 0; k < number_segments; ++k) {
        const double T = Time(k);
        Matrix8d S = Matrix8d::Zero();
        for (int j = 0; j < kKnotDerivatives; ++j) {
            S(j, j) = std::pow(T, j);
            S(j + kKnotDerivatives, j + kKnotDerivatives) = std::pow(T, j);
        }
        segment_maps[k] = A_inv * S;
        Matrix8d H = segment_maps[k].transpose() * Q * segment_maps[k] / std::pow(T, 7);
        R.block(k * kKnotDerivatives, k * kKnotDerivatives, kSnapPolyCoeffs, kSnapPolyCoeffs) += H;
    }

    // 固定量和自由量在 d 中的下标
    std::vector<int> fixed_index;
    std::vector<int> free_index;
    for (int j = 0; j < kKnotDerivatives; ++j) fixed_index.push_back(j);
    for (int j = 0; j < kKnotDerivatives; ++j) fixed_index.push_back(number_segments * kKnotDerivatives + j);
    for (int m = 1; m < number_segments; ++m) {
        fixed_index.push_back(m * kKnotDerivatives);
        for (int j = 1; j < kKnotDerivatives; ++j) free_index.push_back(m * kKnotDerivatives + j);
    }
    const int nF = fixed_index.size();
    const int nP = free_index.size();

    MatrixXd R_FP(nF, nP), R_PP(nP, nP);
    for (int a = 0; a < nF; ++a)
        for (int b = 0; b < nP; ++b)
            R_FP(a, b) = R(fixed_index[a], free_index[b]);
    for (int a = 0; a < nP; ++a)
        for (int b = 0; b < nP; ++b)
            R_PP(a, b) = R(free_index[a], free_index[b]);
    const LDLT<MatrixXd> ldlt(R_PP);

    for (int dim = 0; dim < 3; ++dim) {
        // d_F: 首末航点位置 (其余导数为 0) 与中间航点位置
        VectorXd d_F = VectorXd::Zero(nF);
        d_F(0) = Path(0, dim);
        d_F(kKnotDerivatives) = Path(number_segments, dim);
        for (int m = 1; m < number_segments; ++m) {
            d_F(2 * kKnotDerivatives + m - 1) = Path(m, dim);
        }

        VectorXd d = VectorXd::Zero(number_variables);
        for (int a = 0; a < nF; ++a) d(fixed_index[a]) = d_F(a);
        if (nP > 0) {
            VectorXd d_P = ldlt.solve(-R_FP.transpose() * d_F);
            for (int b = 0; b < nP; ++b) d(free_index[b]) = d_P(b);
        }

        for (int k = 0; k < number_segments; ++k) {
            Matrix<double, kSnapPolyCoeffs, 1> c =
                segment_maps[k] * d.segment<kSnapPolyCoeffs>(k * kKnotDerivatives);
            PolyCoeff.block(k, dim * kSnapPolyCoeffs, 1, kSnapPolyCoeffs) = c.transpose();
        }
    }

    return PolyCoeff;
}

bool TrajectoryGeneratorTool::FitTrajectory(const std::vector<Vector3d> &waypoints, double average_speed,
                                            double min_segment_time, std::vector<TrajectorySegment> &segments) {
    segments.clear();
    if (waypoints.size() < 2) {
        log_e("fit trajectory: at least 2 waypoints are required, got %zu", waypoints.size());
        return false;
    }
    if (!std::isfinite(average_speed) || average_speed <= 0.0) {
        log_e("fit trajectory: average speed %f must be positive", average_speed);
        return false;
    }
    if (!std::isfinite(min_segment_time) || min_segment_time <= 0.0) {
        log_e("fit trajectory: minimum segment time %f must be positive", min_segment_time);
        return false;
    }

    MatrixXd Path(waypoints.size(), 3);
    for (size_t i = 0; i < waypoints.size(); ++i) {
        if (!waypoints[i].allFinite()) {
            log_e("fit trajectory: waypoint %zu is not finite", i);
            return false;
        }
        Path.row(i) = waypoints[i].transpose();
    }

    VectorXd Time = AllocateTime(waypoints, average_speed, min_segment_time);
    MatrixXd PolyCoeff = SolveQPClosedForm(Path, Time);
    if (!PolyCoeff.allFinite()) {
        log_e("fit trajectory: closed-form solution is not finite");
        return false;
    }

    segments.reserve(Time.size());
    for (int k = 0; k < Time.size(); ++k) {
        TrajectorySegment seg;
        seg.start = waypoints[k];
        seg.end = waypoints[k + 1];
        seg.duration = Time(k);
        for (int dim = 0; dim < 3; ++dim) {
            seg.coeffs.col(dim) = PolyCoeff.block(k, dim * kSnapPolyCoeffs, 1, kSnapPolyCoeffs).transpose();
        }
        segments.push_back(seg);
    }

    log_i("fit trajectory: %d segments, total time %.3f s", static_cast<int>(Time.size()), Time.sum());
    return true;
}

Vector3d TrajectorySegment::Evaluate(double t, int order) const {
    const double tau = t / duration;
    Vector3d value = Vector3d::Zero();
    double tau_pow = 1.0;
    for (int i = order; i < kSnapPolyCoeffs; ++i) {
        value += FallingFactorial(i, order) * tau_pow * coeffs.row(i).transpose();
        tau_pow *= tau;
    }
    return value / std::pow(duration, order);
}

double TrajectoryDuration(const std::vector<TrajectorySegment> &segments) {
    double total = 0.0;
    for (const auto &seg : segments) total += seg.duration;
    return total;
}

int FindSegment(const std::vector<TrajectorySegment> &segments, double t, double &local_t) {
    if (segments.empty()) return -1;

    t = std::min(std::max(t, 0.0), TrajectoryDuration(segments));
    size_t k = 0;
    double seg_start = 0.0;
    while (k + 1 < segments.size() && t > seg_start + segments[k].duration) {
        seg_start += segments[k].duration;
        ++k;
    }
    local_t = std::min(std::max(t - seg_start, 0.0), segments[k].duration);
    return static_cast<int>(k);
}

bool EvaluateTrajectory(const std::vector<TrajectorySegment> &segments, double t, MotionSample &sample) {
    double local = 0.0;
    int k = FindSegment(segments, t, local);
    if (k < 0) return false;
    const TrajectorySegment &seg = segments[k];

    sample.time = std::min(std::max(t, 0.0), TrajectoryDuration(segments));
    sample.position = seg.Evaluate(local, 0);
    sample.velocity = seg.Evaluate(local, 1);
    sample.acceleration = seg.Evaluate(local, 2);
    sample.jerk = seg.Evaluate(local, 3);
    sample.snap = seg.Evaluate(local, 4);
    return true;
}

bool SampleTrajectory(const std::vector<TrajectorySegment> &segments, double dt,
                      std::vector<MotionSample> &samples) {
    samples.clear();
    if (segments.empty()) {
        log_e("sample trajectory: no segments");
        return false;
    }
    if (!std::isfinite(dt) || dt <= 0.0) {
        log_e("sample trajectory: time step %f must be positive", dt);
        return false;
    }

    const double total = TrajectoryDuration(segments);
    const long count = static_cast<long>(std::floor(total / dt + 1e-9));
    samples.reserve(count + 2);

    MotionSample sample;
    for (long k = 0; k <= count; ++k) {
        EvaluateTrajectory(segments, std::min(k * dt, total), sample);
        samples.push_back(sample);
    }
    if (samples.back().time < total - 1e-9) {
        EvaluateTrajectory(segments, total, sample);
        samples.push_back(sample);
    }
    return true;
}

}  // namespace math_util
