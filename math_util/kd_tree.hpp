#ifndef UAV_PLANNER_KD_TREE_HPP_
#define UAV_PLANNER_KD_TREE_HPP_

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <queue>
#include <utility>
#include <vector>

namespace math_util
{

/*!
 * 三维 KD-Tree, 用于 PRM 的 k 近邻连接和 RRT 的最近节点查询。
 * 只保存点索引, 点集本身由调用方持有 (build 时传入的 vector 必须比树活得久)。
 * 支持增量插入 (addPoint), 插入后的树不再平衡。
 */
class KDTree3D {
public:
    struct Node {
        int pointIndex;      // 点索引
        int splitDim;        // 分割维度
        double splitValue;   // 分割值
        int left = -1;
        int right = -1;
    };

    KDTree3D() = default;

    /*!
     * 从点集构建平衡 KD-Tree
     * @param points 点集
     */
    void build(const std::vector<Eigen::Vector3d> &points) {
        points_ = &points;
        nodes_.clear();
        nodes_.reserve(points.size());
        rootIndex_ = -1;

        if (points.empty()) return;

        std::vector<int> indices(points.size());
        std::iota(indices.begin(), indices.end(), 0);

        rootIndex_ = buildRecursive(indices, 0, static_cast<int>(indices.size()), 0);
    }

    /*!
     * 查找最近邻
     * @param query 查询点
     * @return 最近邻的索引, 树为空时返回 -1
     */
    int findNearest(const Eigen::Vector3d &query) const {
        if (nodes_.empty()) return -1;

        int bestIndex = -1;
        double bestDist = std::numeric_limits<double>::infinity();

        findNearestRecursive(rootIndex_, query, bestIndex, bestDist);

        return bestIndex;
    }

    /*!
     * 查找K个最近邻
     * @param query 查询点
     * @param k 邻居数量
     * @return 点索引列表 (按距离升序, 距离相同时索引小的在前)
     */
    std::vector<int> findKNearest(const Eigen::Vector3d &query, int k) const {
        if (nodes_.empty() || k <= 0) return {};

        // 最大堆, 堆顶是当前第 k 近的点
        std::priority_queue<std::pair<double, int>> maxHeap;

        findKNearestRecursive(rootIndex_, query, k, maxHeap);

        std::vector<int> result;
        result.reserve(maxHeap.size());
        while (!maxHeap.empty()) {
            result.push_back(maxHeap.top().second);
            maxHeap.pop();
        }
        std::reverse(result.begin(), result.end());

        return result;
    }

    /*!
     * 增量添加点, pointIndex 必须已经存在于 build 时传入的点集中
     */
    void addPoint(int pointIndex) {
        const Eigen::Vector3d &p = (*points_)[pointIndex];
        if (nodes_.empty()) {
            Node node;
            node.pointIndex = pointIndex;
            node.splitDim = 0;
            node.splitValue = p[0];
            nodes_.push_back(node);
            rootIndex_ = 0;
            return;
        }

        int current = rootIndex_;
        while (true) {
            const Node &node = nodes_[current];
            int next = p[node.splitDim] < node.splitValue ? node.left : node.right;
            if (next >= 0) {
                current = next;
                continue;
            }

            Node newNode;
            newNode.pointIndex = pointIndex;
            newNode.splitDim = (node.splitDim + 1) % 3;
            newNode.splitValue = p[newNode.splitDim];

            int newIndex = static_cast<int>(nodes_.size());
            if (p[node.splitDim] < node.splitValue) {
                nodes_[current].left = newIndex;
            } else {
                nodes_[current].right = newIndex;
            }
            nodes_.push_back(newNode);
            break;
        }
    }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    int buildRecursive(std::vector<int> &indices, int start, int end, int depth) {
        if (start >= end) return -1;

        int splitDim = depth % 3;

        // 中位数分割, 坐标相同时按索引排序保证构建结果确定
        int mid = (start + end) / 2;
        std::nth_element(indices.begin() + start, indices.begin() + mid, indices.begin() + end,
            [this, splitDim](int a, int b) {
                double va = (*points_)[a][splitDim];
                double vb = (*points_)[b][splitDim];
                return va < vb || (va == vb && a < b);
            });

        Node node;
        node.pointIndex = indices[mid];
        node.splitDim = splitDim;
        node.splitValue = (*points_)[indices[mid]][splitDim];

        int nodeIndex = static_cast<int>(nodes_.size());
        nodes_.push_back(node);

        nodes_[nodeIndex].left = buildRecursive(indices, start, mid, depth + 1);
        nodes_[nodeIndex].right = buildRecursive(indices, mid + 1, end, depth + 1);

        return nodeIndex;
    }

    void findNearestRecursive(int nodeIndex, const Eigen::Vector3d &query,
                              int &bestIndex, double &bestDist) const {
        if (nodeIndex < 0) return;

        const Node &node = nodes_[nodeIndex];

        double dist = ((*points_)[node.pointIndex] - query).norm();
        if (dist < bestDist || (dist == bestDist && node.pointIndex < bestIndex)) {
            bestDist = dist;
            bestIndex = node.pointIndex;
        }

        double diff = query[node.splitDim] - node.splitValue;
        int first = diff < 0 ? node.left : node.right;
        int second = diff < 0 ? node.right : node.left;

        findNearestRecursive(first, query, bestIndex, bestDist);

        // 分割平面另一侧可能有更近 (或等距) 的点
        if (std::abs(diff) <= bestDist) {
            findNearestRecursive(second, query, bestIndex, bestDist);
        }
    }

    void findKNearestRecursive(int nodeIndex, const Eigen::Vector3d &query, int k,
                               std::priority_queue<std::pair<double, int>> &maxHeap) const {
        if (nodeIndex < 0) return;

        const Node &node = nodes_[nodeIndex];

        std::pair<double, int> candidate(((*points_)[node.pointIndex] - query).norm(), node.pointIndex);

        if (static_cast<int>(maxHeap.size()) < k) {
            maxHeap.push(candidate);
        } else if (candidate < maxHeap.top()) {
            maxHeap.pop();
            maxHeap.push(candidate);
        }

        double diff = query[node.splitDim] - node.splitValue;
        int first = diff < 0 ? node.left : node.right;
        int second = diff < 0 ? node.right : node.left;

        findKNearestRecursive(first, query, k, maxHeap);

        double maxDist = maxHeap.empty() ? std::numeric_limits<double>::infinity() : maxHeap.top().first;
        if (static_cast<int>(maxHeap.size()) < k || std::abs(diff) <= maxDist) {
            findKNearestRecursive(second, query, k, maxHeap);
        }
    }

    const std::vector<Eigen::Vector3d> *points_ = nullptr;
    std::vector<Node> nodes_;
    int rootIndex_ = -1;
};

}  // namespace math_util

#endif
