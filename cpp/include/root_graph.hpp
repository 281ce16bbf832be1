#ifndef ROOTVISION_ROOT_GRAPH_HPP
#define ROOTVISION_ROOT_GRAPH_HPP

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <vector>

namespace RootVision {

enum class NodeKind {
    TIP,
    BRANCH,
    ISOLATED
};

struct RootNode {
    int id = -1;
    NodeKind kind = NodeKind::BRANCH;
    cv::Point position;
    // Plant label of the seed region holding the node, 0 if none
    int seed = 0;
    std::vector<int> segments;
};

struct RootSegment {
    int id = -1;
    int start = -1;
    int end = -1;
    // Skeleton pixels from start node to end node, both included
    std::vector<cv::Point> path;
    double length = 0.0;
    // Plant label when the segment lies in a seed region, 0 otherwise
    int seed = 0;
};

/**
 * @brief Graph of a root skeleton
 *
 * Nodes are skeleton tips, branching points and isolated pixels; segments
 * are the skeleton paths between two nodes.
 */
struct RootGraph {
    cv::Size shape;
    std::vector<RootNode> nodes;
    std::vector<RootSegment> segments;

    // Segments sharing a node with the given segment
    std::vector<int> neighborSegments(int segment_id) const;

    double totalLength() const;
    nlohmann::json toJson() const;
};

/**
 * @brief Build the skeleton graph of a root mask
 *
 * The skeleton is computed on the union of the root mask and the seed
 * regions, so every seed is connected to the roots leaving it.
 *
 * @param rmask Root mask (non-zero = root)
 * @param seed_map Seed labels with the same shape (empty: no seeds)
 * @throws ValueError on shape mismatch
 */
RootGraph computeGraph(const cv::Mat& rmask, const cv::Mat& seed_map);

} // namespace RootVision

#endif // ROOTVISION_ROOT_GRAPH_HPP
