#ifndef ROOTVISION_ROOT_TREE_HPP
#define ROOTVISION_ROOT_TREE_HPP

#include "root_graph.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace RootVision {

struct RootAxis {
    int id = -1;
    int plant = 0;
    // 1 for the primary root, 2 for its laterals, ...
    int order = 1;
    int parent = -1;
    std::vector<int> segments;
    double length = 0.0;
};

/**
 * @brief Root system architecture built on top of a RootGraph
 *
 * Per-segment vectors are indexed by segment id. Unreached segments have
 * plant 0, parent -1 and axis -1.
 */
struct RootTree {
    RootGraph graph;
    std::vector<int> segment_parent;
    std::vector<int> segment_plant;
    std::vector<int> segment_axis;
    std::vector<double> segment_distance;
    std::vector<RootAxis> axes;

    int plantCount() const;
    std::vector<int> axesOfPlant(int plant) const;
    nlohmann::json toJson() const;
};

/**
 * @brief Organize a root graph into per-plant axes
 *
 * Segments are reached from the seed segments by shortest path (segment
 * lengths as cost). For each plant the longest seed-to-tip path is the
 * primary axis; every branch leaving an axis of order o yields an axis of
 * order o+1 following the longest path of its subtree.
 */
RootTree computeTree(const RootGraph& graph);

} // namespace RootVision

#endif // ROOTVISION_ROOT_TREE_HPP
