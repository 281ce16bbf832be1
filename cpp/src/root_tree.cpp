#include "root_tree.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <numeric>
#include <queue>
#include <set>
#include <utility>

namespace RootVision {

namespace {

struct AxisSeed {
    int start;
    int plant;
    int order;
    int parent;
};

} // namespace

int RootTree::plantCount() const {
    std::set<int> plants;
    for (const auto& axis : axes) plants.insert(axis.plant);
    return static_cast<int>(plants.size());
}

std::vector<int> RootTree::axesOfPlant(int plant) const {
    std::vector<int> result;
    for (const auto& axis : axes) {
        if (axis.plant == plant) result.push_back(axis.id);
    }
    return result;
}

nlohmann::json RootTree::toJson() const {
    nlohmann::json j;
    j["graph"] = graph.toJson();

    std::set<int> plants;
    for (const auto& axis : axes) plants.insert(axis.plant);

    nlohmann::json plant_list = nlohmann::json::array();
    for (int plant : plants) {
        nlohmann::json axis_list = nlohmann::json::array();
        double total = 0.0;
        double primary = 0.0;
        for (int id : axesOfPlant(plant)) {
            const RootAxis& axis = axes[id];
            axis_list.push_back({
                {"id", axis.id},
                {"order", axis.order},
                {"parent", axis.parent},
                {"segments", axis.segments},
                {"length", axis.length}
            });
            total += axis.length;
            if (axis.order == 1) primary = std::max(primary, axis.length);
        }
        plant_list.push_back({
            {"plant", plant},
            {"axes", axis_list},
            {"primary_length", primary},
            {"total_length", total}
        });
    }
    j["plants"] = plant_list;
    j["segment_parent"] = segment_parent;
    j["segment_plant"] = segment_plant;
    j["segment_axis"] = segment_axis;
    return j;
}

RootTree computeTree(const RootGraph& graph) {
    RootTree tree;
    tree.graph = graph;

    const int n = static_cast<int>(graph.segments.size());
    const double inf = std::numeric_limits<double>::infinity();
    tree.segment_parent.assign(n, -1);
    tree.segment_plant.assign(n, 0);
    tree.segment_axis.assign(n, -1);
    tree.segment_distance.assign(n, inf);

    // Multi-source shortest path from every seed segment
    using Entry = std::pair<double, int>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    for (const auto& segment : graph.segments) {
        if (segment.seed <= 0) continue;
        tree.segment_distance[segment.id] = 0.0;
        tree.segment_plant[segment.id] = segment.seed;
        queue.push({0.0, segment.id});
    }
    while (!queue.empty()) {
        Entry top = queue.top();
        queue.pop();
        const int s = top.second;
        if (top.first > tree.segment_distance[s]) continue;

        for (int t : graph.neighborSegments(s)) {
            if (graph.segments[t].seed > 0) continue;
            const double d = top.first + graph.segments[t].length;
            if (d < tree.segment_distance[t]) {
                tree.segment_distance[t] = d;
                tree.segment_parent[t] = s;
                tree.segment_plant[t] = tree.segment_plant[s];
                queue.push({d, t});
            }
        }
    }

    std::vector<std::vector<int>> children(n);
    for (int t = 0; t < n; ++t) {
        if (tree.segment_parent[t] >= 0) children[tree.segment_parent[t]].push_back(t);
    }

    // Longest path length down each subtree, children before parents
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return tree.segment_distance[a] > tree.segment_distance[b];
    });
    std::vector<double> reach(n, 0.0);
    for (int s : order) {
        if (tree.segment_plant[s] == 0) continue;
        double best = 0.0;
        for (int c : children[s]) best = std::max(best, reach[c]);
        reach[s] = graph.segments[s].length + best;
    }

    auto longestChild = [&](int s) {
        int best = -1;
        for (int c : children[s]) {
            if (tree.segment_axis[c] >= 0) continue;
            if (best < 0 || reach[c] > reach[best]) best = c;
        }
        return best;
    };

    std::deque<AxisSeed> pending;
    std::map<int, std::vector<int>> roots;
    for (const auto& segment : graph.segments) {
        if (segment.seed > 0) roots[segment.seed].push_back(segment.id);
    }
    for (const auto& kv : roots) {
        const std::vector<int>& plant_roots = kv.second;
        int primary = *std::max_element(plant_roots.begin(), plant_roots.end(),
            [&](int a, int b) { return reach[a] < reach[b]; });
        pending.push_back({primary, kv.first, 1, -1});
    }

    while (!pending.empty()) {
        AxisSeed next = pending.front();
        pending.pop_front();
        if (tree.segment_axis[next.start] >= 0) continue;

        RootAxis axis;
        axis.id = static_cast<int>(tree.axes.size());
        axis.plant = next.plant;
        axis.order = next.order;
        axis.parent = next.parent;
        for (int s = next.start; s >= 0; s = longestChild(s)) {
            tree.segment_axis[s] = axis.id;
            axis.segments.push_back(s);
            axis.length += graph.segments[s].length;
        }

        for (int s : axis.segments) {
            for (int c : children[s]) {
                if (tree.segment_axis[c] < 0) {
                    pending.push_back({c, axis.plant, axis.order + 1, axis.id});
                }
            }
        }

        // Other seed segments of the plant hold laterals of the primary axis
        if (axis.order == 1) {
            for (int r : roots[axis.plant]) {
                if (tree.segment_axis[r] >= 0) continue;
                for (int c : children[r]) {
                    pending.push_back({c, axis.plant, 2, axis.id});
                }
            }
        }

        tree.axes.push_back(axis);
    }

    return tree;
}

} // namespace RootVision
