#include "root_graph.hpp"
#include "errors.hpp"
#include "morphology_analysis.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace RootVision {

namespace {

// 4-neighbors first, then diagonals
const cv::Point NEIGHBORS[8] = {
    {0, -1}, {1, 0}, {0, 1}, {-1, 0}, {1, -1}, {1, 1}, {-1, 1}, {-1, -1}
};

// A walk may close on its own start node only past this many pixels
const size_t MIN_LOOP_PIXELS = 4;

const char* kindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::TIP: return "tip";
        case NodeKind::BRANCH: return "branch";
        case NodeKind::ISOLATED: return "isolated";
    }
    return "unknown";
}

class GraphTracer {
public:
    GraphTracer(const cv::Mat& skeleton, const cv::Mat& seeds, RootGraph& graph)
        : skeleton_(skeleton), seeds_(seeds), graph_(graph) {
        node_ids_ = cv::Mat(skeleton.size(), CV_32S, cv::Scalar(-1));
        visited_ = cv::Mat::zeros(skeleton.size(), CV_8U);
    }

    void run() {
        createNodes();

        const size_t node_count = graph_.nodes.size();
        for (size_t n = 0; n < node_count; ++n) {
            traceFrom(static_cast<int>(n));
        }

        // Remaining pixels form closed loops without any node: cut them
        for (int y = 0; y < skeleton_.rows; ++y) {
            for (int x = 0; x < skeleton_.cols; ++x) {
                const cv::Point p(x, y);
                if (!isSkeleton(p) || nodeAt(p) >= 0 || visited_.at<uchar>(p)) continue;
                visited_.at<uchar>(p) = 1;
                if (!hasUnvisitedNeighbor(p)) continue;
                int id = addNode({p}, NodeKind::BRANCH);
                traceFrom(id);
            }
        }
    }

private:
    bool inside(const cv::Point& p) const {
        return p.x >= 0 && p.y >= 0 && p.x < skeleton_.cols && p.y < skeleton_.rows;
    }

    bool isSkeleton(const cv::Point& p) const {
        return inside(p) && skeleton_.at<uchar>(p) > 0;
    }

    int nodeAt(const cv::Point& p) const {
        return node_ids_.at<int>(p);
    }

    bool hasUnvisitedNeighbor(const cv::Point& p) const {
        for (const auto& offset : NEIGHBORS) {
            const cv::Point r = p + offset;
            if (isSkeleton(r) && nodeAt(r) < 0 && !visited_.at<uchar>(r)) return true;
        }
        return false;
    }

    int seedAt(const cv::Point& p) const {
        return seeds_.empty() ? 0 : seeds_.at<int>(p);
    }

    void createNodes() {
        using Morphology::SkeletonAnalyzer;

        cv::Mat node_pixels = cv::Mat::zeros(skeleton_.size(), CV_8U);
        cv::Mat crossings = cv::Mat::zeros(skeleton_.size(), CV_32S);
        cv::Mat isolated = cv::Mat::zeros(skeleton_.size(), CV_8U);
        for (int y = 0; y < skeleton_.rows; ++y) {
            for (int x = 0; x < skeleton_.cols; ++x) {
                if (skeleton_.at<uchar>(y, x) == 0) continue;
                if (SkeletonAnalyzer::countNeighbors(skeleton_, x, y) == 0) {
                    isolated.at<uchar>(y, x) = 1;
                    node_pixels.at<uchar>(y, x) = 255;
                    continue;
                }
                int c = SkeletonAnalyzer::crossingNumber(skeleton_, x, y);
                crossings.at<int>(y, x) = c;
                if (c != 2) node_pixels.at<uchar>(y, x) = 255;
            }
        }

        // Adjacent node pixels (thick junctions) become a single node
        cv::Mat clusters;
        int n = cv::connectedComponents(node_pixels, clusters, 8, CV_32S);
        std::vector<std::vector<cv::Point>> members(n);
        for (int y = 0; y < clusters.rows; ++y) {
            for (int x = 0; x < clusters.cols; ++x) {
                int c = clusters.at<int>(y, x);
                if (c > 0) members[c].push_back(cv::Point(x, y));
            }
        }

        for (int c = 1; c < n; ++c) {
            const cv::Point& first = members[c].front();
            NodeKind kind = NodeKind::BRANCH;
            if (isolated.at<uchar>(first)) {
                kind = NodeKind::ISOLATED;
            } else if (members[c].size() <= 2) {
                bool tip = true;
                for (const auto& p : members[c]) {
                    if (crossings.at<int>(p) != 1) tip = false;
                }
                if (tip) kind = NodeKind::TIP;
            }
            addNode(members[c], kind);
        }
    }

    int addNode(const std::vector<cv::Point>& pixels, NodeKind kind) {
        RootNode node;
        node.id = static_cast<int>(graph_.nodes.size());
        node.kind = kind;

        // Member pixel closest to the cluster centroid
        cv::Point2d centroid(0, 0);
        for (const auto& p : pixels) {
            centroid.x += p.x;
            centroid.y += p.y;
        }
        centroid *= 1.0 / pixels.size();
        double best = std::numeric_limits<double>::max();
        for (const auto& p : pixels) {
            const double dx = p.x - centroid.x, dy = p.y - centroid.y;
            if (dx * dx + dy * dy < best) {
                best = dx * dx + dy * dy;
                node.position = p;
            }
            node_ids_.at<int>(p) = node.id;
            if (node.seed == 0) node.seed = seedAt(p);
        }

        graph_.nodes.push_back(node);
        node_pixels_.push_back(pixels);
        return node.id;
    }

    void traceFrom(int node_id) {
        // Copy: tracing may append nodes and reallocate node_pixels_
        const std::vector<cv::Point> pixels = node_pixels_[node_id];
        for (const auto& p : pixels) {
            for (const auto& offset : NEIGHBORS) {
                const cv::Point q = p + offset;
                if (!isSkeleton(q)) continue;

                const int other = nodeAt(q);
                if (other == node_id) continue;
                if (other >= 0) {
                    auto link = std::make_pair(std::min(node_id, other), std::max(node_id, other));
                    if (direct_links_.insert(link).second) {
                        addSegment({p, q}, node_id, other);
                    }
                    continue;
                }
                if (visited_.at<uchar>(q)) continue;
                walk(node_id, p, q);
            }
        }
    }

    void walk(int node_id, const cv::Point& start, const cv::Point& first) {
        std::vector<cv::Point> path = {start, first};
        visited_.at<uchar>(first) = 1;
        cv::Point prev = start;
        cv::Point cur = first;

        while (true) {
            // Reaching a node ends the segment, otherwise step to an unvisited pixel
            int end = -1;
            cv::Point end_pixel;
            cv::Point next(-1, -1);
            for (const auto& offset : NEIGHBORS) {
                const cv::Point r = cur + offset;
                if (r == prev || !isSkeleton(r)) continue;

                const int id = nodeAt(r);
                if (id >= 0) {
                    if (id == node_id && path.size() < MIN_LOOP_PIXELS) continue;
                    end = id;
                    end_pixel = r;
                    break;
                }
                if (next.x < 0 && !visited_.at<uchar>(r)) next = r;
            }

            if (end >= 0) {
                path.push_back(end_pixel);
                addSegment(path, node_id, end);
                return;
            }
            if (next.x < 0) {
                // dead end inside a staircase, close the segment on a new tip
                int tip = addNode({cur}, NodeKind::TIP);
                addSegment(path, node_id, tip);
                return;
            }

            visited_.at<uchar>(next) = 1;
            path.push_back(next);
            prev = cur;
            cur = next;
        }
    }

    void addSegment(const std::vector<cv::Point>& path, int start, int end) {
        RootSegment segment;
        segment.id = static_cast<int>(graph_.segments.size());
        segment.start = start;
        segment.end = end;
        segment.path = path;
        segment.length = Morphology::SkeletonAnalyzer::calculatePathLength(path);

        std::map<int, int> votes;
        for (const auto& p : path) {
            int s = seedAt(p);
            if (s > 0) votes[s]++;
        }
        int best = 0;
        for (const auto& kv : votes) {
            if (kv.second > best) {
                best = kv.second;
                segment.seed = kv.first;
            }
        }

        graph_.nodes[start].segments.push_back(segment.id);
        if (end != start) graph_.nodes[end].segments.push_back(segment.id);
        graph_.segments.push_back(segment);
    }

    const cv::Mat& skeleton_;
    const cv::Mat& seeds_;
    RootGraph& graph_;
    cv::Mat node_ids_;
    cv::Mat visited_;
    std::vector<std::vector<cv::Point>> node_pixels_;
    std::set<std::pair<int, int>> direct_links_;
};

} // namespace

std::vector<int> RootGraph::neighborSegments(int segment_id) const {
    std::vector<int> result;
    const RootSegment& segment = segments.at(segment_id);
    for (int node_id : {segment.start, segment.end}) {
        for (int other : nodes.at(node_id).segments) {
            if (other == segment_id) continue;
            if (std::find(result.begin(), result.end(), other) == result.end()) {
                result.push_back(other);
            }
        }
    }
    return result;
}

double RootGraph::totalLength() const {
    double total = 0.0;
    for (const auto& segment : segments) total += segment.length;
    return total;
}

nlohmann::json RootGraph::toJson() const {
    nlohmann::json j;
    j["shape"] = {shape.height, shape.width};

    nlohmann::json node_list = nlohmann::json::array();
    for (const auto& node : nodes) {
        node_list.push_back({
            {"id", node.id},
            {"kind", kindName(node.kind)},
            {"x", node.position.x},
            {"y", node.position.y},
            {"seed", node.seed}
        });
    }
    j["nodes"] = node_list;

    nlohmann::json segment_list = nlohmann::json::array();
    for (const auto& segment : segments) {
        segment_list.push_back({
            {"id", segment.id},
            {"start", segment.start},
            {"end", segment.end},
            {"length", segment.length},
            {"seed", segment.seed}
        });
    }
    j["segments"] = segment_list;
    j["total_length"] = totalLength();
    return j;
}

RootGraph computeGraph(const cv::Mat& rmask, const cv::Mat& seed_map) {
    if (rmask.empty()) {
        throw ValueError("computeGraph: empty root mask");
    }
    if (!seed_map.empty() && seed_map.size() != rmask.size()) {
        throw ValueError("computeGraph: seed map and root mask sizes differ");
    }

    cv::Mat seeds;
    cv::Mat foreground = rmask != 0;
    if (!seed_map.empty()) {
        seed_map.convertTo(seeds, CV_32S);
        cv::Mat seed_pixels = seeds > 0;
        cv::bitwise_or(foreground, seed_pixels, foreground);
    }

    Morphology::SkeletonAnalyzer analyzer;
    cv::Mat skeleton = analyzer.skeletonize(foreground);

    RootGraph graph;
    graph.shape = rmask.size();
    GraphTracer tracer(skeleton, seeds, graph);
    tracer.run();
    return graph;
}

} // namespace RootVision
