#include "errors.hpp"
#include "morphology_analysis.hpp"
#include "root_graph.hpp"
#include "root_tree.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

using namespace RootVision;
using RootVision::Morphology::SkeletonAnalyzer;

namespace {

// Vertical root with one lateral leaving it to the right
cv::Mat rootWithLateral() {
    cv::Mat rmask = cv::Mat::zeros(80, 60, CV_8U);
    rmask(cv::Rect(29, 10, 3, 61)).setTo(255);
    rmask(cv::Rect(31, 39, 20, 3)).setTo(255);
    return rmask;
}

int countKind(const RootGraph& graph, NodeKind kind) {
    return static_cast<int>(std::count_if(graph.nodes.begin(), graph.nodes.end(),
        [kind](const RootNode& node) { return node.kind == kind; }));
}

bool hasTipNear(const RootGraph& graph, const cv::Rect& area) {
    for (const auto& node : graph.nodes) {
        if (node.kind == NodeKind::TIP && area.contains(node.position)) return true;
    }
    return false;
}

} // namespace

TEST(SkeletonAnalyzerTest, ThinsBarToSinglePixelLine) {
    cv::Mat bar = cv::Mat::zeros(20, 50, CV_8U);
    bar(cv::Rect(5, 8, 40, 5)).setTo(255);

    SkeletonAnalyzer analyzer;
    cv::Mat skeleton = analyzer.skeletonize(bar);
    ASSERT_EQ(skeleton.size(), bar.size());
    for (int x = 10; x <= 40; ++x) {
        EXPECT_EQ(cv::countNonZero(skeleton.col(x)), 1) << "column " << x;
    }
}

TEST(SkeletonAnalyzerTest, CrossingNumberClassifiesPixels) {
    cv::Mat skeleton = cv::Mat::zeros(7, 7, CV_8U);
    skeleton(cv::Rect(1, 3, 5, 1)).setTo(1);
    skeleton(cv::Rect(3, 4, 1, 2)).setTo(1);

    EXPECT_EQ(SkeletonAnalyzer::crossingNumber(skeleton, 1, 3), 1);
    EXPECT_EQ(SkeletonAnalyzer::crossingNumber(skeleton, 2, 3), 2);
    EXPECT_EQ(SkeletonAnalyzer::crossingNumber(skeleton, 3, 3), 3);
    EXPECT_EQ(SkeletonAnalyzer::countNeighbors(skeleton, 3, 3), 3);

    SkeletonAnalyzer analyzer;
    EXPECT_EQ(analyzer.findTipPoints(skeleton).size(), 3u);
    ASSERT_EQ(analyzer.findBranchPoints(skeleton).size(), 1u);
    EXPECT_EQ(analyzer.findBranchPoints(skeleton)[0], cv::Point(3, 3));
}

TEST(SkeletonAnalyzerTest, PathLength) {
    std::vector<cv::Point> path = {{0, 0}, {1, 1}, {2, 1}, {3, 1}};
    EXPECT_NEAR(SkeletonAnalyzer::calculatePathLength(path), std::sqrt(2.0) + 2.0, 1e-12);
    EXPECT_EQ(SkeletonAnalyzer::calculatePathLength({{4, 4}}), 0.0);
}

TEST(RootGraphTest, BranchingRootHasTipsAndJunction) {
    RootGraph graph = computeGraph(rootWithLateral(), cv::Mat());

    EXPECT_EQ(graph.shape, cv::Size(60, 80));
    EXPECT_GE(countKind(graph, NodeKind::TIP), 3);
    EXPECT_GE(countKind(graph, NodeKind::BRANCH), 1);
    EXPECT_GE(graph.segments.size(), 3u);

    EXPECT_TRUE(hasTipNear(graph, cv::Rect(27, 8, 7, 10)));    // top
    EXPECT_TRUE(hasTipNear(graph, cv::Rect(27, 62, 7, 10)));   // bottom
    EXPECT_TRUE(hasTipNear(graph, cv::Rect(42, 37, 10, 7)));   // lateral

    EXPECT_GT(graph.totalLength(), 65.0);
    EXPECT_LT(graph.totalLength(), 85.0);
}

TEST(RootGraphTest, SegmentsAreConnectedPixelPaths) {
    RootGraph graph = computeGraph(rootWithLateral(), cv::Mat());
    const int node_count = static_cast<int>(graph.nodes.size());

    for (const auto& segment : graph.segments) {
        ASSERT_GE(segment.start, 0);
        ASSERT_LT(segment.start, node_count);
        ASSERT_GE(segment.end, 0);
        ASSERT_LT(segment.end, node_count);
        ASSERT_GE(segment.path.size(), 2u);

        for (size_t i = 1; i < segment.path.size(); ++i) {
            const cv::Point d = segment.path[i] - segment.path[i - 1];
            EXPECT_LE(std::max(std::abs(d.x), std::abs(d.y)), 1);
            EXPECT_NE(d, cv::Point(0, 0));
        }

        const auto& start_segments = graph.nodes[segment.start].segments;
        EXPECT_NE(std::find(start_segments.begin(), start_segments.end(), segment.id), start_segments.end());
        const auto& end_segments = graph.nodes[segment.end].segments;
        EXPECT_NE(std::find(end_segments.begin(), end_segments.end(), segment.id), end_segments.end());
    }
}

TEST(RootGraphTest, ClosedLoopBecomesSingleSegment) {
    cv::Mat rmask = cv::Mat::zeros(30, 40, CV_8U);
    cv::rectangle(rmask, cv::Point(10, 10), cv::Point(30, 20), cv::Scalar(255), 1);

    RootGraph graph = computeGraph(rmask, cv::Mat());
    ASSERT_EQ(graph.nodes.size(), 1u);
    ASSERT_EQ(graph.segments.size(), 1u);
    EXPECT_EQ(graph.segments[0].start, graph.segments[0].end);
    EXPECT_NEAR(graph.segments[0].length, 60.0, 1e-9);
}

TEST(RootGraphTest, IsolatedPixelIsANode) {
    cv::Mat rmask = cv::Mat::zeros(10, 10, CV_8U);
    rmask.at<uchar>(5, 5) = 255;

    RootGraph graph = computeGraph(rmask, cv::Mat());
    ASSERT_EQ(graph.nodes.size(), 1u);
    EXPECT_EQ(graph.nodes[0].kind, NodeKind::ISOLATED);
    EXPECT_EQ(graph.nodes[0].position, cv::Point(5, 5));
    EXPECT_TRUE(graph.segments.empty());
}

TEST(RootGraphTest, SeedRegionsLabelSegments) {
    cv::Mat seeds = cv::Mat::zeros(80, 60, CV_32S);
    seeds(cv::Rect(26, 8, 9, 7)).setTo(1);

    RootGraph graph = computeGraph(rootWithLateral(), seeds);
    int seeded = 0;
    for (const auto& segment : graph.segments) {
        if (segment.seed == 1) ++seeded;
        EXPECT_TRUE(segment.seed == 0 || segment.seed == 1);
    }
    EXPECT_GE(seeded, 1);
}

TEST(RootGraphTest, RejectsInvalidInput) {
    EXPECT_THROW(computeGraph(cv::Mat(), cv::Mat()), ValueError);
    EXPECT_THROW(computeGraph(rootWithLateral(), cv::Mat::zeros(10, 10, CV_32S)), ValueError);
}

TEST(RootGraphTest, ToJsonListsNodesAndSegments) {
    RootGraph graph = computeGraph(rootWithLateral(), cv::Mat());
    nlohmann::json j = graph.toJson();
    EXPECT_EQ(j["nodes"].size(), graph.nodes.size());
    EXPECT_EQ(j["segments"].size(), graph.segments.size());
    EXPECT_EQ(j["shape"][0], 80);
    EXPECT_EQ(j["shape"][1], 60);
    EXPECT_NEAR(j["total_length"].get<double>(), graph.totalLength(), 1e-9);
}

TEST(RootTreeTest, PrimaryAxisAndLateral) {
    cv::Mat seeds = cv::Mat::zeros(80, 60, CV_32S);
    seeds(cv::Rect(26, 8, 9, 7)).setTo(1);

    RootTree tree = computeTree(computeGraph(rootWithLateral(), seeds));
    ASSERT_EQ(tree.plantCount(), 1);
    ASSERT_FALSE(tree.axes.empty());

    const RootAxis& primary = tree.axes[0];
    EXPECT_EQ(primary.plant, 1);
    EXPECT_EQ(primary.order, 1);
    EXPECT_EQ(primary.parent, -1);

    bool lateral_found = false;
    for (size_t a = 1; a < tree.axes.size(); ++a) {
        const RootAxis& axis = tree.axes[a];
        EXPECT_GT(axis.order, 1);
        EXPECT_LT(axis.length, primary.length);
        if (axis.order == 2 && axis.parent == primary.id) lateral_found = true;
    }
    EXPECT_TRUE(lateral_found);

    // the primary axis reaches down to the bottom tip
    const RootSegment& last = tree.graph.segments[primary.segments.back()];
    EXPECT_GT(std::max(last.path.front().y, last.path.back().y), 62);
}

TEST(RootTreeTest, SegmentBookkeeping) {
    cv::Mat seeds = cv::Mat::zeros(80, 60, CV_32S);
    seeds(cv::Rect(26, 8, 9, 7)).setTo(1);

    RootTree tree = computeTree(computeGraph(rootWithLateral(), seeds));
    const size_t n = tree.graph.segments.size();
    ASSERT_EQ(tree.segment_parent.size(), n);
    ASSERT_EQ(tree.segment_plant.size(), n);
    ASSERT_EQ(tree.segment_axis.size(), n);

    for (size_t s = 0; s < n; ++s) {
        const RootSegment& segment = tree.graph.segments[s];
        if (segment.seed > 0) {
            EXPECT_EQ(tree.segment_parent[s], -1);
            EXPECT_EQ(tree.segment_distance[s], 0.0);
        }
        EXPECT_EQ(tree.segment_plant[s], 1);
    }
    for (const auto& axis : tree.axes) {
        for (int s : axis.segments) EXPECT_EQ(tree.segment_axis[s], axis.id);
    }
}

TEST(RootTreeTest, NoSeedsGivesNoAxes) {
    RootTree tree = computeTree(computeGraph(rootWithLateral(), cv::Mat()));
    EXPECT_TRUE(tree.axes.empty());
    EXPECT_EQ(tree.plantCount(), 0);
    for (int plant : tree.segment_plant) EXPECT_EQ(plant, 0);
}

TEST(RootTreeTest, ToJsonSummarizesPlants) {
    cv::Mat seeds = cv::Mat::zeros(80, 60, CV_32S);
    seeds(cv::Rect(26, 8, 9, 7)).setTo(1);

    RootTree tree = computeTree(computeGraph(rootWithLateral(), seeds));
    nlohmann::json j = tree.toJson();
    ASSERT_EQ(j["plants"].size(), 1u);
    EXPECT_EQ(j["plants"][0]["plant"], 1);
    EXPECT_NEAR(j["plants"][0]["primary_length"].get<double>(), tree.axes[0].length, 1e-9);
    EXPECT_TRUE(j.contains("graph"));
}
