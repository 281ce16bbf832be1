#include "errors.hpp"
#include "root_pipeline.hpp"
#include "seed_detection.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

using namespace RootVision;

class DetectLeavesTest : public ::testing::Test {
protected:
    void SetUp() override {
        image = cv::Mat(120, 80, CV_32F, cv::Scalar(0.5f));
        bbox = cv::Rect(10, 5, 60, 100);
        options.plant_number = 2;
    }

    // Two plants: a leaf disk near the top with a thin root going down
    cv::Mat twoPlants(int left_radius, int right_radius) const {
        cv::Mat rmask = cv::Mat::zeros(100, 60, CV_8U);
        cv::circle(rmask, cv::Point(15, 8), left_radius, cv::Scalar(255), cv::FILLED);
        cv::circle(rmask, cv::Point(45, 8), right_radius, cv::Scalar(255), cv::FILLED);
        rmask(cv::Rect(14, 8, 2, 90)).setTo(255);
        rmask(cv::Rect(44, 8, 2, 90)).setTo(255);
        return rmask;
    }

    cv::Mat image;
    cv::Rect bbox;
    DetectLeavesOptions options;
};

TEST_F(DetectLeavesTest, LabelsSeedsFromLeftToRight) {
    SerializableMask seed_map = detectLeaves(twoPlants(6, 6), image, bbox, options);
    const cv::Mat& labels = seed_map.data();
    ASSERT_EQ(labels.size(), cv::Size(60, 100));
    EXPECT_EQ(labels.at<int>(8, 15), 1);
    EXPECT_EQ(labels.at<int>(8, 45), 2);
}

TEST_F(DetectLeavesTest, IgnoresThinRoots) {
    SerializableMask seed_map = detectLeaves(twoPlants(6, 6), image, bbox, options);
    const cv::Mat& labels = seed_map.data();
    EXPECT_EQ(labels.at<int>(18, 14), 0);
    EXPECT_EQ(labels.at<int>(60, 44), 0);
}

TEST_F(DetectLeavesTest, UnsortedLabelsFollowSize) {
    options.sort = false;
    SerializableMask seed_map = detectLeaves(twoPlants(5, 7), image, bbox, options);
    EXPECT_EQ(seed_map.data().at<int>(8, 45), 1);
    EXPECT_EQ(seed_map.data().at<int>(8, 15), 2);

    options.sort = true;
    seed_map = detectLeaves(twoPlants(5, 7), image, bbox, options);
    EXPECT_EQ(seed_map.data().at<int>(8, 15), 1);
    EXPECT_EQ(seed_map.data().at<int>(8, 45), 2);
}

TEST_F(DetectLeavesTest, KeepsOnlyTheLargestSeeds) {
    options.plant_number = 1;
    SerializableMask seed_map = detectLeaves(twoPlants(5, 7), image, bbox, options);
    EXPECT_EQ(seed_map.data().at<int>(8, 45), 1);
    EXPECT_EQ(seed_map.data().at<int>(8, 15), 0);
}

TEST_F(DetectLeavesTest, FewerSeedsThanPlants) {
    options.plant_number = 3;
    SerializableMask seed_map = detectLeaves(twoPlants(6, 6), image, bbox, options);
    double max_label = 0;
    cv::minMaxLoc(seed_map.data(), nullptr, &max_label);
    EXPECT_EQ(max_label, 2.0);
    EXPECT_DOUBLE_EQ(seed_map.policy().scale, 255.0 / 3);
}

TEST_F(DetectLeavesTest, SearchesOnlyTheLeafBand) {
    cv::Mat rmask = twoPlants(6, 6);
    cv::circle(rmask, cv::Point(30, 60), 9, cv::Scalar(255), cv::FILLED);

    options.plant_number = 3;
    SerializableMask seed_map = detectLeaves(rmask, image, bbox, options);
    EXPECT_EQ(seed_map.data().at<int>(60, 30), 0);

    options.leaf_height = {0.5, 0.7};
    seed_map = detectLeaves(rmask, image, bbox, options);
    EXPECT_EQ(seed_map.data().at<int>(60, 30), 1);
    EXPECT_EQ(seed_map.data().at<int>(8, 15), 0);
}

TEST_F(DetectLeavesTest, LabelMapPolicy) {
    SerializableMask seed_map = detectLeaves(twoPlants(6, 6), image, bbox, options);
    EXPECT_EQ(seed_map.policy().format, "PNG");
    EXPECT_EQ(seed_map.policy().dtype, CV_8U);
    EXPECT_DOUBLE_EQ(seed_map.policy().scale, 127.5);

    cv::Mat encoded = seed_map.encode();
    EXPECT_EQ(encoded.at<uchar>(8, 45), 255);
    EXPECT_EQ(encoded.at<uchar>(50, 5), 0);
}

TEST_F(DetectLeavesTest, RejectsInvalidArguments) {
    const cv::Mat rmask = twoPlants(6, 6);

    DetectLeavesOptions bad = options;
    bad.plant_number = 0;
    EXPECT_THROW(detectLeaves(rmask, image, bbox, bad), ValueError);

    bad = options;
    bad.root_min_radius = 0;
    EXPECT_THROW(detectLeaves(rmask, image, bbox, bad), ValueError);

    bad = options;
    bad.leaf_height = {0.5, 0.2};
    EXPECT_THROW(detectLeaves(rmask, image, bbox, bad), ValueError);

    bad = options;
    bad.leaf_height = {-0.1, 0.2};
    EXPECT_THROW(detectLeaves(rmask, image, bbox, bad), ValueError);

    bad = options;
    bad.leaf_height = {0.0, 1.5};
    EXPECT_THROW(detectLeaves(rmask, image, bbox, bad), ValueError);

    EXPECT_THROW(detectLeaves(cv::Mat(), image, bbox, options), ValueError);
    EXPECT_THROW(detectLeaves(rmask, image, cv::Rect(10, 5, 50, 100), options), ValueError);
}

TEST(DetectSeedsTest, EmptyBandGivesNoSeed) {
    cv::Mat mask = cv::Mat::zeros(50, 50, CV_8U);
    cv::circle(mask, cv::Point(25, 5), 5, cv::Scalar(255), cv::FILLED);

    cv::Mat labels = detectSeeds(mask, cv::Mat(), 1, 2, {0.3, 0.3});
    EXPECT_EQ(labels.type(), CV_32S);
    EXPECT_EQ(cv::countNonZero(labels), 0);
}

TEST(DetectSeedsTest, EqualAreasPreferTheBrighterLeaf) {
    cv::Mat mask = cv::Mat::zeros(50, 60, CV_8U);
    cv::circle(mask, cv::Point(15, 8), 6, cv::Scalar(255), cv::FILLED);
    cv::circle(mask, cv::Point(45, 8), 6, cv::Scalar(255), cv::FILLED);

    cv::Mat image(50, 60, CV_32F, cv::Scalar(0.2f));
    image.colRange(30, 60).setTo(0.8f);

    cv::Mat labels = detectSeeds(mask, image, 1, 2, {0.0, 0.5});
    EXPECT_EQ(labels.at<int>(8, 45), 1);
    EXPECT_EQ(labels.at<int>(8, 15), 0);

    image.colRange(0, 30).setTo(0.9f);
    labels = detectSeeds(mask, image, 1, 2, {0.0, 0.5});
    EXPECT_EQ(labels.at<int>(8, 15), 1);
    EXPECT_EQ(labels.at<int>(8, 45), 0);
}

TEST(DetectSeedsTest, RejectsMismatchedImage) {
    cv::Mat mask = cv::Mat::zeros(50, 50, CV_8U);
    EXPECT_THROW(detectSeeds(mask, cv::Mat::zeros(40, 50, CV_32F), 1, 2, {0.0, 0.2}), ValueError);
}
