#include <gtest/gtest.h>
#include "frame.hpp"

#include <algorithm>
#include <cmath>
#include <random>

class FrameTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        rng.seed(1234);
    }

    DesignBounds bounds;
    std::mt19937 rng;
};

// ===== Construction and derived geometry =====

TEST_F(FrameTest, MassOfReferenceSteelFrame)
{
    Frame frame(2.0, 2.0, 1e-3, 1e-3, 1e-3);

    double expected = (2.0 * std::sqrt(1.0 * 1.0 + 2.0 * 2.0) + 2.0) * 1e-3 * 7850.0;
    EXPECT_NEAR(frame.calcMass(7850.0), expected, 1e-9);
    EXPECT_NEAR(frame.legLength(), std::sqrt(5.0), 1e-12);
    EXPECT_DOUBLE_EQ(frame.baseLength(), 2.0);
}

TEST_F(FrameTest, MassIsDeterministic)
{
    Frame frame = Frame::randomFrame(bounds, rng);
    double first = frame.calcMass(7850.0);
    double second = frame.calcMass(7850.0);
    EXPECT_EQ(first, second);
}

TEST_F(FrameTest, MassUsesEachMemberArea)
{
    Frame frame(4.0, 3.0, 1e-3, 2e-3, 3e-3);
    double leg = std::sqrt(2.0 * 2.0 + 3.0 * 3.0);
    EXPECT_NEAR(frame.calcMass(1000.0), (1e-3 * leg + 2e-3 * leg + 3e-3 * 4.0) * 1000.0, 1e-9);
}

TEST_F(FrameTest, NodesFollowWidthAndHeight)
{
    Frame frame(3.0, 5.0, 1e-3, 1e-3, 1e-3);
    auto nodes = frame.nodes();

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_TRUE(nodes[Frame::LEFT_NODE].isApprox(Eigen::Vector3d(0.0, 0.0, 0.0)));
    EXPECT_TRUE(nodes[Frame::RIGHT_NODE].isApprox(Eigen::Vector3d(3.0, 0.0, 0.0)));
    EXPECT_TRUE(nodes[Frame::TOP_NODE].isApprox(Eigen::Vector3d(1.5, 5.0, 0.0)));

    // Changing the geometry is reflected without any explicit refresh
    frame.width = 6.0;
    frame.height = 2.0;
    nodes = frame.nodes();
    EXPECT_TRUE(nodes[Frame::RIGHT_NODE].isApprox(Eigen::Vector3d(6.0, 0.0, 0.0)));
    EXPECT_TRUE(nodes[Frame::TOP_NODE].isApprox(Eigen::Vector3d(3.0, 2.0, 0.0)));
}

TEST_F(FrameTest, MembersConnectTheTriangle)
{
    Frame frame(3.0, 5.0, 1e-3, 2e-3, 3e-3);
    auto members = frame.members();

    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members[0].start_node, Frame::LEFT_NODE);
    EXPECT_EQ(members[0].end_node, Frame::TOP_NODE);
    EXPECT_DOUBLE_EQ(members[0].area, 1e-3);
    EXPECT_EQ(members[1].start_node, Frame::RIGHT_NODE);
    EXPECT_EQ(members[1].end_node, Frame::TOP_NODE);
    EXPECT_DOUBLE_EQ(members[1].area, 2e-3);
    EXPECT_EQ(members[2].start_node, Frame::LEFT_NODE);
    EXPECT_EQ(members[2].end_node, Frame::RIGHT_NODE);
    EXPECT_DOUBLE_EQ(members[2].area, 3e-3);
}

// ===== Random sampling and mutation =====

TEST_F(FrameTest, RandomFramesStayInBounds)
{
    for (int i = 0; i < 500; i++)
    {
        Frame frame = Frame::randomFrame(bounds, rng);
        EXPECT_TRUE(frame.withinBounds(bounds)) << frame.toString();
    }
}

TEST_F(FrameTest, RandomFramesSpanTheRange)
{
    double min_w = bounds.max_width, max_w = bounds.min_width;
    for (int i = 0; i < 500; i++)
    {
        Frame frame = Frame::randomFrame(bounds, rng);
        min_w = std::min(min_w, frame.width);
        max_w = std::max(max_w, frame.width);
    }
    EXPECT_LT(min_w, 2.0);
    EXPECT_GT(max_w, 9.0);
}

TEST_F(FrameTest, MutationKeepsFramesInBounds)
{
    Frame frame = Frame::randomFrame(bounds, rng);
    for (int i = 0; i < 2000; i++)
    {
        frame.mutate(1.0, bounds, rng);
        ASSERT_TRUE(frame.withinBounds(bounds)) << frame.toString();
    }
}

TEST_F(FrameTest, MutationClampsAtBoundaries)
{
    Frame frame(bounds.max_width, bounds.min_height, bounds.max_area, bounds.min_area, bounds.max_area);
    for (int i = 0; i < 200; i++)
    {
        frame.mutate(1.0, bounds, rng);
        EXPECT_TRUE(frame.withinBounds(bounds));
    }
}

TEST_F(FrameTest, MutationStepIsAtMostTenPercentOfRange)
{
    Frame original(5.0, 5.0, 0.5, 0.5, 0.5);
    for (int i = 0; i < 200; i++)
    {
        Frame frame = original;
        frame.mutate(1.0, bounds, rng);
        EXPECT_LE(std::abs(frame.width - original.width), 0.1 * (bounds.max_width - bounds.min_width) + 1e-12);
        EXPECT_LE(std::abs(frame.height - original.height), 0.1 * (bounds.max_height - bounds.min_height) + 1e-12);
        EXPECT_LE(std::abs(frame.area_base - original.area_base), 0.1 * (bounds.max_area - bounds.min_area) + 1e-12);
    }
}

TEST_F(FrameTest, ZeroRateMutationChangesNothing)
{
    Frame frame = Frame::randomFrame(bounds, rng);
    Frame copy = frame;
    frame.mutate(0.0, bounds, rng);
    EXPECT_TRUE(frame.sameParameters(copy));
}

TEST_F(FrameTest, MutationUpdatesDerivedNodes)
{
    Frame frame(5.0, 5.0, 0.5, 0.5, 0.5);
    frame.mutate(1.0, bounds, rng);

    auto nodes = frame.nodes();
    EXPECT_DOUBLE_EQ(nodes[Frame::RIGHT_NODE].x(), frame.width);
    EXPECT_DOUBLE_EQ(nodes[Frame::TOP_NODE].x(), frame.width / 2.0);
    EXPECT_DOUBLE_EQ(nodes[Frame::TOP_NODE].y(), frame.height);
}

TEST_F(FrameTest, WithinBoundsRejectsOutsideValues)
{
    EXPECT_FALSE(Frame(0.5, 2.0, 1e-3, 1e-3, 1e-3).withinBounds(bounds));
    EXPECT_FALSE(Frame(2.0, 11.0, 1e-3, 1e-3, 1e-3).withinBounds(bounds));
    EXPECT_FALSE(Frame(2.0, 2.0, 1e-5, 1e-3, 1e-3).withinBounds(bounds));
    EXPECT_TRUE(Frame(1.0, 10.0, 1e-4, 1.0, 1e-3).withinBounds(bounds));
}
