// =====================================================================
//  tests/test_segment.cpp — Segment region tests
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <locus/region/segment.h>
#include <locus/geometry/utils.h>

#include <QMap>

#include <cmath>

namespace locus
{

using namespace region;

class SegmentTest : public testing::Test
{
public:
    const float tolerance = 0.01f;
    const QVector3D start = QVector3D(0, 0, 0);
    const QVector3D end = QVector3D(10, 0, 0);
};

TEST_F(SegmentTest, Corners)
{
    const Segment3f rail(start, end, tolerance);

    EXPECT_EQ(rail.copyCornerLocation(1), end);
    EXPECT_FALSE(rail.doCoincide());
    EXPECT_EQ(rail.findCorner(QVector3D(7, 1, 0)), 1);
    EXPECT_EQ(rail.findCorner(QVector3D(5, 0, 0)), 0); // tie
    EXPECT_EQ(rail.onCorner(QVector3D(0.005f, 0, 0)), 0);
    EXPECT_EQ(rail.onCorner(QVector3D(5, 0, 0)), -1);
    EXPECT_TRUE(rail.onCorner(QVector3D(10, 0, 0), 1));
    EXPECT_FALSE(rail.onCorner(QVector3D(10, 0, 0), 2));
    EXPECT_DOUBLE_EQ(rail.squaredDistanceToCorner(QVector3D(10, 3, 4), 1), 25.0);
    EXPECT_TRUE(std::isnan(rail.squaredDistanceToCorner(QVector3D(), -1)));

    EXPECT_TRUE(Segment3f(start, QVector3D(0.001f, 0, 0), tolerance).doCoincide());
}

TEST_F(SegmentTest, SharesCorner)
{
    const Segment3f rail(start, end, tolerance);
    const Segment3f spur(QVector3D(10, 0, 0), QVector3D(10, 5, 0), tolerance);

    QMap<int, int> corners;
    ASSERT_TRUE(rail.sharesCornerWith(spur, &corners));
    ASSERT_EQ(corners.size(), 1);
    EXPECT_EQ(corners.value(1), 0);

    const Segment3f apart(QVector3D(0, 5, 0), QVector3D(10, 5, 0), tolerance);
    EXPECT_FALSE(rail.sharesCornerWith(apart, &corners));
    EXPECT_TRUE(corners.isEmpty());
}

TEST_F(SegmentTest, Measures)
{
    const Segment3f rail(start, end, tolerance);

    EXPECT_NEAR(rail.length(), 10.0, 1e-6);
    EXPECT_FLOAT_EQ(rail.tolerance(), tolerance);

    QVector3D closest;
    EXPECT_NEAR(rail.squaredDistance(QVector3D(5, 3, 4), &closest), 25.0, 1e-6);
    EXPECT_EQ(closest, QVector3D(5, 0, 0));

    EXPECT_FLOAT_EQ(Segment3f(start, end, -2.0f).tolerance(), 0.0f);
}

TEST_F(SegmentTest, Containment)
{
    const Segment3f rail(start, end, tolerance);

    EXPECT_TRUE(rail.contains(QVector3D(5, 0.005f, 0)));
    EXPECT_FALSE(rail.contains(QVector3D(5, 0.1f, 0)));
    EXPECT_FALSE(rail.contains(QVector3D(10.5f, 0, 0)));

    EXPECT_TRUE(rail.contains(QVector3D(1, 0, 0), QVector3D(9, 0, 0)));
    EXPECT_FALSE(rail.contains(QVector3D(1, 0, 0), QVector3D(9, 1, 0)));
}

TEST_F(SegmentTest, FindLocation)
{
    const Segment3f rail(start, end, tolerance);

    EXPECT_EQ(rail.findLocation(QVector3D(5, 3, 0)), QVector3D(5, 0, 0));
    EXPECT_EQ(rail.findLocation(QVector3D(-4, 1, 0)), start);

    // Contained points come back unchanged.
    const QVector3D onRail(5, 0.005f, 0);
    EXPECT_EQ(rail.findLocation(onRail), onRail);
}

TEST_F(SegmentTest, CentroidAndScore)
{
    const Segment3f rail(start, end, tolerance);

    EXPECT_EQ(rail.centroid(), QVector3D(5, 0, 0));
    EXPECT_EQ(rail.representative(), QVector3D(5, 0, 0));
    EXPECT_TRUE(rail.contains(rail.representative()));

    EXPECT_NEAR(rail.score(QVector3D(5, 2, 0)), -4.0, 1e-6);
    EXPECT_GT(rail.score(QVector3D(5, 1, 0)), rail.score(QVector3D(5, 2, 0)));
}

TEST_F(SegmentTest, ShortestPath)
{
    const Segment3f rail(start, end, tolerance);

    const PathResult result = rail.shortestPath(QVector3D(2, 0, 0), QVector3D(8, 0, 0), 2);
    ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.path.numControlPoints(), 2);
    EXPECT_NEAR(result.path.totalLength(), 6.0, 1e-6);

    const PathResult tooFew = rail.shortestPath(QVector3D(2, 0, 0), QVector3D(8, 0, 0), 1);
    EXPECT_FALSE(tooFew.success);
    EXPECT_TRUE(tooFew.invalidArgument);

    const PathResult offRail = rail.shortestPath(QVector3D(2, 1, 0), QVector3D(8, 0, 0), 2);
    EXPECT_FALSE(offRail.success);
    EXPECT_TRUE(offRail.supported);
    EXPECT_TRUE(offRail.invalidArgument);
}

TEST_F(SegmentTest, UnsupportedOperations)
{
    const Segment3f rail(start, end, tolerance);
    const Segment3f other(end, QVector3D(20, 0, 0), tolerance);

    const SupportResult support = rail.supportDistance(QVector3D(5, 5, 0), 0.5f);
    EXPECT_FALSE(support.supported);
    EXPECT_FALSE(support.invalidArgument);
    EXPECT_FALSE(support.errorMessage.isEmpty());
    EXPECT_TRUE(rail.supportDistance(QVector3D(5, 5, 0), 2.0f).invalidArgument);

    EXPECT_FALSE(rail.canMerge(other));
    const MergeResult merged = rail.merge(other);
    EXPECT_FALSE(merged.success);
    EXPECT_FALSE(merged.errorMessage.isEmpty());
}

TEST_F(SegmentTest, Describe)
{
    const Segment3f rail(start, end, tolerance);
    EXPECT_EQ(rail.describe(), QStringLiteral("Segment3f[(0, 0, 0) to (10, 0, 0) tol=0.01]"));
}

} // namespace locus
