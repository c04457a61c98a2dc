// =====================================================================
//  tests/test_polygon.cpp — Corner set and polygon tests
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <locus/polygon/cornerset.h>
#include <locus/polygon/polygon.h>
#include <locus/geometry/utils.h>

#include <cmath>

namespace locus
{

using namespace polygon;

class PolygonTest : public testing::Test
{
public:
    const float tolerance = 0.01f;

    // 2x2 square in the XZ plane, and its neighbor along +X.
    QVector<QVector3D> square;
    QVector<QVector3D> neighbor;

    void SetUp()
    {
        square = {QVector3D(0, 0, 0), QVector3D(2, 0, 0), QVector3D(2, 0, 2), QVector3D(0, 0, 2)};
        neighbor = {QVector3D(2, 0, 0), QVector3D(4, 0, 0), QVector3D(4, 0, 2), QVector3D(2, 0, 2)};
    }
};

// ===== Corner sets =====

TEST_F(PolygonTest, CornerQueries)
{
    const CornerSet3f corners(square, tolerance);

    EXPECT_EQ(corners.numCorners(), 4);
    EXPECT_FLOAT_EQ(corners.tolerance(), tolerance);
    EXPECT_NEAR(corners.diameter(), std::sqrt(8.0), 1e-5);

    EXPECT_EQ(corners.findCorner(QVector3D(1.9f, 0, 0.1f)), 1);
    EXPECT_EQ(corners.onCorner(QVector3D(2.005f, 0, 0)), 1);
    EXPECT_EQ(corners.onCorner(QVector3D(1, 0, 1)), -1);
    EXPECT_TRUE(corners.onCorner(QVector3D(0, 0, 2), 3));
    EXPECT_FALSE(corners.onCorner(QVector3D(0, 0, 2), 2));
    EXPECT_DOUBLE_EQ(corners.squaredDistanceToCorner(QVector3D(0, 3, 2), 3), 9.0);
    EXPECT_EQ(corners.copyCornerLocation(2), QVector3D(2, 0, 2));
}

TEST_F(PolygonTest, CornerIndexOutOfRange)
{
    const CornerSet3f corners(square, tolerance);

    EXPECT_FALSE(corners.onCorner(QVector3D(0, 0, 0), 4));
    EXPECT_FALSE(corners.onCorner(QVector3D(0, 0, 0), -1));
    EXPECT_TRUE(std::isnan(corners.squaredDistanceToCorner(QVector3D(), 9)));
}

TEST_F(PolygonTest, EmptyCornerSet)
{
    const CornerSet3f corners(QVector<QVector3D>(), tolerance);

    EXPECT_EQ(corners.numCorners(), 0);
    EXPECT_EQ(corners.findCorner(QVector3D(1, 2, 3)), -1);
    EXPECT_EQ(corners.onCorner(QVector3D(1, 2, 3)), -1);
    EXPECT_FLOAT_EQ(corners.diameter(), 0.0f);
    EXPECT_FALSE(corners.largestTriangle().has_value());
}

TEST_F(PolygonTest, InvalidToleranceBecomesZero)
{
    const CornerSet3f corners(square, -1.0f);
    EXPECT_FLOAT_EQ(corners.tolerance(), 0.0f);
}

TEST_F(PolygonTest, LargestTriangle)
{
    // Corner 2 is far from the others; corners 1 and 3 flank it widest.
    const CornerSet3f corners({QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(5, 0, 5), QVector3D(0, 0, 1)}, tolerance);

    const std::optional<CornerTriple> triangle = corners.largestTriangle();
    ASSERT_TRUE(triangle.has_value());
    EXPECT_EQ((*triangle)[0], 1);
    EXPECT_EQ((*triangle)[1], 2);
    EXPECT_EQ((*triangle)[2], 3);
}

TEST_F(PolygonTest, Planarity)
{
    EXPECT_TRUE(CornerSet3f(square, tolerance).isPlanar());

    // Tilted square, not at a constant height.
    const CornerSet3f tilted({QVector3D(0, 0, 0), QVector3D(1, 1, 0), QVector3D(1, 1, 1), QVector3D(0, 0, 1)}, tolerance);
    EXPECT_TRUE(tilted.isPlanar());

    const CornerSet3f warped({QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(1, 0, 1), QVector3D(0, 1, 0)}, tolerance);
    EXPECT_FALSE(warped.isPlanar());

    // Fewer than four corners are always planar.
    EXPECT_TRUE(CornerSet3f({QVector3D(0, 0, 0), QVector3D(1, 5, 0), QVector3D(1, 0, 7)}, tolerance).isPlanar());
}

TEST_F(PolygonTest, SharesCorner)
{
    const CornerSet3f left(square, tolerance);
    const CornerSet3f right(neighbor, tolerance);

    BoolMatrix shared;
    ASSERT_TRUE(left.sharesCornerWith(right, &shared));
    ASSERT_EQ(shared.size(), 4);
    ASSERT_EQ(shared[0].size(), 4);
    EXPECT_TRUE(shared[1][0]);
    EXPECT_TRUE(shared[2][3]);
    EXPECT_FALSE(shared[0][0]);
    EXPECT_FALSE(shared[3][1]);

    const CornerSet3f distant({QVector3D(10, 0, 0), QVector3D(11, 0, 0), QVector3D(11, 0, 1)}, tolerance);
    EXPECT_FALSE(left.sharesCornerWith(distant));
}

TEST_F(PolygonTest, SharesCornerToleranceMismatch)
{
    const CornerSet3f left(square, tolerance);
    const CornerSet3f right(neighbor, 0.1f);
    EXPECT_FALSE(left.sharesCornerWith(right));
}

// ===== Polygons =====

TEST_F(PolygonTest, Sides)
{
    const Polygon3f polygon(square, tolerance);

    EXPECT_NEAR(polygon.perimeter(), 8.0, 1e-5);
    EXPECT_NEAR(polygon.sideLength(0), 2.0, 1e-6);
    EXPECT_EQ(polygon.midpoint(1), QVector3D(2, 0, 1));

    QVector3D closest;
    EXPECT_EQ(polygon.findSide(QVector3D(3, 0, 1), &closest), 1);
    EXPECT_NEAR(geometry::distanceSquared(closest, QVector3D(2, 0, 1)), 0.0, 1e-10);

    EXPECT_EQ(polygon.onSide(QVector3D(1, 0, 0.005f)), 0);
    EXPECT_EQ(polygon.onSide(QVector3D(1, 0, 1)), -1);
    EXPECT_TRUE(polygon.onSide(QVector3D(0, 0, 1), 3));
    EXPECT_FALSE(polygon.onSide(QVector3D(0, 0, 1), 1));
    EXPECT_NEAR(polygon.squaredDistanceToSide(QVector3D(1, 0, 1), 2), 1.0, 1e-6);
}

TEST_F(PolygonTest, LongestAndShortest)
{
    const Polygon3f rectangle({QVector3D(0, 0, 0), QVector3D(3, 0, 0), QVector3D(3, 0, 1), QVector3D(0, 0, 1)}, tolerance);

    // Ties go to the lowest index.
    EXPECT_EQ(rectangle.findLongest(), 0);
    EXPECT_EQ(rectangle.findShortest(), 1);

    const Polygon3f empty(QVector<QVector3D>(), tolerance);
    EXPECT_EQ(empty.findLongest(), -1);
    EXPECT_EQ(empty.findShortest(), -1);
    EXPECT_EQ(empty.findSide(QVector3D()), -1);
}

TEST_F(PolygonTest, TurnProducts)
{
    const Polygon3f polygon(square, tolerance);

    for (int i = 0; i < polygon.numCorners(); ++i)
    {
        EXPECT_NEAR(polygon.absTurnAngle(i), M_PI / 2.0, 1e-6) << "Corner " << i << ".";
        EXPECT_NEAR(polygon.dotProduct(i), 0.0, 1e-9) << "Corner " << i << ".";
    }

    // In (2,0,0), out (0,0,2).
    const QVector3D cross = polygon.crossProduct(1);
    EXPECT_NEAR(geometry::distanceSquared(cross, QVector3D(0, -4, 0)), 0.0, 1e-9);
}

TEST_F(PolygonTest, AbsTurnAngleZeroLengthSide)
{
    const Polygon3f polygon({QVector3D(0, 0, 0), QVector3D(0, 0, 0), QVector3D(1, 0, 0)}, tolerance);
    EXPECT_TRUE(std::isnan(polygon.absTurnAngle(1)));
}

TEST_F(PolygonTest, CyclicIndices)
{
    const Polygon3f polygon(square, tolerance);

    EXPECT_EQ(polygon.nextIndex(3), 0);
    EXPECT_EQ(polygon.nextIndex(1), 2);
    EXPECT_EQ(polygon.prevIndex(0), 3);
    EXPECT_EQ(polygon.nextIndex(4), -1);
    EXPECT_EQ(polygon.prevIndex(-1), -1);
}

TEST_F(PolygonTest, FromRange)
{
    const Polygon3f polygon(square, tolerance);

    const std::optional<Polygon3f> forward = polygon.fromRange(1, 3);
    ASSERT_TRUE(forward.has_value());
    ASSERT_EQ(forward->numCorners(), 3);
    EXPECT_EQ(forward->copyCornerLocation(0), QVector3D(2, 0, 0));
    EXPECT_EQ(forward->copyCornerLocation(2), QVector3D(0, 0, 2));

    // Wraps past the last corner.
    const std::optional<Polygon3f> wrapped = polygon.fromRange(3, 1);
    ASSERT_TRUE(wrapped.has_value());
    ASSERT_EQ(wrapped->numCorners(), 3);
    EXPECT_EQ(wrapped->copyCornerLocation(0), QVector3D(0, 0, 2));
    EXPECT_EQ(wrapped->copyCornerLocation(1), QVector3D(0, 0, 0));
    EXPECT_EQ(wrapped->copyCornerLocation(2), QVector3D(2, 0, 0));

    EXPECT_FALSE(polygon.fromRange(2, 2).has_value());
    EXPECT_FALSE(polygon.fromRange(0, 4).has_value());
}

TEST_F(PolygonTest, SharesSide)
{
    const Polygon3f left(square, tolerance);
    const Polygon3f right(neighbor, tolerance);

    BoolMatrix sides;
    ASSERT_TRUE(left.sharesSideWith(right, &sides));
    // Left side 1 runs (2,0,0)-(2,0,2); right side 3 runs back along it.
    EXPECT_TRUE(sides[1][3]);
    int count = 0;
    for (const QVector<bool>& row : sides)
    {
        for (bool shared : row)
        {
            count += shared ? 1 : 0;
        }
    }
    EXPECT_EQ(count, 1);

    // A single shared corner is not a shared side.
    const Polygon3f diagonal({QVector3D(2, 0, 2), QVector3D(3, 0, 2), QVector3D(3, 0, 3)}, tolerance);
    EXPECT_TRUE(left.sharesCornerWith(diagonal));
    EXPECT_FALSE(left.sharesSideWith(diagonal));
}

/*
 * Parameters for the degeneracy check.
 */
struct DegeneracyParameters
{
    QVector<QVector3D> corners;
    bool actual_is_degenerate;
};

class DegeneracyTest : public testing::TestWithParam<DegeneracyParameters>
{
};

TEST_P(DegeneracyTest, IsDegenerate)
{
    const DegeneracyParameters parameters = GetParam();
    const Polygon3f polygon(parameters.corners, 0.01f);
    EXPECT_EQ(polygon.isDegenerate(), parameters.actual_is_degenerate) << polygon.numCorners() << " corners.";
}

INSTANTIATE_TEST_SUITE_P(DegeneracyInstantiation, DegeneracyTest, testing::Values(
    DegeneracyParameters{{}, true}, // No corners.
    DegeneracyParameters{{QVector3D(0, 0, 0), QVector3D(1, 0, 0)}, true}, // Too few corners.
    DegeneracyParameters{{QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(1, 0, 1), QVector3D(0.005f, 0, 0)}, true}, // Coincident corners.
    DegeneracyParameters{{QVector3D(0, 0, 0), QVector3D(2, 0, 0), QVector3D(1, 0, 0)}, true}, // Doubles back at corner 1.
    DegeneracyParameters{{QVector3D(0, 0, 0), QVector3D(3, 0, 0), QVector3D(0, 0, 4)}, false}, // Triangle.
    DegeneracyParameters{{QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(2, 0, 0), QVector3D(2, 0, 1)}, false} // Straight-through corner.
));

} // namespace locus
