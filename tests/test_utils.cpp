// =====================================================================
//  tests/test_utils.cpp — Vector helper tests
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <locus/geometry/utils.h>

#include <cmath>
#include <limits>

namespace locus
{

using namespace geometry;

/*
 * Parameters provided to squaredDistanceToSegment.
 */
struct SegmentDistanceParameters
{
    QVector3D start;
    QVector3D end;
    QVector3D point;
    double actual_distance2;
    QVector3D actual_closest;
};

class SegmentDistanceTest : public testing::TestWithParam<SegmentDistanceParameters>
{
public:
    const double maximum_error = 1e-6;
};

TEST_P(SegmentDistanceTest, SquaredDistanceToSegment)
{
    const SegmentDistanceParameters parameters = GetParam();

    QVector3D closest;
    const double supposed_distance2 = squaredDistanceToSegment(parameters.point, parameters.start, parameters.end, &closest);
    ASSERT_NEAR(supposed_distance2, parameters.actual_distance2, maximum_error)
        << "Segment " << toString(parameters.start).toStdString() << " -- " << toString(parameters.end).toStdString()
        << ", point " << toString(parameters.point).toStdString() << ".";
    ASSERT_NEAR(distanceSquared(closest, parameters.actual_closest), 0.0, maximum_error)
        << "Closest point was " << toString(closest).toStdString() << " rather than "
        << toString(parameters.actual_closest).toStdString() << ".";
}

INSTANTIATE_TEST_SUITE_P(SegmentDistanceInstantiation, SegmentDistanceTest, testing::Values(
    SegmentDistanceParameters{QVector3D(0, 0, 0), QVector3D(4, 0, 0), QVector3D(2, 3, 0), 9.0, QVector3D(2, 0, 0)}, // Beside the middle.
    SegmentDistanceParameters{QVector3D(0, 0, 0), QVector3D(4, 0, 0), QVector3D(2, 0, 0), 0.0, QVector3D(2, 0, 0)}, // On the segment.
    SegmentDistanceParameters{QVector3D(0, 0, 0), QVector3D(4, 0, 0), QVector3D(-1, 0, 0), 1.0, QVector3D(0, 0, 0)}, // Before the start.
    SegmentDistanceParameters{QVector3D(0, 0, 0), QVector3D(4, 0, 0), QVector3D(6, 0, 2), 8.0, QVector3D(4, 0, 0)}, // Beyond the end.
    SegmentDistanceParameters{QVector3D(0, 0, 0), QVector3D(0, 0, 4), QVector3D(0, 1, 1), 1.0, QVector3D(0, 0, 1)}, // Vertical segment.
    SegmentDistanceParameters{QVector3D(1, 1, 1), QVector3D(1, 1, 1), QVector3D(1, 3, 1), 4.0, QVector3D(1, 1, 1)}  // Zero-length segment.
));

TEST(UtilsTest, DotAndCross)
{
    EXPECT_DOUBLE_EQ(dot(QVector3D(1, 2, 3), QVector3D(4, -5, 6)), 12.0);

    const QVector3D z = cross(QVector3D(1, 0, 0), QVector3D(0, 1, 0));
    EXPECT_FLOAT_EQ(z.x(), 0.0f);
    EXPECT_FLOAT_EQ(z.y(), 0.0f);
    EXPECT_FLOAT_EQ(z.z(), 1.0f);
}

TEST(UtilsTest, NormalizeZeroVector)
{
    const QVector3D result = normalize(QVector3D());
    EXPECT_EQ(result, QVector3D());

    const QVector3D unit = normalize(QVector3D(0, 3, 4));
    EXPECT_NEAR(length(unit), 1.0, 1e-6);
    EXPECT_NEAR(unit.z(), 0.8, 1e-6);
}

TEST(UtilsTest, MaxAxisPrefersLowestIndex)
{
    EXPECT_EQ(maxAxis(QVector3D(1, 3, 2)), 1);
    EXPECT_EQ(maxAxis(QVector3D(2, 2, 2)), 0);
    EXPECT_EQ(maxAxis(QVector3D(0, 5, 5)), 1);
    EXPECT_FLOAT_EQ(maxComponent(QVector3D(-7, 3, 2)), 3.0f);
}

TEST(UtilsTest, IsFinite)
{
    EXPECT_TRUE(isFinite(QVector3D(1, 2, 3)));
    EXPECT_FALSE(isFinite(QVector3D(std::numeric_limits<float>::infinity(), 0, 0)));
    EXPECT_FALSE(isFinite(QVector3D(0, std::nanf(""), 0)));
}

TEST(UtilsTest, ToString)
{
    EXPECT_EQ(toString(QVector3D(1, 2.5f, -3)), QStringLiteral("(1, 2.5, -3)"));
}

TEST(UtilsTest, DoCoincide)
{
    const double tolerance2 = 0.01 * 0.01;
    EXPECT_TRUE(doCoincide(QVector3D(1, 1, 1), QVector3D(1.005f, 1, 1), tolerance2));
    EXPECT_FALSE(doCoincide(QVector3D(1, 1, 1), QVector3D(1.02f, 1, 1), tolerance2));
    EXPECT_TRUE(doCoincide(QVector3D(1, 1, 1), QVector3D(1, 1, 1), 0.0));
}

TEST(UtilsTest, MostRemote)
{
    const QVector<QVector3D> points = {QVector3D(1, 0, 0), QVector3D(0, 0, 0), QVector3D(5, 0, 0), QVector3D(2, 1, 0)};
    const IndexPair pair = mostRemote(points);
    ASSERT_TRUE(pair.isValid());
    EXPECT_EQ(pair.first, 1);
    EXPECT_EQ(pair.second, 2);

    EXPECT_FALSE(mostRemote(QVector<QVector3D>()).isValid());
}

TEST(UtilsTest, AllCollinear)
{
    const double tolerance2 = 0.01 * 0.01;
    const QVector3D first(0, 0, 0);
    const QVector3D last(4, 0, 0);

    EXPECT_TRUE(allCollinear(first, last, {QVector3D(1, 0, 0.001f), QVector3D(3, 0, 0)}, tolerance2));
    EXPECT_FALSE(allCollinear(first, last, {QVector3D(1, 1, 0)}, tolerance2));

    // Too short to define a direction.
    EXPECT_TRUE(allCollinear(first, first, {QVector3D(1, 1, 0)}, tolerance2));
}

TEST(UtilsTest, GenerateBasisIsOrthonormal)
{
    const std::optional<Basis3D> basis = generateBasis(QVector3D(0, 0, 2));
    ASSERT_TRUE(basis.has_value());

    EXPECT_NEAR(basis->u.z(), 1.0, 1e-6);
    EXPECT_NEAR(length(basis->v), 1.0, 1e-6);
    EXPECT_NEAR(length(basis->w), 1.0, 1e-6);
    EXPECT_NEAR(dot(basis->u, basis->v), 0.0, 1e-6);
    EXPECT_NEAR(dot(basis->u, basis->w), 0.0, 1e-6);
    EXPECT_NEAR(dot(basis->v, basis->w), 0.0, 1e-6);

    // Right-handed.
    EXPECT_NEAR(distanceSquared(cross(basis->u, basis->v), basis->w), 0.0, 1e-10);
}

TEST(UtilsTest, GenerateBasisTinyDirection)
{
    const std::optional<Basis3D> basis = generateBasis(QVector3D(1e-30f, 0, 0));
    ASSERT_TRUE(basis.has_value());
    EXPECT_NEAR(basis->u.x(), 1.0, 1e-6);
}

TEST(UtilsTest, GenerateBasisRejectsBadDirection)
{
    EXPECT_FALSE(generateBasis(QVector3D()).has_value());
    EXPECT_FALSE(generateBasis(QVector3D(std::nanf(""), 1, 0)).has_value());
}

TEST(UtilsTest, LerpAndMidpoint)
{
    const QVector3D a(0, 0, 0);
    const QVector3D b(4, 2, 0);
    EXPECT_EQ(midpoint(a, b), QVector3D(2, 1, 0));
    EXPECT_EQ(lerp(a, b, 0.25), QVector3D(1, 0.5f, 0));
}

} // namespace locus
