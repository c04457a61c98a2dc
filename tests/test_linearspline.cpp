// =====================================================================
//  tests/test_linearspline.cpp — Piecewise-linear path tests
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <locus/spline/linearspline.h>
#include <locus/region/segment.h>
#include <locus/region/shell.h>

namespace locus
{

using namespace spline;

class LinearSplineTest : public testing::Test
{
public:
    LinearSpline3f path;

    void SetUp()
    {
        // Repeated points are dropped, leaving legs of length 3 and 4.
        path = LinearSpline3f({QVector3D(0, 0, 0), QVector3D(0, 0, 0), QVector3D(3, 0, 0), QVector3D(3, 4, 0), QVector3D(3, 4, 0)});
    }
};

TEST_F(LinearSplineTest, DropsRepeatedPoints)
{
    ASSERT_TRUE(path.isValid());
    EXPECT_EQ(path.numControlPoints(), 3);
    EXPECT_EQ(path.copyControlPoint(1), QVector3D(3, 0, 0));
    EXPECT_EQ(path.controlPoints().last(), QVector3D(3, 4, 0));
    EXPECT_FLOAT_EQ(path.totalLength(), 7.0f);
    EXPECT_EQ(path.terminus(), QVector3D(3, 4, 0));
}

TEST_F(LinearSplineTest, EmptyPath)
{
    const LinearSpline3f empty;

    EXPECT_FALSE(empty.isValid());
    EXPECT_EQ(empty.numControlPoints(), 0);
    EXPECT_FLOAT_EQ(empty.totalLength(), 0.0f);
    EXPECT_EQ(empty.terminus(), QVector3D());
    EXPECT_EQ(empty.interpolate(1.0f), QVector3D());
    EXPECT_EQ(empty.rightDerivative(0.0f), QVector3D());
}

TEST_F(LinearSplineTest, SinglePoint)
{
    const LinearSpline3f point({QVector3D(1, 2, 3), QVector3D(1, 2, 3)});

    EXPECT_TRUE(point.isValid());
    EXPECT_EQ(point.numControlPoints(), 1);
    EXPECT_EQ(point.interpolate(5.0f), QVector3D(1, 2, 3));
    EXPECT_EQ(point.rightDerivative(0.0f), QVector3D());
}

TEST_F(LinearSplineTest, CopyControlPointOutOfRange)
{
    EXPECT_EQ(path.copyControlPoint(-1), QVector3D());
    EXPECT_EQ(path.copyControlPoint(3), QVector3D());
}

TEST_F(LinearSplineTest, Interpolate)
{
    EXPECT_EQ(path.interpolate(0.0f), QVector3D(0, 0, 0));
    EXPECT_EQ(path.interpolate(1.5f), QVector3D(1.5f, 0, 0));
    EXPECT_EQ(path.interpolate(3.0f), QVector3D(3, 0, 0));
    EXPECT_EQ(path.interpolate(5.0f), QVector3D(3, 2, 0));
    EXPECT_EQ(path.interpolate(7.0f), QVector3D(3, 4, 0));

    // Samples beyond either end are clamped.
    EXPECT_EQ(path.interpolate(-1.0f), QVector3D(0, 0, 0));
    EXPECT_EQ(path.interpolate(100.0f), QVector3D(3, 4, 0));
}

TEST_F(LinearSplineTest, RightDerivative)
{
    EXPECT_EQ(path.rightDerivative(-1.0f), QVector3D(1, 0, 0));
    EXPECT_EQ(path.rightDerivative(1.0f), QVector3D(1, 0, 0));
    EXPECT_EQ(path.rightDerivative(3.0f), QVector3D(0, 1, 0));
    EXPECT_EQ(path.rightDerivative(7.0f), QVector3D(0, 1, 0));
}

TEST_F(LinearSplineTest, ContainedInShell)
{
    // Every control point is 2.5 from the center.
    const region::ShellResult wide = region::Shell3f::sphere(QVector3D(1.5f, 2, 0), 3.0f);
    const region::ShellResult narrow = region::Shell3f::sphere(QVector3D(1.5f, 2, 0), 2.0f);
    ASSERT_TRUE(wide.success);
    ASSERT_TRUE(narrow.success);

    EXPECT_TRUE(path.isContainedIn(*wide.shell));
    EXPECT_FALSE(path.isContainedIn(*narrow.shell));
}

TEST_F(LinearSplineTest, ContainedInSegment)
{
    const region::Segment3f rail(QVector3D(0, 0, 0), QVector3D(10, 0, 0), 0.01f);
    const LinearSpline3f along({QVector3D(1, 0, 0), QVector3D(4, 0, 0), QVector3D(9, 0, 0)});

    EXPECT_TRUE(along.isContainedIn(rail));
    EXPECT_FALSE(path.isContainedIn(rail));
}

TEST_F(LinearSplineTest, Describe)
{
    EXPECT_EQ(path.describe(), QStringLiteral("LinearSpline3f[@t=0.0(0, 0, 0) @t=3.0(3, 0, 0) @t=7.0(3, 4, 0)]"));
    EXPECT_EQ(LinearSpline3f().describe(), QStringLiteral("LinearSpline3f[]"));
}

} // namespace locus
