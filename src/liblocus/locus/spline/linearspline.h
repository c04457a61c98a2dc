// =====================================================================
//  src/liblocus/locus/spline/linearspline.h — Piecewise-linear path
// =====================================================================
//
//  A polyline through a sequence of control points, parameterized by
//  arc length.  Returned by Locus3f::shortestPath().
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_SPLINE_LINEARSPLINE_H
#define LOCUS_SPLINE_LINEARSPLINE_H

#include "../geometry/types.h"

#include <QString>

namespace locus {

namespace region {
class Locus3f;
}

namespace spline {

/// Piecewise-linear path through 3-D control points
///
/// Consecutive duplicate points are dropped on construction, so every
/// remaining segment has positive length and the cumulative length
/// (the "t" of each control point) is strictly increasing.
///
/// Example usage:
/// @code
///     LinearSpline3f path({QVector3D(0, 0, 0), QVector3D(3, 4, 0)});
///     path.totalLength();        // 5
///     path.interpolate(2.5f);    // (1.5, 2, 0)
/// @endcode
class LOCUS_EXPORT LinearSpline3f {
public:
    LinearSpline3f() = default;
    explicit LinearSpline3f(const QVector<QVector3D>& points);

    /// True if the path has at least one control point
    bool isValid() const { return !m_points.isEmpty(); }

    /// Number of control points after duplicates were dropped
    int numControlPoints() const { return int(m_points.size()); }

    /// Copy of the control point at index, or a zero vector (with a
    /// logged error) if the index is out of range
    QVector3D copyControlPoint(int index) const;

    /// All control points, in order
    QVector<QVector3D> controlPoints() const { return m_points; }

    /// Point at arc length t, clamped to the ends of the path
    QVector3D interpolate(float t) const;

    /// Check whether every segment of the path lies in a region
    bool isContainedIn(const region::Locus3f& locus) const;

    /// Velocity (unit direction) just after arc length t
    QVector3D rightDerivative(float t) const;

    /// Last control point (zero vector for an empty path)
    QVector3D terminus() const;

    /// Sum of the segment lengths
    float totalLength() const { return m_totalLength; }

    /// Human-readable form, e.g. "LinearSpline3f[@t=0.0(0, 0, 0) @t=5.0(3, 4, 0)]"
    QString describe() const;

private:
    int leftIndex(float t) const;

    QVector<QVector3D> m_points;
    QVector<float> m_ts;
    float m_totalLength = 0.0f;
};

}  // namespace spline
}  // namespace locus

#endif  // LOCUS_SPLINE_LINEARSPLINE_H
