// =====================================================================
//  src/liblocus/locus/geometry/utils.h — Geometry utility functions
// =====================================================================
//
//  Vector helpers on QVector3D.  Products and squared lengths are
//  accumulated in double precision even though the coordinates are
//  stored as float, so that angle and coincidence tests stay stable.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_GEOMETRY_UTILS_H
#define LOCUS_GEOMETRY_UTILS_H

#include "types.h"

#include <QString>

namespace locus {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Compute the dot product of two vectors in double precision
LOCUS_EXPORT double dot(const QVector3D& a, const QVector3D& b);

/// Compute the cross product of two vectors
LOCUS_EXPORT QVector3D cross(const QVector3D& a, const QVector3D& b);

/// Compute the length of a vector
LOCUS_EXPORT double length(const QVector3D& v);

/// Compute the squared length of a vector (faster, no sqrt)
LOCUS_EXPORT double lengthSquared(const QVector3D& v);

/// Compute the squared distance between two points
LOCUS_EXPORT double distanceSquared(const QVector3D& a, const QVector3D& b);

/// Normalize a vector to unit length.
/// Returns the zero vector if the input is shorter than DEFAULT_TOLERANCE.
LOCUS_EXPORT QVector3D normalize(const QVector3D& v);

/// Linear interpolation between two points
LOCUS_EXPORT QVector3D lerp(const QVector3D& a, const QVector3D& b, double t);

/// Compute the midpoint of a line segment
LOCUS_EXPORT QVector3D midpoint(const QVector3D& a, const QVector3D& b);

/// Largest of the three components
LOCUS_EXPORT float maxComponent(const QVector3D& v);

/// Index (0 = x, 1 = y, 2 = z) of the largest component.
/// Ties resolve to the lowest index.
LOCUS_EXPORT int maxAxis(const QVector3D& v);

/// Check that all three components are finite
LOCUS_EXPORT bool isFinite(const QVector3D& v);

/// Format a vector as "(x, y, z)"
LOCUS_EXPORT QString toString(const QVector3D& v);

// =====================================================================
//  Point Comparisons
// =====================================================================

/// Check whether two points lie within sqrt(tolerance2) of each other
/// @param tolerance2 Squared distance tolerance (>= 0)
LOCUS_EXPORT bool doCoincide(const QVector3D& a, const QVector3D& b,
                             double tolerance2);

/// Find the two points of a list that are farthest apart.
/// Returns an invalid pair if the list has fewer than two points.
LOCUS_EXPORT IndexPair mostRemote(const QVector<QVector3D>& points);

/// Check whether every middle point lies on the line through first and
/// last, within sqrt(tolerance2).  Trivially true if first and last
/// coincide.
LOCUS_EXPORT bool allCollinear(const QVector3D& first, const QVector3D& last,
                               const QVector<QVector3D>& middle,
                               double tolerance2);

// =====================================================================
//  Segment Operations
// =====================================================================

/// Squared distance from a point to a line segment.
/// The closest point is found by clamped projection (t in [0,1]); a
/// zero-length segment behaves like its start point.
/// @param storeClosest If non-null, receives the closest point on the segment
LOCUS_EXPORT double squaredDistanceToSegment(
    const QVector3D& point,
    const QVector3D& segStart, const QVector3D& segEnd,
    QVector3D* storeClosest = nullptr);

// =====================================================================
//  Bases
// =====================================================================

/// Generate an orthonormal basis whose first axis points along the
/// given direction.  The second axis is perpendicular to the world
/// axis on which the direction has the smallest component.
/// Returns nullopt if the direction has zero length or is not finite.
///
/// Example usage:
/// @code
///     auto basis = generateBasis(QVector3D(0, 0, 2));
///     QQuaternion orientation = QQuaternion::fromAxes(
///         basis->u, basis->v, basis->w);
/// @endcode
LOCUS_EXPORT std::optional<Basis3D> generateBasis(const QVector3D& direction);

}  // namespace geometry
}  // namespace locus

#endif  // LOCUS_GEOMETRY_UTILS_H
