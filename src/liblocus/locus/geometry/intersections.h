// =====================================================================
//  src/liblocus/locus/geometry/intersections.h — Intersection functions
// =====================================================================
//
//  Functions for computing intersections between 3-D line segments.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_GEOMETRY_INTERSECTIONS_H
#define LOCUS_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace locus {
namespace geometry {

// =====================================================================
//  Intersection Results
// =====================================================================

/// Result of a segment-segment intersection
struct SegmentIntersection {
    bool intersects = false;      ///< Whether the segments meet (within tolerance)
    bool parallel = false;        ///< Whether the segment directions are parallel
    bool collinear = false;       ///< Whether all four endpoints share a line
    QVector3D point;              ///< A point common to both segments (if intersects)
};

// =====================================================================
//  Segment Intersections
// =====================================================================

/// Compute an intersection of two line segments in 3-D
///
/// Skew segments meet where their lines' closest-approach points
/// coincide within tolerance and both parameters fall inside [0,1]
/// (with a fuzz scaled by each segment's length).  Parallel segments
/// meet only if all four endpoints are collinear and the segments
/// overlap, in which case an endpoint inside the overlap is reported.
/// A zero-length segment behaves like a point.
///
/// @param start1, end1 First segment endpoints
/// @param start2, end2 Second segment endpoints
/// @param tolerance2 Squared distance tolerance for coincidence (>= 0)
/// @return Intersection result
LOCUS_EXPORT SegmentIntersection intersectSegments(
    const QVector3D& start1, const QVector3D& end1,
    const QVector3D& start2, const QVector3D& end2,
    double tolerance2);

}  // namespace geometry
}  // namespace locus

#endif  // LOCUS_GEOMETRY_INTERSECTIONS_H
