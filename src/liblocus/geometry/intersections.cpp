// =====================================================================
//  src/liblocus/geometry/intersections.cpp — Intersection functions
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/geometry/intersections.h>
#include <locus/geometry/utils.h>

namespace locus {
namespace geometry {

namespace {

// Collinear segments a = (0,1) and b = (2,3), indexed into four points.
// ext is one of the two most remote endpoints.  Walking from ext, the
// segments overlap iff ext's own partner reaches at least as far as an
// endpoint of the other segment; that endpoint is then common to both.
SegmentIntersection collinearOverlap(const QVector<QVector3D>& points, int ext)
{
    SegmentIntersection result;
    result.parallel = true;
    result.collinear = true;

    int partner = (ext % 2 == 0) ? ext + 1 : ext - 1;
    int otherStart = (ext < 2) ? 2 : 0;
    int otherEnd = otherStart + 1;

    double sdPartner = distanceSquared(points[ext], points[partner]);
    if (sdPartner >= distanceSquared(points[ext], points[otherStart])) {
        result.intersects = true;
        result.point = points[otherStart];
    } else if (sdPartner >= distanceSquared(points[ext], points[otherEnd])) {
        result.intersects = true;
        result.point = points[otherEnd];
    }

    return result;
}

SegmentIntersection parallelIntersection(
    const QVector3D& start1, const QVector3D& end1,
    const QVector3D& start2, const QVector3D& end2,
    double tolerance2)
{
    SegmentIntersection result;
    result.parallel = true;

    const QVector<QVector3D> points = {start1, end1, start2, end2};
    IndexPair remote = mostRemote(points);
    const QVector3D& first = points[remote.first];
    const QVector3D& last = points[remote.second];
    if (doCoincide(first, last, tolerance2)) {
        // All four endpoints coincide.
        result.intersects = true;
        result.collinear = true;
        result.point = start2;
        return result;
    }

    QVector<QVector3D> middle;
    for (int i = 0; i < points.size(); ++i) {
        if (i != remote.first && i != remote.second) {
            middle.append(points[i]);
        }
    }
    if (!allCollinear(first, last, middle, tolerance2)) {
        return result;
    }

    return collinearOverlap(points, remote.first);
}

}  // anonymous namespace

// =====================================================================
//  Segment-Segment Intersection
// =====================================================================

SegmentIntersection intersectSegments(
    const QVector3D& start1, const QVector3D& end1,
    const QVector3D& start2, const QVector3D& end2,
    double tolerance2)
{
    SegmentIntersection result;

    // A zero-length segment intersects wherever it touches the other.
    QVector3D offset1 = end1 - start1;
    double ls1 = lengthSquared(offset1);
    if (ls1 == 0.0) {
        QVector3D closest;
        double ds = squaredDistanceToSegment(start1, start2, end2, &closest);
        if (ds <= tolerance2) {
            result.intersects = true;
            result.point = closest;
        }
        return result;
    }

    QVector3D offset2 = end2 - start2;
    double ls2 = lengthSquared(offset2);
    if (ls2 == 0.0) {
        QVector3D closest;
        double ds = squaredDistanceToSegment(start2, start1, end1, &closest);
        if (ds <= tolerance2) {
            result.intersects = true;
            result.point = closest;
        }
        return result;
    }

    QVector3D n = cross(offset2, offset1);
    if (lengthSquared(n) <= tolerance2) {
        return parallelIntersection(start1, end1, start2, end2, tolerance2);
    }

    // Closest approach of the two infinite lines: t1 parameterizes
    // segment 2, t2 parameterizes segment 1.
    QVector3D n1 = cross(offset2, n);
    QVector3D n2 = cross(offset1, n);
    double t1 = dot(start1 - start2, n2) / dot(offset2, n2);
    double t2 = dot(start2 - start1, n1) / dot(offset1, n1);
    QVector3D c1 = start2 + offset2 * float(t1);
    QVector3D c2 = start1 + offset1 * float(t2);
    if (!doCoincide(c1, c2, tolerance2)) {
        return result;
    }

    // Allow each parameter to stray outside [0,1] by about one tolerance.
    double fuzz1 = tolerance2 / ls2;
    if (t1 < 0.0 && t1 * t1 > fuzz1) {
        return result;
    }
    double ct1 = 1.0 - t1;
    if (ct1 < 0.0 && ct1 * ct1 > fuzz1) {
        return result;
    }
    double fuzz2 = tolerance2 / ls1;
    if (t2 < 0.0 && t2 * t2 > fuzz2) {
        return result;
    }
    double ct2 = 1.0 - t2;
    if (ct2 < 0.0 && ct2 * ct2 > fuzz2) {
        return result;
    }

    result.intersects = true;
    result.point = c1;
    return result;
}

}  // namespace geometry
}  // namespace locus
