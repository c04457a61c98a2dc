// =====================================================================
//  src/liblocus/polygon/genericpolygon.cpp — Non-degenerate polygon
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/polygon/genericpolygon.h>
#include <locus/geometry/intersections.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <algorithm>

namespace locus {
namespace polygon {

GenericPolygonResult GenericPolygon3f::create(const QVector<QVector3D>& corners,
                                              float tolerance)
{
    GenericPolygonResult result;

    Polygon3f base(corners, tolerance);
    if (base.isDegenerate()) {
        result.errorMessage = QStringLiteral("degenerate polygon");
        qCDebug(lcGeometry) << "GenericPolygon3f::create:" << result.errorMessage
                            << "with" << base.numCorners() << "corners";
        return result;
    }

    result.polygon = GenericPolygon3f(std::move(base));
    result.success = true;
    return result;
}

GenericPolygon3f::GenericPolygon3f(Polygon3f&& base)
    : Polygon3f(std::move(base))
{
    m_isSelfIntersecting = computeIsSelfIntersecting();
}

// =====================================================================
//  Perimeter Intersections
// =====================================================================

bool GenericPolygon3f::doesSegmentIntersectPerimeter(const QVector3D& start,
                                                     const QVector3D& end) const
{
    return intersectionWithPerimeter(start, end).has_value();
}

std::optional<QVector3D> GenericPolygon3f::intersectionWithPerimeter(
    const QVector3D& start, const QVector3D& end) const
{
    for (int i = 0; i < m_numCorners; ++i) {
        std::optional<QVector3D> result = intersectionWithCorner(i, start, end);
        if (result) {
            return result;
        }
    }

    for (int i = 0; i < m_numCorners; ++i) {
        std::optional<QVector3D> result = intersectionWithSide(i, start, end);
        if (result) {
            return result;
        }
    }

    return std::nullopt;
}

// =====================================================================
//  Side Intersections
// =====================================================================

bool GenericPolygon3f::doSegmentsIntersect(int corner1, int partner1,
                                           int corner2, int partner2) const
{
    if (!validateIndex(corner1, "corner index") || !validateIndex(partner1, "corner index")
        || !validateIndex(corner2, "corner index") || !validateIndex(partner2, "corner index")) {
        return false;
    }
    if (corner1 == partner1 || corner2 == partner2) {
        qCCritical(lcGeometry, "GenericPolygon3f: trivial segment (%d,%d) or (%d,%d)",
                   corner1, partner1, corner2, partner2);
        return false;
    }

    QVector<int> corners = {corner1, partner1, corner2, partner2};
    std::sort(corners.begin(), corners.end());
    corners.erase(std::unique(corners.begin(), corners.end()), corners.end());
    int numUnique = int(corners.size());

    if (numUnique == 2) {
        // Both corners shared, so the segments coincide.
        return true;
    }

    const QVector3D& p1 = m_corners[corner1];
    const QVector3D& p2 = m_corners[corner2];
    QVector3D offset1 = m_corners[partner1] - p1;
    QVector3D offset2 = m_corners[partner2] - p2;
    QVector3D n = geometry::cross(offset1, offset2);

    if (geometry::lengthSquared(n) < m_tolerance2) {
        // Parallel.  They intersect only if collinear and overlapping.
        geometry::IndexPair longest = mostDistant(corners);
        QVector<int> middle;
        for (int index : corners) {
            if (index != longest.first && index != longest.second) {
                middle.append(index);
            }
        }
        if (allCollinear(longest.first, longest.second, middle)) {
            return isOverlap(longest.first, corner1, partner1, corner2, partner2);
        }
        return false;
    }

    if (numUnique == 3) {
        // Not parallel, one shared corner.
        return false;
    }

    // Closest approach of the two lines: c1 on line 1, c2 on line 2.
    QVector3D n1 = geometry::cross(offset1, n);
    QVector3D n2 = geometry::cross(offset2, n);
    double t1 = geometry::dot(p2 - p1, n2) / geometry::dot(offset1, n2);
    double t2 = geometry::dot(p1 - p2, n1) / geometry::dot(offset2, n1);
    QVector3D c1 = p1 + offset1 * float(t1);
    QVector3D c2 = p2 + offset2 * float(t2);
    if (!geometry::doCoincide(c1, c2, m_tolerance2)) {
        return false;
    }

    double fuzz1 = m_tolerance2 / squaredDistance(corner1, partner1);
    if (t1 < 0.0 && t1 * t1 > fuzz1) {
        return false;
    }
    double ct1 = 1.0 - t1;
    if (ct1 < 0.0 && ct1 * ct1 > fuzz1) {
        return false;
    }

    double fuzz2 = m_tolerance2 / squaredDistance(corner2, partner2);
    if (t2 < 0.0 && t2 * t2 > fuzz2) {
        return false;
    }
    double ct2 = 1.0 - t2;
    if (ct2 < 0.0 && ct2 * ct2 > fuzz2) {
        return false;
    }

    return true;
}

bool GenericPolygon3f::computeIsSelfIntersecting() const
{
    for (int sideI = 0; sideI < m_numCorners; ++sideI) {
        int nextI = nextIndex(sideI);
        for (int sideJ = sideI + 1; sideJ < m_numCorners; ++sideJ) {
            if (doSegmentsIntersect(sideI, nextI, sideJ, nextIndex(sideJ))) {
                return true;
            }
        }
    }
    return false;
}

std::optional<QVector3D> GenericPolygon3f::intersectionWithCorner(
    int cornerIndex, const QVector3D& start, const QVector3D& end) const
{
    const QVector3D& corner = m_corners[cornerIndex];
    double sd = geometry::squaredDistanceToSegment(corner, start, end);
    if (sd > m_tolerance2) {
        return std::nullopt;
    }
    return corner;
}

std::optional<QVector3D> GenericPolygon3f::intersectionWithSide(
    int sideIndex, const QVector3D& start, const QVector3D& end) const
{
    geometry::SegmentIntersection hit = geometry::intersectSegments(
        m_corners[sideIndex], m_corners[nextIndex(sideIndex)], start, end,
        m_tolerance2);
    if (!hit.intersects) {
        return std::nullopt;
    }
    return hit.point;
}

// Overlap test for collinear segments, given a corner at one extreme
// of the shared line.
bool GenericPolygon3f::isOverlap(int extreme, int corner1, int partner1,
                                 int corner2, int partner2) const
{
    int otherCorner = corner1;
    int otherPartner = partner1;
    if (extreme == corner1 || extreme == partner1) {
        otherCorner = corner2;
        otherPartner = partner2;
    }

    int extremePartner;
    if (extreme == corner1) {
        extremePartner = partner1;
    } else if (extreme == partner1) {
        extremePartner = corner1;
    } else if (extreme == corner2) {
        extremePartner = partner2;
    } else {
        extremePartner = corner2;
    }

    if (extreme == otherCorner || extreme == otherPartner) {
        return true;
    }

    double sdPartner = squaredDistance(extreme, extremePartner);
    if (sdPartner > squaredDistance(extreme, otherCorner)) {
        return true;
    }
    if (sdPartner > squaredDistance(extreme, otherPartner)) {
        return true;
    }

    return false;
}

}  // namespace polygon
}  // namespace locus
