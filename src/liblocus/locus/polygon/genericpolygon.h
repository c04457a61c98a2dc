// =====================================================================
//  src/liblocus/locus/polygon/genericpolygon.h — Non-degenerate polygon
// =====================================================================
//
//  A polygon known to be non-degenerate.  It may still be non-planar
//  or self-intersecting; those are checked by SimplePolygon3f.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_POLYGON_GENERICPOLYGON_H
#define LOCUS_POLYGON_GENERICPOLYGON_H

#include "polygon.h"

#include <QString>

namespace locus {
namespace polygon {

struct GenericPolygonResult;

/// Non-degenerate polygon in 3-D
///
/// Instances are created through create(), which rejects degenerate
/// corner lists.
class LOCUS_EXPORT GenericPolygon3f : public Polygon3f {
public:
    /// Validate corners and build a polygon
    /// @return Result with the polygon, or an error if the corners are degenerate
    static GenericPolygonResult create(const QVector<QVector3D>& corners,
                                       float tolerance);

    /// Check whether any two sides intersect other than at their
    /// shared corner
    bool isSelfIntersecting() const { return m_isSelfIntersecting; }

    /// Check whether a line segment touches the perimeter
    bool doesSegmentIntersectPerimeter(const QVector3D& start,
                                       const QVector3D& end) const;

    /// First point where a line segment meets the perimeter.  Corners
    /// are tried before sides.
    std::optional<QVector3D> intersectionWithPerimeter(const QVector3D& start,
                                                       const QVector3D& end) const;

protected:
    explicit GenericPolygon3f(Polygon3f&& base);

    /// Check whether two sides, given by their corner indices, intersect
    bool doSegmentsIntersect(int corner1, int partner1,
                             int corner2, int partner2) const;

private:
    bool computeIsSelfIntersecting() const;
    std::optional<QVector3D> intersectionWithCorner(int cornerIndex,
                                                    const QVector3D& start,
                                                    const QVector3D& end) const;
    std::optional<QVector3D> intersectionWithSide(int sideIndex,
                                                  const QVector3D& start,
                                                  const QVector3D& end) const;
    bool isOverlap(int extreme, int corner1, int partner1,
                   int corner2, int partner2) const;

    bool m_isSelfIntersecting = false;
};

/// Result of GenericPolygon3f::create()
struct GenericPolygonResult {
    bool success = false;
    std::optional<GenericPolygon3f> polygon;
    QString errorMessage;
};

}  // namespace polygon
}  // namespace locus

#endif  // LOCUS_POLYGON_GENERICPOLYGON_H
