// =====================================================================
//  src/liblocus/locus/polygon/simplepolygon.h — Simple planar polygon
// =====================================================================
//
//  A polygon that is non-degenerate, planar and not self-intersecting,
//  so it has a well-defined interior.  SimplePolygon3f is a Locus3f:
//  it answers containment, nearest-point, merge and path queries.
//
//  The plane normal is oriented so the corners wind counter-clockwise
//  about it.  signedArea() is therefore always positive, and a point is
//  inside a side when it lies to the left of that side looking down
//  the normal.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_POLYGON_SIMPLEPOLYGON_H
#define LOCUS_POLYGON_SIMPLEPOLYGON_H

#include "genericpolygon.h"
#include "../region/locus.h"

namespace locus {
namespace polygon {

struct SimplePolygonResult;

/// Simple polygon in 3-D space
///
/// Example usage:
/// @code
///     SimplePolygonResult made = SimplePolygon3f::create(
///         {QVector3D(0, 0, 0), QVector3D(1, 0, 0),
///          QVector3D(1, 0, 1), QVector3D(0, 0, 1)}, 0.01f);
///     if (!made.success) {
///         qWarning() << made.errorMessage;
///         return;
///     }
///     const SimplePolygon3f& square = *made.polygon;
///     square.area();                                  // 1
///     square.contains(QVector3D(0.5f, 0, 0.5f));      // true
///     square.findLocation(QVector3D(2, 0, 0.5f));     // (1, 0, 0.5)
/// @endcode
class LOCUS_EXPORT SimplePolygon3f : public GenericPolygon3f, public region::Locus3f {
public:
    /// Validate corners and build a polygon
    /// @return Result with the polygon, or an error naming the first
    ///         failed check (degenerate, non-planar, self-intersecting)
    static SimplePolygonResult create(const QVector<QVector3D>& corners,
                                      float tolerance);

    /// Promote a generic polygon, checking planarity and self-intersection
    static SimplePolygonResult fromGeneric(const GenericPolygon3f& generic);

    // ---- Plane -------------------------------------------------------

    /// Unit normal of the polygon's plane
    QVector3D planeNormal() const { return m_planeNormal; }

    /// Plane constant c, such that normal . p + c = 0 on the plane
    float planeConstant() const { return m_planeConstant; }

    /// Check whether a point lies within tolerance of the plane
    bool inPlane(const QVector3D& point) const;

    /// 2-D coordinates of a corner relative to corner 0, in the plane
    QVector2D planarOffset(int cornerIndex) const;

    // ---- Shape -------------------------------------------------------

    /// Area enclosed by the polygon
    float area() const { return float(qAbs(m_signedArea)); }

    /// Area with winding sign; positive for the normal's orientation
    double signedArea() const { return m_signedArea; }

    /// Check whether every turn has the same handedness
    bool isConvex() const { return m_isConvex; }

    /// Signed turn angle at a corner, in radians (-pi, pi).
    /// Positive turns are counter-clockwise about the normal.
    double turnAngle(int cornerIndex) const;

    /// Interior angle at a corner, in radians (0, 2*pi)
    double interiorAngle(int cornerIndex) const;

    // ---- Locus3f -----------------------------------------------------

    bool canMerge(const region::Locus3f& other) const override;
    QVector3D centroid() const override;
    bool contains(const QVector3D& location) const override;
    bool contains(const QVector3D& start, const QVector3D& end) const override;
    QVector3D findLocation(const QVector3D& location) const override;
    region::MergeResult merge(const region::Locus3f& other) const override;
    QVector3D representative() const override;
    double score(const QVector3D& location) const override;
    region::PathResult shortestPath(const QVector3D& start, const QVector3D& goal,
                                    int maxPoints) const override;
    region::SupportResult supportDistance(const QVector3D& location,
                                          float cosineTolerance) const override;
    QString describe() const override;

private:
    explicit SimplePolygon3f(GenericPolygon3f&& base);

    void setPlane();
    QVector2D toPlanar(const QVector3D& point) const;
    bool containsSegment(const QVector3D& start, const QVector3D& end,
                         int depth) const;
    std::optional<QVector<QVector3D>> mergeCorners(const SimplePolygon3f& other) const;

    QVector3D m_planeNormal;
    float m_planeConstant = 0.0f;
    QVector3D m_xBasis;                 ///< in-plane unit vector
    QVector3D m_zBasis;                 ///< normal x xBasis
    QVector<QVector2D> m_planarOffsets; ///< per corner, relative to corner 0
    double m_signedArea = 0.0;
    QVector2D m_planarCentroid;
    bool m_isConvex = false;
};

/// Result of SimplePolygon3f::create() and fromGeneric()
struct SimplePolygonResult {
    bool success = false;
    std::optional<SimplePolygon3f> polygon;
    QString errorMessage;
};

}  // namespace polygon
}  // namespace locus

#endif  // LOCUS_POLYGON_SIMPLEPOLYGON_H
