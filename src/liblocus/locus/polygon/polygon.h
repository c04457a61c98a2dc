// =====================================================================
//  src/liblocus/locus/polygon/polygon.h — Closed polygon in 3-D
// =====================================================================
//
//  A cyclic sequence of corners: side i runs from corner i to corner
//  i+1 (mod n).  Polygon3f adds side queries, turn angles and the
//  degeneracy test to CornerSet3f.  It may be degenerate, non-planar or
//  self-intersecting; the derived classes narrow that down.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_POLYGON_POLYGON_H
#define LOCUS_POLYGON_POLYGON_H

#include "cornerset.h"

namespace locus {
namespace polygon {

/// Closed polygon with arbitrary corners
///
/// Example usage:
/// @code
///     Polygon3f square({QVector3D(0, 0, 0), QVector3D(1, 0, 0),
///                       QVector3D(1, 0, 1), QVector3D(0, 0, 1)}, 0.01f);
///     square.isDegenerate();     // false
///     square.perimeter();        // 4
///     square.findSide(QVector3D(0.5f, 0, -1));   // 0
/// @endcode
class LOCUS_EXPORT Polygon3f : public CornerSet3f {
public:
    Polygon3f(const QVector<QVector3D>& corners, float tolerance);

    // ---- Angles ------------------------------------------------------

    /// Magnitude of the turn at a corner, in radians [0, pi].
    /// NaN if either adjacent side has zero length; callers must check.
    double absTurnAngle(int cornerIndex) const;

    /// Cross product of the incoming and outgoing sides at a corner
    QVector3D crossProduct(int cornerIndex) const;

    /// Dot product of the incoming and outgoing sides at a corner
    double dotProduct(int cornerIndex) const;

    // ---- Sides -------------------------------------------------------

    /// Index of the longest side, or -1 if there are no corners
    int findLongest() const;

    /// Index of the shortest side, or -1 if there are no corners
    int findShortest() const;

    /// Index of the side nearest a point, or -1 if there are no corners
    /// @param storeClosest If non-null, receives the closest point on that side
    int findSide(const QVector3D& location, QVector3D* storeClosest = nullptr) const;

    /// Midpoint of a side
    QVector3D midpoint(int sideIndex) const;

    /// Index of the first side within tolerance of a point, or -1 if none
    int onSide(const QVector3D& location) const;

    /// Check whether a point lies within tolerance of a side
    bool onSide(const QVector3D& location, int sideIndex) const;

    /// Total length of all sides
    float perimeter() const;

    /// Length of a side
    float sideLength(int sideIndex) const;

    /// Squared distance from a point to a side
    /// @param storeClosest If non-null, receives the closest point on the side
    double squaredDistanceToSide(const QVector3D& location, int sideIndex,
                                 QVector3D* storeClosest = nullptr) const;

    /// Find sides that coincide with sides of another polygon, in either
    /// direction.  Both polygons must use the same tolerance.
    /// @param storeSharedSides If non-null, resized to
    ///        numCorners() x other.numCorners() and filled in
    /// @return true if at least one side is shared
    bool sharesSideWith(const Polygon3f& other,
                        BoolMatrix* storeSharedSides = nullptr) const;

    // ---- Topology ----------------------------------------------------

    /// Check for fewer than three corners, coincident corners or a
    /// straight (180 degree) corner
    bool isDegenerate() const { return m_isDegenerate; }

    /// Cyclic successor of a corner/side index
    int nextIndex(int index) const;

    /// Cyclic predecessor of a corner/side index
    int prevIndex(int index) const;

    /// Polygon made of the corners from firstIndex through lastIndex
    /// inclusive, wrapping around.  The indices must differ.
    std::optional<Polygon3f> fromRange(int firstIndex, int lastIndex) const;

private:
    bool computeIsDegenerate() const;

    QVector<QVector3D> m_crossProducts;   ///< per corner
    QVector<double> m_dotProducts;        ///< per corner
    QVector<double> m_sideLengthSquared;  ///< per side
    bool m_isDegenerate = true;
};

}  // namespace polygon
}  // namespace locus

#endif  // LOCUS_POLYGON_POLYGON_H
