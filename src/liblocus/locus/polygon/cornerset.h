// =====================================================================
//  src/liblocus/locus/polygon/cornerset.h — Set of 3-D corner points
// =====================================================================
//
//  Corner storage shared by the polygon classes, together with the
//  tolerance used for every coincidence test.  Pairwise distances,
//  planarity and the largest triangle are computed once, when the set
//  is constructed; the set is immutable afterwards.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_POLYGON_CORNERSET_H
#define LOCUS_POLYGON_CORNERSET_H

#include "../geometry/types.h"

#include <array>

namespace locus {
namespace polygon {

/// Row-major boolean matrix: matrix[thisIndex][otherIndex]
using BoolMatrix = QVector<QVector<bool>>;

/// Indices of three corners, in increasing order
using CornerTriple = std::array<int, 3>;

/// Fixed set of corner points with a comparison tolerance
///
/// Two points coincide if they lie within the tolerance of each other.
/// Index arguments must lie in [0, numCorners()); an out-of-range index
/// is logged as a critical error and the query returns a sentinel
/// (-1, NaN, false or a zero vector).
class LOCUS_EXPORT CornerSet3f {
public:
    /// @param corners Corner locations (copied)
    /// @param tolerance Comparison tolerance (>= 0).  A negative or
    ///        non-finite value is replaced by 0 with a logged warning.
    CornerSet3f(const QVector<QVector3D>& corners, float tolerance);
    virtual ~CornerSet3f() = default;

    // ---- Corners -----------------------------------------------------

    /// Location of the indexed corner
    QVector3D copyCornerLocation(int cornerIndex) const;

    /// Locations of all corners, in order
    QVector<QVector3D> copyCornerLocations() const { return m_corners; }

    /// Number of corners
    int numCorners() const { return m_numCorners; }

    /// Comparison tolerance (distance units)
    float tolerance() const { return m_tolerance; }

    // ---- Queries -----------------------------------------------------

    /// Largest distance between any two corners (0 if fewer than two)
    float diameter() const;

    /// Index of the corner nearest a point, or -1 if there are no corners
    int findCorner(const QVector3D& location) const;

    /// Check whether every corner lies in a single plane (within tolerance)
    bool isPlanar() const { return m_isPlanar; }

    /// The three corners spanning the largest triangle, or nullopt if
    /// there are fewer than three corners
    std::optional<CornerTriple> largestTriangle() const { return m_largestTriangle; }

    /// Index of the first corner coinciding with a point, or -1 if none
    int onCorner(const QVector3D& location) const;

    /// Check whether a point coincides with the indexed corner
    bool onCorner(const QVector3D& location, int cornerIndex) const;

    /// Find corners that coincide with corners of another set.
    /// Both sets must use the same tolerance.
    /// @param storeSharedCorners If non-null, resized to
    ///        numCorners() x other.numCorners() and filled in
    /// @return true if at least one corner is shared
    bool sharesCornerWith(const CornerSet3f& other,
                          BoolMatrix* storeSharedCorners = nullptr) const;

    /// Squared distance from a point to the indexed corner
    double squaredDistanceToCorner(const QVector3D& location, int cornerIndex) const;

protected:
    /// Check whether the corners in subset lie on the line through two
    /// other corners (trivially true if those two coincide)
    bool allCollinear(int cornerIndex1, int cornerIndex2,
                      const QVector<int>& subset) const;

    /// Check whether two corners coincide
    bool doCoincide(int cornerIndex1, int cornerIndex2) const;

    /// The two corners of subset that are farthest apart
    geometry::IndexPair mostDistant(const QVector<int>& subset) const;

    /// Squared area of the triangle spanned by three corners
    double squaredArea(int indexA, int indexB, int indexC) const;

    /// Squared distance between two corners (precomputed)
    double squaredDistance(int cornerIndex1, int cornerIndex2) const;

    /// Log and return false if an index is out of range
    bool validateIndex(int index, const char* description) const;

    QVector<QVector3D> m_corners;
    int m_numCorners = 0;
    float m_tolerance = 0.0f;
    double m_tolerance2 = 0.0;    ///< tolerance squared

private:
    bool computeIsPlanar() const;
    std::optional<CornerTriple> computeLargestTriangle() const;

    QVector<double> m_squaredDistances;     ///< numCorners x numCorners
    std::optional<CornerTriple> m_largestTriangle;
    bool m_isPlanar = true;
};

}  // namespace polygon
}  // namespace locus

#endif  // LOCUS_POLYGON_CORNERSET_H
