// =====================================================================
//  src/liblocus/locus/region/segment.h — Line-segment region
// =====================================================================
//
//  A straight segment between two corners, thickened by a comparison
//  tolerance.  Useful as a path region for narrow passages.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_REGION_SEGMENT_H
#define LOCUS_REGION_SEGMENT_H

#include "locus.h"

#include <QMap>

namespace locus {
namespace region {

/// Line segment in 3-D, treated as a region
///
/// A point is contained if it lies within the tolerance of the segment.
///
/// Example usage:
/// @code
///     Segment3f rail(QVector3D(0, 0, 0), QVector3D(10, 0, 0), 0.01f);
///     rail.contains(QVector3D(5, 0.005f, 0));        // true
///     rail.findLocation(QVector3D(5, 3, 0));         // (5, 0, 0)
///     rail.supportDistance(p, 0.7f).supported;       // false
/// @endcode
class LOCUS_EXPORT Segment3f : public Locus3f {
public:
    /// @param tolerance Comparison tolerance (>= 0).  A negative or
    ///        non-finite value is replaced by 0 with a logged warning.
    Segment3f(const QVector3D& corner0, const QVector3D& corner1, float tolerance);

    // ---- Corners -----------------------------------------------------

    /// Location of corner 0 or 1
    QVector3D copyCornerLocation(int cornerIndex) const;

    /// Check whether the two corners coincide
    bool doCoincide() const;

    /// Index of the corner nearest a point (0 on a tie)
    int findCorner(const QVector3D& location) const;

    /// Index of the first corner coinciding with a point, or -1 if none
    int onCorner(const QVector3D& location) const;

    /// Check whether a point coincides with corner 0 or 1
    bool onCorner(const QVector3D& location, int cornerIndex) const;

    /// Find corners shared with another segment, using the mean of the
    /// two squared tolerances
    /// @param storeCornerMap If non-null, cleared and filled with
    ///        thisIndex -> otherIndex for each shared pair
    bool sharesCornerWith(const Segment3f& other,
                          QMap<int, int>* storeCornerMap = nullptr) const;

    double squaredDistanceToCorner(const QVector3D& location, int cornerIndex) const;

    // ---- Measures ----------------------------------------------------

    float length() const;

    float tolerance() const { return m_tolerance; }

    /// Squared distance from a point to the segment
    /// @param storeClosest If non-null, receives the closest point
    double squaredDistance(const QVector3D& location,
                           QVector3D* storeClosest = nullptr) const;

    // ---- Locus3f -----------------------------------------------------

    bool canMerge(const Locus3f& other) const override;
    QVector3D centroid() const override;
    bool contains(const QVector3D& location) const override;
    bool contains(const QVector3D& start, const QVector3D& end) const override;
    QVector3D findLocation(const QVector3D& location) const override;
    MergeResult merge(const Locus3f& other) const override;
    QVector3D representative() const override;
    double score(const QVector3D& location) const override;
    PathResult shortestPath(const QVector3D& start, const QVector3D& goal,
                            int maxPoints) const override;
    SupportResult supportDistance(const QVector3D& location,
                                  float cosineTolerance) const override;
    QString describe() const override;

private:
    bool validateIndex(int index, const char* description) const;

    QVector3D m_corners[2];
    float m_tolerance = 0.0f;
    double m_tolerance2 = 0.0;
};

}  // namespace region
}  // namespace locus

#endif  // LOCUS_REGION_SEGMENT_H
