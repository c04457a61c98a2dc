// =====================================================================
//  src/liblocus/locus/region/locus.h — Region-of-space interface
// =====================================================================
//
//  Locus3f is the capability shared by every region type: polygons,
//  segments and shells answer containment, nearest-point, centroid,
//  merge and path-finding queries through it.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_REGION_LOCUS_H
#define LOCUS_REGION_LOCUS_H

#include "../geometry/types.h"
#include "../spline/linearspline.h"

#include <QString>

#include <limits>
#include <memory>

namespace locus {
namespace region {

class Locus3f;

// =====================================================================
//  Query Results
// =====================================================================

/// Result of a shortest-path query
///
/// A failed query is one of three kinds: the region cannot search
/// (!supported), the arguments broke a precondition (invalidArgument),
/// or the search found no path (neither flag set).
struct PathResult {
    bool success = false;          ///< A contained path was found
    bool supported = true;         ///< False if this region cannot search for paths
    bool invalidArgument = false;  ///< maxPoints < 2, or an end outside the region
    spline::LinearSpline3f path;   ///< The path (if success)
    QString errorMessage;
};

/// Result of merging two regions
struct MergeResult {
    bool success = false;
    std::shared_ptr<Locus3f> locus;    ///< The merged region (if success)
    QString errorMessage;
};

/// Result of a support-distance query
struct SupportResult {
    bool supported = false;        ///< False if this region cannot compute support
    bool invalidArgument = false;  ///< Cosine tolerance outside [0, 1]
    float distance = std::numeric_limits<float>::infinity();  ///< +inf if unsupported below
    QString errorMessage;
};

// =====================================================================
//  Locus3f
// =====================================================================

/// A region of 3-D space
///
/// Regions are immutable once constructed, so every query is a pure
/// function of the region and its arguments.
///
/// Example usage:
/// @code
///     ShellResult made = Shell3f::hollow(QVector3D(0, 0, 0), 2.0f, 5.0f);
///     const Locus3f& region = *made.shell;
///
///     region.contains(QVector3D(3, 0, 0));          // true
///     region.findLocation(QVector3D(10, 0, 0));     // about (5, 0, 0)
///
///     PathResult path = region.shortestPath(a, b, 4);
///     if (!path.supported) {
///         // hollow shells cannot search for paths
///     }
/// @endcode
class LOCUS_EXPORT Locus3f {
public:
    virtual ~Locus3f() = default;

    /// Check whether this region can be merged with another
    virtual bool canMerge(const Locus3f& other) const = 0;

    /// Centroid of the region (not necessarily contained)
    virtual QVector3D centroid() const = 0;

    /// Check whether a point lies in the region
    virtual bool contains(const QVector3D& location) const = 0;

    /// Check whether every point of a line segment lies in the region
    virtual bool contains(const QVector3D& start, const QVector3D& end) const = 0;

    /// Find a contained point near the given point.
    /// A point that is already contained is returned unchanged.
    virtual QVector3D findLocation(const QVector3D& location) const = 0;

    /// Merge with another region.  Fails unless canMerge(other).
    virtual MergeResult merge(const Locus3f& other) const = 0;

    /// A representative point, guaranteed to be contained
    virtual QVector3D representative() const = 0;

    /// Score a point for optimization: higher is a better fit.
    /// Not a metric.
    virtual double score(const QVector3D& location) const = 0;

    /// Find a short contained path between two contained points
    /// @param maxPoints Maximum number of control points (>= 2)
    virtual PathResult shortestPath(const QVector3D& start,
                                    const QVector3D& goal,
                                    int maxPoints) const = 0;

    /// Vertical (-Y) distance from a point down to the region's first
    /// point of support, if the supporting surface is no steeper than
    /// the cosine tolerance allows.
    virtual SupportResult supportDistance(const QVector3D& location,
                                          float cosineTolerance) const = 0;

    /// Human-readable description of the region
    virtual QString describe() const = 0;
};

}  // namespace region
}  // namespace locus

#endif  // LOCUS_REGION_LOCUS_H
