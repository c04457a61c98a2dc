// =====================================================================
//  src/liblocus/locus/region/shell.h — Metric shell region
// =====================================================================
//
//  The set of points whose weighted, rotated offset from a center has
//  a metric value between an inner and an outer radius.  Depending on
//  the parameters this is a solid sphere, box, octahedron or ellipsoid,
//  an infinite cylinder or slab, or a hollow shell around a hole.
//
//  Shells are immutable.  movedTo() and reoriented() return modified
//  copies.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_REGION_SHELL_H
#define LOCUS_REGION_SHELL_H

#include "locus.h"
#include "metric.h"

namespace locus {
namespace region {

struct ShellResult;

/// Region between two metric radii around a center
///
/// A point p is contained if
///     inner^2 <= squaredValue(metric, weights * R^-1 * (p - center)) <= outer^2
/// where R is the orientation and the weights scale each local axis.
/// A missing orientation means the local axes are the world axes; a
/// missing weight vector means (1, 1, 1).
///
/// Example usage:
/// @code
///     ShellResult made = Shell3f::solid(Metric::Chebyshev, QVector3D(), 1.0f);
///     made.shell->contains(QVector3D(1, 1, 1));      // true: a unit cube
///
///     ShellResult pipe = Shell3f::cylinder(QVector3D(), QVector3D(0, 1, 0), 0.5f);
///     pipe.shell->contains(QVector3D(0, 100, 0.4f)); // true: unbounded along Y
/// @endcode
class LOCUS_EXPORT Shell3f : public Locus3f {
public:
    // ---- Factories ---------------------------------------------------

    /// Solid Euclidean sphere
    static ShellResult sphere(const QVector3D& center, float radius);

    /// Solid sphere, cube or octahedron, depending on the metric
    static ShellResult solid(Metric metric, const QVector3D& center, float radius);

    /// Axis-aligned solid with a radius per axis (ellipsoid, box, ...)
    static ShellResult solid(Metric metric, const QVector3D& center,
                             float xRadius, float yRadius, float zRadius);

    /// Oriented solid with a radius per local axis
    /// @param orientation Local-to-world rotation, or nullopt for none
    static ShellResult solid(Metric metric, const QVector3D& center,
                             const std::optional<QQuaternion>& orientation,
                             float uRadius, float vRadius, float wRadius);

    /// Infinite solid cylinder around an axis
    static ShellResult cylinder(const QVector3D& center, const QVector3D& axis,
                                float radius);

    /// Infinite slab of half-thickness radius, perpendicular to an axis
    static ShellResult slab(const QVector3D& center, const QVector3D& axis,
                            float radius);

    /// Euclidean spherical shell.  An infinite outer radius makes a hole.
    static ShellResult hollow(const QVector3D& center, float innerRadius,
                              float outerRadius);

    /// Fully general shell
    /// @param orientation Local-to-world rotation, or nullopt for none
    /// @param weights Per-axis weights (all positive), or nullopt for none
    static ShellResult general(Metric metric, const QVector3D& center,
                               const std::optional<QQuaternion>& orientation,
                               const std::optional<QVector3D>& weights,
                               float innerRadius, float outerRadius);

    // ---- Properties --------------------------------------------------

    Metric metric() const { return m_metric; }
    QVector3D center() const { return m_center; }
    std::optional<QQuaternion> orientation() const { return m_orientation; }
    std::optional<QVector3D> weights() const { return m_weights; }
    float innerRadius() const { return m_innerRadius; }
    float outerRadius() const { return m_outerRadius; }

    /// True if the shell has no hole (inner radius 0)
    bool isConvex() const { return m_innerRSquared == 0.0; }

    /// Copy of this shell centered elsewhere.  Fails for a non-finite center.
    ShellResult movedTo(const QVector3D& newCenter) const;

    /// Copy of this shell with a different orientation (nullopt for none).
    /// Fails for a non-finite or zero quaternion.
    ShellResult reoriented(const std::optional<QQuaternion>& newOrientation) const;

    // ---- Locus3f -----------------------------------------------------

    bool canMerge(const Locus3f& other) const override;
    QVector3D centroid() const override;
    bool contains(const QVector3D& location) const override;
    bool contains(const QVector3D& start, const QVector3D& end) const override;

    /// Nearest contained point, approximately.  Points outside the shell
    /// are scaled radially (in weighted local coordinates) onto the
    /// nearer surface.  Exact for spheres; a starting point for
    /// refinement for other shapes.
    QVector3D findLocation(const QVector3D& location) const override;

    MergeResult merge(const Locus3f& other) const override;
    QVector3D representative() const override;
    double score(const QVector3D& location) const override;
    PathResult shortestPath(const QVector3D& start, const QVector3D& goal,
                            int maxPoints) const override;
    SupportResult supportDistance(const QVector3D& location,
                                  float cosineTolerance) const override;

    /// e.g. "[Euclidean cen(0, 0, 0) ori=none wei=none 2.00<r<5.00]"
    QString describe() const override;

private:
    Shell3f(Metric metric, const QVector3D& center,
            const std::optional<QQuaternion>& orientation,
            const std::optional<QVector3D>& weights,
            float innerRadius, float outerRadius);

    static ShellResult axial(const QVector3D& center, const QVector3D& axis,
                             float radius, const QVector3D& weights,
                             const char* kind);

    void setOrientation(const std::optional<QQuaternion>& orientation);
    QVector3D toLocal(const QVector3D& location) const;
    QVector3D toWorld(const QVector3D& offset) const;
    double weightedSquaredValue(const QVector3D& location) const;
    double minSquaredValue(const QVector3D& start, const QVector3D& end) const;
    float maxWeight() const;

    Metric m_metric = Metric::Euclid;
    QVector3D m_center;
    std::optional<QQuaternion> m_orientation;
    std::optional<QQuaternion> m_inverseRotation;
    std::optional<QVector3D> m_weights;
    float m_innerRadius = 0.0f;
    float m_outerRadius = 0.0f;
    double m_innerRSquared = 0.0;
    double m_optimalRSquared = 0.0;
    double m_outerRSquared = 0.0;
};

/// Result of a Shell3f factory
struct ShellResult {
    bool success = false;
    std::optional<Shell3f> shell;
    QString errorMessage;
};

}  // namespace region
}  // namespace locus

#endif  // LOCUS_REGION_SHELL_H
