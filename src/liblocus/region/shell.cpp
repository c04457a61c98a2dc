// =====================================================================
//  src/liblocus/region/shell.cpp — Metric shell region
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/region/shell.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <cmath>
#include <limits>

namespace locus {
namespace region {

namespace {

const QVector3D CYLINDER_WEIGHTS(0.0f, 1.0f, 1.0f);
const QVector3D SLAB_WEIGHTS(1.0f, 0.0f, 0.0f);

ShellResult failure(const QString& message)
{
    qCDebug(lcGeometry) << "Shell3f:" << message;
    ShellResult result;
    result.errorMessage = message;
    return result;
}

bool isPositiveFinite(float value)
{
    return std::isfinite(value) && value > 0.0f;
}

// Parameters in [0, 1] where the metric along a + t*d can reach its
// minimum.  Every metric is convex along a line, and Chebyshev and
// Manhattan are piecewise linear, so the minimum lies at an end, at a
// zero of a component or (Chebyshev) where two components match.
QVector<double> criticalParameters(Metric metric, const QVector3D& a, const QVector3D& d)
{
    QVector<double> result = {0.0, 1.0};
    auto consider = [&result](double numerator, double denominator) {
        if (denominator == 0.0) {
            return;
        }
        double t = numerator / denominator;
        if (t > 0.0 && t < 1.0) {
            result.append(t);
        }
    };

    switch (metric) {
    case Metric::Euclid:
        consider(-geometry::dot(a, d), geometry::dot(d, d));
        break;
    case Metric::Chebyshev:
        for (int i = 0; i < 3; ++i) {
            for (int j = i + 1; j < 3; ++j) {
                consider(double(a[j]) - a[i], double(d[i]) - d[j]);
                consider(-(double(a[i]) + a[j]), double(d[i]) + d[j]);
            }
        }
        Q_FALLTHROUGH();
    case Metric::Manhattan:
        for (int i = 0; i < 3; ++i) {
            consider(-double(a[i]), double(d[i]));
        }
        break;
    }
    return result;
}

bool isValidOrientation(const std::optional<QQuaternion>& orientation)
{
    if (!orientation) {
        return true;
    }
    const QQuaternion& q = *orientation;
    bool finite = std::isfinite(q.scalar()) && std::isfinite(q.x())
               && std::isfinite(q.y()) && std::isfinite(q.z());
    return finite && q.lengthSquared() > 0.0f;
}

QString quaternionString(const QQuaternion& q)
{
    return QStringLiteral("(%1, %2, %3, %4)")
        .arg(double(q.x())).arg(double(q.y())).arg(double(q.z())).arg(double(q.scalar()));
}

}  // anonymous namespace

// =====================================================================
//  Factories
// =====================================================================

ShellResult Shell3f::sphere(const QVector3D& center, float radius)
{
    return solid(Metric::Euclid, center, radius);
}

ShellResult Shell3f::solid(Metric metric, const QVector3D& center, float radius)
{
    return solid(metric, center, std::nullopt, radius, radius, radius);
}

ShellResult Shell3f::solid(Metric metric, const QVector3D& center,
                           float xRadius, float yRadius, float zRadius)
{
    return solid(metric, center, std::nullopt, xRadius, yRadius, zRadius);
}

ShellResult Shell3f::solid(Metric metric, const QVector3D& center,
                           const std::optional<QQuaternion>& orientation,
                           float uRadius, float vRadius, float wRadius)
{
    if (!geometry::isFinite(center)) {
        return failure(QStringLiteral("center must be finite"));
    }
    if (!isValidOrientation(orientation)) {
        return failure(QStringLiteral("orientation must be finite and nonzero"));
    }
    if (!isPositiveFinite(uRadius) || !isPositiveFinite(vRadius)
        || !isPositiveFinite(wRadius)) {
        return failure(QStringLiteral("radii must be positive and finite (%1, %2, %3)")
                           .arg(double(uRadius)).arg(double(vRadius)).arg(double(wRadius)));
    }

    std::optional<QVector3D> weights;
    float outerRadius = uRadius;
    if (uRadius != vRadius || vRadius != wRadius) {
        float maxRadius = qMax(uRadius, qMax(vRadius, wRadius));
        weights = QVector3D(maxRadius / uRadius, maxRadius / vRadius, maxRadius / wRadius);
        outerRadius = maxRadius;
    }

    ShellResult result;
    result.shell = Shell3f(metric, center, orientation, weights, 0.0f, outerRadius);
    result.shell->m_optimalRSquared = 0.0;
    result.success = true;
    return result;
}

ShellResult Shell3f::cylinder(const QVector3D& center, const QVector3D& axis,
                              float radius)
{
    return axial(center, axis, radius, CYLINDER_WEIGHTS, "cylinder");
}

ShellResult Shell3f::slab(const QVector3D& center, const QVector3D& axis,
                          float radius)
{
    return axial(center, axis, radius, SLAB_WEIGHTS, "slab");
}

// Local U runs along the axis; the weights drop one or two local axes
// from the metric.
ShellResult Shell3f::axial(const QVector3D& center, const QVector3D& axis,
                           float radius, const QVector3D& weights, const char* kind)
{
    if (!geometry::isFinite(center)) {
        return failure(QStringLiteral("center must be finite"));
    }
    std::optional<geometry::Basis3D> basis = geometry::generateBasis(axis);
    if (!basis) {
        return failure(QStringLiteral("%1 axis must be nonzero and finite")
                           .arg(QLatin1String(kind)));
    }
    if (!isPositiveFinite(radius)) {
        return failure(QStringLiteral("%1 radius must be positive and finite (%2)")
                           .arg(QLatin1String(kind)).arg(double(radius)));
    }

    QQuaternion orientation = QQuaternion::fromAxes(basis->u, basis->v, basis->w);

    ShellResult result;
    result.shell = Shell3f(Metric::Euclid, center, orientation, weights, 0.0f, radius);
    result.shell->m_optimalRSquared = 0.0;
    result.success = true;
    return result;
}

ShellResult Shell3f::hollow(const QVector3D& center, float innerRadius,
                            float outerRadius)
{
    return general(Metric::Euclid, center, std::nullopt, std::nullopt,
                   innerRadius, outerRadius);
}

ShellResult Shell3f::general(Metric metric, const QVector3D& center,
                             const std::optional<QQuaternion>& orientation,
                             const std::optional<QVector3D>& weights,
                             float innerRadius, float outerRadius)
{
    if (!geometry::isFinite(center)) {
        return failure(QStringLiteral("center must be finite"));
    }
    if (!isValidOrientation(orientation)) {
        return failure(QStringLiteral("orientation must be finite and nonzero"));
    }
    if (!std::isfinite(innerRadius) || innerRadius < 0.0f) {
        return failure(QStringLiteral("inner radius must be finite and non-negative (%1)")
                           .arg(double(innerRadius)));
    }
    if (!(outerRadius >= innerRadius)) {
        qCCritical(lcGeometry, "Shell3f: innerRadius=%g, outerRadius=%g",
                   double(innerRadius), double(outerRadius));
        return failure(QStringLiteral("inner radius must not exceed outer radius"));
    }
    if (weights) {
        for (int axis = 0; axis < 3; ++axis) {
            if (!isPositiveFinite((*weights)[axis])) {
                return failure(QStringLiteral("weights must be positive and finite %1")
                                   .arg(geometry::toString(*weights)));
            }
        }
    }

    double thickness = double(outerRadius) - innerRadius;
    if (thickness < geometry::THIN_SHELL_RATIO * value(Metric::Chebyshev, center)) {
        qCWarning(lcGeometry, "Shell3f: perilously thin shell (%g thick at %s)",
                  thickness, qPrintable(geometry::toString(center)));
    }

    ShellResult result;
    result.shell = Shell3f(metric, center, orientation, weights, innerRadius, outerRadius);
    result.success = true;
    return result;
}

Shell3f::Shell3f(Metric metric, const QVector3D& center,
                 const std::optional<QQuaternion>& orientation,
                 const std::optional<QVector3D>& weights,
                 float innerRadius, float outerRadius)
    : m_metric(metric)
    , m_center(center)
    , m_weights(weights)
    , m_innerRadius(innerRadius)
    , m_outerRadius(outerRadius)
{
    setOrientation(orientation);

    m_innerRSquared = double(innerRadius) * innerRadius;
    m_outerRSquared = double(outerRadius) * outerRadius;
    if (std::isinf(outerRadius)) {
        m_optimalRSquared = std::numeric_limits<double>::infinity();
    } else {
        double optimalRadius = 0.5 * (double(innerRadius) + outerRadius);
        m_optimalRSquared = optimalRadius * optimalRadius;
    }
}

// =====================================================================
//  Copies
// =====================================================================

ShellResult Shell3f::movedTo(const QVector3D& newCenter) const
{
    ShellResult result;
    if (!geometry::isFinite(newCenter)) {
        qCCritical(lcGeometry) << "Shell3f::movedTo: non-finite center"
                               << geometry::toString(newCenter);
        result.errorMessage = QStringLiteral("center must be finite");
        return result;
    }

    result.shell = *this;
    result.shell->m_center = newCenter;
    result.success = true;
    return result;
}

ShellResult Shell3f::reoriented(const std::optional<QQuaternion>& newOrientation) const
{
    ShellResult result;
    if (!isValidOrientation(newOrientation)) {
        qCCritical(lcGeometry, "Shell3f::reoriented: invalid orientation");
        result.errorMessage = QStringLiteral("orientation must be finite and nonzero");
        return result;
    }

    result.shell = *this;
    result.shell->setOrientation(newOrientation);
    result.success = true;
    return result;
}

// =====================================================================
//  Locus3f
// =====================================================================

bool Shell3f::canMerge(const Locus3f& /*other*/) const
{
    return false;
}

QVector3D Shell3f::centroid() const
{
    return m_center;
}

bool Shell3f::contains(const QVector3D& location) const
{
    double squaredValue = weightedSquaredValue(location);
    return squaredValue >= m_innerRSquared && squaredValue <= m_outerRSquared;
}

bool Shell3f::contains(const QVector3D& start, const QVector3D& end) const
{
    // The outer bound is convex, so the ends decide it.
    if (!contains(start) || !contains(end)) {
        return false;
    }
    if (isConvex()) {
        return true;
    }
    return minSquaredValue(start, end) >= m_innerRSquared;
}

QVector3D Shell3f::findLocation(const QVector3D& location) const
{
    QVector3D unweighted = toLocal(location);
    QVector3D offset = m_weights ? unweighted * *m_weights : unweighted;
    double squaredValue = region::squaredValue(m_metric, offset);

    if (squaredValue == 0.0 && m_innerRadius > 0.0f) {
        // At the center of a hole every direction is equally good.
        // Pick a point halfway out along the most heavily weighted axis.
        float r = m_innerRadius / 2.0f;
        unweighted = QVector3D();
        if (!m_weights) {
            unweighted.setX(r);
            offset = unweighted;
        } else {
            int axis = geometry::maxAxis(*m_weights);
            unweighted[axis] = r / (*m_weights)[axis];
            offset = unweighted * *m_weights;
        }
        squaredValue = region::squaredValue(m_metric, offset);
    }

    // The fuzz keeps the projected point inside despite rounding, and
    // grows when the center is far from the origin.
    double centerMagnitude = value(Metric::Chebyshev, m_center);
    double scaleFactor;
    if (squaredValue < m_innerRSquared) {
        double ratio = centerMagnitude / (m_innerRadius / maxWeight());
        double fuzz = geometry::SHELL_PROJECTION_FUZZ * qMax(1.0, ratio);
        scaleFactor = (1.0 + fuzz) * qSqrt(m_innerRSquared / squaredValue);
    } else if (squaredValue > m_outerRSquared) {
        double ratio = centerMagnitude / (m_outerRadius / maxWeight());
        double fuzz = geometry::SHELL_PROJECTION_FUZZ * qMax(1.0, ratio);
        scaleFactor = qSqrt(m_outerRSquared / squaredValue) / (1.0 + fuzz);
    } else {
        return location;
    }

    QVector3D result = offset * float(scaleFactor);
    if (m_weights) {
        for (int axis = 0; axis < 3; ++axis) {
            float weight = (*m_weights)[axis];
            if (weight != 0.0f) {
                result[axis] /= weight;
            } else {
                result[axis] = unweighted[axis];
            }
        }
    }

    return toWorld(result);
}

MergeResult Shell3f::merge(const Locus3f& /*other*/) const
{
    MergeResult result;
    result.errorMessage = QStringLiteral("shells cannot be merged");
    return result;
}

QVector3D Shell3f::representative() const
{
    if (isConvex()) {
        return m_center;
    }

    // A point on the inner surface.
    QVector3D local;
    if (!m_weights) {
        if (m_metric == Metric::Manhattan) {
            float coord = m_innerRadius / 3.0f;
            local = QVector3D(coord, coord, coord);
        } else {
            local.setX(m_innerRadius);
        }
    } else if (m_metric == Metric::Manhattan) {
        const QVector3D& w = *m_weights;
        float coord = m_innerRadius / (w.x() + w.y() + w.z());
        local = QVector3D(coord, coord, coord);
    } else {
        int axis = geometry::maxAxis(*m_weights);
        local[axis] = m_innerRadius / (*m_weights)[axis];
    }

    QVector3D result = toWorld(local);
    if (!contains(result)) {
        result = findLocation(result);
    }
    return result;
}

double Shell3f::score(const QVector3D& location) const
{
    double squaredValue = weightedSquaredValue(location);

    if (std::isinf(m_optimalRSquared)) {
        return squaredValue;
    } else if (squaredValue >= m_optimalRSquared) {
        return m_optimalRSquared - squaredValue;
    }
    return qAbs(m_optimalRSquared - squaredValue);
}

PathResult Shell3f::shortestPath(const QVector3D& start, const QVector3D& goal,
                                 int maxPoints) const
{
    PathResult result;

    if (maxPoints < 2) {
        qCCritical(lcGeometry, "Shell3f::shortestPath: maxPoints %d < 2", maxPoints);
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("a path needs at least 2 points");
        return result;
    }
    if (!isConvex()) {
        result.supported = false;
        result.errorMessage = QStringLiteral("path search not supported for hollow shells");
        return result;
    }
    if (!contains(start) || !contains(goal)) {
        qCCritical(lcGeometry, "Shell3f::shortestPath: endpoint not in shell");
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("start and goal must lie in the shell");
        return result;
    }

    result.path = spline::LinearSpline3f({start, goal});
    result.success = true;
    return result;
}

SupportResult Shell3f::supportDistance(const QVector3D& /*location*/,
                                       float cosineTolerance) const
{
    SupportResult result;
    if (!(cosineTolerance >= 0.0f && cosineTolerance <= 1.0f)) {
        qCCritical(lcGeometry, "Shell3f::supportDistance: cosine tolerance %g "
                   "outside [0, 1]", double(cosineTolerance));
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("cosine tolerance must lie in [0, 1]");
        return result;
    }
    result.errorMessage = QStringLiteral("shells do not provide support");
    return result;
}

QString Shell3f::describe() const
{
    QString orientation = m_orientation ? quaternionString(*m_orientation)
                                        : QStringLiteral("none");
    QString weights = m_weights ? geometry::toString(*m_weights)
                                : QStringLiteral("none");

    return QStringLiteral("[%1 cen%2 ori=%3 wei=%4 %5<r<%6]")
        .arg(region::describe(m_metric))
        .arg(geometry::toString(m_center))
        .arg(orientation)
        .arg(weights)
        .arg(double(m_innerRadius), 0, 'f', 2)
        .arg(double(m_outerRadius), 0, 'f', 2);
}

// =====================================================================
//  Private Helpers
// =====================================================================

void Shell3f::setOrientation(const std::optional<QQuaternion>& orientation)
{
    if (!orientation) {
        m_orientation.reset();
        m_inverseRotation.reset();
        return;
    }
    m_orientation = orientation->normalized();
    m_inverseRotation = m_orientation->inverted();
}

// Offset from the center in local (unrotated, unweighted) coordinates
QVector3D Shell3f::toLocal(const QVector3D& location) const
{
    QVector3D offset = location - m_center;
    if (m_inverseRotation) {
        offset = m_inverseRotation->rotatedVector(offset);
    }
    return offset;
}

QVector3D Shell3f::toWorld(const QVector3D& offset) const
{
    QVector3D result = offset;
    if (m_orientation) {
        result = m_orientation->rotatedVector(result);
    }
    return result + m_center;
}

double Shell3f::weightedSquaredValue(const QVector3D& location) const
{
    QVector3D offset = toLocal(location);
    if (m_weights) {
        offset *= *m_weights;
    }
    return region::squaredValue(m_metric, offset);
}

// Smallest weighted squared value along a segment
double Shell3f::minSquaredValue(const QVector3D& start, const QVector3D& end) const
{
    QVector3D a = toLocal(start);
    QVector3D b = toLocal(end);
    if (m_weights) {
        a *= *m_weights;
        b *= *m_weights;
    }
    QVector3D d = b - a;

    double result = std::numeric_limits<double>::infinity();
    for (double t : criticalParameters(m_metric, a, d)) {
        QVector3D offset = geometry::lerp(a, b, t);
        result = qMin(result, region::squaredValue(m_metric, offset));
    }
    return result;
}

float Shell3f::maxWeight() const
{
    if (!m_weights) {
        return 1.0f;
    }
    return geometry::maxComponent(*m_weights);
}

}  // namespace region
}  // namespace locus
