// =====================================================================
//  src/liblocus/region/segment.cpp — Line-segment region
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/region/segment.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <cmath>

namespace locus {
namespace region {

Segment3f::Segment3f(const QVector3D& corner0, const QVector3D& corner1,
                     float tolerance)
    : m_corners{corner0, corner1}
    , m_tolerance(tolerance)
{
    if (!std::isfinite(tolerance) || tolerance < 0.0f) {
        qCWarning(lcGeometry, "Segment3f: invalid tolerance %g replaced by 0",
                  double(tolerance));
        m_tolerance = 0.0f;
    }
    m_tolerance2 = double(m_tolerance) * m_tolerance;
}

// =====================================================================
//  Corners
// =====================================================================

QVector3D Segment3f::copyCornerLocation(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return QVector3D();
    }
    return m_corners[cornerIndex];
}

bool Segment3f::doCoincide() const
{
    return geometry::doCoincide(m_corners[0], m_corners[1], m_tolerance2);
}

int Segment3f::findCorner(const QVector3D& location) const
{
    double sd0 = geometry::distanceSquared(location, m_corners[0]);
    double sd1 = geometry::distanceSquared(location, m_corners[1]);
    return sd0 > sd1 ? 1 : 0;
}

int Segment3f::onCorner(const QVector3D& location) const
{
    for (int i = 0; i < 2; ++i) {
        if (geometry::doCoincide(location, m_corners[i], m_tolerance2)) {
            return i;
        }
    }
    return -1;
}

bool Segment3f::onCorner(const QVector3D& location, int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return false;
    }
    return geometry::doCoincide(location, m_corners[cornerIndex], m_tolerance2);
}

bool Segment3f::sharesCornerWith(const Segment3f& other,
                                 QMap<int, int>* storeCornerMap) const
{
    if (storeCornerMap) {
        storeCornerMap->clear();
    }

    double tolerance2 = (m_tolerance2 + other.m_tolerance2) / 2.0;

    bool result = false;
    for (int otherI = 0; otherI < 2; ++otherI) {
        for (int thisI = 0; thisI < 2; ++thisI) {
            if (geometry::doCoincide(other.m_corners[otherI], m_corners[thisI],
                                     tolerance2)) {
                result = true;
                if (storeCornerMap) {
                    storeCornerMap->insert(thisI, otherI);
                }
            }
        }
    }

    return result;
}

double Segment3f::squaredDistanceToCorner(const QVector3D& location,
                                          int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }
    return geometry::distanceSquared(location, m_corners[cornerIndex]);
}

// =====================================================================
//  Measures
// =====================================================================

float Segment3f::length() const
{
    return float(geometry::length(m_corners[1] - m_corners[0]));
}

double Segment3f::squaredDistance(const QVector3D& location,
                                  QVector3D* storeClosest) const
{
    return geometry::squaredDistanceToSegment(location, m_corners[0], m_corners[1],
                                              storeClosest);
}

// =====================================================================
//  Locus3f
// =====================================================================

bool Segment3f::canMerge(const Locus3f& /*other*/) const
{
    return false;
}

QVector3D Segment3f::centroid() const
{
    return geometry::midpoint(m_corners[0], m_corners[1]);
}

bool Segment3f::contains(const QVector3D& location) const
{
    return squaredDistance(location) <= m_tolerance2;
}

bool Segment3f::contains(const QVector3D& start, const QVector3D& end) const
{
    // The region is convex.
    return contains(start) && contains(end);
}

QVector3D Segment3f::findLocation(const QVector3D& location) const
{
    if (contains(location)) {
        return location;
    }
    QVector3D closest;
    squaredDistance(location, &closest);
    return closest;
}

MergeResult Segment3f::merge(const Locus3f& /*other*/) const
{
    MergeResult result;
    result.errorMessage = QStringLiteral("segments cannot be merged");
    return result;
}

QVector3D Segment3f::representative() const
{
    return centroid();
}

double Segment3f::score(const QVector3D& location) const
{
    return -squaredDistance(location);
}

PathResult Segment3f::shortestPath(const QVector3D& start, const QVector3D& goal,
                                   int maxPoints) const
{
    PathResult result;

    if (maxPoints < 2) {
        qCCritical(lcGeometry, "Segment3f::shortestPath: maxPoints %d < 2", maxPoints);
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("a path needs at least 2 points");
        return result;
    }
    if (!contains(start) || !contains(goal)) {
        qCCritical(lcGeometry, "Segment3f::shortestPath: endpoint not on segment");
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("start and goal must lie on the segment");
        return result;
    }

    result.path = spline::LinearSpline3f({start, goal});
    result.success = true;
    return result;
}

SupportResult Segment3f::supportDistance(const QVector3D& /*location*/,
                                         float cosineTolerance) const
{
    SupportResult result;
    if (!(cosineTolerance >= 0.0f && cosineTolerance <= 1.0f)) {
        qCCritical(lcGeometry, "Segment3f::supportDistance: cosine tolerance %g "
                   "outside [0, 1]", double(cosineTolerance));
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("cosine tolerance must lie in [0, 1]");
        return result;
    }
    result.errorMessage = QStringLiteral("segments do not provide support");
    return result;
}

QString Segment3f::describe() const
{
    return QStringLiteral("Segment3f[%1 to %2 tol=%3]")
        .arg(geometry::toString(m_corners[0]))
        .arg(geometry::toString(m_corners[1]))
        .arg(double(m_tolerance), 0, 'g', 3);
}

bool Segment3f::validateIndex(int index, const char* description) const
{
    if (index < 0 || index > 1) {
        qCCritical(lcGeometry, "Segment3f: %s %d out of range [0, 1]", description, index);
        return false;
    }
    return true;
}

}  // namespace region
}  // namespace locus
