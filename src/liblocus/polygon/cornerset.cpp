// =====================================================================
//  src/liblocus/polygon/cornerset.cpp — Set of 3-D corner points
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/polygon/cornerset.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <cmath>
#include <limits>

namespace locus {
namespace polygon {

CornerSet3f::CornerSet3f(const QVector<QVector3D>& corners, float tolerance)
    : m_corners(corners)
    , m_numCorners(int(corners.size()))
    , m_tolerance(tolerance)
{
    if (!std::isfinite(tolerance) || tolerance < 0.0f) {
        qCWarning(lcGeometry, "CornerSet3f: invalid tolerance %g replaced by 0",
                  double(tolerance));
        m_tolerance = 0.0f;
    }
    m_tolerance2 = double(m_tolerance) * m_tolerance;

    m_squaredDistances.resize(m_numCorners * m_numCorners);
    for (int i = 0; i < m_numCorners; ++i) {
        m_squaredDistances[i * m_numCorners + i] = 0.0;
        for (int j = i + 1; j < m_numCorners; ++j) {
            double sd = geometry::distanceSquared(m_corners[i], m_corners[j]);
            m_squaredDistances[i * m_numCorners + j] = sd;
            m_squaredDistances[j * m_numCorners + i] = sd;
        }
    }

    m_largestTriangle = computeLargestTriangle();
    m_isPlanar = computeIsPlanar();
}

// =====================================================================
//  Corners
// =====================================================================

QVector3D CornerSet3f::copyCornerLocation(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return QVector3D();
    }
    return m_corners[cornerIndex];
}

// =====================================================================
//  Queries
// =====================================================================

float CornerSet3f::diameter() const
{
    double largestSD = 0.0;
    for (double sd : m_squaredDistances) {
        largestSD = qMax(largestSD, sd);
    }
    return float(qSqrt(largestSD));
}

int CornerSet3f::findCorner(const QVector3D& location) const
{
    int result = -1;
    double bestSD = std::numeric_limits<double>::infinity();

    for (int i = 0; i < m_numCorners; ++i) {
        double sd = geometry::distanceSquared(location, m_corners[i]);
        if (sd < bestSD) {
            bestSD = sd;
            result = i;
        }
    }

    return result;
}

int CornerSet3f::onCorner(const QVector3D& location) const
{
    for (int i = 0; i < m_numCorners; ++i) {
        if (geometry::doCoincide(location, m_corners[i], m_tolerance2)) {
            return i;
        }
    }
    return -1;
}

bool CornerSet3f::onCorner(const QVector3D& location, int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return false;
    }
    return geometry::doCoincide(location, m_corners[cornerIndex], m_tolerance2);
}

bool CornerSet3f::sharesCornerWith(const CornerSet3f& other,
                                   BoolMatrix* storeSharedCorners) const
{
    if (other.m_tolerance != m_tolerance) {
        qCCritical(lcGeometry, "CornerSet3f: tolerance mismatch (%g vs %g)",
                   double(m_tolerance), double(other.m_tolerance));
        return false;
    }

    if (storeSharedCorners) {
        storeSharedCorners->fill(QVector<bool>(other.m_numCorners, false),
                                 m_numCorners);
    }

    bool result = false;
    for (int i = 0; i < m_numCorners; ++i) {
        for (int j = 0; j < other.m_numCorners; ++j) {
            if (geometry::doCoincide(m_corners[i], other.m_corners[j], m_tolerance2)) {
                result = true;
                if (!storeSharedCorners) {
                    return true;
                }
                (*storeSharedCorners)[i][j] = true;
            }
        }
    }

    return result;
}

double CornerSet3f::squaredDistanceToCorner(const QVector3D& location,
                                            int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }
    return geometry::distanceSquared(location, m_corners[cornerIndex]);
}

// =====================================================================
//  Protected Helpers
// =====================================================================

bool CornerSet3f::allCollinear(int cornerIndex1, int cornerIndex2,
                               const QVector<int>& subset) const
{
    if (!validateIndex(cornerIndex1, "corner index")
        || !validateIndex(cornerIndex2, "corner index")) {
        return false;
    }

    QVector<QVector3D> middle;
    middle.reserve(subset.size());
    for (int index : subset) {
        if (!validateIndex(index, "corner index")) {
            return false;
        }
        middle.append(m_corners[index]);
    }

    return geometry::allCollinear(m_corners[cornerIndex1], m_corners[cornerIndex2],
                                  middle, m_tolerance2);
}

bool CornerSet3f::doCoincide(int cornerIndex1, int cornerIndex2) const
{
    if (!validateIndex(cornerIndex1, "corner index")
        || !validateIndex(cornerIndex2, "corner index")) {
        return false;
    }
    return squaredDistance(cornerIndex1, cornerIndex2) <= m_tolerance2;
}

geometry::IndexPair CornerSet3f::mostDistant(const QVector<int>& subset) const
{
    geometry::IndexPair result;
    double largestSD = -1.0;

    for (int i = 0; i < subset.size(); ++i) {
        for (int j = i + 1; j < subset.size(); ++j) {
            double sd = squaredDistance(subset[i], subset[j]);
            if (sd > largestSD) {
                largestSD = sd;
                result.first = subset[i];
                result.second = subset[j];
            }
        }
    }

    return result;
}

double CornerSet3f::squaredArea(int indexA, int indexB, int indexC) const
{
    if (!validateIndex(indexA, "corner index") || !validateIndex(indexB, "corner index")
        || !validateIndex(indexC, "corner index")) {
        return qQNaN();
    }

    const QVector3D& a = m_corners[indexA];
    QVector3D ab = m_corners[indexB] - a;
    QVector3D ac = m_corners[indexC] - a;
    return geometry::lengthSquared(geometry::cross(ab, ac)) / 4.0;
}

double CornerSet3f::squaredDistance(int cornerIndex1, int cornerIndex2) const
{
    if (!validateIndex(cornerIndex1, "corner index")
        || !validateIndex(cornerIndex2, "corner index")) {
        return qQNaN();
    }
    return m_squaredDistances[cornerIndex1 * m_numCorners + cornerIndex2];
}

bool CornerSet3f::validateIndex(int index, const char* description) const
{
    if (index < 0 || index >= m_numCorners) {
        qCCritical(lcGeometry, "%s %d out of range [0, %d)", description, index,
                   m_numCorners);
        return false;
    }
    return true;
}

// =====================================================================
//  Construction-time Caches
// =====================================================================

bool CornerSet3f::computeIsPlanar() const
{
    if (m_numCorners < 4) {
        return true;
    }

    // Common case: every corner at the same height.
    float y0 = m_corners[0].y();
    bool sameY = true;
    for (const QVector3D& corner : m_corners) {
        if (qAbs(corner.y() - y0) > m_tolerance) {
            sameY = false;
            break;
        }
    }
    if (sameY) {
        return true;
    }

    if (!m_largestTriangle) {
        return true;
    }
    const CornerTriple& tri = *m_largestTriangle;
    const QVector3D& a = m_corners[tri[0]];
    QVector3D crossProduct = geometry::cross(m_corners[tri[1]] - a,
                                             m_corners[tri[2]] - a);
    if (geometry::lengthSquared(crossProduct) == 0.0) {
        // All corners lie on a line.
        return true;
    }

    QVector3D normal = crossProduct / float(geometry::length(crossProduct));
    double planeConstant = -geometry::dot(normal, a);
    for (const QVector3D& corner : m_corners) {
        double pd = geometry::dot(normal, corner) + planeConstant;
        if (pd * pd > m_tolerance2) {
            return false;
        }
    }

    return true;
}

std::optional<CornerTriple> CornerSet3f::computeLargestTriangle() const
{
    if (m_numCorners < 3) {
        return std::nullopt;
    }

    CornerTriple result = {0, 1, 2};
    double largestSA = -1.0;
    for (int i = 0; i < m_numCorners; ++i) {
        for (int j = i + 1; j < m_numCorners; ++j) {
            for (int k = j + 1; k < m_numCorners; ++k) {
                double sa = squaredArea(i, j, k);
                if (sa > largestSA) {
                    largestSA = sa;
                    result = {i, j, k};
                }
            }
        }
    }

    return result;
}

}  // namespace polygon
}  // namespace locus
