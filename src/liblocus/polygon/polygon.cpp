// =====================================================================
//  src/liblocus/polygon/polygon.cpp — Closed polygon in 3-D
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/polygon/polygon.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <limits>

namespace locus {
namespace polygon {

Polygon3f::Polygon3f(const QVector<QVector3D>& corners, float tolerance)
    : CornerSet3f(corners, tolerance)
{
    m_crossProducts.resize(m_numCorners);
    m_dotProducts.resize(m_numCorners);
    m_sideLengthSquared.resize(m_numCorners);

    for (int i = 0; i < m_numCorners; ++i) {
        int next = (i + 1) % m_numCorners;
        int prev = (i + m_numCorners - 1) % m_numCorners;
        QVector3D sideIn = m_corners[i] - m_corners[prev];
        QVector3D sideOut = m_corners[next] - m_corners[i];

        m_crossProducts[i] = geometry::cross(sideIn, sideOut);
        m_dotProducts[i] = geometry::dot(sideIn, sideOut);
        m_sideLengthSquared[i] = geometry::lengthSquared(sideOut);
    }

    m_isDegenerate = computeIsDegenerate();
}

// =====================================================================
//  Angles
// =====================================================================

double Polygon3f::absTurnAngle(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }

    double lsProduct = m_sideLengthSquared[prevIndex(cornerIndex)]
                     * m_sideLengthSquared[cornerIndex];
    if (lsProduct == 0.0) {
        return qQNaN();
    }

    double cosTurn = m_dotProducts[cornerIndex] / qSqrt(lsProduct);
    cosTurn = qBound(-1.0, cosTurn, 1.0);
    return qAcos(cosTurn);
}

QVector3D Polygon3f::crossProduct(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return QVector3D();
    }
    return m_crossProducts[cornerIndex];
}

double Polygon3f::dotProduct(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }
    return m_dotProducts[cornerIndex];
}

// =====================================================================
//  Sides
// =====================================================================

int Polygon3f::findLongest() const
{
    int result = -1;
    double longestSquared = -1.0;

    for (int i = 0; i < m_numCorners; ++i) {
        if (m_sideLengthSquared[i] > longestSquared) {
            longestSquared = m_sideLengthSquared[i];
            result = i;
        }
    }

    return result;
}

int Polygon3f::findShortest() const
{
    int result = -1;
    double shortestSquared = std::numeric_limits<double>::infinity();

    for (int i = 0; i < m_numCorners; ++i) {
        if (m_sideLengthSquared[i] < shortestSquared) {
            shortestSquared = m_sideLengthSquared[i];
            result = i;
        }
    }

    return result;
}

int Polygon3f::findSide(const QVector3D& location, QVector3D* storeClosest) const
{
    int result = -1;
    double bestSD = std::numeric_limits<double>::infinity();
    QVector3D bestClosest;

    for (int i = 0; i < m_numCorners; ++i) {
        QVector3D closest;
        double sd = geometry::squaredDistanceToSegment(
            location, m_corners[i], m_corners[nextIndex(i)], &closest);
        if (sd < bestSD) {
            bestSD = sd;
            bestClosest = closest;
            result = i;
        }
    }

    if (storeClosest && result >= 0) {
        *storeClosest = bestClosest;
    }
    return result;
}

QVector3D Polygon3f::midpoint(int sideIndex) const
{
    if (!validateIndex(sideIndex, "side index")) {
        return QVector3D();
    }
    return geometry::midpoint(m_corners[sideIndex], m_corners[nextIndex(sideIndex)]);
}

int Polygon3f::onSide(const QVector3D& location) const
{
    for (int i = 0; i < m_numCorners; ++i) {
        double sd = geometry::squaredDistanceToSegment(
            location, m_corners[i], m_corners[nextIndex(i)]);
        if (sd <= m_tolerance2) {
            return i;
        }
    }
    return -1;
}

bool Polygon3f::onSide(const QVector3D& location, int sideIndex) const
{
    if (!validateIndex(sideIndex, "side index")) {
        return false;
    }
    double sd = geometry::squaredDistanceToSegment(
        location, m_corners[sideIndex], m_corners[nextIndex(sideIndex)]);
    return sd <= m_tolerance2;
}

float Polygon3f::perimeter() const
{
    double sum = 0.0;
    for (double ls : m_sideLengthSquared) {
        sum += qSqrt(ls);
    }
    return float(sum);
}

float Polygon3f::sideLength(int sideIndex) const
{
    if (!validateIndex(sideIndex, "side index")) {
        return qQNaN();
    }
    return float(qSqrt(m_sideLengthSquared[sideIndex]));
}

double Polygon3f::squaredDistanceToSide(const QVector3D& location, int sideIndex,
                                        QVector3D* storeClosest) const
{
    if (!validateIndex(sideIndex, "side index")) {
        return qQNaN();
    }
    return geometry::squaredDistanceToSegment(
        location, m_corners[sideIndex], m_corners[nextIndex(sideIndex)], storeClosest);
}

bool Polygon3f::sharesSideWith(const Polygon3f& other,
                               BoolMatrix* storeSharedSides) const
{
    BoolMatrix cornerMap;
    if (!sharesCornerWith(other, &cornerMap)) {
        if (storeSharedSides) {
            storeSharedSides->fill(QVector<bool>(other.m_numCorners, false),
                                   m_numCorners);
        }
        return false;
    }

    BoolMatrix sideMap;
    sideMap.fill(QVector<bool>(other.m_numCorners, false), m_numCorners);

    // Side otherI shares a side with this polygon if both of its
    // corners are shared by adjacent corners here, in either order.
    bool result = false;
    for (int otherI = 0; otherI < other.m_numCorners; ++otherI) {
        int otherN = other.nextIndex(otherI);
        for (int thisI = 0; thisI < m_numCorners; ++thisI) {
            if (!cornerMap[thisI][otherI]) {
                continue;
            }
            int thisN = nextIndex(thisI);
            int thisP = prevIndex(thisI);
            if (cornerMap[thisN][otherN]) {
                sideMap[thisI][otherI] = true;
                result = true;
            }
            if (cornerMap[thisP][otherN]) {
                sideMap[thisP][otherI] = true;
                result = true;
            }
        }
    }

    if (storeSharedSides) {
        *storeSharedSides = sideMap;
    }
    return result;
}

// =====================================================================
//  Topology
// =====================================================================

int Polygon3f::nextIndex(int index) const
{
    if (!validateIndex(index, "index")) {
        return -1;
    }
    return (index + 1) % m_numCorners;
}

int Polygon3f::prevIndex(int index) const
{
    if (!validateIndex(index, "index")) {
        return -1;
    }
    return (index + m_numCorners - 1) % m_numCorners;
}

std::optional<Polygon3f> Polygon3f::fromRange(int firstIndex, int lastIndex) const
{
    if (!validateIndex(firstIndex, "first index")
        || !validateIndex(lastIndex, "last index")) {
        return std::nullopt;
    }
    if (firstIndex == lastIndex) {
        qCCritical(lcGeometry, "Polygon3f::fromRange: first and last index both %d",
                   firstIndex);
        return std::nullopt;
    }

    int count = (lastIndex - firstIndex + m_numCorners) % m_numCorners + 1;
    QVector<QVector3D> corners;
    corners.reserve(count);
    for (int i = 0; i < count; ++i) {
        corners.append(m_corners[(firstIndex + i) % m_numCorners]);
    }

    return Polygon3f(corners, m_tolerance);
}

bool Polygon3f::computeIsDegenerate() const
{
    if (m_numCorners < 3) {
        return true;
    }

    for (int i = 0; i < m_numCorners; ++i) {
        for (int j = i + 1; j < m_numCorners; ++j) {
            if (doCoincide(i, j)) {
                return true;
            }
        }
    }

    // A side that doubles back on its predecessor.
    for (int i = 0; i < m_numCorners; ++i) {
        double lsPrev = m_sideLengthSquared[prevIndex(i)];
        double lsCur = m_sideLengthSquared[i];
        if (m_dotProducts[i] < m_tolerance2 - qSqrt(lsPrev * lsCur)) {
            return true;
        }
    }

    return false;
}

}  // namespace polygon
}  // namespace locus
