// =====================================================================
//  src/liblocus/polygon/simplepolygon.cpp — Simple planar polygon
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/polygon/simplepolygon.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <cmath>
#include <limits>

namespace locus {
namespace polygon {

namespace {

// Segment containment gives up splitting after this many levels and
// decides by the midpoint.
constexpr int MAX_SPLIT_DEPTH = 40;

// Index of the first set entry in a matrix row, or -1
int firstSet(const QVector<bool>& row)
{
    for (int i = 0; i < row.size(); ++i) {
        if (row[i]) {
            return i;
        }
    }
    return -1;
}

// 2-D cross product of planar offsets
double planarCross(const QVector2D& a, const QVector2D& b)
{
    return double(a.x()) * b.y() - double(a.y()) * b.x();
}

// Ray casting on planar offsets
bool pointInPlanarPolygon(const QVector2D& point, const QVector<QVector2D>& polygon)
{
    bool inside = false;
    int n = int(polygon.size());

    for (int i = 0, j = n - 1; i < n; j = i++) {
        double xi = polygon[i].x(), yi = polygon[i].y();
        double xj = polygon[j].x(), yj = polygon[j].y();

        if (((yi > point.y()) != (yj > point.y())) &&
            (point.x() < (xj - xi) * (point.y() - yi) / (yj - yi) + xi)) {
            inside = !inside;
        }
    }

    return inside;
}

}  // anonymous namespace

// =====================================================================
//  Construction
// =====================================================================

SimplePolygonResult SimplePolygon3f::create(const QVector<QVector3D>& corners,
                                            float tolerance)
{
    GenericPolygonResult generic = GenericPolygon3f::create(corners, tolerance);
    if (!generic.success) {
        SimplePolygonResult result;
        result.errorMessage = generic.errorMessage;
        return result;
    }
    return fromGeneric(*generic.polygon);
}

SimplePolygonResult SimplePolygon3f::fromGeneric(const GenericPolygon3f& generic)
{
    SimplePolygonResult result;

    if (!generic.isPlanar()) {
        result.errorMessage = QStringLiteral("non-planar polygon");
    } else if (generic.isSelfIntersecting()) {
        result.errorMessage = QStringLiteral("self-intersecting polygon");
    }
    if (!result.errorMessage.isEmpty()) {
        qCDebug(lcGeometry) << "SimplePolygon3f:" << result.errorMessage
                            << "with" << generic.numCorners() << "corners";
        return result;
    }

    GenericPolygon3f copy(generic);
    result.polygon = SimplePolygon3f(std::move(copy));
    result.success = true;
    return result;
}

SimplePolygon3f::SimplePolygon3f(GenericPolygon3f&& base)
    : GenericPolygon3f(std::move(base))
{
    setPlane();

    double sumX = 0.0;
    double sumZ = 0.0;
    for (int i = 0; i < m_numCorners; ++i) {
        const QVector2D& p1 = m_planarOffsets[i];
        const QVector2D& p2 = m_planarOffsets[nextIndex(i)];
        double cross = planarCross(p1, p2);
        sumX += (double(p1.x()) + p2.x()) * cross;
        sumZ += (double(p1.y()) + p2.y()) * cross;
    }
    m_planarCentroid = QVector2D(float(sumX / (6.0 * m_signedArea)),
                                 float(sumZ / (6.0 * m_signedArea)));

    m_isConvex = true;
    for (int i = 0; i < m_numCorners; ++i) {
        if (!(geometry::dot(m_planeNormal, crossProduct(i)) >= 0.0)) {
            m_isConvex = false;
            break;
        }
    }
}

// Fit the plane to the largest triangle, then orient the normal so the
// corners wind counter-clockwise about it.
void SimplePolygon3f::setPlane()
{
    const CornerTriple tri = *largestTriangle();
    const QVector3D& a = m_corners[tri[0]];
    const QVector3D& b = m_corners[tri[1]];
    const QVector3D& c = m_corners[tri[2]];
    QVector3D offsetB = b - a;
    QVector3D offsetC = c - b;

    m_planeNormal = geometry::normalize(geometry::cross(offsetB, offsetC));
    m_xBasis = geometry::normalize(offsetB);
    m_zBasis = geometry::cross(m_planeNormal, m_xBasis);

    auto computeOffsets = [this]() {
        m_planarOffsets.resize(m_numCorners);
        double total = 0.0;
        for (int i = 0; i < m_numCorners; ++i) {
            m_planarOffsets[i] = toPlanar(m_corners[i]);
        }
        for (int i = 0; i < m_numCorners; ++i) {
            total += planarCross(m_planarOffsets[i],
                                 m_planarOffsets[(i + 1) % m_numCorners]);
        }
        m_signedArea = 0.5 * total;
    };

    computeOffsets();
    if (m_signedArea < 0.0) {
        m_planeNormal = -m_planeNormal;
        m_zBasis = -m_zBasis;
        computeOffsets();
    }

    m_planeConstant = float(-geometry::dot(m_planeNormal, a));
}

// =====================================================================
//  Plane
// =====================================================================

bool SimplePolygon3f::inPlane(const QVector3D& point) const
{
    double pseudoDistance = geometry::dot(m_planeNormal, point) + m_planeConstant;
    return pseudoDistance * pseudoDistance <= m_tolerance2;
}

// In-plane coordinates of a point, relative to corner 0
QVector2D SimplePolygon3f::toPlanar(const QVector3D& point) const
{
    QVector3D offset = point - m_corners[0];
    return QVector2D(float(geometry::dot(offset, m_xBasis)),
                     float(geometry::dot(offset, m_zBasis)));
}

QVector2D SimplePolygon3f::planarOffset(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return QVector2D();
    }
    return m_planarOffsets[cornerIndex];
}

// =====================================================================
//  Shape
// =====================================================================

double SimplePolygon3f::turnAngle(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }
    double magnitude = absTurnAngle(cornerIndex);
    double sign = geometry::dot(m_planeNormal, crossProduct(cornerIndex));
    return std::copysign(magnitude, sign);
}

double SimplePolygon3f::interiorAngle(int cornerIndex) const
{
    if (!validateIndex(cornerIndex, "corner index")) {
        return qQNaN();
    }
    return M_PI - turnAngle(cornerIndex);
}

// =====================================================================
//  Locus3f
// =====================================================================

bool SimplePolygon3f::canMerge(const region::Locus3f& other) const
{
    const SimplePolygon3f* otherPolygon = dynamic_cast<const SimplePolygon3f*>(&other);
    if (!otherPolygon || otherPolygon->tolerance() != m_tolerance) {
        return false;
    }

    std::optional<QVector<QVector3D>> corners = mergeCorners(*otherPolygon);
    if (!corners) {
        return false;
    }
    return create(*corners, m_tolerance).success;
}

QVector3D SimplePolygon3f::centroid() const
{
    return m_corners[0] + m_xBasis * m_planarCentroid.x()
                        + m_zBasis * m_planarCentroid.y();
}

bool SimplePolygon3f::contains(const QVector3D& location) const
{
    if (!inPlane(location)) {
        return false;
    }

    QVector3D closest;
    findSide(location, &closest);
    if (geometry::doCoincide(location, closest, m_tolerance2)) {
        return true;
    }

    return pointInPlanarPolygon(toPlanar(location), m_planarOffsets);
}

bool SimplePolygon3f::contains(const QVector3D& start, const QVector3D& end) const
{
    return containsSegment(start, end, 0);
}

bool SimplePolygon3f::containsSegment(const QVector3D& start, const QVector3D& end,
                                      int depth) const
{
    if (!contains(start) || !contains(end)) {
        return false;
    }
    if (m_isConvex) {
        return true;
    }

    for (int side = 0; side < m_numCorners; ++side) {
        if (onSide(start, side) && onSide(end, side)) {
            return true;
        }
    }

    std::optional<QVector3D> joint = intersectionWithPerimeter(start, end);
    if (!joint) {
        // Never crosses the perimeter.
        return true;
    }

    if (depth >= MAX_SPLIT_DEPTH) {
        qCDebug(lcGeometry) << "SimplePolygon3f: segment split limit reached";
        return contains(geometry::midpoint(start, end));
    }

    // Split where the segment meets the perimeter, unless that is an
    // end, in which case split in the middle.
    QVector3D split = *joint;
    if (geometry::doCoincide(start, split, m_tolerance2)
        || geometry::doCoincide(end, split, m_tolerance2)) {
        split = geometry::midpoint(start, end);
    }

    return containsSegment(start, split, depth + 1)
        && containsSegment(split, end, depth + 1);
}

QVector3D SimplePolygon3f::findLocation(const QVector3D& location) const
{
    if (contains(location)) {
        return location;
    }

    QVector3D result = location;
    if (!inPlane(result)) {
        double pseudoDistance = geometry::dot(m_planeNormal, location) + m_planeConstant;
        result = location - m_planeNormal * float(pseudoDistance);
        if (contains(result)) {
            return result;
        }
    }

    QVector3D closest;
    findSide(result, &closest);
    return closest;
}

region::MergeResult SimplePolygon3f::merge(const region::Locus3f& other) const
{
    region::MergeResult result;

    const SimplePolygon3f* otherPolygon = dynamic_cast<const SimplePolygon3f*>(&other);
    if (!otherPolygon) {
        result.errorMessage = QStringLiteral("can only merge with another simple polygon");
        return result;
    }
    if (otherPolygon->tolerance() != m_tolerance) {
        result.errorMessage = QStringLiteral("tolerances differ");
        return result;
    }

    std::optional<QVector<QVector3D>> corners = mergeCorners(*otherPolygon);
    if (!corners) {
        result.errorMessage = QStringLiteral("polygons share no side in compatible planes");
        return result;
    }

    SimplePolygonResult merged = create(*corners, m_tolerance);
    if (!merged.success) {
        result.errorMessage = QStringLiteral("merged polygon is invalid: %1")
                                  .arg(merged.errorMessage);
        return result;
    }

    result.locus = std::make_shared<SimplePolygon3f>(*merged.polygon);
    result.success = true;
    return result;
}

QVector3D SimplePolygon3f::representative() const
{
    QVector3D center = centroid();
    if (contains(center)) {
        return center;
    }

    QVector3D closest;
    findSide(center, &closest);
    return closest;
}

double SimplePolygon3f::score(const QVector3D& location) const
{
    double pseudoDistance = geometry::dot(m_planeNormal, location) + m_planeConstant;
    double squaredPD = pseudoDistance * pseudoDistance;

    if (squaredPD > m_tolerance2) {
        QVector3D projection = location - m_planeNormal * float(pseudoDistance);
        return score(projection) + squaredPD;
    }

    QVector3D closest;
    findSide(location, &closest);
    double distanceSquared = geometry::distanceSquared(location, closest);
    return contains(location) ? distanceSquared : -distanceSquared;
}

region::PathResult SimplePolygon3f::shortestPath(const QVector3D& start,
                                                 const QVector3D& goal,
                                                 int maxPoints) const
{
    region::PathResult result;

    if (maxPoints < 2) {
        qCCritical(lcGeometry, "SimplePolygon3f::shortestPath: maxPoints %d < 2", maxPoints);
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("a path needs at least 2 points");
        return result;
    }
    if (!contains(start) || !contains(goal)) {
        qCCritical(lcGeometry, "SimplePolygon3f::shortestPath: endpoint not in polygon");
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("start and goal must lie in the polygon");
        return result;
    }

    spline::LinearSpline3f direct({start, goal});
    if (direct.isContainedIn(*this)) {
        result.path = direct;
        result.success = true;
        return result;
    }

    if (maxPoints > 2) {
        // Detour through a single corner.
        float bestLength = std::numeric_limits<float>::max();
        for (int i = 0; i < m_numCorners; ++i) {
            spline::LinearSpline3f detour({start, m_corners[i], goal});
            if (detour.isContainedIn(*this) && detour.totalLength() < bestLength) {
                bestLength = detour.totalLength();
                result.path = detour;
                result.success = true;
            }
        }
    }

    if (!result.success) {
        result.errorMessage = QStringLiteral("no path with a single detour");
    }
    return result;
}

region::SupportResult SimplePolygon3f::supportDistance(const QVector3D& location,
                                                       float cosineTolerance) const
{
    region::SupportResult result;
    result.supported = true;

    if (!(cosineTolerance >= 0.0f && cosineTolerance <= 1.0f)) {
        qCCritical(lcGeometry, "SimplePolygon3f::supportDistance: cosine tolerance %g "
                   "outside [0, 1]", double(cosineTolerance));
        result.invalidArgument = true;
        result.errorMessage = QStringLiteral("cosine tolerance must lie in [0, 1]");
        return result;
    }

    // Too steep to stand on.
    float cosineSlope = qAbs(m_planeNormal.y());
    if (cosineSlope < cosineTolerance || cosineSlope == 0.0f) {
        return result;
    }

    double dot = geometry::dot(m_planeNormal, location);
    float distance = float((dot + m_planeConstant) / m_planeNormal.y());
    if (distance < 0.0f) {
        // Below the plane.
        return result;
    }

    QVector3D projection = location;
    projection.setY(location.y() - distance);
    if (contains(projection)) {
        result.distance = distance;
    }
    return result;
}

QString SimplePolygon3f::describe() const
{
    return QStringLiteral("SimplePolygon3f[%1 corners area=%2 nor=%3]")
        .arg(m_numCorners)
        .arg(double(area()), 0, 'f', 2)
        .arg(geometry::toString(m_planeNormal));
}

// =====================================================================
//  Merging
// =====================================================================

// Splice the corner loops of two polygons that share at least one side.
// Returns nullopt if the planes are orthogonal or no side is shared.
std::optional<QVector<QVector3D>> SimplePolygon3f::mergeCorners(
    const SimplePolygon3f& other) const
{
    double dot = geometry::dot(other.m_planeNormal, m_planeNormal);
    if (dot == 0.0) {
        return std::nullopt;
    }

    BoolMatrix sideMap;
    if (!sharesSideWith(other, &sideMap)) {
        return std::nullopt;
    }
    BoolMatrix revMap;
    other.sharesSideWith(*this, &revMap);

    // Start with an unshared side of this polygon.
    int startI = 0;
    while (startI < m_numCorners && firstSet(sideMap[startI]) >= 0) {
        ++startI;
    }
    if (startI == m_numCorners) {
        return std::nullopt;
    }

    const int maxCorners = m_numCorners + other.m_numCorners;
    QVector<QVector3D> result;
    result.append(m_corners[startI]);

    for (int cornerI = nextIndex(startI); cornerI != startI; cornerI = nextIndex(cornerI)) {
        result.append(m_corners[cornerI]);

        int startJ = firstSet(sideMap[cornerI]);
        if (startJ >= 0) {
            int cornerJ;
            if (dot > 0.0) {
                // Same winding: walk forward through the other polygon.
                startJ = other.nextIndex(startJ);
                for (cornerJ = other.nextIndex(startJ);
                     firstSet(revMap[cornerJ]) < 0 && result.size() <= maxCorners;
                     cornerJ = other.nextIndex(cornerJ)) {
                    result.append(other.m_corners[cornerJ]);
                }
                cornerI = firstSet(revMap[cornerJ]);
            } else {
                // Opposite winding: walk backward.
                for (cornerJ = other.prevIndex(startJ);
                     firstSet(revMap[other.prevIndex(cornerJ)]) < 0
                     && result.size() <= maxCorners;
                     cornerJ = other.prevIndex(cornerJ)) {
                    result.append(other.m_corners[cornerJ]);
                }
                cornerI = firstSet(revMap[other.prevIndex(cornerJ)]);
            }
        }

        if (cornerI < 0 || result.size() > maxCorners) {
            qCWarning(lcGeometry, "SimplePolygon3f: merge walk did not close after %d corners",
                      int(result.size()));
            return std::nullopt;
        }
    }

    return result;
}

}  // namespace polygon
}  // namespace locus
