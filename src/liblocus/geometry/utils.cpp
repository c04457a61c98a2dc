// =====================================================================
//  src/liblocus/geometry/utils.cpp — Geometry utility functions
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/geometry/utils.h>

#include <QString>

#include <cmath>

namespace locus {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

double dot(const QVector3D& a, const QVector3D& b)
{
    double x = double(a.x()) * b.x();
    double y = double(a.y()) * b.y();
    double z = double(a.z()) * b.z();
    return x + y + z;
}

QVector3D cross(const QVector3D& a, const QVector3D& b)
{
    return QVector3D::crossProduct(a, b);
}

double length(const QVector3D& v)
{
    return qSqrt(lengthSquared(v));
}

double lengthSquared(const QVector3D& v)
{
    return dot(v, v);
}

double distanceSquared(const QVector3D& a, const QVector3D& b)
{
    double dx = double(a.x()) - b.x();
    double dy = double(a.y()) - b.y();
    double dz = double(a.z()) - b.z();
    return dx * dx + dy * dy + dz * dz;
}

QVector3D normalize(const QVector3D& v)
{
    double len = length(v);
    if (len < DEFAULT_TOLERANCE) {
        return QVector3D(0, 0, 0);
    }
    return QVector3D(float(v.x() / len), float(v.y() / len),
                     float(v.z() / len));
}

QVector3D lerp(const QVector3D& a, const QVector3D& b, double t)
{
    return QVector3D(
        float(a.x() + t * (double(b.x()) - a.x())),
        float(a.y() + t * (double(b.y()) - a.y())),
        float(a.z() + t * (double(b.z()) - a.z()))
    );
}

QVector3D midpoint(const QVector3D& a, const QVector3D& b)
{
    return QVector3D(
        float((double(a.x()) + b.x()) / 2.0),
        float((double(a.y()) + b.y()) / 2.0),
        float((double(a.z()) + b.z()) / 2.0)
    );
}

float maxComponent(const QVector3D& v)
{
    return qMax(v.x(), qMax(v.y(), v.z()));
}

int maxAxis(const QVector3D& v)
{
    float max = maxComponent(v);
    if (v.x() == max) {
        return 0;
    } else if (v.y() == max) {
        return 1;
    }
    return 2;
}

bool isFinite(const QVector3D& v)
{
    return std::isfinite(v.x()) && std::isfinite(v.y())
        && std::isfinite(v.z());
}

QString toString(const QVector3D& v)
{
    return QStringLiteral("(%1, %2, %3)")
        .arg(double(v.x()))
        .arg(double(v.y()))
        .arg(double(v.z()));
}

// =====================================================================
//  Point Comparisons
// =====================================================================

bool doCoincide(const QVector3D& a, const QVector3D& b, double tolerance2)
{
    return distanceSquared(a, b) <= tolerance2;
}

IndexPair mostRemote(const QVector<QVector3D>& points)
{
    IndexPair result;
    double largestSD = -1.0;

    for (int i = 0; i < points.size(); ++i) {
        for (int j = i + 1; j < points.size(); ++j) {
            double sd = distanceSquared(points[i], points[j]);
            if (sd > largestSD) {
                largestSD = sd;
                result.first = i;
                result.second = j;
            }
        }
    }

    return result;
}

bool allCollinear(const QVector3D& first, const QVector3D& last,
                  const QVector<QVector3D>& middle, double tolerance2)
{
    QVector3D fl = last - first;
    double normSquaredFL = lengthSquared(fl);
    if (normSquaredFL <= tolerance2) {
        // The line is too short to define a direction.
        return true;
    }

    for (const QVector3D& point : middle) {
        QVector3D fm = point - first;
        double fraction = dot(fm, fl) / normSquaredFL;
        QVector3D projection = fl * float(fraction);
        if (!doCoincide(projection, fm, tolerance2)) {
            return false;
        }
    }

    return true;
}

// =====================================================================
//  Segment Operations
// =====================================================================

double squaredDistanceToSegment(
    const QVector3D& point,
    const QVector3D& segStart, const QVector3D& segEnd,
    QVector3D* storeClosest)
{
    QVector3D segOffset = segEnd - segStart;
    double segLengthSquared = lengthSquared(segOffset);
    if (segLengthSquared == 0.0) {
        if (storeClosest) {
            *storeClosest = segStart;
        }
        return distanceSquared(segStart, point);
    }

    QVector3D pointOffset = point - segStart;
    double t = dot(pointOffset, segOffset) / segLengthSquared;
    t = qBound(0.0, t, 1.0);

    QVector3D closestOffset = segOffset * float(t);
    if (storeClosest) {
        *storeClosest = segStart + closestOffset;
    }

    return distanceSquared(closestOffset, pointOffset);
}

// =====================================================================
//  Bases
// =====================================================================

std::optional<Basis3D> generateBasis(const QVector3D& direction)
{
    if (!isFinite(direction) || lengthSquared(direction) == 0.0) {
        return std::nullopt;
    }

    // Rescale first so very short directions survive normalize().
    float largest = qMax(qAbs(direction.x()),
                         qMax(qAbs(direction.y()), qAbs(direction.z())));
    Basis3D basis;
    basis.u = normalize(direction / largest);

    // Start from the world axis least aligned with u.
    float x = qAbs(basis.u.x());
    float y = qAbs(basis.u.y());
    float z = qAbs(basis.u.z());
    QVector3D seed;
    if (x <= y && x <= z) {
        seed = QVector3D(1, 0, 0);
    } else if (y <= z) {
        seed = QVector3D(0, 1, 0);
    } else {
        seed = QVector3D(0, 0, 1);
    }

    basis.v = normalize(cross(basis.u, seed));
    basis.w = normalize(cross(basis.u, basis.v));

    return basis;
}

}  // namespace geometry
}  // namespace locus
