// =====================================================================
//  src/liblocus/spline/linearspline.cpp — Piecewise-linear path
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/spline/linearspline.h>
#include <locus/region/locus.h>
#include <locus/geometry/utils.h>

#include "../geometry/logging.h"

#include <QStringList>

namespace locus {
namespace spline {

LinearSpline3f::LinearSpline3f(const QVector<QVector3D>& points)
{
    double sumDistance = 0.0;
    for (int i = 0; i < points.size(); ++i) {
        const QVector3D& point = points[i];
        if (i > 0) {
            double distance = geometry::length(point - points[i - 1]);
            if (distance == 0.0) {
                continue;
            }
            sumDistance += distance;
        }
        m_points.append(point);
        m_ts.append(float(sumDistance));
    }
    m_totalLength = float(sumDistance);
}

QVector3D LinearSpline3f::copyControlPoint(int index) const
{
    if (index < 0 || index >= m_points.size()) {
        qCCritical(lcGeometry, "LinearSpline3f: control point index %d out of range [0, %d)",
                   index, int(m_points.size()));
        return QVector3D();
    }
    return m_points[index];
}

QVector3D LinearSpline3f::interpolate(float t) const
{
    if (m_points.isEmpty()) {
        return QVector3D();
    }
    if (t <= m_ts.first()) {
        return m_points.first();
    }
    if (t >= m_totalLength) {
        return m_points.last();
    }

    int left = leftIndex(t);
    float t0 = m_ts[left];
    if (t == t0) {
        return m_points[left];
    }

    float t1 = m_ts[left + 1];
    double fraction = (double(t) - t0) / (double(t1) - t0);
    return geometry::lerp(m_points[left], m_points[left + 1], fraction);
}

bool LinearSpline3f::isContainedIn(const region::Locus3f& locus) const
{
    for (int i = 0; i + 1 < m_points.size(); ++i) {
        if (!locus.contains(m_points[i], m_points[i + 1])) {
            return false;
        }
    }
    return true;
}

QVector3D LinearSpline3f::rightDerivative(float t) const
{
    if (m_points.size() < 2) {
        return QVector3D();
    }

    int left = qMax(leftIndex(t), 0);
    int lastIndex = int(m_points.size()) - 1;
    if (left == lastIndex) {
        left = lastIndex - 1;
    }

    QVector3D offset = m_points[left + 1] - m_points[left];
    float dt = m_ts[left + 1] - m_ts[left];
    return offset / dt;
}

QVector3D LinearSpline3f::terminus() const
{
    if (m_points.isEmpty()) {
        return QVector3D();
    }
    return m_points.last();
}

QString LinearSpline3f::describe() const
{
    QStringList parts;
    for (int i = 0; i < m_points.size(); ++i) {
        parts << QStringLiteral("@t=%1%2")
                     .arg(double(m_ts[i]), 0, 'f', 1)
                     .arg(geometry::toString(m_points[i]));
    }
    return QStringLiteral("LinearSpline3f[%1]").arg(parts.join(QLatin1Char(' ')));
}

// Index of the last control point whose t does not exceed the sample,
// or -1 if the sample is before the start.
int LinearSpline3f::leftIndex(float t) const
{
    if (t < 0.0f) {
        return -1;
    }
    for (int i = 1; i < m_ts.size(); ++i) {
        if (t < m_ts[i]) {
            return i - 1;
        }
    }
    return int(m_ts.size()) - 1;
}

}  // namespace spline
}  // namespace locus
