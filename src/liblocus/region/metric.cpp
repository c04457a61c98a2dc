// =====================================================================
//  src/liblocus/region/metric.cpp — Distance metrics
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <locus/region/metric.h>
#include <locus/geometry/utils.h>

namespace locus {
namespace region {

double squaredValue(Metric metric, const QVector3D& offset)
{
    switch (metric) {
    case Metric::Euclid:
        return geometry::lengthSquared(offset);

    case Metric::Chebyshev: {
        double dx = offset.x();
        double dy = offset.y();
        double dz = offset.z();
        return qMax(dx * dx, qMax(dy * dy, dz * dz));
    }

    case Metric::Manhattan: {
        double sum = qAbs(double(offset.x())) + qAbs(double(offset.y()))
                   + qAbs(double(offset.z()));
        return sum * sum;
    }
    }

    return 0.0;
}

double value(Metric metric, const QVector3D& offset)
{
    double dx = qAbs(double(offset.x()));
    double dy = qAbs(double(offset.y()));
    double dz = qAbs(double(offset.z()));

    switch (metric) {
    case Metric::Euclid:
        return qSqrt(dx * dx + dy * dy + dz * dz);
    case Metric::Chebyshev:
        return qMax(dx, qMax(dy, dz));
    case Metric::Manhattan:
        return dx + dy + dz;
    }

    return 0.0;
}

QString describe(Metric metric)
{
    switch (metric) {
    case Metric::Euclid:    return QStringLiteral("Euclidean");
    case Metric::Chebyshev: return QStringLiteral("Chebyshev");
    case Metric::Manhattan: return QStringLiteral("Manhattan");
    }
    return QStringLiteral("?");
}

std::optional<Metric> metricFromDescription(const QString& description)
{
    for (Metric metric : {Metric::Euclid, Metric::Chebyshev, Metric::Manhattan}) {
        if (describe(metric) == description) {
            return metric;
        }
    }
    return std::nullopt;
}

}  // namespace region
}  // namespace locus
