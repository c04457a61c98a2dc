// =====================================================================
//  src/liblocus/locus/region/metric.h — Distance metrics
// =====================================================================
//
//  The three distance functions that define shell boundaries: a
//  Euclidean shell is round, a Chebyshev shell is a cube and a
//  Manhattan shell is an octahedron.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_REGION_METRIC_H
#define LOCUS_REGION_METRIC_H

#include "../geometry/types.h"

#include <QString>

namespace locus {
namespace region {

/// Distance function over a 3-D offset
enum class Metric {
    Euclid,         ///< Square root of the sum of squares
    Chebyshev,      ///< Largest absolute component
    Manhattan       ///< Sum of absolute components
};

/// Squared value of the metric for an offset (always >= 0).
///
/// For offset (3, 4, 5): Euclid gives 50, Chebyshev 25, Manhattan 144.
LOCUS_EXPORT double squaredValue(Metric metric, const QVector3D& offset);

/// Unsquared value of the metric for an offset (always >= 0)
LOCUS_EXPORT double value(Metric metric, const QVector3D& offset);

/// Canonical name: "Euclidean", "Chebyshev" or "Manhattan"
LOCUS_EXPORT QString describe(Metric metric);

/// Parse a canonical name produced by describe().
/// Returns nullopt for any other string.
LOCUS_EXPORT std::optional<Metric> metricFromDescription(const QString& description);

}  // namespace region
}  // namespace locus

#endif  // LOCUS_REGION_METRIC_H
