// =====================================================================
//  src/liblocus/locus/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Constants and small value types shared by the polygon, region and
//  spline modules.  Points and offsets are QVector3D, planar offsets
//  are QVector2D, orientations are QQuaternion.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_GEOMETRY_TYPES_H
#define LOCUS_GEOMETRY_TYPES_H

#include "../core.h"

#include <QVector2D>
#include <QVector3D>
#include <QQuaternion>
#include <QVector>
#include <QtMath>

#include <optional>

namespace locus {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Lengths below this are treated as zero when normalizing
constexpr double DEFAULT_TOLERANCE = 1e-6;

/// A shell thinner than this fraction of its center's Chebyshev
/// magnitude is at risk of losing its interior to rounding
constexpr double THIN_SHELL_RATIO = 1e-6;

/// Relative fudge applied when projecting onto a shell surface, so the
/// projected point lands inside despite single-precision rounding
constexpr double SHELL_PROJECTION_FUZZ = 3e-7;

// =====================================================================
//  Basis
// =====================================================================

/// Right-handed orthonormal basis (u x v = w)
struct Basis3D {
    QVector3D u;
    QVector3D v;
    QVector3D w;
};

// =====================================================================
//  Index Pair
// =====================================================================

/// Pair of indices into a point list, ordered first < second
struct IndexPair {
    int first = -1;
    int second = -1;

    bool isValid() const { return first >= 0 && second >= 0; }
};

}  // namespace geometry
}  // namespace locus

#endif  // LOCUS_GEOMETRY_TYPES_H
