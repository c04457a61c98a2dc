// =====================================================================
//  src/liblocus/geometry/logging.h — Internal logging category
// =====================================================================
//
//  Not installed.  Sources inside liblocus report diagnostics through
//  the "locus.geometry" category with qCDebug / qCWarning / qCCritical.
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_GEOMETRY_LOGGING_H
#define LOCUS_GEOMETRY_LOGGING_H

#include <QLoggingCategory>

namespace locus {

Q_DECLARE_LOGGING_CATEGORY(lcGeometry)

}  // namespace locus

#endif  // LOCUS_GEOMETRY_LOGGING_H
