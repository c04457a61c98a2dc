// =====================================================================
//  src/liblocus/core.cpp -- Library initialization
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "locus/core.h"
#include "geometry/logging.h"

#include <QtGlobal>

namespace locus {

Q_LOGGING_CATEGORY(lcGeometry, "locus.geometry")

const char* version()
{
    return "0.1.0";
}

bool initialize()
{
    // Respect rules the application supplied through the environment.
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(
            QStringLiteral("locus.geometry.debug=false"));
    }
    return true;
}

void shutdown()
{
    // Nothing to tear down: every region owns its own state.
}

}  // namespace locus
