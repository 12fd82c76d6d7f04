// =====================================================================
//  src/libtangram/core.cpp -- Library initialization
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "tangram/core.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcCore, "tangram.core")

namespace tangram {

namespace {
bool g_initialized = false;
}

const char* version()
{
    return "1.0.0";
}

bool initialize()
{
    // The geometry core is stateless; this only records that the host
    // went through the startup sequence.
    if (!g_initialized) {
        qCDebug(lcCore) << "initialize: libtangram" << version();
        g_initialized = true;
    }
    return true;
}

void shutdown()
{
    if (g_initialized) {
        qCDebug(lcCore) << "shutdown";
        g_initialized = false;
    }
}

}  // namespace tangram
