// =====================================================================
//  src/tangram/app/logging.h — Application log output
// =====================================================================
//
//  Installs a Qt message handler that stamps every message with time,
//  level and category.  Warnings and errors go to stderr, the rest to
//  stdout.  Debug categories are off unless --debug is given or
//  TANGRAM_LOG_DEBUG is set.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_LOGGING_H
#define TANGRAM_LOGGING_H

#include <QString>

namespace tangram {

class Logging {
public:
    /// Install the handler and filter rules.  Safe to call twice.
    static void initialize(bool debugEnabled);

    /// Restore the previous message handler.
    static void shutdown();

    /// True if debug output is enabled for this run.
    static bool debugEnabled();

    /// Parse a "1/true/yes/on" style flag value.
    static bool isEnabledFlag(const QString& value);
};

}  // namespace tangram

#endif  // TANGRAM_LOGGING_H
