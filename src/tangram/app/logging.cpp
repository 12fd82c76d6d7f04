// =====================================================================
//  src/tangram/app/logging.cpp — Application log output
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "logging.h"

#include <QDateTime>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

#include <cstdlib>
#include <iostream>

namespace tangram {

namespace {

QMutex g_logMutex;
QtMessageHandler g_previousHandler = nullptr;
bool g_initialized = false;
bool g_debugEnabled = false;

const char* levelToString(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg:    return "FATAL";
    }
    return "UNKNOWN";
}

void setLoggingRules(bool debugEnabled)
{
    QStringList rules;
    rules << QStringLiteral("tangram.*.info=true")
          << QStringLiteral("*.warning=true")
          << QStringLiteral("*.critical=true");

    if (debugEnabled) {
        rules << QStringLiteral("tangram.*.debug=true");
    } else {
        rules << QStringLiteral("*.debug=false");
    }

    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

QString formatMessage(QtMsgType type, const QMessageLogContext& context,
                      const QString& msg)
{
    const QString timestamp =
        QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString category = context.category
        ? QString::fromUtf8(context.category)
        : QStringLiteral("default");

    return QStringLiteral("%1 [%2] [%3] %4")
        .arg(timestamp, QString::fromLatin1(levelToString(type)),
             category, msg);
}

void messageHandler(QtMsgType type, const QMessageLogContext& context,
                    const QString& msg)
{
    const QString formatted = formatMessage(type, context, msg);

    {
        QMutexLocker lock(&g_logMutex);
        if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
            std::cerr << formatted.toStdString() << std::endl;
        } else {
            std::cout << formatted.toStdString() << std::endl;
        }
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}

}  // namespace

void Logging::initialize(bool debugEnabled)
{
    QMutexLocker lock(&g_logMutex);
    if (g_initialized) {
        return;
    }

    g_debugEnabled = debugEnabled ||
        isEnabledFlag(qEnvironmentVariable("TANGRAM_LOG_DEBUG"));
    setLoggingRules(g_debugEnabled);

    g_previousHandler = qInstallMessageHandler(messageHandler);
    g_initialized = true;
}

void Logging::shutdown()
{
    QMutexLocker lock(&g_logMutex);
    if (!g_initialized) {
        return;
    }

    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    g_initialized = false;
}

bool Logging::debugEnabled()
{
    return g_debugEnabled;
}

bool Logging::isEnabledFlag(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("1") ||
           normalized == QLatin1String("true") ||
           normalized == QLatin1String("yes") ||
           normalized == QLatin1String("on");
}

}  // namespace tangram
