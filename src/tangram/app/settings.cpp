// =====================================================================
//  src/tangram/app/settings.cpp — Application preferences
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "settings.h"

#include <QLoggingCategory>
#include <QSettings>
#include <QtNumeric>

Q_LOGGING_CATEGORY(lcSettings, "tangram.settings")

namespace tangram {

docking::DockingThresholds AppSettings::thresholds() const
{
    return docking::DockingThresholds::fromDegrees(angularThresholdDeg,
                                                   distanceThreshold);
}

AppSettings loadSettings(QSettings& store)
{
    AppSettings defaults;
    AppSettings s;

    store.beginGroup(QStringLiteral("view"));
    s.draftMode = store.value(QStringLiteral("draftMode"),
                              defaults.draftMode).toBool();
    s.fieldSize = store.value(QStringLiteral("fieldSize"),
                              defaults.fieldSize).toSize();
    store.endGroup();

    store.beginGroup(QStringLiteral("docking"));
    s.snapOnRelease = store.value(QStringLiteral("snapOnRelease"),
                                  defaults.snapOnRelease).toBool();
    s.angularThresholdDeg = store.value(QStringLiteral("angularThresholdDeg"),
                                        defaults.angularThresholdDeg).toDouble();
    s.distanceThreshold = store.value(QStringLiteral("distanceThreshold"),
                                      defaults.distanceThreshold).toDouble();
    store.endGroup();

    if (!s.fieldSize.isValid() || s.fieldSize.isEmpty()) {
        qCWarning(lcSettings) << "invalid field size" << s.fieldSize
                              << "- using" << defaults.fieldSize;
        s.fieldSize = defaults.fieldSize;
    }
    if (!qIsFinite(s.angularThresholdDeg) ||
        s.angularThresholdDeg < 0.0 || s.angularThresholdDeg > 180.0) {
        qCWarning(lcSettings) << "angular threshold out of range"
                              << s.angularThresholdDeg << "- using"
                              << defaults.angularThresholdDeg;
        s.angularThresholdDeg = defaults.angularThresholdDeg;
    }
    if (!qIsFinite(s.distanceThreshold) || s.distanceThreshold < 0.0) {
        qCWarning(lcSettings) << "invalid distance threshold"
                              << s.distanceThreshold << "- using"
                              << defaults.distanceThreshold;
        s.distanceThreshold = defaults.distanceThreshold;
    }

    return s;
}

void saveSettings(QSettings& store, const AppSettings& settings)
{
    store.beginGroup(QStringLiteral("view"));
    store.setValue(QStringLiteral("draftMode"), settings.draftMode);
    store.setValue(QStringLiteral("fieldSize"), settings.fieldSize);
    store.endGroup();

    store.beginGroup(QStringLiteral("docking"));
    store.setValue(QStringLiteral("snapOnRelease"), settings.snapOnRelease);
    store.setValue(QStringLiteral("angularThresholdDeg"),
                   settings.angularThresholdDeg);
    store.setValue(QStringLiteral("distanceThreshold"),
                   settings.distanceThreshold);
    store.endGroup();
}

}  // namespace tangram
