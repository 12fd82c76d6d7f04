// =====================================================================
//  src/tangram/app/settings.h — Application preferences
// =====================================================================
//
//  Preferences stored in QSettings (groups "view" and "docking").
//  Command-line flags override them for a single run; shape layouts
//  are never stored.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_SETTINGS_H
#define TANGRAM_SETTINGS_H

#include <tangram/docking/docking.h>

#include <QSize>

class QSettings;

namespace tangram {

struct AppSettings {
    bool draftMode = false;              ///< Outline drawing with inner circles
    bool printLayout = false;            ///< Print shape vertices on exit
    bool snapOnRelease = true;           ///< Apply the highlighted docking
    double angularThresholdDeg = 20.0;   ///< Docking angular threshold
    double distanceThreshold = 10.0;     ///< Docking distance threshold
    QSize fieldSize = QSize(640, 420);   ///< Playing field size in pixels

    /// Docking thresholds derived from the angle and distance
    docking::DockingThresholds thresholds() const;
};

/// Load preferences; missing or invalid values fall back to defaults.
AppSettings loadSettings(QSettings& store);

/// Save preferences.  printLayout is per-run and not saved.
void saveSettings(QSettings& store, const AppSettings& settings);

}  // namespace tangram

#endif  // TANGRAM_SETTINGS_H
