// =====================================================================
//  src/tangram/gui/tangramwindow.h — Main window
// =====================================================================
//
//  Hosts the playing field, a View menu with the draft and snap
//  toggles, and a status bar reporting the drag state.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_TANGRAMWINDOW_H
#define TANGRAM_TANGRAMWINDOW_H

#include "../app/settings.h"

#include <tangram/shapes/shape.h>

#include <QMainWindow>

class QAction;

namespace tangram {

class FieldWidget;

class TangramWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit TangramWindow(const QVector<shapes::Shape>& shapes,
                           const AppSettings& settings,
                           QWidget* parent = nullptr);
    ~TangramWindow() override;

    /// Current shapes in drawing order
    QVector<shapes::Shape> shapes() const;

private slots:
    void onDraftModeToggled(bool checked);
    void onSnapToggled(bool checked);

private:
    void createMenus();

    AppSettings m_settings;
    FieldWidget* m_field = nullptr;
    QAction* m_actionDraftMode = nullptr;
    QAction* m_actionSnap = nullptr;
};

}  // namespace tangram

#endif  // TANGRAM_TANGRAMWINDOW_H
