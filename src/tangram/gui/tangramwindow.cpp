// =====================================================================
//  src/tangram/gui/tangramwindow.cpp — Main window
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "tangramwindow.h"
#include "fieldwidget.h"

#include <QAction>
#include <QApplication>
#include <QMenuBar>
#include <QSettings>
#include <QStatusBar>

namespace tangram {

TangramWindow::TangramWindow(const QVector<shapes::Shape>& shapes,
                             const AppSettings& settings,
                             QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    setWindowTitle(QStringLiteral("Tangram"));

    m_field = new FieldWidget(shapes, this);
    m_field->setFieldSize(m_settings.fieldSize);
    m_field->setDraftMode(m_settings.draftMode);
    m_field->setSnapOnRelease(m_settings.snapOnRelease);
    m_field->setThresholds(m_settings.thresholds());
    setCentralWidget(m_field);

    connect(m_field, &FieldWidget::statusChanged, this,
            [this](const QString& message) {
                statusBar()->showMessage(message);
            });

    createMenus();
    statusBar()->showMessage(
        tr("Drag a piece near its centre to move it, near a corner to rotate it."));
}

TangramWindow::~TangramWindow() = default;

QVector<shapes::Shape> TangramWindow::shapes() const
{
    return m_field->shapes();
}

void TangramWindow::createMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    QAction* quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));

    m_actionDraftMode = viewMenu->addAction(tr("&Draft Mode"));
    m_actionDraftMode->setCheckable(true);
    m_actionDraftMode->setChecked(m_settings.draftMode);
    connect(m_actionDraftMode, &QAction::toggled,
            this, &TangramWindow::onDraftModeToggled);

    m_actionSnap = viewMenu->addAction(tr("&Snap on Release"));
    m_actionSnap->setCheckable(true);
    m_actionSnap->setChecked(m_settings.snapOnRelease);
    connect(m_actionSnap, &QAction::toggled,
            this, &TangramWindow::onSnapToggled);
}

void TangramWindow::onDraftModeToggled(bool checked)
{
    m_settings.draftMode = checked;
    m_field->setDraftMode(checked);

    QSettings store;
    AppSettings stored = loadSettings(store);
    stored.draftMode = checked;
    saveSettings(store, stored);
}

void TangramWindow::onSnapToggled(bool checked)
{
    m_settings.snapOnRelease = checked;
    m_field->setSnapOnRelease(checked);

    // Only the toggled value is persisted; command-line overrides
    // for this run stay out of the stored preferences
    QSettings store;
    AppSettings stored = loadSettings(store);
    stored.snapOnRelease = checked;
    saveSettings(store, stored);
}

}  // namespace tangram
