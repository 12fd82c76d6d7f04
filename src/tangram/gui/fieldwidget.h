// =====================================================================
//  src/tangram/gui/fieldwidget.h — Playing field widget
// =====================================================================
//
//  Paints the pieces and the highlighted docking edges, and feeds
//  left-button mouse events to the DragController.
//
//  Filled mode draws solid black polygons.  Draft mode draws outlines,
//  the inner circle and a cross at the reference point.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_FIELDWIDGET_H
#define TANGRAM_FIELDWIDGET_H

#include "dragcontroller.h"

#include <QWidget>

namespace tangram {

class FieldWidget : public QWidget {
    Q_OBJECT

public:
    explicit FieldWidget(const QVector<shapes::Shape>& shapes,
                         QWidget* parent = nullptr);

    void setDraftMode(bool draft);
    bool draftMode() const { return m_draftMode; }

    void setSnapOnRelease(bool snap);
    void setThresholds(const docking::DockingThresholds& thresholds);

    /// Current shapes in drawing order
    QVector<shapes::Shape> shapes() const;

    QSize sizeHint() const override;

    void setFieldSize(const QSize& size);

signals:
    /// Emitted when a drag starts or ends, and when the docking
    /// highlight appears or disappears
    void statusChanged(const QString& message);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void drawShape(QPainter& painter, const shapes::Shape& shape) const;
    void drawDocking(QPainter& painter, const docking::DockingPair& pair) const;

    DragController m_controller;
    bool m_draftMode = false;
    bool m_hadDocking = false;
    QSize m_fieldSize = QSize(640, 420);
};

}  // namespace tangram

#endif  // TANGRAM_FIELDWIDGET_H
