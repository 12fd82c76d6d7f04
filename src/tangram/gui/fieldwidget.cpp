// =====================================================================
//  src/tangram/gui/fieldwidget.cpp — Playing field widget
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "fieldwidget.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPolygonF>

namespace tangram {

namespace {

const QColor kBackgroundColor(0xFF, 0xFF, 0xFF);
const QColor kShapeColor(0x00, 0x00, 0x00);
const QColor kDockingColor(0xFF, 0x00, 0xFF);

}  // namespace

FieldWidget::FieldWidget(const QVector<shapes::Shape>& shapes, QWidget* parent)
    : QWidget(parent)
    , m_controller(shapes)
{
    setObjectName(QStringLiteral("FieldWidget"));
    setAutoFillBackground(true);
    QPalette pal = palette();
    pal.setColor(QPalette::Window, kBackgroundColor);
    setPalette(pal);
    setCursor(Qt::ArrowCursor);
}

void FieldWidget::setDraftMode(bool draft)
{
    if (m_draftMode != draft) {
        m_draftMode = draft;
        update();
    }
}

void FieldWidget::setSnapOnRelease(bool snap)
{
    m_controller.setSnapOnRelease(snap);
}

void FieldWidget::setThresholds(const docking::DockingThresholds& thresholds)
{
    m_controller.setThresholds(thresholds);
}

QVector<shapes::Shape> FieldWidget::shapes() const
{
    return m_controller.allShapes();
}

QSize FieldWidget::sizeHint() const
{
    return m_fieldSize;
}

void FieldWidget::setFieldSize(const QSize& size)
{
    m_fieldSize = size;
    setMinimumSize(size);
    updateGeometry();
}

// ---- Painting -------------------------------------------------------

void FieldWidget::paintEvent(QPaintEvent* /*event*/)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const auto& shape : m_controller.staticShapes()) {
        drawShape(painter, shape);
    }

    // Dragged shape on top
    if (const shapes::Shape* active = m_controller.activeShape()) {
        drawShape(painter, *active);
    }

    // Only draft mode shows the docking highlight
    if (m_draftMode && m_controller.docking()) {
        drawDocking(painter, *m_controller.docking());
    }
}

void FieldWidget::drawShape(QPainter& painter, const shapes::Shape& shape) const
{
    QPolygonF polygon(shape.vertices());

    if (!m_draftMode) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(kShapeColor);
        painter.drawPolygon(polygon);
        return;
    }

    painter.setPen(QPen(kShapeColor, 1.0));
    painter.setBrush(Qt::NoBrush);
    painter.drawPolygon(polygon);

    // Inner circle with a cross at its centre
    const QPointF ref = shape.referencePoint();
    const double r = shape.innerRadius();
    painter.drawEllipse(ref, r, r);

    const double arm = r / 3.0;
    painter.drawLine(QPointF(ref.x() - arm, ref.y()), QPointF(ref.x() + arm, ref.y()));
    painter.drawLine(QPointF(ref.x(), ref.y() - arm), QPointF(ref.x(), ref.y() + arm));
}

void FieldWidget::drawDocking(QPainter& painter, const docking::DockingPair& pair) const
{
    painter.setPen(QPen(kDockingColor, 2.0));
    painter.drawLine(pair.staticEdge.tail, pair.staticEdge.head);
    painter.drawLine(pair.floatingEdge.tail, pair.floatingEdge.head);
}

// ---- Mouse ----------------------------------------------------------

void FieldWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }

    if (m_controller.press(event->position())) {
        setCursor(m_controller.state() == DragController::State::Moving
                      ? Qt::ClosedHandCursor : Qt::SizeAllCursor);
        emit statusChanged(m_controller.state() == DragController::State::Moving
                               ? tr("Moving") : tr("Rotating"));
        update();
    }
}

void FieldWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_controller.move(event->position())) {
        QWidget::mouseMoveEvent(event);
        return;
    }

    bool hasDocking = m_controller.docking().has_value();
    if (hasDocking != m_hadDocking) {
        m_hadDocking = hasDocking;
        emit statusChanged(hasDocking ? tr("Docking edge found") : QString());
    }
    update();
}

void FieldWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    if (m_controller.release()) {
        m_hadDocking = false;
        setCursor(Qt::ArrowCursor);
        emit statusChanged(QString());
        update();
    }
}

}  // namespace tangram
