// =====================================================================
//  src/tangram/gui/dragcontroller.cpp — Shape drag state machine
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "dragcontroller.h"

#include <tangram/geometry/utils.h>

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcField, "tangram.field")

namespace tangram {

using docking::DockingThresholds;
using shapes::Shape;

DragController::DragController(const QVector<Shape>& shapes,
                               const DockingThresholds& thresholds)
    : m_shapes(shapes)
    , m_thresholds(thresholds)
{
}

void DragController::setThresholds(const DockingThresholds& thresholds)
{
    m_thresholds = thresholds;
}

const Shape* DragController::activeShape() const
{
    return m_active ? &*m_active : nullptr;
}

QVector<Shape> DragController::allShapes() const
{
    QVector<Shape> result = m_shapes;
    if (m_active) {
        result.append(*m_active);
    }
    return result;
}

bool DragController::press(const QPointF& pos)
{
    if (m_state != State::Idle) {
        return false;
    }

    // First shape containing the touch point wins
    for (int i = 0; i < m_shapes.size(); ++i) {
        const Shape& shape = m_shapes[i];
        if (!shape.contains(pos)) {
            continue;
        }

        // Inside the inner circle drags, elsewhere rotates
        if (geometry::distance(pos, shape.referencePoint()) <= shape.innerRadius()) {
            m_state = State::Moving;
        } else {
            m_state = State::Rotating;
        }

        m_active = shape;
        m_shapes.removeAt(i);
        m_prevPos = pos;
        m_docking.reset();

        qCDebug(lcField) << "press:" << pos << "shape" << i
                         << (m_state == State::Moving ? "moving" : "rotating");
        return true;
    }

    return false;
}

bool DragController::move(const QPointF& pos)
{
    if (m_state == State::Idle || !m_active) {
        return false;
    }

    const QVector<geometry::Edge> before = m_active->edges();

    if (m_state == State::Moving) {
        QPointF manualMove = geometry::vectorBetween(m_prevPos, pos);
        m_docking = docking::dock(m_shapes, *m_active, m_thresholds,
                                  0.0, manualMove);
        m_active->moveBy(manualMove);
    } else {
        const QPointF ref = m_active->referencePoint();
        double angle = geometry::normalizeAngle(
            geometry::inclinationAngle(ref, pos) -
            geometry::inclinationAngle(ref, m_prevPos));
        double rotateSign = (angle > 0.0) - (angle < 0.0);
        m_docking = docking::dock(m_shapes, *m_active, m_thresholds,
                                  rotateSign, QPointF(0.0, 0.0));
        m_active->rotate(angle);
    }

    // The pair was found on the pre-motion snapshot; follow the
    // floating edge to where the motion put it
    if (m_docking) {
        int index = before.indexOf(m_docking->floatingEdge);
        if (index >= 0) {
            m_docking->floatingEdge = m_active->edges().at(index);
        }
    }

    m_prevPos = pos;
    return true;
}

bool DragController::release()
{
    if (m_state == State::Idle || !m_active) {
        return false;
    }

    if (m_snapOnRelease && m_docking) {
        try {
            docking::DockingTransform t =
                docking::dockingTransform(*m_docking, m_active->referencePoint());
            m_active->rotate(t.angle);
            m_active->moveBy(t.offset);
            qCDebug(lcField) << "release: snapped, angle" << t.angle
                             << "offset" << t.offset;
        } catch (const geometry::DegenerateGeometry& e) {
            qCWarning(lcField) << "release: snap skipped:" << e.what();
        }
    }

    m_shapes.append(*m_active);
    m_active.reset();
    m_docking.reset();
    m_state = State::Idle;
    return true;
}

}  // namespace tangram
