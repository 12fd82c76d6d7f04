// =====================================================================
//  src/tangram/gui/dragcontroller.h — Shape drag state machine
// =====================================================================
//
//  Turns pointer press/move/release into shape moves and rotations and
//  asks the docking engine for the edge pair to highlight.
//
//    Idle ──press inside inner circle──▶ Moving
//    Idle ──press elsewhere in shape───▶ Rotating
//    Moving / Rotating ──release──────▶ Idle
//
//  While a shape is dragged it is held apart from the scene list; the
//  remaining shapes form the static set.  On release it goes back to
//  the end of the list so it is drawn on top.
//
//  Does not depend on QtWidgets, so it can be driven directly in tests.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_DRAGCONTROLLER_H
#define TANGRAM_DRAGCONTROLLER_H

#include <tangram/docking/docking.h>
#include <tangram/shapes/shape.h>

#include <QPointF>
#include <QVector>

#include <optional>

namespace tangram {

class DragController {
public:
    enum class State {
        Idle,
        Moving,
        Rotating
    };

    explicit DragController(const QVector<shapes::Shape>& shapes,
                            const docking::DockingThresholds& thresholds = {});

    void setThresholds(const docking::DockingThresholds& thresholds);
    const docking::DockingThresholds& thresholds() const { return m_thresholds; }

    void setSnapOnRelease(bool snap) { m_snapOnRelease = snap; }
    bool snapOnRelease() const { return m_snapOnRelease; }

    State state() const { return m_state; }

    /// Shapes not being dragged, in drawing order
    const QVector<shapes::Shape>& staticShapes() const { return m_shapes; }

    /// The shape being dragged, or nullptr when idle
    const shapes::Shape* activeShape() const;

    /// Every shape in drawing order; the dragged one last
    QVector<shapes::Shape> allShapes() const;

    /// Edge pair found on the last pointer move, if any
    const std::optional<docking::DockingPair>& docking() const { return m_docking; }

    // ---- Pointer events ----
    //  Each returns true if the scene changed and needs a repaint.

    bool press(const QPointF& pos);
    bool move(const QPointF& pos);
    bool release();

private:
    QVector<shapes::Shape> m_shapes;
    std::optional<shapes::Shape> m_active;
    std::optional<docking::DockingPair> m_docking;
    docking::DockingThresholds m_thresholds;
    bool m_snapOnRelease = true;
    State m_state = State::Idle;
    QPointF m_prevPos;
};

}  // namespace tangram

#endif  // TANGRAM_DRAGCONTROLLER_H
