// =====================================================================
//  src/libtangram/tangram/docking/docking.h — Edge docking (gravity)
// =====================================================================
//
//  Finds the best edge-to-edge alignment between a floating (dragged)
//  shape and a set of static shapes.  Every (floating edge, static
//  edge) pair is passed through five filters:
//
//    1. motion direction: the drag must not point out of the
//       floating edge;
//    2. rotation direction: the requested rotation must not turn the
//       floating edge away from the static one;
//    3. proximity: both floating endpoints lie within the distance
//       threshold of the static edge line;
//    4. alignment: the edges are close to antiparallel;
//    5. overlap: the floating edge, projected on the static edge,
//       covers part of it.
//
//  Survivors are ranked by (smallest distance, best alignment, largest
//  overlap); ties go to the earliest pair in enumeration order.
//
//  The engine never modifies a shape.  It advises; the host decides
//  whether to highlight the pair and whether to apply the transform
//  returned by dockingTransform().
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_DOCKING_DOCKING_H
#define TANGRAM_DOCKING_DOCKING_H

#include "../core.h"
#include "../geometry/types.h"
#include "../shapes/shape.h"

#include <QPointF>
#include <QVector>

#include <optional>

namespace tangram {
namespace docking {

// =====================================================================
//  Configuration
// =====================================================================

/// Host-tunable "stickiness"
struct DockingThresholds {
    /// Minimum cosine of the angle between antiparallel edges
    double angularThresholdCos = 0.9396926207859084;  // cos(20°)
    /// Maximum distance from the floating edge ends to the static edge line
    double distanceThreshold = 10.0;

    /// Build thresholds from an angle in degrees
    static DockingThresholds fromDegrees(double angleDegrees, double distance);
};

// =====================================================================
//  Results
// =====================================================================

/// Edge pair selected for docking
struct DockingPair {
    geometry::Edge staticEdge;     ///< Edge of one of the static shapes
    geometry::Edge floatingEdge;   ///< Edge of the floating shape

    bool operator==(const DockingPair& other) const
    {
        return staticEdge == other.staticEdge && floatingEdge == other.floatingEdge;
    }
};

/// A pair that passed every filter, with its ranking values
struct DockingCandidate {
    double distance = 0.0;    ///< Larger endpoint distance to the static line
    double cosTheta = 0.0;    ///< Alignment cosine (1 = exactly antiparallel)
    double overlap = 0.0;     ///< Length of the shared projection
    DockingPair pair;
};

/// Rigid motion that lays the floating edge on the static edge
struct DockingTransform {
    double angle = 0.0;       ///< Rotation about the pivot (radians, (-π, π])
    QPointF offset;           ///< Translation applied after the rotation
};

// =====================================================================
//  Docking Queries
// =====================================================================

/// Every pair that passes all filters, in enumeration order:
/// floating edge, then static shape, then static edge.
/// @param staticShapes Shapes that stay in place
/// @param floating The shape being dragged
/// @param angularThresholdCos Minimum alignment cosine
/// @param distanceThreshold Maximum edge line distance (>= 0)
/// @param manualRotateSign +1, -1, or 0 when not rotating
/// @param manualMove Current drag vector (zero when not moving)
TANGRAM_EXPORT QVector<DockingCandidate> dockingCandidates(
    const QVector<shapes::Shape>& staticShapes,
    const shapes::Shape& floating,
    double angularThresholdCos,
    double distanceThreshold,
    double manualRotateSign,
    const QPointF& manualMove);

/// Best docking pair, or nullopt if no pair passes the filters
TANGRAM_EXPORT std::optional<DockingPair> dock(
    const QVector<shapes::Shape>& staticShapes,
    const shapes::Shape& floating,
    double angularThresholdCos,
    double distanceThreshold,
    double manualRotateSign,
    const QPointF& manualMove);

/// Convenience overload taking the host thresholds
TANGRAM_EXPORT std::optional<DockingPair> dock(
    const QVector<shapes::Shape>& staticShapes,
    const shapes::Shape& floating,
    const DockingThresholds& thresholds,
    double manualRotateSign,
    const QPointF& manualMove);

/// Rotation about pivot followed by a translation that makes the
/// floating edge antiparallel to and collinear with the static edge.
/// The position along the static edge line is kept.
/// @throws geometry::DegenerateGeometry if the static edge has zero length
TANGRAM_EXPORT DockingTransform dockingTransform(
    const DockingPair& pair, const QPointF& pivot);

}  // namespace docking
}  // namespace tangram

#endif  // TANGRAM_DOCKING_DOCKING_H
