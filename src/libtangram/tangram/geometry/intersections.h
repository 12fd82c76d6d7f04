// =====================================================================
//  src/libtangram/tangram/geometry/intersections.h — Line algebra
// =====================================================================
//
//  Intersection and distance functions on infinite lines given as a
//  base point and a direction vector:
//
//      P = base + p * direction,   p real
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_GEOMETRY_INTERSECTIONS_H
#define TANGRAM_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace tangram {
namespace geometry {

// =====================================================================
//  Line Intersections
// =====================================================================

/// Compute the intersection of two infinite lines
/// @param baseA, directionA First line
/// @param baseB, directionB Second line
/// @return Intersection point
/// @throws DegenerateGeometry if the directions are parallel or either
///         has zero length
TANGRAM_EXPORT QPointF lineIntersection(
    const QPointF& baseA, const QPointF& directionA,
    const QPointF& baseB, const QPointF& directionB);

// =====================================================================
//  Distance Functions
// =====================================================================

/// Distance from a point to an infinite line
/// @throws DegenerateGeometry if direction has zero length
TANGRAM_EXPORT double pointToLineDistance(
    const QPointF& point,
    const QPointF& base, const QPointF& direction);

/// Project a point onto a line, returning the parameter t such that
/// base + t * direction is the foot of the perpendicular
/// @throws DegenerateGeometry if direction has zero length
TANGRAM_EXPORT double projectPointOnLine(
    const QPointF& point,
    const QPointF& base, const QPointF& direction);

}  // namespace geometry
}  // namespace tangram

#endif  // TANGRAM_GEOMETRY_INTERSECTIONS_H
