// =====================================================================
//  src/libtangram/tangram/geometry/utils.h — Vector and angle utilities
// =====================================================================
//
//  Stateless vector/point arithmetic.  All angles are in radians,
//  counter-clockwise positive.
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_GEOMETRY_UTILS_H
#define TANGRAM_GEOMETRY_UTILS_H

#include "types.h"

namespace tangram {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Vector from point a to point b (b - a)
TANGRAM_EXPORT QPointF vectorBetween(const QPointF& a, const QPointF& b);

/// Compute the length of a vector
TANGRAM_EXPORT double length(const QPointF& v);

/// Euclidean distance between two points
TANGRAM_EXPORT double distance(const QPointF& a, const QPointF& b);

/// Compute the dot product of two vectors
TANGRAM_EXPORT double dot(const QPointF& a, const QPointF& b);

/// Compute the cross product (z-component) of two 2D vectors
TANGRAM_EXPORT double cross(const QPointF& a, const QPointF& b);

/// Compute perpendicular vector (90° CCW rotation)
TANGRAM_EXPORT QPointF perpendicular(const QPointF& v);

// =====================================================================
//  Angle Operations
// =====================================================================

/// Inclination of the vector a→b, in (-π, π].
/// Returns 0 when a == b.
TANGRAM_EXPORT double inclinationAngle(const QPointF& a, const QPointF& b);

/// Normalize an angle to (-π, π]
TANGRAM_EXPORT double normalizeAngle(double radians);

/// Rotate a point around a center by angle (radians, CCW positive)
TANGRAM_EXPORT QPointF rotatePointAround(
    const QPointF& point, const QPointF& center, double radians);

}  // namespace geometry
}  // namespace tangram

#endif  // TANGRAM_GEOMETRY_UTILS_H
