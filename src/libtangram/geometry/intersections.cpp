// =====================================================================
//  src/libtangram/geometry/intersections.cpp — Line algebra
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/geometry/intersections.h>
#include <tangram/geometry/utils.h>

namespace tangram {
namespace geometry {

// =====================================================================
//  Line-Line Intersection
// =====================================================================

QPointF lineIntersection(
    const QPointF& baseA, const QPointF& directionA,
    const QPointF& baseB, const QPointF& directionB)
{
    // Eliminate the second line's parameter by projecting onto the
    // normal of directionB:  p = (nB · (baseB - baseA)) / (nB · dirA)
    QPointF normalB = perpendicular(directionB);
    double denominator = dot(normalB, directionA);

    // Sine of the angle between the directions; also zero when either
    // direction is a zero vector
    if (qAbs(denominator) <= PRECISION * length(directionA) * length(directionB)) {
        throw DegenerateGeometry(
            "lineIntersection: directions are parallel or zero-length");
    }

    double p = dot(normalB, vectorBetween(baseA, baseB)) / denominator;
    return QPointF(baseA.x() + p * directionA.x(),
                   baseA.y() + p * directionA.y());
}

// =====================================================================
//  Distance Functions
// =====================================================================

double pointToLineDistance(
    const QPointF& point,
    const QPointF& base, const QPointF& direction)
{
    double len = length(direction);
    if (len < PRECISION) {
        throw DegenerateGeometry(
            "pointToLineDistance: zero-length line direction");
    }
    return qAbs(cross(vectorBetween(point, base), direction)) / len;
}

double projectPointOnLine(
    const QPointF& point,
    const QPointF& base, const QPointF& direction)
{
    double lenSq = dot(direction, direction);
    if (lenSq < PRECISION * PRECISION) {
        throw DegenerateGeometry(
            "projectPointOnLine: zero-length line direction");
    }
    return dot(direction, vectorBetween(base, point)) / lenSq;
}

}  // namespace geometry
}  // namespace tangram
