// =====================================================================
//  src/libtangram/geometry/utils.cpp — Vector and angle utilities
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/geometry/utils.h>

#include <cmath>

namespace tangram {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

QPointF vectorBetween(const QPointF& a, const QPointF& b)
{
    return QPointF(b.x() - a.x(), b.y() - a.y());
}

double length(const QPointF& v)
{
    return qSqrt(v.x() * v.x() + v.y() * v.y());
}

double distance(const QPointF& a, const QPointF& b)
{
    return length(vectorBetween(a, b));
}

double dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

double cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

QPointF perpendicular(const QPointF& v)
{
    return QPointF(-v.y(), v.x());
}

// =====================================================================
//  Angle Operations
// =====================================================================

double inclinationAngle(const QPointF& a, const QPointF& b)
{
    QPointF v = vectorBetween(a, b);
    if (v.x() == 0.0 && v.y() == 0.0) {
        return 0.0;
    }

    // atan2 yields -π for (negative, -0.0); fold it onto π
    double angle = qAtan2(v.y(), v.x());
    if (angle <= -M_PI) {
        angle = M_PI;
    }
    return angle;
}

double normalizeAngle(double radians)
{
    double result = std::fmod(radians, 2.0 * M_PI);
    if (result <= -M_PI) {
        result += 2.0 * M_PI;
    } else if (result > M_PI) {
        result -= 2.0 * M_PI;
    }
    return result;
}

QPointF rotatePointAround(const QPointF& point, const QPointF& center, double radians)
{
    double c = qCos(radians);
    double s = qSin(radians);
    QPointF rel = point - center;
    return center + QPointF(
        rel.x() * c - rel.y() * s,
        rel.x() * s + rel.y() * c
    );
}

}  // namespace geometry
}  // namespace tangram
