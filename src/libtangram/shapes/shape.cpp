// =====================================================================
//  src/libtangram/shapes/shape.cpp — Rigid polygon shapes
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/shapes/shape.h>
#include <tangram/geometry/intersections.h>
#include <tangram/geometry/utils.h>

#include <QLoggingCategory>

#include <algorithm>
#include <string>

Q_LOGGING_CATEGORY(lcShapes, "tangram.shapes")

namespace tangram {
namespace shapes {

using namespace geometry;

// =====================================================================
//  Shape Implementation
// =====================================================================

Shape::Shape(ShapeType type, const QVector<QPointF>& vertices,
             const QPointF& referencePoint, double innerRadius)
    : m_type(type)
    , m_vertices(vertices)
    , m_referencePoint(referencePoint)
    , m_innerRadius(innerRadius)
{
    const int expected = (type == ShapeType::Triangle) ? 3 : 4;
    if (m_vertices.size() != expected) {
        throw DegenerateGeometry(
            "Shape: " + std::to_string(m_vertices.size()) + " vertices given, " +
            std::to_string(expected) + " required");
    }
}

QVector<Edge> Shape::edges() const
{
    QVector<Edge> result;
    if (m_vertices.isEmpty()) {
        return result;
    }

    result.reserve(m_vertices.size());
    QPointF tail = m_vertices.last();
    for (const QPointF& head : m_vertices) {
        result.append(Edge{tail, head});
        tail = head;
    }
    return result;
}

bool Shape::contains(const QPointF& point) const
{
    switch (m_type) {
    case ShapeType::Triangle:
        return triangleContains(point, m_vertices[0], m_vertices[1], m_vertices[2]);

    case ShapeType::Quadrilateral:
        // Two triangles sharing the a-c diagonal
        return triangleContains(point, m_vertices[0], m_vertices[1], m_vertices[2]) ||
               triangleContains(point, m_vertices[2], m_vertices[3], m_vertices[0]);
    }
    return false;
}

void Shape::rotate(double radians)
{
    // The pivot is the reference point, which the rotation leaves fixed
    for (QPointF& v : m_vertices) {
        v = rotatePointAround(v, m_referencePoint, radians);
    }
}

void Shape::moveTo(const QPointF& point)
{
    QPointF offset = vectorBetween(m_referencePoint, point);
    for (QPointF& v : m_vertices) {
        v += offset;
    }
    m_referencePoint = point;
}

void Shape::moveBy(const QPointF& offset)
{
    for (QPointF& v : m_vertices) {
        v += offset;
    }
    m_referencePoint += offset;
}

// =====================================================================
//  Shape Factory Functions
// =====================================================================

Shape createTriangle(const QPointF& a, const QPointF& b, const QPointF& c)
{
    // Relative test: the sine of the angle at a must not vanish
    QPointF ab = vectorBetween(a, b);
    QPointF ac = vectorBetween(a, c);
    if (qAbs(cross(ab, ac)) <= PRECISION * length(ab) * length(ac)) {
        throw DegenerateGeometry("createTriangle: vertices are collinear");
    }

    // Edge inclinations
    double abAngle = inclinationAngle(a, b);
    double acAngle = inclinationAngle(a, c);
    double cbAngle = inclinationAngle(c, b);

    // Internal bisectors at a and c.  Averaging two ray directions gives
    // the bisector line regardless of how atan2 wraps either angle.
    double bisectorA = (abAngle + acAngle) / 2.0;
    double bisectorC = (cbAngle + (acAngle + M_PI)) / 2.0;

    QPointF incenter = lineIntersection(
        a, QPointF(qCos(bisectorA), qSin(bisectorA)),
        c, QPointF(qCos(bisectorC), qSin(bisectorC)));

    double radius = pointToLineDistance(
        incenter, a, QPointF(qCos(acAngle), qSin(acAngle)));

    qCDebug(lcShapes) << "createTriangle:" << a << b << c
                      << "incenter=" << incenter << "r=" << radius;

    return Shape(ShapeType::Triangle, {a, b, c}, incenter, radius);
}

Shape createQuadrilateral(const QPointF& a, const QPointF& b, const QPointF& c)
{
    QPointF d = a + c - b;

    QPointF center = lineIntersection(
        a, vectorBetween(a, c),
        b, vectorBetween(d, b));

    double radius = std::min(
        pointToLineDistance(center, a, vectorBetween(a, b)),
        pointToLineDistance(center, a, vectorBetween(a, d)));

    qCDebug(lcShapes) << "createQuadrilateral:" << a << b << c << d
                      << "center=" << center << "r=" << radius;

    return Shape(ShapeType::Quadrilateral, {a, b, c, d}, center, radius);
}

// =====================================================================
//  Containment Helpers
// =====================================================================

bool triangleContains(const QPointF& point,
                      const QPointF& a, const QPointF& b, const QPointF& c)
{
    const QPointF vertices[3] = {a, b, c};

    // The line through each pair of vertices splits the plane in two.
    // The point is inside iff it shares the half-plane of the third
    // vertex for all three lines.
    for (int n = 0; n < 3; ++n) {
        const QPointF& opposite = vertices[n];
        const QPointF& v1 = vertices[(n + 1) % 3];
        const QPointF& v2 = vertices[(n + 2) % 3];

        QPointF edge = vectorBetween(v1, v2);
        double pointSide = cross(edge, vectorBetween(v1, point));
        double vertexSide = cross(edge, vectorBetween(v1, opposite));

        // On the line: boundary counts as inside
        if (qAbs(pointSide) <= PRECISION) {
            continue;
        }
        if (pointSide * vertexSide < 0.0) {
            return false;
        }
    }
    return true;
}

}  // namespace shapes
}  // namespace tangram
