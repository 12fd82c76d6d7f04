// =====================================================================
//  src/libtangram/tangram/shapes/shape.h — Rigid polygon shapes
// =====================================================================
//
//  A shape is a convex polygon (triangle or quadrilateral) together
//  with two values derived once at construction:
//
//    reference point: rotation pivot and inner circle centre
//      (incenter of a triangle, diagonal intersection of a
//      quadrilateral);
//    inner radius: distance from the reference point to the nearest
//      edge line.
//
//  Rotation and translation apply the same rigid transform to the
//  vertices and to the reference point; neither value is recomputed
//  from the moved vertices.
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_SHAPES_SHAPE_H
#define TANGRAM_SHAPES_SHAPE_H

#include "../core.h"
#include "../geometry/types.h"

#include <QPointF>
#include <QVector>

namespace tangram {
namespace shapes {

// =====================================================================
//  Shape Types
// =====================================================================

/// Kinds of shapes
enum class ShapeType {
    Triangle,       ///< Three vertices, reference point is the incenter
    Quadrilateral   ///< Parallelogram closed from three vertices
};

// =====================================================================
//  Shape
// =====================================================================

class TANGRAM_EXPORT Shape {
public:
    /// Build a shape from already-derived data.  Prefer the factory
    /// functions, which derive the reference point and inner radius.
    /// @throws geometry::DegenerateGeometry if the vertex count does not
    ///         match the type (3 for Triangle, 4 for Quadrilateral)
    Shape(ShapeType type, const QVector<QPointF>& vertices,
          const QPointF& referencePoint, double innerRadius);

    ShapeType type() const { return m_type; }

    /// Vertices in the winding order fixed at construction
    const QVector<QPointF>& vertices() const { return m_vertices; }

    int vertexCount() const { return m_vertices.size(); }

    QPointF vertex(int index) const { return m_vertices.at(index); }

    QPointF referencePoint() const { return m_referencePoint; }

    double innerRadius() const { return m_innerRadius; }

    /// Boundary edges, starting with (last vertex, first vertex)
    QVector<geometry::Edge> edges() const;

    /// Check if a point is inside the shape (boundary counts as inside)
    bool contains(const QPointF& point) const;

    // ---- Rigid transforms ----

    /// Rotate about the reference point (radians, CCW positive)
    void rotate(double radians);

    /// Translate so that the reference point lands on the given point
    void moveTo(const QPointF& point);

    /// Translate by the given offset
    void moveBy(const QPointF& offset);

private:
    ShapeType m_type;
    QVector<QPointF> m_vertices;
    QPointF m_referencePoint;
    double m_innerRadius;
};

// =====================================================================
//  Shape Factory Functions
// =====================================================================

/// Create a triangle.  The reference point is the intersection of the
/// internal angle bisectors at a and c.
/// @throws geometry::DegenerateGeometry if the vertices are collinear
TANGRAM_EXPORT Shape createTriangle(const QPointF& a, const QPointF& b,
                                    const QPointF& c);

/// Create a parallelogram from three consecutive vertices.  The fourth
/// vertex is a + c - b; the reference point is the diagonal
/// intersection.
/// @throws geometry::DegenerateGeometry if the diagonals are parallel
TANGRAM_EXPORT Shape createQuadrilateral(const QPointF& a, const QPointF& b,
                                         const QPointF& c);

// =====================================================================
//  Containment Helpers
// =====================================================================

/// Check if a point lies inside the triangle (a, b, c), boundary
/// included.  The vertices must not be collinear.
TANGRAM_EXPORT bool triangleContains(const QPointF& point,
                                     const QPointF& a, const QPointF& b,
                                     const QPointF& c);

}  // namespace shapes
}  // namespace tangram

#endif  // TANGRAM_SHAPES_SHAPE_H
