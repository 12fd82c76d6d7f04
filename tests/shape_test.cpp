// =====================================================================
//  tests/shape_test.cpp — Shape construction, containment, transforms
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <tangram/geometry/intersections.h>
#include <tangram/geometry/utils.h>
#include <tangram/shapes/shape.h>

#include <cmath>

using namespace tangram;
using namespace tangram::shapes;
using tangram::geometry::DegenerateGeometry;
using tangram::geometry::Edge;

namespace {

void expectPointNear(const QPointF& actual, const QPointF& expected,
                     double tolerance = 1e-9)
{
    EXPECT_NEAR(actual.x(), expected.x(), tolerance);
    EXPECT_NEAR(actual.y(), expected.y(), tolerance);
}

void expectVerticesNear(const Shape& shape, const QVector<QPointF>& expected)
{
    ASSERT_EQ(shape.vertexCount(), expected.size());
    for (int i = 0; i < expected.size(); ++i) {
        SCOPED_TRACE(i);
        expectPointNear(shape.vertex(i), expected[i]);
    }
}

}  // namespace

// ---- Construction ----------------------------------------------------

TEST(ShapeTest, TriangleIncenter) {
    Shape t = createTriangle(QPointF(-22, -7), QPointF(11, 23), QPointF(12, -12));
    EXPECT_EQ(t.type(), ShapeType::Triangle);
    EXPECT_EQ(t.vertexCount(), 3);
    EXPECT_NEAR(t.referencePoint().x(), 1.25, 0.01);
    EXPECT_NEAR(t.referencePoint().y(), 0.09, 0.01);
    EXPECT_NEAR(t.innerRadius(), 10.40, 0.01);
}

TEST(ShapeTest, EquilateralTriangle) {
    const double s = 2 * std::sqrt(3.0);
    Shape t = createTriangle(QPointF(0, 4), QPointF(s, -2), QPointF(-s, -2));
    expectPointNear(t.referencePoint(), QPointF(0, 0));
    EXPECT_NEAR(t.innerRadius(), 2.0, 1e-9);
}

TEST(ShapeTest, InnerCircleTouchesEveryEdge) {
    Shape t = createTriangle(QPointF(2, 1), QPointF(5, 2), QPointF(3, 4));
    for (const Edge& e : t.edges()) {
        EXPECT_NEAR(geometry::pointToLineDistance(
                        t.referencePoint(), e.tail,
                        geometry::vectorBetween(e.tail, e.head)),
                    t.innerRadius(), 1e-9);
    }
}

TEST(ShapeTest, CollinearTriangleThrows) {
    EXPECT_THROW(createTriangle(QPointF(0, 0), QPointF(1, 1), QPointF(3, 3)),
                 DegenerateGeometry);
}

TEST(ShapeTest, SmallTriangleIsNotCollinear) {
    // Right isosceles triangle with legs of 1e-6
    Shape t = createTriangle(QPointF(0, 0), QPointF(1e-6, 0), QPointF(0, 1e-6));
    const double r = (2.0 - std::sqrt(2.0)) / 2.0 * 1e-6;
    EXPECT_NEAR(t.innerRadius(), r, 1e-15);
    EXPECT_NEAR(t.referencePoint().x(), r, 1e-15);
    EXPECT_NEAR(t.referencePoint().y(), r, 1e-15);
}

TEST(ShapeTest, RepeatedVertexThrows) {
    EXPECT_THROW(createTriangle(QPointF(1, 1), QPointF(1, 1), QPointF(3, 0)),
                 DegenerateGeometry);
}

TEST(ShapeTest, VertexCountMustMatchType) {
    EXPECT_THROW(Shape(ShapeType::Quadrilateral,
                       {QPointF(0, 0), QPointF(1, 0), QPointF(1, 1)},
                       QPointF(0.5, 0.5), 0.1),
                 DegenerateGeometry);
    EXPECT_THROW(Shape(ShapeType::Triangle, {QPointF(0, 0), QPointF(1, 0)},
                       QPointF(0.5, 0.2), 0.1),
                 DegenerateGeometry);
    EXPECT_THROW(Shape(ShapeType::Triangle,
                       {QPointF(0, 0), QPointF(1, 0), QPointF(1, 1), QPointF(0, 1)},
                       QPointF(0.5, 0.5), 0.1),
                 DegenerateGeometry);
    EXPECT_NO_THROW(Shape(ShapeType::Quadrilateral,
                          {QPointF(0, 0), QPointF(1, 0), QPointF(1, 1), QPointF(0, 1)},
                          QPointF(0.5, 0.5), 0.5));
}

TEST(ShapeTest, Parallelogram) {
    Shape q = createQuadrilateral(QPointF(2, 1), QPointF(7, 1), QPointF(8, 4));
    EXPECT_EQ(q.type(), ShapeType::Quadrilateral);
    ASSERT_EQ(q.vertexCount(), 4);
    EXPECT_EQ(q.vertex(0), QPointF(2, 1));
    EXPECT_EQ(q.vertex(1), QPointF(7, 1));
    EXPECT_EQ(q.vertex(2), QPointF(8, 4));
    EXPECT_DOUBLE_EQ(q.vertex(3).x(), 3.0);
    EXPECT_DOUBLE_EQ(q.vertex(3).y(), 4.0);
    EXPECT_DOUBLE_EQ(q.referencePoint().x(), 5.0);
    EXPECT_DOUBLE_EQ(q.referencePoint().y(), 2.5);
    EXPECT_DOUBLE_EQ(q.innerRadius(), 1.5);
}

TEST(ShapeTest, DegenerateParallelogramThrows) {
    EXPECT_THROW(createQuadrilateral(QPointF(0, 0), QPointF(1, 1), QPointF(2, 2)),
                 DegenerateGeometry);
}

TEST(ShapeTest, EdgesStartWithClosingEdge) {
    Shape t = createTriangle(QPointF(2, 1), QPointF(5, 2), QPointF(3, 4));
    const QVector<Edge> edges = t.edges();
    ASSERT_EQ(edges.size(), 3);
    EXPECT_EQ(edges[0], (Edge{QPointF(3, 4), QPointF(2, 1)}));
    EXPECT_EQ(edges[1], (Edge{QPointF(2, 1), QPointF(5, 2)}));
    EXPECT_EQ(edges[2], (Edge{QPointF(5, 2), QPointF(3, 4)}));
}

// ---- Containment -----------------------------------------------------

TEST(ShapeTest, TriangleContainsExcludesOutside) {
    EXPECT_FALSE(triangleContains(QPointF(1, 1),
                                  QPointF(0, 1), QPointF(1, -1), QPointF(-1, -1)));
}

TEST(ShapeTest, TriangleContainsBoundary) {
    EXPECT_TRUE(triangleContains(QPointF(0, 1),
                                 QPointF(0, 1), QPointF(1, -1), QPointF(-1, -1)));
    EXPECT_TRUE(triangleContains(QPointF(5, 2.5),
                                 QPointF(3, 1), QPointF(6, 1), QPointF(7, 4)));
}

TEST(ShapeTest, ParallelogramContains) {
    Shape q = createQuadrilateral(QPointF(2, 1), QPointF(7, 1), QPointF(8, 4));
    EXPECT_TRUE(q.contains(QPointF(4, 3)));
    EXPECT_TRUE(q.contains(QPointF(6, 2)));
    EXPECT_TRUE(q.contains(QPointF(3, 4)));
    EXPECT_FALSE(q.contains(QPointF(2, 3)));
    EXPECT_FALSE(q.contains(QPointF(8, 1.5)));
}

// ---- Transforms ------------------------------------------------------

TEST(ShapeTest, RotateAboutOrigin) {
    Shape t(ShapeType::Triangle, {QPointF(0, 0), QPointF(0, 3), QPointF(1, 0)},
            QPointF(0, 0), 0.5);
    t.rotate(M_PI);
    expectVerticesNear(t, {QPointF(0, 0), QPointF(0, -3), QPointF(-1, 0)});

    Shape u(ShapeType::Triangle, {QPointF(0, 0), QPointF(0, 3), QPointF(1, 0)},
            QPointF(0, 0), 0.5);
    u.rotate(M_PI / 2);
    expectVerticesNear(u, {QPointF(0, 0), QPointF(-3, 0), QPointF(0, 1)});
}

TEST(ShapeTest, RotateKeepsReferencePoint) {
    Shape t(ShapeType::Triangle, {QPointF(1, -2), QPointF(4, 5), QPointF(6, -2)},
            QPointF(4, 5), 1.0);
    t.rotate(M_PI / 2);
    expectVerticesNear(t, {QPointF(11, 2), QPointF(4, 5), QPointF(11, 7)});
    expectPointNear(t.referencePoint(), QPointF(4, 5));
    EXPECT_DOUBLE_EQ(t.innerRadius(), 1.0);
}

TEST(ShapeTest, MoveTo) {
    Shape t(ShapeType::Triangle, {QPointF(0, 0), QPointF(0, 3), QPointF(2, 0)},
            QPointF(4, 6), 0.5);
    t.moveTo(QPointF(1, 2));
    expectVerticesNear(t, {QPointF(-3, -4), QPointF(-3, -1), QPointF(-1, -4)});
    expectPointNear(t.referencePoint(), QPointF(1, 2));
}

TEST(ShapeTest, MoveBy) {
    Shape t(ShapeType::Triangle, {QPointF(0, 0), QPointF(0, 3), QPointF(2, 0)},
            QPointF(4, 6), 0.5);
    t.moveBy(QPointF(1, 2));
    expectVerticesNear(t, {QPointF(1, 2), QPointF(1, 5), QPointF(3, 2)});
    expectPointNear(t.referencePoint(), QPointF(5, 8));
}

TEST(ShapeTest, RigidMotionPreservesContainment) {
    Shape t = createTriangle(QPointF(2, 1), QPointF(5, 2), QPointF(3, 4));
    t.rotate(0.7);
    t.moveBy(QPointF(-3, 8));
    EXPECT_TRUE(t.contains(t.referencePoint()));
    for (const Edge& e : t.edges()) {
        EXPECT_NEAR(geometry::pointToLineDistance(
                        t.referencePoint(), e.tail,
                        geometry::vectorBetween(e.tail, e.head)),
                    t.innerRadius(), 1e-9);
    }
}

TEST(ShapeTest, InverseRotationRestoresVertices) {
    const Shape original = createQuadrilateral(QPointF(2, 1), QPointF(7, 1), QPointF(8, 4));
    for (double angle : {0.3, -1.2, 2.9, M_PI}) {
        SCOPED_TRACE(angle);
        Shape s = original;
        s.rotate(angle);
        s.rotate(-angle);
        expectVerticesNear(s, original.vertices());
    }

    Shape full = original;
    full.rotate(2 * M_PI);
    expectVerticesNear(full, original.vertices());
}

TEST(ShapeTest, InverseTranslationRestoresShape) {
    const Shape original = createTriangle(QPointF(-22, -7), QPointF(11, 23), QPointF(12, -12));
    const QPointF offset(13.5, -4.25);

    Shape s = original;
    s.moveBy(offset);
    s.moveBy(-offset);
    expectVerticesNear(s, original.vertices());
    expectPointNear(s.referencePoint(), original.referencePoint());
}

TEST(ShapeTest, ContainsOwnReferencePoint) {
    const Shape shapes[] = {
        createTriangle(QPointF(2, 1), QPointF(5, 2), QPointF(3, 4)),
        createTriangle(QPointF(-22, -7), QPointF(11, 23), QPointF(12, -12)),
        createTriangle(QPointF(0, 0), QPointF(100, 1), QPointF(50, 2)),
        createQuadrilateral(QPointF(2, 1), QPointF(7, 1), QPointF(8, 4)),
        createQuadrilateral(QPointF(0, 0), QPointF(-3, 5), QPointF(40, 6))
    };
    for (const Shape& s : shapes) {
        EXPECT_TRUE(s.contains(s.referencePoint()));
    }
}
