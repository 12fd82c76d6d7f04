// =====================================================================
//  tests/geometry_test.cpp — Vector, angle and line algebra
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <tangram/core.h>
#include <tangram/geometry/intersections.h>
#include <tangram/geometry/utils.h>

#include <cmath>

using namespace tangram::geometry;

namespace {

void expectPointNear(const QPointF& actual, const QPointF& expected,
                     double tolerance = 1e-9)
{
    EXPECT_NEAR(actual.x(), expected.x(), tolerance);
    EXPECT_NEAR(actual.y(), expected.y(), tolerance);
}

}  // namespace

// ---- Vector basics ---------------------------------------------------

TEST(GeometryTest, VectorBetweenPoints) {
    expectPointNear(vectorBetween(QPointF(1, 2), QPointF(4, -1)), QPointF(3, -3));
}

TEST(GeometryTest, Distance) {
    EXPECT_DOUBLE_EQ(distance(QPointF(2, -1), QPointF(5, 3)), 5.0);
    EXPECT_DOUBLE_EQ(distance(QPointF(5, 3), QPointF(5, 3)), 0.0);
}

TEST(GeometryTest, DotAndCross) {
    EXPECT_DOUBLE_EQ(dot(QPointF(1, 2), QPointF(3, 4)), 11.0);
    EXPECT_DOUBLE_EQ(cross(QPointF(1, 0), QPointF(0, 1)), 1.0);
    EXPECT_DOUBLE_EQ(cross(QPointF(0, 1), QPointF(1, 0)), -1.0);
    EXPECT_DOUBLE_EQ(cross(QPointF(2, 3), QPointF(4, 6)), 0.0);
}

TEST(GeometryTest, PerpendicularIsCounterClockwise) {
    expectPointNear(perpendicular(QPointF(1, 0)), QPointF(0, 1));
    expectPointNear(perpendicular(QPointF(2, 3)), QPointF(-3, 2));
}

TEST(GeometryTest, DistanceIsSymmetric) {
    const QPointF points[] = {{0, 0}, {2.5, -1}, {-7, 3.25}, {100, 100}};
    for (const QPointF& a : points) {
        EXPECT_DOUBLE_EQ(distance(a, a), 0.0);
        for (const QPointF& b : points) {
            EXPECT_DOUBLE_EQ(distance(a, b), distance(b, a));
        }
    }
}

// ---- Angles ----------------------------------------------------------

TEST(GeometryTest, InclinationAngle) {
    EXPECT_DOUBLE_EQ(inclinationAngle(QPointF(1, 2), QPointF(3, 2)), 0.0);
    EXPECT_DOUBLE_EQ(inclinationAngle(QPointF(3, 2), QPointF(1, 2)), M_PI);
    EXPECT_DOUBLE_EQ(inclinationAngle(QPointF(1, 2), QPointF(1, 5)), M_PI / 2);
    EXPECT_DOUBLE_EQ(inclinationAngle(QPointF(1, 5), QPointF(1, 2)), -M_PI / 2);
}

TEST(GeometryTest, InclinationOfCoincidentPointsIsZero) {
    EXPECT_DOUBLE_EQ(inclinationAngle(QPointF(4, 4), QPointF(4, 4)), 0.0);
}

TEST(GeometryTest, ReversedInclinationDiffersByPi) {
    const QPointF points[] = {{0, 0}, {2.5, -1}, {-7, 3.25}, {1, 5}};
    for (const QPointF& a : points) {
        for (const QPointF& b : points) {
            if (a == b) {
                continue;
            }
            double diff = inclinationAngle(a, b) - inclinationAngle(b, a);
            EXPECT_NEAR(std::abs(normalizeAngle(diff)), M_PI, 1e-12);
        }
    }
}

TEST(GeometryTest, NormalizeAngle) {
    EXPECT_NEAR(normalizeAngle(3 * M_PI / 2), -M_PI / 2, 1e-12);
    EXPECT_NEAR(normalizeAngle(-3 * M_PI / 2), M_PI / 2, 1e-12);
    EXPECT_NEAR(normalizeAngle(-M_PI), M_PI, 1e-12);
    EXPECT_NEAR(normalizeAngle(5 * M_PI), M_PI, 1e-12);
    EXPECT_NEAR(normalizeAngle(0.25), 0.25, 1e-12);
}

TEST(GeometryTest, RotatePointAround) {
    expectPointNear(rotatePointAround(QPointF(1, 0), QPointF(0, 0), M_PI / 2),
                    QPointF(0, 1));
    expectPointNear(rotatePointAround(QPointF(1, -2), QPointF(4, 5), M_PI / 2),
                    QPointF(11, 2));
    expectPointNear(rotatePointAround(QPointF(4, 5), QPointF(4, 5), 1.3),
                    QPointF(4, 5));
}

// ---- Line intersections ----------------------------------------------

TEST(IntersectionsTest, ParallelLinesThrow) {
    EXPECT_THROW(lineIntersection(QPointF(2, -1), QPointF(2, 3),
                                  QPointF(5, 5), QPointF(3, 4.5)),
                 DegenerateGeometry);
}

TEST(IntersectionsTest, ZeroDirectionThrows) {
    EXPECT_THROW(lineIntersection(QPointF(2, -1), QPointF(0, 0),
                                  QPointF(5, 5), QPointF(1, 0)),
                 DegenerateGeometry);
}

TEST(IntersectionsTest, ShortDirectionsStillIntersect) {
    expectPointNear(lineIntersection(QPointF(0, 0), QPointF(1e-6, 0),
                                     QPointF(3, 1), QPointF(0, 1e-6)),
                    QPointF(3, 0));
}

TEST(IntersectionsTest, GeneralLines) {
    const QPointF base(2, -1);
    const QPointF dir(2, 3);
    expectPointNear(lineIntersection(base, dir, QPointF(7, 0), QPointF(1.5, -1)),
                    QPointF(4, 2));
    expectPointNear(lineIntersection(base, dir, QPointF(7, -2.5), QPointF(4, -3)),
                    QPointF(3, 0.5));
    expectPointNear(lineIntersection(QPointF(7, 6), QPointF(4, 3),
                                     QPointF(2, 6), QPointF(2, 3)),
                    QPointF(-3, -1.5));
}

TEST(IntersectionsTest, AxisAlignedLines) {
    const QPointF base(2, -1);
    const QPointF dir(2, 3);
    expectPointNear(lineIntersection(base, dir, QPointF(3, 1.5), QPointF(0, 1)),
                    QPointF(3, 0.5));
    expectPointNear(lineIntersection(base, dir, QPointF(3, 3.5), QPointF(1, 0)),
                    QPointF(5, 3.5));
}

// ---- Distances and projections ---------------------------------------

TEST(IntersectionsTest, PointToLineDistance) {
    const QPointF p(6, 8);
    EXPECT_NEAR(pointToLineDistance(p, QPointF(-1, 2), QPointF(0, 3)), 7.0, 1e-12);
    EXPECT_NEAR(pointToLineDistance(p, QPointF(4, 5), QPointF(2, 0)), 3.0, 1e-12);
    EXPECT_NEAR(pointToLineDistance(p, QPointF(-1, -1), QPointF(3, 2)),
                std::sqrt(13.0), 1e-12);
}

TEST(IntersectionsTest, PointOnLineHasZeroDistance) {
    EXPECT_NEAR(pointToLineDistance(QPointF(1, 2), QPointF(0, 4), QPointF(1, -2)),
                0.0, 1e-12);
}

TEST(IntersectionsTest, DistanceToDegenerateLineThrows) {
    EXPECT_THROW(pointToLineDistance(QPointF(1, 2), QPointF(0, 4), QPointF(0, 0)),
                 DegenerateGeometry);
}

TEST(IntersectionsTest, ProjectPointOnLine) {
    EXPECT_DOUBLE_EQ(projectPointOnLine(QPointF(3, 7), QPointF(1, 0), QPointF(4, 0)), 0.5);
    EXPECT_DOUBLE_EQ(projectPointOnLine(QPointF(-3, 1), QPointF(1, 0), QPointF(4, 0)), -1.0);
    EXPECT_THROW(projectPointOnLine(QPointF(3, 7), QPointF(1, 0), QPointF(0, 0)),
                 DegenerateGeometry);
}

// ---- Library lifecycle -----------------------------------------------

TEST(CoreTest, VersionAndLifecycle) {
    EXPECT_STREQ(tangram::version(), "1.0.0");
    EXPECT_TRUE(tangram::initialize());
    EXPECT_TRUE(tangram::initialize());
    tangram::shutdown();
}
