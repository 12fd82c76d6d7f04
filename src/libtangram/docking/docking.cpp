// =====================================================================
//  src/libtangram/docking/docking.cpp — Edge docking (gravity)
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/docking/docking.h>
#include <tangram/geometry/intersections.h>
#include <tangram/geometry/utils.h>

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(lcDocking, "tangram.docking")

namespace tangram {
namespace docking {

using namespace geometry;
using shapes::Shape;

namespace {

/// Lexicographic (-distance, cosTheta, overlap) comparison
bool ranksAbove(const DockingCandidate& a, const DockingCandidate& b)
{
    if (a.distance != b.distance) {
        return a.distance < b.distance;
    }
    if (a.cosTheta != b.cosTheta) {
        return a.cosTheta > b.cosTheta;
    }
    return a.overlap > b.overlap;
}

}  // namespace

// =====================================================================
//  Thresholds
// =====================================================================

DockingThresholds DockingThresholds::fromDegrees(double angleDegrees, double distance)
{
    DockingThresholds t;
    t.angularThresholdCos = qCos(qDegreesToRadians(angleDegrees));
    t.distanceThreshold = distance;
    return t;
}

// =====================================================================
//  Candidate Enumeration
// =====================================================================

QVector<DockingCandidate> dockingCandidates(
    const QVector<Shape>& staticShapes,
    const Shape& floating,
    double angularThresholdCos,
    double distanceThreshold,
    double manualRotateSign,
    const QPointF& manualMove)
{
    QVector<DockingCandidate> result;

    for (const Edge& floatingEdge : floating.edges()) {
        QPointF floatingVector = vectorBetween(floatingEdge.tail, floatingEdge.head);

        // A drag pointing out of this edge means the user is not
        // aiming it at anything
        if (cross(floatingVector, manualMove) > PRECISION) {
            continue;
        }

        double floatingLength = length(floatingVector);
        if (floatingLength < PRECISION) {
            continue;
        }

        for (const Shape& shape : staticShapes) {
            for (const Edge& staticEdge : shape.edges()) {
                QPointF staticVector = vectorBetween(staticEdge.tail, staticEdge.head);

                // Rotation turning the floating edge away from
                // antiparallel.  A zero sign never rejects.
                if (cross(staticVector, floatingVector) * manualRotateSign < -PRECISION) {
                    continue;
                }

                double staticLength = length(staticVector);
                if (staticLength < PRECISION) {
                    continue;
                }

                double dist = std::max(
                    pointToLineDistance(floatingEdge.tail, staticEdge.tail, staticVector),
                    pointToLineDistance(floatingEdge.head, staticEdge.tail, staticVector));
                if (dist > distanceThreshold) {
                    continue;
                }

                // Consistent winding: docked edges point opposite ways
                double cosTheta = -dot(floatingVector, staticVector) /
                                  (floatingLength * staticLength);
                if (cosTheta < angularThresholdCos) {
                    continue;
                }

                // Intersection of the floating edge's projection with
                // the static edge, as fractions of the static edge
                double tTail = projectPointOnLine(floatingEdge.tail, staticEdge.tail, staticVector);
                double tHead = projectPointOnLine(floatingEdge.head, staticEdge.tail, staticVector);
                double lower = std::max(std::min(tTail, tHead), 0.0);
                double upper = std::min(std::max(tTail, tHead), 1.0);
                double overlap = staticLength * (upper - lower);
                if (overlap <= PRECISION) {
                    continue;
                }

                DockingCandidate candidate;
                candidate.distance = dist;
                candidate.cosTheta = cosTheta;
                candidate.overlap = overlap;
                candidate.pair = DockingPair{staticEdge, floatingEdge};
                result.append(candidate);
            }
        }
    }

    return result;
}

// =====================================================================
//  Best Candidate
// =====================================================================

std::optional<DockingPair> dock(
    const QVector<Shape>& staticShapes,
    const Shape& floating,
    double angularThresholdCos,
    double distanceThreshold,
    double manualRotateSign,
    const QPointF& manualMove)
{
    const QVector<DockingCandidate> candidates = dockingCandidates(
        staticShapes, floating,
        angularThresholdCos, distanceThreshold,
        manualRotateSign, manualMove);

    // Only a strictly better candidate replaces the current best, so
    // the earliest one wins ties
    const DockingCandidate* best = nullptr;
    for (const DockingCandidate& c : candidates) {
        if (!best || ranksAbove(c, *best)) {
            best = &c;
        }
    }

    if (!best) {
        return std::nullopt;
    }

    qCDebug(lcDocking) << "dock:" << candidates.size() << "candidate(s), best d="
                       << best->distance << "cos=" << best->cosTheta
                       << "overlap=" << best->overlap;
    return best->pair;
}

std::optional<DockingPair> dock(
    const QVector<Shape>& staticShapes,
    const Shape& floating,
    const DockingThresholds& thresholds,
    double manualRotateSign,
    const QPointF& manualMove)
{
    return dock(staticShapes, floating,
                thresholds.angularThresholdCos, thresholds.distanceThreshold,
                manualRotateSign, manualMove);
}

// =====================================================================
//  Snap Transform
// =====================================================================

DockingTransform dockingTransform(const DockingPair& pair, const QPointF& pivot)
{
    const Edge& s = pair.staticEdge;
    const Edge& f = pair.floatingEdge;
    QPointF staticVector = vectorBetween(s.tail, s.head);

    DockingTransform result;

    // Turn the floating edge until it points against the static edge
    result.angle = normalizeAngle(
        inclinationAngle(s.tail, s.head) + M_PI - inclinationAngle(f.tail, f.head));

    // Then close the perpendicular gap
    QPointF rotatedTail = rotatePointAround(f.tail, pivot, result.angle);
    double t = projectPointOnLine(rotatedTail, s.tail, staticVector);
    QPointF foot = s.tail + t * staticVector;
    result.offset = foot - rotatedTail;

    return result;
}

}  // namespace docking
}  // namespace tangram
