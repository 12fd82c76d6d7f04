// =====================================================================
//  src/libtangram/tangram/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libtangram.
//  Points and vectors are both QPointF values: a point is a location,
//  a vector is a displacement between two locations.  Lines are never
//  stored; they are passed as (base point, direction vector) or as two
//  points.
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_GEOMETRY_TYPES_H
#define TANGRAM_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QVector>
#include <QtMath>

#include <stdexcept>
#include <string>

namespace tangram {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Precision used for every "is it zero?" decision in the kernel,
/// the shape containment test and the docking filters.
///
/// Parallelism and collinearity are tested relative to the vector
/// lengths, so they hold at any scale.  Containment and the docking
/// filters compare absolute values and assume field coordinates in
/// pixels (edge lengths well above 1e-4).
constexpr double PRECISION = 1e-10;

// =====================================================================
//  Errors
// =====================================================================

/// Raised when a line, intersection or distance computation has no
/// well-defined answer: parallel or coincident directions, zero-length
/// direction vectors, collinear triangle vertices.
class TANGRAM_EXPORT DegenerateGeometry : public std::runtime_error {
public:
    explicit DegenerateGeometry(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

// =====================================================================
//  Edge
// =====================================================================

/// Oriented polygon edge between two adjacent vertices
struct Edge {
    QPointF tail;   ///< Start vertex
    QPointF head;   ///< End vertex (next vertex in winding order)

    bool operator==(const Edge& other) const
    {
        return tail == other.tail && head == other.head;
    }

    bool operator!=(const Edge& other) const
    {
        return !(*this == other);
    }
};

}  // namespace geometry
}  // namespace tangram

#endif  // TANGRAM_GEOMETRY_TYPES_H
