// =====================================================================
//  src/libtangram/shapes/puzzle.cpp — Standard tangram piece set
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/shapes/puzzle.h>

#include <QPoint>

#include <iterator>

namespace tangram {
namespace shapes {

namespace {

// (column, row) of each piece's starting cell
const QPoint kStartCells[] = {
    {0, 0}, {1, 0}, {2, 1},
    {2, 2}, {0, 1}, {0, 2},
    {2, 0}
};

constexpr int kGridSize = 3;

}  // namespace

QVector<Shape> standardPuzzle()
{
    return {
        createTriangle(QPointF(0, 0), QPointF(60, 60), QPointF(0, 120)),
        createTriangle(QPointF(0, 0), QPointF(60, 0), QPointF(30, 30)),
        createTriangle(QPointF(60, 0), QPointF(120, 0), QPointF(120, 60)),
        createTriangle(QPointF(0, 120), QPointF(60, 60), QPointF(120, 120)),
        createTriangle(QPointF(60, 60), QPointF(90, 30), QPointF(90, 90)),
        createQuadrilateral(QPointF(60, 0), QPointF(90, 30), QPointF(60, 60)),
        createQuadrilateral(QPointF(90, 30), QPointF(120, 60), QPointF(120, 120))
    };
}

void arrangeInGrid(QVector<Shape>& shapes, const QSizeF& fieldSize)
{
    const double cellW = fieldSize.width() / kGridSize;
    const double cellH = fieldSize.height() / kGridSize;
    const int cellCount = static_cast<int>(std::size(kStartCells));

    for (int i = 0; i < shapes.size() && i < cellCount; ++i) {
        const QPoint& cell = kStartCells[i];
        shapes[i].moveTo(QPointF((cell.x() + 0.5) * cellW,
                                 (cell.y() + 0.5) * cellH));
    }
}

}  // namespace shapes
}  // namespace tangram
