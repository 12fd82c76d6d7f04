// =====================================================================
//  src/libtangram/tangram/shapes/puzzle.h — Standard tangram piece set
// =====================================================================
//
//  The seven classic pieces cut from a 120x120 square, and the initial
//  spread of those pieces over a 3x3 grid of the playing field.
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_SHAPES_PUZZLE_H
#define TANGRAM_SHAPES_PUZZLE_H

#include "shape.h"

#include <QSizeF>

namespace tangram {
namespace shapes {

/// Number of pieces in the classic set
constexpr int STANDARD_PIECE_COUNT = 7;

/// Create the five triangles and two quadrilaterals of the classic set
TANGRAM_EXPORT QVector<Shape> standardPuzzle();

/// Move each shape's reference point to the centre of its cell in a
/// 3x3 grid covering the field.  Shapes beyond the cell table keep
/// their position.
TANGRAM_EXPORT void arrangeInGrid(QVector<Shape>& shapes, const QSizeF& fieldSize);

}  // namespace shapes
}  // namespace tangram

#endif  // TANGRAM_SHAPES_PUZZLE_H
