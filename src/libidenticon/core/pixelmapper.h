// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_PIXELMAPPER_H
#define LIBIDENTICON_CORE_PIXELMAPPER_H

#include "libidenticon/core/image.h"

namespace identicon {

//! Get the canvas rectangle of the cell at the given row-major index
PixelRect cellRect(int index);

/**
 * @brief Map every remaining grid cell to its canvas rectangle
 *
 * The pixel map has the same length and order as the grid.
 */
Image buildPixelMap(const GriddedImage &image);

}

#endif
