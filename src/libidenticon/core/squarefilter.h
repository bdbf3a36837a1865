// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_SQUAREFILTER_H
#define LIBIDENTICON_CORE_SQUAREFILTER_H

#include "libidenticon/core/image.h"

namespace identicon {

//! Keep only the cells with an even value, in order, with their indices
GriddedImage filterOddSquares(const GriddedImage &image);

}

#endif
