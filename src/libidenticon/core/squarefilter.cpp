// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/squarefilter.h"

namespace identicon {

GriddedImage filterOddSquares(const GriddedImage &image)
{
	Grid grid;
	for(const GridCell &cell : image.grid()) {
		if(cell.value % 2 == 0) {
			grid.append(cell);
		}
	}
	return GriddedImage(image.hex(), image.color(), grid);
}

}
