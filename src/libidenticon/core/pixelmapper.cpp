// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/pixelmapper.h"

namespace identicon {

PixelRect cellRect(int index)
{
	Q_ASSERT(index >= 0);
	const int x = (index % GRID_COLUMNS) * CELL_SIZE;
	const int y = (index / GRID_COLUMNS) * CELL_SIZE;
	return PixelRect{QPoint(x, y), QPoint(x + CELL_SIZE, y + CELL_SIZE)};
}

Image buildPixelMap(const GriddedImage &image)
{
	const Grid &grid = image.grid();
	PixelMap pixelMap;
	pixelMap.reserve(grid.size());
	for(const GridCell &cell : grid) {
		pixelMap.append(cellRect(cell.index));
	}
	return Image(image.hex(), image.color(), grid, pixelMap);
}

}
