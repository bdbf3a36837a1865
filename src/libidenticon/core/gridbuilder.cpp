// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/gridbuilder.h"
#include "libidenticon/utils/logging.h"

namespace identicon {

static constexpr int GROUP_SIZE = 3;

QVector<quint8> mirrorRow(const QVector<quint8> &row)
{
	if(row.size() < 2) {
		return row;
	}
	QVector<quint8> mirrored = row;
	mirrored.append(row.at(1));
	mirrored.append(row.at(0));
	return mirrored;
}

GriddedImage buildGrid(const ColoredImage &image)
{
	const Digest &hex = image.hex();
	const int groups = int(hex.size()) / GROUP_SIZE;

	Grid grid;
	grid.reserve(groups * GRID_COLUMNS);
	for(int group = 0; group < groups; ++group) {
		const QVector<quint8> row =
			mirrorRow(hex.mid(group * GROUP_SIZE, GROUP_SIZE));
		for(quint8 value : row) {
			grid.append(GridCell{value, int(grid.size())});
		}
	}

	qCDebug(
		lcIdenticon, "Built %d grid cells from %d digest byte(s)",
		int(grid.size()), int(hex.size()));
	return GriddedImage(hex, image.color(), grid);
}

}
