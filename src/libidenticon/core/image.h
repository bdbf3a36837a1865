// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_IMAGE_H
#define LIBIDENTICON_CORE_IMAGE_H

#include <QColor>
#include <QPoint>
#include <QVector>
#include <QtGlobal>

class QDebug;

namespace identicon {

//! Number of bytes produced by the hasher
constexpr int DIGEST_LENGTH = 16;

//! Side length of one grid cell in pixels
constexpr int CELL_SIZE = 50;

//! Number of cells per grid row (and rows per grid)
constexpr int GRID_COLUMNS = 5;

//! Side length of the finished square canvas
constexpr int CANVAS_SIZE = GRID_COLUMNS * CELL_SIZE;

using Digest = QVector<quint8>;

struct Color {
	quint8 red;
	quint8 green;
	quint8 blue;

	QColor toQColor() const { return QColor(red, green, blue); }
};

/**
 * @brief One cell of the 5x5 layout
 *
 * The index is the cell's position in the unfiltered row-major layout
 * and is never recomputed, even after cells are filtered out.
 */
struct GridCell {
	quint8 value;
	int index;
};

using Grid = QVector<GridCell>;

//! Rectangle covering the half-open pixel range [topLeft, bottomRight)
struct PixelRect {
	QPoint topLeft;
	QPoint bottomRight;
};

using PixelMap = QVector<PixelRect>;

/**
 * @brief Output of the hasher: the raw digest
 */
class HashedImage {
public:
	explicit HashedImage(const Digest &hex) : m_hex(hex) {}

	const Digest &hex() const { return m_hex; }

private:
	Digest m_hex;
};

/**
 * @brief Digest plus the color picked from it
 */
class ColoredImage {
public:
	ColoredImage(const Digest &hex, const Color &color)
		: m_hex(hex), m_color(color)
	{
	}

	const Digest &hex() const { return m_hex; }
	const Color &color() const { return m_color; }

private:
	Digest m_hex;
	Color m_color;
};

/**
 * @brief Digest, color and cell grid
 *
 * The grid holds all 25 cells right after the grid builder and only the
 * painted ones after the square filter.
 */
class GriddedImage {
public:
	GriddedImage(const Digest &hex, const Color &color, const Grid &grid)
		: m_hex(hex), m_color(color), m_grid(grid)
	{
	}

	const Digest &hex() const { return m_hex; }
	const Color &color() const { return m_color; }
	const Grid &grid() const { return m_grid; }

private:
	Digest m_hex;
	Color m_color;
	Grid m_grid;
};

class Image;

Image buildPixelMap(const GriddedImage &image);

/**
 * @brief The fully computed identicon, ready to be rasterized
 *
 * The pixel map has exactly one rectangle per grid cell, in grid order.
 * Only buildPixelMap creates these.
 */
class Image {
public:
	const Digest &hex() const { return m_hex; }
	const Color &color() const { return m_color; }
	const Grid &grid() const { return m_grid; }
	const PixelMap &pixelMap() const { return m_pixelMap; }

private:
	friend Image buildPixelMap(const GriddedImage &image);

	Image(
		const Digest &hex, const Color &color, const Grid &grid,
		const PixelMap &pixelMap)
		: m_hex(hex), m_color(color), m_grid(grid), m_pixelMap(pixelMap)
	{
		Q_ASSERT(grid.size() == pixelMap.size());
	}

	Digest m_hex;
	Color m_color;
	Grid m_grid;
	PixelMap m_pixelMap;
};

bool operator==(const Color &a, const Color &b);
bool operator!=(const Color &a, const Color &b);
bool operator==(const GridCell &a, const GridCell &b);
bool operator!=(const GridCell &a, const GridCell &b);
bool operator==(const PixelRect &a, const PixelRect &b);
bool operator!=(const PixelRect &a, const PixelRect &b);
bool operator==(const Image &a, const Image &b);
bool operator!=(const Image &a, const Image &b);

QDebug operator<<(QDebug debug, const Color &color);
QDebug operator<<(QDebug debug, const GridCell &cell);
QDebug operator<<(QDebug debug, const PixelRect &rect);
QDebug operator<<(QDebug debug, const Image &image);

}

#endif
