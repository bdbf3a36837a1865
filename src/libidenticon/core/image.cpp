// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/image.h"
#include <QDebug>

namespace identicon {

bool operator==(const Color &a, const Color &b)
{
	return a.red == b.red && a.green == b.green && a.blue == b.blue;
}

bool operator!=(const Color &a, const Color &b)
{
	return !(a == b);
}

bool operator==(const GridCell &a, const GridCell &b)
{
	return a.value == b.value && a.index == b.index;
}

bool operator!=(const GridCell &a, const GridCell &b)
{
	return !(a == b);
}

bool operator==(const PixelRect &a, const PixelRect &b)
{
	return a.topLeft == b.topLeft && a.bottomRight == b.bottomRight;
}

bool operator!=(const PixelRect &a, const PixelRect &b)
{
	return !(a == b);
}

bool operator==(const Image &a, const Image &b)
{
	return a.hex() == b.hex() && a.color() == b.color() &&
		   a.grid() == b.grid() && a.pixelMap() == b.pixelMap();
}

bool operator!=(const Image &a, const Image &b)
{
	return !(a == b);
}

QDebug operator<<(QDebug debug, const Color &color)
{
	QDebugStateSaver saver(debug);
	debug.nospace() << "Color(" << int(color.red) << ", " << int(color.green)
					<< ", " << int(color.blue) << ')';
	return debug;
}

QDebug operator<<(QDebug debug, const GridCell &cell)
{
	QDebugStateSaver saver(debug);
	debug.nospace() << "GridCell(" << int(cell.value) << ", " << cell.index
					<< ')';
	return debug;
}

QDebug operator<<(QDebug debug, const PixelRect &rect)
{
	QDebugStateSaver saver(debug);
	debug.nospace() << "PixelRect(" << rect.topLeft << ", " << rect.bottomRight
					<< ')';
	return debug;
}

QDebug operator<<(QDebug debug, const Image &image)
{
	QDebugStateSaver saver(debug);
	const Digest &hex = image.hex();
	debug.nospace() << "Image(hex="
					<< QByteArray(
						   reinterpret_cast<const char *>(hex.constData()),
						   hex.size())
						   .toHex()
					<< ", color=" << image.color()
					<< ", cells=" << image.grid().size() << ')';
	return debug;
}

}
