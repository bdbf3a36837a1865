// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_RENDER_RASTERIZER_H
#define LIBIDENTICON_RENDER_RASTERIZER_H

#include "libidenticon/core/image.h"
#include <QByteArray>
#include <QImage>
#include <QString>

namespace identicon {

/**
 * @brief Paint the identicon onto a blank white canvas
 *
 * Each pixel map rectangle is filled with the image color. Rectangles
 * cover [topLeft, bottomRight), so neighboring cells never overlap.
 */
QImage drawImage(const Image &image);

/**
 * @brief Encode an image into the given format in memory
 *
 * On failure, outError is set to the image writer's error message.
 */
bool encodeImage(
	const QImage &image, const QByteArray &format, QByteArray &outBytes,
	QString &outError);

}

#endif
