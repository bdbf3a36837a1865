// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/render/rasterizer.h"
#include "libidenticon/utils/logging.h"
#include <QBuffer>
#include <QImageWriter>
#include <QPainter>
#include <QRect>

namespace identicon {

QImage drawImage(const Image &image)
{
	QImage canvas(CANVAS_SIZE, CANVAS_SIZE, QImage::Format_RGB32);
	canvas.fill(Qt::white);

	const QColor color = image.color().toQColor();
	QPainter painter(&canvas);
	for(const PixelRect &rect : image.pixelMap()) {
		painter.fillRect(
			QRect(
				rect.topLeft,
				QSize(
					rect.bottomRight.x() - rect.topLeft.x(),
					rect.bottomRight.y() - rect.topLeft.y())),
			color);
	}
	painter.end();

	qCDebug(
		lcIdenticonRender, "Filled %d rectangle(s)",
		int(image.pixelMap().size()));
	return canvas;
}

bool encodeImage(
	const QImage &image, const QByteArray &format, QByteArray &outBytes,
	QString &outError)
{
	QByteArray bytes;
	QBuffer buffer(&bytes);
	if(!buffer.open(QIODevice::WriteOnly)) {
		outError = buffer.errorString();
		return false;
	}

	QImageWriter writer(&buffer, format);
	if(!writer.write(image)) {
		outError = writer.errorString();
		qCWarning(
			lcIdenticonRender, "Error encoding %s image: %s",
			format.constData(), qUtf8Printable(outError));
		return false;
	}

	buffer.close();
	outBytes = bytes;
	return true;
}

}
