// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/generator.h"
#include "libidenticon/core/colorpicker.h"
#include "libidenticon/core/gridbuilder.h"
#include "libidenticon/core/hasher.h"
#include "libidenticon/core/pixelmapper.h"
#include "libidenticon/core/squarefilter.h"
#include "libidenticon/export/persister.h"
#include "libidenticon/render/rasterizer.h"
#include "libidenticon/utils/logging.h"
#include <QByteArray>
#include <QString>

namespace identicon {

std::optional<Image> buildImage(const HashedImage &hashed, Result *outResult)
{
	std::optional<ColoredImage> colored = pickColor(hashed, outResult);
	if(!colored) {
		return std::nullopt;
	}
	return buildPixelMap(filterOddSquares(buildGrid(*colored)));
}

std::optional<Image> buildImage(const QByteArray &input, Result *outResult)
{
	return buildImage(hashInput(input), outResult);
}

QImage makeIdenticon(const QString &input)
{
	std::optional<Image> image = buildImage(input.toUtf8());
	if(!image) {
		return QImage();
	}
	return drawImage(*image);
}

Result generate(
	const QString &input, const Settings &settings, QString *outError)
{
	return generate(input, input, settings, outError);
}

Result generate(
	const QString &input, const QString &name, const Settings &settings,
	QString *outError)
{
	Result result = Result::Success;
	std::optional<Image> image = buildImage(input.toUtf8(), &result);
	if(!image) {
		if(outError) {
			*outError = resultToString(result);
		}
		return result;
	}
	qCDebug(lcIdenticon) << "Generating" << name << *image;

	QByteArray bytes;
	QString error;
	if(!encodeImage(drawImage(*image), settings.imageFormat, bytes, error)) {
		if(outError) {
			*outError = error;
		}
		return Result::EncodeError;
	}

	if(!saveImage(bytes, name, settings, nullptr, error)) {
		if(outError) {
			*outError = error;
		}
		return Result::IoError;
	}

	return Result::Success;
}

}
