// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/settings.h"
#include "cmake-config/config.h"
#include "libidenticon/utils/logging.h"
#include <QImageWriter>
#include <QSettings>

namespace identicon {

static const QString OUTPUT_DIRECTORY_KEY =
	QStringLiteral("identicon/outputDirectory");
static const QString IMAGE_FORMAT_KEY = QStringLiteral("identicon/imageFormat");

QByteArray Settings::defaultImageFormat()
{
	return QByteArray(cmake_config::defaultImageFormat());
}

Settings Settings::load(QSettings &settings)
{
	Settings s;
	s.outputDirectory =
		settings.value(OUTPUT_DIRECTORY_KEY, s.outputDirectory).toString();

	QByteArray format =
		settings
			.value(IMAGE_FORMAT_KEY, QString::fromLatin1(s.imageFormat))
			.toString()
			.toLower()
			.toLatin1();
	if(QImageWriter::supportedImageFormats().contains(format)) {
		s.imageFormat = format;
	} else {
		qCWarning(
			lcIdenticon, "Unsupported image format '%s', using '%s'",
			format.constData(), s.imageFormat.constData());
	}

	return s;
}

void Settings::save(QSettings &settings) const
{
	settings.setValue(OUTPUT_DIRECTORY_KEY, outputDirectory);
	settings.setValue(IMAGE_FORMAT_KEY, QString::fromLatin1(imageFormat));
}

}
