// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_SETTINGS_H
#define LIBIDENTICON_SETTINGS_H

#include <QByteArray>
#include <QString>

class QSettings;

namespace identicon {

/**
 * @brief Where and how generated identicons are stored
 *
 * Only the output side is configurable, the image itself always uses the
 * same grid, palette and size.
 */
struct Settings {
	//! Directory the image files are written into
	QString outputDirectory = QStringLiteral(".");

	//! Image format understood by QImageWriter, also used as file extension
	QByteArray imageFormat = defaultImageFormat();

	static QByteArray defaultImageFormat();

	/**
	 * @brief Read settings from the "identicon" group
	 *
	 * Missing keys keep their defaults. An image format that can't be
	 * written is replaced by the default one.
	 */
	static Settings load(QSettings &settings);

	void save(QSettings &settings) const;
};

}

#endif
