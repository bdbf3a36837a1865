// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_EXPORT_PERSISTER_H
#define LIBIDENTICON_EXPORT_PERSISTER_H

#include <QByteArray>
#include <QString>

namespace identicon {

struct Settings;

//! Get the path "<outputDirectory>/<name>.<imageFormat>"
QString imagePath(const QString &name, const Settings &settings);

/**
 * @brief Write encoded image bytes to the file for the given name
 *
 * An existing file with the same name is replaced atomically. The output
 * directory must already exist. On failure, returns false and sets
 * outError to the file's error string.
 *
 * @param outPath receives the path written to, may be null
 */
bool saveImage(
	const QByteArray &bytes, const QString &name, const Settings &settings,
	QString *outPath, QString &outError);

}

#endif
