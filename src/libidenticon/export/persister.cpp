// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/export/persister.h"
#include "libidenticon/settings.h"
#include "libidenticon/utils/logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QSaveFile>

namespace identicon {

QString imagePath(const QString &name, const Settings &settings)
{
	return QDir(settings.outputDirectory)
		.filePath(
			QStringLiteral("%1.%2").arg(
				name, QString::fromLatin1(settings.imageFormat)));
}

bool saveImage(
	const QByteArray &bytes, const QString &name, const Settings &settings,
	QString *outPath, QString &outError)
{
	const QString path = imagePath(name, settings);
	if(outPath) {
		*outPath = path;
	}

	QSaveFile file(path);
	if(!file.open(QIODevice::WriteOnly)) {
		outError = file.errorString();
		qCWarning(
			lcIdenticonExport, "Error opening '%s': %s", qUtf8Printable(path),
			qUtf8Printable(outError));
		return false;
	}

	qint64 written = file.write(bytes);
	if(written != bytes.size()) {
		outError = written < 0 ? file.errorString()
							   : QCoreApplication::translate(
									 "identicon", "Could not write entire file");
		qCWarning(
			lcIdenticonExport, "Error writing '%s': %s", qUtf8Printable(path),
			qUtf8Printable(outError));
		file.cancelWriting();
		return false;
	}

	if(!file.commit()) {
		outError = file.errorString();
		qCWarning(
			lcIdenticonExport, "Error committing '%s': %s",
			qUtf8Printable(path), qUtf8Printable(outError));
		return false;
	}

	qCDebug(
		lcIdenticonExport, "Wrote %lld byte(s) to '%s'",
		static_cast<long long>(written), qUtf8Printable(path));
	return true;
}

}
