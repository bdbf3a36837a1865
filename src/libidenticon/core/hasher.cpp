// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/hasher.h"
#include <QByteArray>
#include <QCryptographicHash>
#include <QString>

namespace identicon {

HashedImage hashInput(const QByteArray &input)
{
	const QByteArray hash =
		QCryptographicHash::hash(input, QCryptographicHash::Md5);
	Q_ASSERT(hash.size() == DIGEST_LENGTH);

	Digest hex;
	hex.reserve(hash.size());
	for(char c : hash) {
		hex.append(quint8(c));
	}
	return HashedImage(hex);
}

HashedImage hashInput(const QString &input)
{
	return hashInput(input.toUtf8());
}

}
