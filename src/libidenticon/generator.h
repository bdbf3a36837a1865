// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_GENERATOR_H
#define LIBIDENTICON_GENERATOR_H

#include "libidenticon/core/image.h"
#include "libidenticon/core/result.h"
#include "libidenticon/settings.h"
#include <QImage>
#include <optional>

class QByteArray;
class QString;

namespace identicon {

/**
 * @brief Compute color, grid and pixel map from an already hashed input
 *
 * Fails with InsufficientData if the digest is too short to pick a color.
 */
std::optional<Image>
buildImage(const HashedImage &hashed, Result *outResult = nullptr);

//! Hash the input and compute the identicon from it
std::optional<Image>
buildImage(const QByteArray &input, Result *outResult = nullptr);

/**
 * @brief Generate a (repeatable) identicon image from the given string
 *
 * Nothing is written to disk. Returns a null image on failure.
 */
QImage makeIdenticon(const QString &input);

/**
 * @brief Generate the identicon for input and write it to disk
 *
 * The file is named after the input itself, see the other overload.
 */
Result generate(
	const QString &input, const Settings &settings = Settings(),
	QString *outError = nullptr);

/**
 * @brief Generate the identicon for input and store it as name
 *
 * The file ends up at imagePath(name, settings). Errors from encoding or
 * writing are passed on in outError unchanged.
 */
Result generate(
	const QString &input, const QString &name, const Settings &settings,
	QString *outError = nullptr);

}

#endif
