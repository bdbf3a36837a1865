// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_HASHER_H
#define LIBIDENTICON_CORE_HASHER_H

#include "libidenticon/core/image.h"

class QByteArray;
class QString;

namespace identicon {

/**
 * @brief Hash the input bytes into a 16 byte MD5 digest
 *
 * Any input works, including an empty one.
 */
HashedImage hashInput(const QByteArray &input);

//! Hash the UTF-8 encoding of the given string
HashedImage hashInput(const QString &input);

}

#endif
