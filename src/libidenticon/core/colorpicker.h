// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_COLORPICKER_H
#define LIBIDENTICON_CORE_COLORPICKER_H

#include "libidenticon/core/image.h"
#include "libidenticon/core/result.h"
#include <optional>

namespace identicon {

/**
 * @brief Use the first three digest bytes as the red, green and blue values
 *
 * Returns nothing and sets outResult to InsufficientData if the digest has
 * fewer than three bytes.
 */
std::optional<ColoredImage>
pickColor(const HashedImage &image, Result *outResult = nullptr);

}

#endif
