// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/colorpicker.h"
#include "libidenticon/utils/logging.h"

namespace identicon {

std::optional<ColoredImage> pickColor(const HashedImage &image, Result *outResult)
{
	const Digest &hex = image.hex();
	if(hex.size() < 3) {
		qCWarning(
			lcIdenticon, "Can't pick a color from %d digest byte(s)",
			int(hex.size()));
		if(outResult) {
			*outResult = Result::InsufficientData;
		}
		return std::nullopt;
	}

	if(outResult) {
		*outResult = Result::Success;
	}
	return ColoredImage(hex, Color{hex.at(0), hex.at(1), hex.at(2)});
}

}
