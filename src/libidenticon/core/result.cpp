// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/result.h"
#include <QCoreApplication>

namespace identicon {

QString resultToString(Result result)
{
	constexpr char CONTEXT[] = "identicon";
	switch(result) {
	case Result::Success:
		return QCoreApplication::translate(CONTEXT, "Success.");
	case Result::InsufficientData:
		return QCoreApplication::translate(
			CONTEXT, "Not enough hash data, this is probably a bug.");
	case Result::EncodeError:
		return QCoreApplication::translate(CONTEXT, "Couldn't encode image.");
	case Result::IoError:
		return QCoreApplication::translate(
			CONTEXT, "Couldn't write image file.");
	}
	qWarning("Unhandled result %d in %s", int(result), __func__);
	return QCoreApplication::translate(CONTEXT, "Unknown error.");
}

}
