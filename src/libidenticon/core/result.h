// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_RESULT_H
#define LIBIDENTICON_CORE_RESULT_H

#include <QString>

namespace identicon {

enum class Result {
	Success,
	// A stage got fewer elements than it needs, e.g. a digest shorter than
	// three bytes. This is an integration bug, not a runtime condition.
	InsufficientData,
	EncodeError,
	IoError,
};

QString resultToString(Result result);

}

#endif
