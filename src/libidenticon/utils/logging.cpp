// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/utils/logging.h"

Q_LOGGING_CATEGORY(lcIdenticon, "net.identicon", QtWarningMsg)
Q_LOGGING_CATEGORY(lcIdenticonRender, "net.identicon.render", QtWarningMsg)
Q_LOGGING_CATEGORY(lcIdenticonExport, "net.identicon.export", QtWarningMsg)
