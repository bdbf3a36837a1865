// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_UTILS_LOGGING_H
#define LIBIDENTICON_UTILS_LOGGING_H
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcIdenticon)
Q_DECLARE_LOGGING_CATEGORY(lcIdenticonRender)
Q_DECLARE_LOGGING_CATEGORY(lcIdenticonExport)

#endif
