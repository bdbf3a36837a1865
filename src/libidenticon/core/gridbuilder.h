// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBIDENTICON_CORE_GRIDBUILDER_H
#define LIBIDENTICON_CORE_GRIDBUILDER_H

#include "libidenticon/core/image.h"

namespace identicon {

/**
 * @brief Mirror a row around its last element
 *
 * [a, b, c] becomes [a, b, c, b, a]. Rows with fewer than two elements
 * are returned as is.
 */
QVector<quint8> mirrorRow(const QVector<quint8> &row);

/**
 * @brief Build the horizontally symmetric cell grid from the digest
 *
 * The digest is cut into groups of three bytes, each mirrored into a row
 * of five. An incomplete trailing group is dropped, so a 16 byte digest
 * gives 5 rows and its last byte goes unused. A digest shorter than three
 * bytes gives an empty grid.
 */
GriddedImage buildGrid(const ColoredImage &image);

}

#endif
