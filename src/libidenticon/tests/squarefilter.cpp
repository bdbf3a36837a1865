// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/core/squarefilter.h"
#include "libidenticon/core/gridbuilder.h"
#include "libidenticon/core/hasher.h"
#include "referencedata.h"
#include <QtTest/QtTest>

using identicon::Grid;
using identicon::GriddedImage;

class TestSquareFilter final : public QObject {
	Q_OBJECT
private slots:
	void testExampleFilter()
	{
		GriddedImage filtered = identicon::filterOddSquares(GriddedImage(
			reference::exampleHex(), reference::exampleColor(),
			reference::exampleGrid()));
		QCOMPARE(filtered.grid(), reference::exampleFilteredGrid());
		QCOMPARE(filtered.hex(), reference::exampleHex());
		QCOMPARE(filtered.color(), reference::exampleColor());
	}

	void testKeepsEvenCellsInOrder()
	{
		for(int i = 0; i < 50; ++i) {
			identicon::Digest hex =
				identicon::hashInput(QByteArray::number(i)).hex();
			Grid grid =
				identicon::buildGrid(identicon::ColoredImage(hex, {0, 0, 0}))
					.grid();
			Grid filtered =
				identicon::filterOddSquares(GriddedImage(hex, {0, 0, 0}, grid))
					.grid();

			int expectedCount = 0;
			for(const identicon::GridCell &cell : grid) {
				if(cell.value % 2 == 0) {
					QVERIFY(filtered.contains(cell));
					++expectedCount;
				}
			}
			QCOMPARE(int(filtered.size()), expectedCount);

			int lastIndex = -1;
			for(const identicon::GridCell &cell : filtered) {
				QCOMPARE(cell.value % 2, 0);
				QVERIFY(cell.index > lastIndex);
				lastIndex = cell.index;
			}
		}
	}

	void testEmptyGrid()
	{
		GriddedImage filtered =
			identicon::filterOddSquares(GriddedImage({}, {0, 0, 0}, {}));
		QVERIFY(filtered.grid().isEmpty());
	}
};


QTEST_GUILESS_MAIN(TestSquareFilter)
#include "squarefilter.moc"
