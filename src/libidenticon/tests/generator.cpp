// SPDX-License-Identifier: GPL-3.0-or-later
#include "libidenticon/generator.h"
#include "libidenticon/export/persister.h"
#include "referencedata.h"
#include <QRegularExpression>
#include <QtTest/QtTest>
#include <QTemporaryDir>

using identicon::Result;

class TestGenerator final : public QObject {
	Q_OBJECT
private slots:
	void testBuildExample()
	{
		Result result = Result::IoError;
		std::optional<identicon::Image> image =
			identicon::buildImage(QByteArray("example"), &result);
		QVERIFY(image.has_value());
		QCOMPARE(result, Result::Success);
		QCOMPARE(image->hex(), reference::exampleHex());
		QCOMPARE(image->color(), reference::exampleColor());
		QCOMPARE(image->grid(), reference::exampleFilteredGrid());
		QCOMPARE(image->pixelMap(), reference::examplePixelMap());
	}

	void testDeterministic()
	{
		const QByteArrayList inputs = {"", "a", "example", "identicon"};
		for(const QByteArray &input : inputs) {
			std::optional<identicon::Image> a = identicon::buildImage(input);
			std::optional<identicon::Image> b = identicon::buildImage(input);
			QVERIFY(a.has_value());
			QVERIFY(b.has_value());
			QCOMPARE(*a, *b);
			QCOMPARE(a->pixelMap().size(), a->grid().size());
		}
	}

	void testShortDigest()
	{
		QTest::ignoreMessage(
			QtWarningMsg, "Can't pick a color from 2 digest byte(s)");
		Result result = Result::Success;
		std::optional<identicon::Image> image =
			identicon::buildImage(identicon::HashedImage({4, 2}), &result);
		QVERIFY(!image.has_value());
		QCOMPARE(result, Result::InsufficientData);
		QVERIFY(!identicon::resultToString(result).isEmpty());
	}

	void testMakeIdenticon()
	{
		const QImage image = identicon::makeIdenticon("example");
		QCOMPARE(image.size(), QSize(250, 250));
		QCOMPARE(image.pixel(10, 10), qRgb(26, 121, 164));
		QCOMPARE(image, identicon::makeIdenticon("example"));
		QVERIFY(image != identicon::makeIdenticon("another example"));
	}

	void testGenerate()
	{
		QTemporaryDir tempdir;
		QVERIFY(tempdir.isValid());
		identicon::Settings settings;
		settings.outputDirectory = tempdir.path();

		QString error;
		QCOMPARE(
			identicon::generate("example", settings, &error), Result::Success);
		QVERIFY(error.isEmpty());

		const QString path = identicon::imagePath("example", settings);
		QCOMPARE(path, QDir(tempdir.path()).filePath("example.png"));
		QImage saved(path, "png");
		QVERIFY(!saved.isNull());
		QCOMPARE(
			saved.convertToFormat(QImage::Format_RGB32),
			identicon::makeIdenticon("example"));

		// Generating the same name again overwrites the earlier file.
		QCOMPARE(
			identicon::generate("other input", "example", settings, &error),
			Result::Success);
		QImage replaced(path, "png");
		QCOMPARE(
			replaced.convertToFormat(QImage::Format_RGB32),
			identicon::makeIdenticon("other input"));
	}

	void testGenerateIntoMissingDirectory()
	{
		QTemporaryDir tempdir;
		QVERIFY(tempdir.isValid());
		identicon::Settings settings;
		settings.outputDirectory = QDir(tempdir.path()).filePath("missing");

		QTest::ignoreMessage(QtWarningMsg, QRegularExpression("^Error opening "));
		QString error;
		QCOMPARE(
			identicon::generate("example", settings, &error), Result::IoError);
		QVERIFY(!error.isEmpty());
	}
};


QTEST_GUILESS_MAIN(TestGenerator)
#include "generator.moc"
