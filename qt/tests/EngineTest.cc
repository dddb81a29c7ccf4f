/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * EngineTest.cc
 * Copyright (C) 2013-2025 Sandro Mani <manisandro@gmail.com>
 *
 * PdfOcr is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the
 * Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PdfOcr is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <QFile>
#include <QImage>
#include <QTemporaryDir>
#include <gtest/gtest.h>

#include "DnnEngine.hh"
#include "DocumentSession.hh"
#include "NativeEngine.hh"
#include "Recognizer.hh"
#include "TesseractEngine.hh"
#include "TestHelpers.hh"

static QImage blankImage() {
	QImage image(64, 32, QImage::Format_RGB32);
	image.fill(Qt::white);
	return image;
}

static EngineConfig missingConfig() {
	EngineConfig config;
	config.language = "eng";
	config.tessdataDir = "/nonexistent/tessdata";
	config.detectorModel = "/nonexistent/detector.onnx";
	config.recognizerModel = "/nonexistent/recognizer.onnx";
	config.vocabulary = "/nonexistent/vocabulary.txt";
	return config;
}

TEST(OcrEngine, KeysMapToTypes) {
	for(OcrEngine::Type type : OcrEngine::allTypes()) {
		OcrEngine::Type parsed = OcrEngine::Type::Traditional;
		ASSERT_TRUE(OcrEngine::typeFromKey(OcrEngine::typeKey(type), parsed));
		EXPECT_EQ(parsed, type);
		EXPECT_FALSE(OcrEngine::typeName(type).isEmpty());
	}
	OcrEngine::Type parsed = OcrEngine::Type::OsNative;
	EXPECT_TRUE(OcrEngine::typeFromKey("DeepLearning", parsed));
	EXPECT_EQ(parsed, OcrEngine::Type::DeepLearning);
	EXPECT_FALSE(OcrEngine::typeFromKey("cuneiform", parsed));
	EXPECT_EQ(parsed, OcrEngine::Type::DeepLearning);
}

TEST(OcrEngine, CreatesRequestedType) {
	for(OcrEngine::Type type : OcrEngine::allTypes()) {
		std::shared_ptr<OcrEngine> engine = OcrEngine::create(type, EngineConfig());
		ASSERT_TRUE(engine != nullptr);
		EXPECT_EQ(engine->getType(), type);
	}
}

TEST(TesseractEngine, MissingLanguageDataIsUnavailable) {
	EngineConfig config = missingConfig();
	config.language = "zzz";
	TesseractEngine engine(config);
	EXPECT_FALSE(engine.isAvailable());
	QString text;
	Error error;
	EXPECT_FALSE(engine.recognize(blankImage(), "", text, error));
	EXPECT_EQ(error.code, Error::Code::EngineUnavailable);
}

TEST(DnnEngine, MissingModelsAreUnavailable) {
	DnnEngine engine(missingConfig());
	EXPECT_FALSE(engine.isAvailable());
	QString text;
	Error error;
	EXPECT_FALSE(engine.recognize(blankImage(), "", text, error));
	EXPECT_EQ(error.code, Error::Code::EngineUnavailable);
	EXPECT_FALSE(DnnEngine::isModelLoaded());
}

TEST(OcrEngine, ThrowingEngineReportsError) {
	ThrowingEngine engine;
	QString text;
	Error error;
	EXPECT_FALSE(Recognizer::recognizeImage(engine, blankImage(), "", text, error));
	EXPECT_EQ(error.code, Error::Code::EngineUnavailable);
	EXPECT_TRUE(error.message.contains("internal engine failure"));
}

TEST(DnnEngine, CorruptModelsLeaveNoModelLoaded) {
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	EngineConfig config;
	config.detectorModel = dir.filePath("detector.onnx");
	config.recognizerModel = dir.filePath("recognizer.onnx");
	config.vocabulary = dir.filePath("vocabulary.txt");
	const QString files[] = {config.detectorModel, config.recognizerModel};
	for(const QString& path : files) {
		QFile file(path);
		ASSERT_TRUE(file.open(QIODevice::WriteOnly));
		file.write("not a network");
	}
	QFile vocabulary(config.vocabulary);
	ASSERT_TRUE(vocabulary.open(QIODevice::WriteOnly));
	vocabulary.write("a\nb\nc\n");
	vocabulary.close();

	DnnEngine engine(config);
	EXPECT_TRUE(engine.isAvailable());
	QString text;
	Error error;
	EXPECT_FALSE(engine.recognize(blankImage(), "", text, error));
	EXPECT_EQ(error.code, Error::Code::EngineUnavailable);
	EXPECT_FALSE(DnnEngine::isModelLoaded());
}

#ifndef Q_OS_WIN
TEST(NativeEngine, UnsupportedOffWindows) {
	NativeEngine engine(EngineConfig());
	EXPECT_FALSE(engine.isAvailable());
	QString text;
	Error error;
	EXPECT_FALSE(engine.recognize(blankImage(), "", text, error));
	EXPECT_EQ(error.code, Error::Code::EnginePlatformUnsupported);
}
#endif

TEST(Recognizer, OffersOnlyUsableEngines) {
	DocumentSession session;
	Recognizer recognizer(&session);
	recognizer.setEngineConfig(missingConfig());
	QList<OcrEngine::Type> types = recognizer.getAvailableEngines();
	EXPECT_TRUE(types.contains(OcrEngine::Type::Traditional));
	EXPECT_FALSE(types.contains(OcrEngine::Type::DeepLearning));
#ifndef Q_OS_WIN
	EXPECT_FALSE(types.contains(OcrEngine::Type::OsNative));
#endif
}

TEST(Recognizer, ConfigChangeRecreatesEngines) {
	DocumentSession session;
	Recognizer recognizer(&session);
	std::shared_ptr<OcrEngine> first = recognizer.getEngine(OcrEngine::Type::Traditional);
	EXPECT_EQ(recognizer.getEngine(OcrEngine::Type::Traditional), first);
	EngineConfig config;
	config.language = "deu";
	recognizer.setEngineConfig(config);
	std::shared_ptr<OcrEngine> second = recognizer.getEngine(OcrEngine::Type::Traditional);
	EXPECT_NE(second, first);
	EXPECT_EQ(second->getConfig().language, QString("deu"));
}
