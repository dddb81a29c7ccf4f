/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * RecognizerTest.cc
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

#include <QCoreApplication>
#include <QSignalSpy>
#include <cmath>
#include <gtest/gtest.h>

#include "DocumentSession.hh"
#include "Recognizer.hh"
#include "TestHelpers.hh"

class RecognizerTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_renderer = std::make_shared<FakeRenderer>(3);
		m_engine = std::make_shared<InkEngine>();
		m_recognizer.setEngine(OcrEngine::Type::Traditional, m_engine);
		m_recognizer.setEngineType(OcrEngine::Type::Traditional);
	}

	bool waitIdle() {
		return TestHelpers::waitFor([this] { return !m_recognizer.isBusy(); });
	}

	void select(const QRectF& pageRect) {
		SelectionMapper::DisplayTransform transform = m_session.getDisplayTransform();
		m_session.beginSelection(SelectionMapper::pageToScreen(pageRect.topLeft(), transform), QPointF());
		m_session.updateSelection(SelectionMapper::pageToScreen(pageRect.bottomRight(), transform), QPointF());
		Error error;
		ASSERT_TRUE(m_session.endSelection(error));
	}

	DocumentSession m_session;
	Recognizer m_recognizer{&m_session};
	std::shared_ptr<FakeRenderer> m_renderer;
	std::shared_ptr<InkEngine> m_engine;
};

TEST_F(RecognizerTest, RequiresDocument) {
	Error error;
	EXPECT_FALSE(m_recognizer.recognizeCurrentPage(error));
	EXPECT_EQ(error.code, Error::Code::Render);
	error.clear();
	EXPECT_FALSE(m_recognizer.recognizeDocument(error));
	EXPECT_EQ(error.code, Error::Code::Render);
	EXPECT_FALSE(m_recognizer.isBusy());
}

TEST_F(RecognizerTest, SelectionRequiresArea) {
	m_session.setDocument(m_renderer);
	Error error;
	EXPECT_FALSE(m_recognizer.recognizeSelection(error));
	EXPECT_EQ(error.code, Error::Code::InvalidSelection);
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, CurrentPageIsLogged) {
	m_renderer->addInk(1, QRectF(20, 20, 50, 10));
	m_session.setDocument(m_renderer);
	m_session.setPage(1);
	QSignalSpy startedSpy(&m_recognizer, &Recognizer::recognitionStarted);
	QSignalSpy resultsSpy(&m_recognizer, &Recognizer::resultsAvailable);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	EXPECT_EQ(startedSpy.count(), 1);
	ASSERT_TRUE(waitIdle());
	EXPECT_EQ(resultsSpy.count(), 1);

	const OutputLog& log = m_session.getOutputLog();
	ASSERT_EQ(log.size(), 1);
	EXPECT_EQ(log.getEntries()[0].text, QString("ink"));
	EXPECT_EQ(log.getEntries()[0].page, 1);
	EXPECT_EQ(log.getEntries()[0].source, OcrResult::Source::Page);
	EXPECT_EQ(log.toPlainText(), QString("ink\n"));
}

TEST_F(RecognizerTest, SelectionCropsToArea) {
	m_renderer->addInk(0, QRectF(100, 100, 20, 20));
	m_session.setDocument(m_renderer);

	select(QRectF(10, 10, 50, 50));
	Error error;
	ASSERT_TRUE(m_recognizer.recognizeSelection(error));
	ASSERT_TRUE(waitIdle());

	select(QRectF(90, 90, 50, 50));
	ASSERT_TRUE(m_recognizer.recognizeSelection(error));
	ASSERT_TRUE(waitIdle());

	const OutputLog& log = m_session.getOutputLog();
	ASSERT_EQ(log.size(), 2);
	EXPECT_EQ(log.getEntries()[0].text, QString());
	EXPECT_EQ(log.getEntries()[1].text, QString("ink"));
	EXPECT_TRUE(log.getEntries()[1].hasArea);
	EXPECT_EQ(log.getEntries()[1].source, OcrResult::Source::Selection);

	// Crop is taken from the page rendered at 1.5 pixels per unit
	QList<QSize> calls = m_engine->getCalls();
	ASSERT_EQ(calls.size(), 2);
	EXPECT_LE(std::abs(calls[1].width() - 75), 1);
	EXPECT_LE(std::abs(calls[1].height() - 75), 1);
}

TEST_F(RecognizerTest, SelectionFollowsZoom) {
	m_renderer->addInk(0, QRectF(100, 100, 20, 20));
	m_session.setDocument(m_renderer);
	m_session.setZoom(2.0);

	select(QRectF(90, 90, 50, 50));
	Error error;
	ASSERT_TRUE(m_recognizer.recognizeSelection(error));
	ASSERT_TRUE(waitIdle());

	ASSERT_EQ(m_session.getOutputLog().size(), 1);
	EXPECT_EQ(m_session.getOutputLog().getEntries()[0].text, QString("ink"));
	QList<QSize> calls = m_engine->getCalls();
	ASSERT_EQ(calls.size(), 1);
	EXPECT_LE(std::abs(calls[0].width() - 150), 1);
}

TEST_F(RecognizerTest, DocumentPagesAreOrderedAndFailuresMarked) {
	m_renderer->addInk(0, QRectF(10, 10, 30, 30));
	m_renderer->addInk(2, QRectF(10, 10, 30, 30));
	m_renderer->setFailingPage(1);
	m_session.setDocument(m_renderer);
	QSignalSpy pageSpy(&m_recognizer, &Recognizer::pageStarted);
	QSignalSpy finishedSpy(&m_recognizer, &Recognizer::recognitionFinished);

	Error error;
	std::shared_ptr<Recognizer::ProgressMonitor> monitor;
	ASSERT_TRUE(m_recognizer.recognizeDocument(error, &monitor));
	ASSERT_TRUE(monitor != nullptr);
	EXPECT_EQ(monitor->getTotal(), 3);
	ASSERT_TRUE(waitIdle());
	QCoreApplication::processEvents();

	EXPECT_EQ(monitor->getProgress(), 100);
	EXPECT_EQ(pageSpy.count(), 3);
	ASSERT_EQ(finishedSpy.count(), 1);
	EXPECT_EQ(finishedSpy[0][0].value<Recognizer::Scope>(), Recognizer::Scope::Document);

	const QList<OcrResult>& entries = m_session.getOutputLog().getEntries();
	ASSERT_EQ(entries.size(), 3);
	for(int i = 0; i < 3; ++i) {
		EXPECT_EQ(entries[i].page, i);
		EXPECT_EQ(entries[i].source, OcrResult::Source::Document);
	}
	EXPECT_FALSE(entries[0].failed);
	EXPECT_TRUE(entries[1].failed);
	EXPECT_FALSE(entries[2].failed);

	QString text = m_session.getOutputLog().toPlainText();
	int first = text.indexOf("--- Page 1 ---");
	int second = text.indexOf("--- Page 2 ---");
	int third = text.indexOf("--- Page 3 ---");
	EXPECT_GE(first, 0);
	EXPECT_GT(second, first);
	EXPECT_GT(third, second);
	EXPECT_TRUE(text.contains("Failed to recognize page 2"));

	// The whole document is recognized at the unzoomed resolution
	QList<QSize> calls = m_engine->getCalls();
	ASSERT_EQ(calls.size(), 2);
	EXPECT_EQ(calls[0], QSize(300, 450));
}

TEST_F(RecognizerTest, EngineFailureIsReported) {
	m_engine->setFailure(Error(Error::Code::EngineUnavailable, "no models"));
	m_session.setDocument(m_renderer);
	QSignalSpy failedSpy(&m_recognizer, &Recognizer::recognitionFailed);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	ASSERT_TRUE(waitIdle());
	ASSERT_EQ(failedSpy.count(), 1);
	EXPECT_EQ(failedSpy[0][0].value<Error>().code, Error::Code::EngineUnavailable);
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, ThrowingEngineFailsPageJob) {
	m_recognizer.setEngine(OcrEngine::Type::Traditional, std::make_shared<ThrowingEngine>());
	m_session.setDocument(m_renderer);
	QSignalSpy failedSpy(&m_recognizer, &Recognizer::recognitionFailed);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	ASSERT_TRUE(waitIdle());
	ASSERT_EQ(failedSpy.count(), 1);
	EXPECT_EQ(failedSpy[0][0].value<Error>().code, Error::Code::EngineUnavailable);
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, ThrowingEngineMarksDocumentPagesFailed) {
	m_recognizer.setEngine(OcrEngine::Type::Traditional, std::make_shared<ThrowingEngine>());
	m_session.setDocument(m_renderer);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeDocument(error));
	ASSERT_TRUE(waitIdle());
	const QList<OcrResult>& entries = m_session.getOutputLog().getEntries();
	ASSERT_EQ(entries.size(), 3);
	EXPECT_EQ(OutputLog::failedCount(entries), 3);
}

TEST_F(RecognizerTest, SwitchingEngineKeepsSessionState) {
	m_session.setDocument(m_renderer);
	m_session.setPage(1);
	m_session.setZoom(2.0);
	select(QRectF(20, 30, 40, 50));
	quint64 id = m_session.getDocumentId();
	QRectF selection = m_session.getSelection();
	QSignalSpy selectionSpy(&m_session, &DocumentSession::selectionChanged);
	QSignalSpy pageSpy(&m_session, &DocumentSession::pageChanged);
	QSignalSpy zoomSpy(&m_session, &DocumentSession::zoomChanged);

	for(OcrEngine::Type type : OcrEngine::allTypes()) {
		m_recognizer.setEngineType(type);
		EXPECT_EQ(m_recognizer.getEngineType(), type);
		EXPECT_EQ(m_session.getPage(), 1);
		EXPECT_DOUBLE_EQ(m_session.getZoom(), 2.0);
		EXPECT_TRUE(m_session.hasSelection());
		EXPECT_EQ(m_session.getSelection(), selection);
		EXPECT_EQ(m_session.getDocumentId(), id);
	}
	m_recognizer.setEngineConfig(EngineConfig());
	EXPECT_TRUE(m_session.hasSelection());
	EXPECT_EQ(selectionSpy.count(), 0);
	EXPECT_EQ(pageSpy.count(), 0);
	EXPECT_EQ(zoomSpy.count(), 0);
}

TEST_F(RecognizerTest, LateResultAfterCloseIsDiscarded) {
	m_renderer->addInk(0, QRectF(10, 10, 30, 30));
	m_renderer->setRenderDelay(200);
	m_session.setDocument(m_renderer);
	QSignalSpy discardedSpy(&m_recognizer, &Recognizer::recognitionDiscarded);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	m_session.closeDocument();
	ASSERT_TRUE(waitIdle());
	EXPECT_EQ(discardedSpy.count(), 1);
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, LateResultAfterReopenIsDiscarded) {
	m_renderer->setRenderDelay(100);
	m_session.setDocument(m_renderer);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeDocument(error));
	m_session.setDocument(std::make_shared<FakeRenderer>(1));
	ASSERT_TRUE(waitIdle());
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, LateResultAfterPageChangeIsDiscarded) {
	m_renderer->setRenderDelay(200);
	m_session.setDocument(m_renderer);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	m_session.navigatePage(+1);
	ASSERT_TRUE(waitIdle());
	EXPECT_TRUE(m_session.getOutputLog().isEmpty());
}

TEST_F(RecognizerTest, JobsRunOneAtATimeInOrder) {
	m_renderer->setRenderDelay(20);
	m_renderer->addInk(0, QRectF(0, 0, 10, 10));
	m_session.setDocument(m_renderer);

	Error error;
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	ASSERT_TRUE(m_recognizer.recognizeDocument(error));
	ASSERT_TRUE(m_recognizer.recognizeCurrentPage(error));
	ASSERT_TRUE(waitIdle());

	EXPECT_EQ(m_engine->getMaxConcurrency(), 1);
	const QList<OcrResult>& entries = m_session.getOutputLog().getEntries();
	ASSERT_EQ(entries.size(), 5);
	EXPECT_EQ(entries[0].source, OcrResult::Source::Page);
	EXPECT_EQ(entries[1].source, OcrResult::Source::Document);
	EXPECT_EQ(entries[3].source, OcrResult::Source::Document);
	EXPECT_EQ(entries[4].source, OcrResult::Source::Page);
}
