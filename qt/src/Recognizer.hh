/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Recognizer.hh
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

#ifndef RECOGNIZER_HH
#define RECOGNIZER_HH

#include <QList>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <functional>
#include <memory>

#include "Error.hh"
#include "OcrEngine.hh"
#include "OutputLog.hh"

class DocumentSession;
class PageRenderer;

/**
 * Runs recognition jobs on a single worker thread, in submission order, and
 * delivers their results on the thread owning the Recognizer. Results of a
 * job are appended to the session's output log unless the session has
 * moved on to another document (or, for single page jobs, another page)
 * in the meantime, in which case they are dropped.
 */
class Recognizer : public QObject {
	Q_OBJECT
public:
	class ProgressMonitor {
	public:
		ProgressMonitor(int total) : mTotal(total) {}
		void increaseProgress() {
			QMutexLocker locker(&mMutex);
			++mProgress;
		}
		int getProgress() const {
			QMutexLocker locker(&mMutex);
			return mTotal > 0 ? (mProgress * 100) / mTotal : 100;
		}
		int getTotal() const {
			return mTotal;
		}

	private:
		mutable QMutex mMutex;
		const int mTotal;
		int mProgress = 0;
	};

	enum class Scope { CurrentPage, Selection, Document };

	Recognizer(DocumentSession* session, QObject* parent = nullptr);
	~Recognizer();

	const EngineConfig& getEngineConfig() const {
		return m_engineConfig;
	}
	void setEngineConfig(const EngineConfig& config);
	OcrEngine::Type getEngineType() const {
		return m_engineType;
	}
	void setEngineType(OcrEngine::Type type);
	void setEngine(OcrEngine::Type type, const std::shared_ptr<OcrEngine>& engine);
	std::shared_ptr<OcrEngine> getEngine(OcrEngine::Type type);
	QList<OcrEngine::Type> getAvailableEngines();

	bool recognizeCurrentPage(Error& error);
	bool recognizeSelection(Error& error);
	bool recognizeDocument(Error& error, std::shared_ptr<ProgressMonitor>* monitor = nullptr);
	bool isBusy() const {
		return m_pending > 0;
	}
	void waitForDone();

	static bool recognizeImage(OcrEngine& engine, const QImage& image, const QString& language, QString& text, Error& error);
	static QList<OcrResult> recognizePages(OcrEngine& engine, const PageRenderer& renderer, const QString& language, const std::function<void(int, int)>& pageStarted = nullptr);

signals:
	void recognitionStarted(Recognizer::Scope scope, const QString& message);
	void pageStarted(int page, int nPages);
	void resultsAvailable(const QList<OcrResult>& results);
	void recognitionFailed(const Error& error);
	void recognitionDiscarded();
	void recognitionFinished(Recognizer::Scope scope);

private:
	struct Job {
		Scope scope;
		quint64 documentId;
		int page;
		OcrEngine::Type engine;
	};
	struct JobResult {
		QList<OcrResult> results;
		Error error;
	};

	DocumentSession* m_session;
	QThreadPool m_pool;
	EngineConfig m_engineConfig;
	OcrEngine::Type m_engineType = OcrEngine::Type::Traditional;
	QMap<OcrEngine::Type, std::shared_ptr<OcrEngine>> m_engines;
	int m_pending = 0;

	bool checkDocument(Error& error) const;
	Job makeJob(Scope scope) const;
	void submit(const Job& job, const std::function<JobResult()>& work);
	void deliver(const Job& job, const JobResult& result);
};

Q_DECLARE_METATYPE(Recognizer::Scope)

#endif // RECOGNIZER_HH
