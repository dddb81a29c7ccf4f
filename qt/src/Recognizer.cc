/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Recognizer.cc
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

#include <QDebug>
#include <QElapsedTimer>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>
#include <exception>

#include "common.hh"
#include "DocumentSession.hh"
#include "PageRenderer.hh"
#include "Recognizer.hh"
#include "SelectionMapper.hh"


Recognizer::Recognizer(DocumentSession* session, QObject* parent)
	: QObject(parent), m_session(session) {
	// A single worker keeps jobs in submission order
	m_pool.setMaxThreadCount(1);
	m_pool.setExpiryTimeout(-1);
	qRegisterMetaType<QList<OcrResult>>("QList<OcrResult>");
	qRegisterMetaType<Error>("Error");
	qRegisterMetaType<Recognizer::Scope>();
}

Recognizer::~Recognizer() {
	m_pool.waitForDone();
}

void Recognizer::setEngineConfig(const EngineConfig& config) {
	m_engineConfig = config;
	// In-flight jobs keep their own reference to the engine they started with
	m_engines.clear();
}

void Recognizer::setEngineType(OcrEngine::Type type) {
	if(type != m_engineType) {
		qDebug() << "Switching OCR engine to" << OcrEngine::typeKey(type);
		m_engineType = type;
	}
}

void Recognizer::setEngine(OcrEngine::Type type, const std::shared_ptr<OcrEngine>& engine) {
	m_engines[type] = engine;
}

std::shared_ptr<OcrEngine> Recognizer::getEngine(OcrEngine::Type type) {
	auto it = m_engines.find(type);
	if(it == m_engines.end()) {
		it = m_engines.insert(type, OcrEngine::create(type, m_engineConfig));
	}
	return it.value();
}

QList<OcrEngine::Type> Recognizer::getAvailableEngines() {
	QList<OcrEngine::Type> types;
	for(OcrEngine::Type type : OcrEngine::allTypes()) {
		std::shared_ptr<OcrEngine> engine = getEngine(type);
		// The traditional engine is always offered, failures are reported on use
		if(type == OcrEngine::Type::Traditional || (engine && engine->isAvailable())) {
			types.append(type);
		}
	}
	return types;
}

bool Recognizer::checkDocument(Error& error) const {
	if(!m_session->isLoaded() || !m_session->getRenderer()) {
		error.set(Error::Code::Render, _("No document is open"));
		return false;
	}
	return true;
}

Recognizer::Job Recognizer::makeJob(Scope scope) const {
	Job job;
	job.scope = scope;
	job.documentId = m_session->getDocumentId();
	job.page = m_session->getPage();
	job.engine = m_engineType;
	return job;
}

bool Recognizer::recognizeCurrentPage(Error& error) {
	if(!checkDocument(error)) {
		return false;
	}
	std::shared_ptr<OcrEngine> engine = getEngine(m_engineType);
	std::shared_ptr<PageRenderer> renderer = m_session->getRenderer();
	Job job = makeJob(Scope::CurrentPage);
	double zoom = m_session->getZoom();
	QString language = m_engineConfig.language;

	emit recognitionStarted(job.scope, _("Performing OCR on page %1 with %2...").arg(job.page + 1).arg(OcrEngine::typeName(job.engine)));
	submit(job, [engine, renderer, job, zoom, language] {
		JobResult result;
		QImage image = renderer->render(job.page, zoom, result.error);
		if(image.isNull()) {
			return result;
		}
		OcrResult ocr;
		ocr.engine = job.engine;
		ocr.source = OcrResult::Source::Page;
		ocr.page = job.page;
		if(recognizeImage(*engine, image, language, ocr.text, result.error)) {
			result.results.append(ocr);
		}
		return result;
	});
	return true;
}

bool Recognizer::recognizeSelection(Error& error) {
	if(!checkDocument(error)) {
		return false;
	}
	if(!m_session->hasSelection()) {
		error.set(Error::Code::InvalidSelection, _("No area is selected"));
		return false;
	}
	std::shared_ptr<OcrEngine> engine = getEngine(m_engineType);
	std::shared_ptr<PageRenderer> renderer = m_session->getRenderer();
	Job job = makeJob(Scope::Selection);
	double zoom = m_session->getZoom();
	QRectF area = m_session->getSelection();
	QString language = m_engineConfig.language;

	emit recognitionStarted(job.scope, _("Performing OCR on selection of page %1 with %2...").arg(job.page + 1).arg(OcrEngine::typeName(job.engine)));
	submit(job, [engine, renderer, job, zoom, area, language] {
		JobResult result;
		QImage image = renderer->render(job.page, zoom, result.error);
		if(image.isNull()) {
			return result;
		}
		QImage cropped = SelectionMapper::crop(image, area, renderer->pixelsPerUnit(zoom), result.error);
		if(cropped.isNull()) {
			return result;
		}
		OcrResult ocr;
		ocr.engine = job.engine;
		ocr.source = OcrResult::Source::Selection;
		ocr.page = job.page;
		ocr.hasArea = true;
		ocr.area = area;
		if(recognizeImage(*engine, cropped, language, ocr.text, result.error)) {
			result.results.append(ocr);
		}
		return result;
	});
	return true;
}

bool Recognizer::recognizeDocument(Error& error, std::shared_ptr<ProgressMonitor>* monitor) {
	if(!checkDocument(error)) {
		return false;
	}
	std::shared_ptr<OcrEngine> engine = getEngine(m_engineType);
	std::shared_ptr<PageRenderer> renderer = m_session->getRenderer();
	Job job = makeJob(Scope::Document);
	QString language = m_engineConfig.language;
	std::shared_ptr<ProgressMonitor> progress = std::make_shared<ProgressMonitor>(renderer->getNPages());
	if(monitor) {
		*monitor = progress;
	}

	emit recognitionStarted(job.scope, _("Performing OCR on %1 pages with %2...").arg(renderer->getNPages()).arg(OcrEngine::typeName(job.engine)));
	submit(job, [this, engine, renderer, language, progress] {
		JobResult result;
		result.results = recognizePages(*engine, *renderer, language, [this, progress](int page, int nPages) {
			if(page > 0) {
				progress->increaseProgress();
			}
			QMetaObject::invokeMethod(this, "pageStarted", Qt::QueuedConnection, Q_ARG(int, page), Q_ARG(int, nPages));
		});
		progress->increaseProgress();
		return result;
	});
	return true;
}

void Recognizer::waitForDone() {
	m_pool.waitForDone();
}

bool Recognizer::recognizeImage(OcrEngine& engine, const QImage& image, const QString& language, QString& text, Error& error) {
	if(image.isNull()) {
		error.set(Error::Code::Render, _("Nothing to recognize"));
		return false;
	}
	try {
		return engine.recognize(image.convertToFormat(QImage::Format_RGB32), language, text, error);
	} catch(const std::exception& e) {
		qWarning() << OcrEngine::typeName(engine.getType()) << "threw:" << e.what();
		error.set(Error::Code::EngineUnavailable, _("%1 failed: %2").arg(OcrEngine::typeName(engine.getType())).arg(QString::fromLocal8Bit(e.what())));
		return false;
	}
}

QList<OcrResult> Recognizer::recognizePages(OcrEngine& engine, const PageRenderer& renderer, const QString& language, const std::function<void(int, int)>& pageStarted) {
	QList<OcrResult> results;
	int nPages = renderer.getNPages();
	for(int page = 0; page < nPages; ++page) {
		if(pageStarted) {
			pageStarted(page, nPages);
		}
		OcrResult result;
		result.engine = engine.getType();
		result.source = OcrResult::Source::Document;
		result.page = page;

		Error error;
		// Whole-document recognition always works on the unzoomed page
		QImage image = renderer.render(page, 1.0, error);
		if(image.isNull() || !recognizeImage(engine, image, language, result.text, error)) {
			qWarning() << "Failed to recognize page" << (page + 1) << ":" << error.message;
			result.failed = true;
			result.errorMessage = error.message;
			result.text.clear();
		}
		results.append(result);
	}
	return results;
}

void Recognizer::submit(const Job& job, const std::function<JobResult()>& work) {
	++m_pending;
	switch(job.scope) {
	case Scope::CurrentPage:
		qDebug() << "Queued recognition of page" << (job.page + 1) << "with" << OcrEngine::typeKey(job.engine);
		break;
	case Scope::Selection:
		qDebug() << "Queued recognition of" << m_session->getSelection() << "on page" << (job.page + 1) << "with" << OcrEngine::typeKey(job.engine);
		break;
	case Scope::Document:
		qDebug() << "Queued recognition of" << m_session->getNPages() << "pages with" << OcrEngine::typeKey(job.engine);
		break;
	}
	QElapsedTimer timer;
	timer.start();
	QFutureWatcher<JobResult>* watcher = new QFutureWatcher<JobResult>(this);
	connect(watcher, &QFutureWatcher<JobResult>::finished, this, [this, watcher, job, timer] {
		JobResult result = watcher->result();
		watcher->deleteLater();
		qDebug() << "Recognition finished after" << timer.elapsed() << "ms";
		deliver(job, result);
	});
	watcher->setFuture(QtConcurrent::run(&m_pool, work));
}

void Recognizer::deliver(const Job& job, const JobResult& result) {
	--m_pending;
	bool stale = job.documentId != m_session->getDocumentId();
	if(job.scope != Scope::Document) {
		stale = stale || job.page != m_session->getPage();
	}
	if(stale) {
		qDebug() << "Discarding recognition result for page" << (job.page + 1) << "of a document which is no longer current";
		emit recognitionDiscarded();
	} else if(result.error.isSet()) {
		qWarning() << "Recognition failed:" << result.error.message;
		emit recognitionFailed(result.error);
	} else {
		m_session->getOutputLog().append(result.results);
		emit resultsAvailable(result.results);
	}
	emit recognitionFinished(job.scope);
}
