/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TestHelpers.hh
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

#ifndef TESTHELPERS_HH
#define TESTHELPERS_HH

#include <QAtomicInt>
#include <QList>
#include <QMutex>
#include <QRectF>
#include <QSet>
#include <functional>

#include "OcrEngine.hh"
#include "PageRenderer.hh"

/**
 * In-memory document: white pages of a fixed size with optional black
 * "ink" rectangles (in page units) and pages that fail to render.
 */
class FakeRenderer : public PageRenderer {
public:
	FakeRenderer(int nPages, const QSizeF& pageSize = QSizeF(200., 300.))
		: PageRenderer("fake.pdf"), m_nPages(nPages), m_pageSize(pageSize) {}

	void addInk(int page, const QRectF& rect) {
		m_ink.append(qMakePair(page, rect));
	}
	void setFailingPage(int page) {
		m_failing.insert(page);
	}
	void setRenderDelay(unsigned long msecs) {
		m_delay = msecs;
	}

	QImage render(int page, double zoom, Error& error) const override;
	int getNPages() const override {
		return m_nPages;
	}
	QSizeF getPageSize(int /*page*/) const override {
		return m_pageSize;
	}

private:
	int m_nPages;
	QSizeF m_pageSize;
	QList<QPair<int, QRectF>> m_ink;
	QSet<int> m_failing;
	unsigned long m_delay = 0;
};

/**
 * Engine returning "ink" if the image contains dark pixels and an empty
 * string otherwise. Every call is recorded with the size of the image.
 */
class InkEngine : public OcrEngine {
public:
	InkEngine(Type type = Type::Traditional) : OcrEngine(EngineConfig()), m_type(type) {}

	Type getType() const override {
		return m_type;
	}
	bool isAvailable() const override {
		return true;
	}
	bool recognize(const QImage& image, const QString& language, QString& text, Error& error) override;

	void setFailure(const Error& error) {
		m_failure = error;
	}
	QList<QSize> getCalls() const {
		QMutexLocker locker(&m_mutex);
		return m_calls;
	}
	int getMaxConcurrency() const {
		return m_maxConcurrent;
	}

private:
	Type m_type;
	Error m_failure;
	mutable QMutex m_mutex;
	QList<QSize> m_calls;
	QAtomicInt m_concurrent;
	int m_maxConcurrent = 0;
};

// Engine whose recognition throws, like a library failing internally
class ThrowingEngine : public OcrEngine {
public:
	ThrowingEngine() : OcrEngine(EngineConfig()) {}

	Type getType() const override {
		return Type::Traditional;
	}
	bool isAvailable() const override {
		return true;
	}
	bool recognize(const QImage& image, const QString& language, QString& text, Error& error) override;
};

namespace TestHelpers {

// Writes a PDF with the given number of A4 pages, each showing its page number
bool writeTestPdf(const QString& filename, int nPages);

// Processes events until the predicate holds or the timeout expires
bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 5000);

}

#endif // TESTHELPERS_HH
