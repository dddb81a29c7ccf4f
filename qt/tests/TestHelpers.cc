/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TestHelpers.cc
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
#include <QElapsedTimer>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QThread>
#include <algorithm>
#include <stdexcept>

#include "TestHelpers.hh"

QImage FakeRenderer::render(int page, double zoom, Error& error) const {
	if(m_delay > 0) {
		QThread::msleep(m_delay);
	}
	if(page < 0 || page >= m_nPages || m_failing.contains(page)) {
		error.set(Error::Code::Render, QString("Page %1 could not be decoded").arg(page + 1));
		return QImage();
	}
	double scale = pixelsPerUnit(zoom);
	QImage image(qRound(m_pageSize.width() * scale), qRound(m_pageSize.height() * scale), QImage::Format_RGB32);
	image.fill(Qt::white);
	QPainter painter(&image);
	for(const QPair<int, QRectF>& ink : m_ink) {
		if(ink.first == page) {
			painter.fillRect(QRectF(ink.second.topLeft() * scale, ink.second.bottomRight() * scale), Qt::black);
		}
	}
	return image;
}

bool InkEngine::recognize(const QImage& image, const QString& /*language*/, QString& text, Error& error) {
	int concurrent = m_concurrent.fetchAndAddOrdered(1) + 1;
	{
		QMutexLocker locker(&m_mutex);
		m_maxConcurrent = std::max(m_maxConcurrent, concurrent);
		m_calls.append(image.size());
	}
	bool ok = true;
	if(m_failure.isSet()) {
		error = m_failure;
		ok = false;
	} else {
		bool ink = false;
		for(int y = 0; y < image.height() && !ink; ++y) {
			const QRgb* line = reinterpret_cast<const QRgb*>(image.constScanLine(y));
			for(int x = 0; x < image.width(); ++x) {
				if(qGray(line[x]) < 128) {
					ink = true;
					break;
				}
			}
		}
		text = ink ? "ink" : "";
	}
	m_concurrent.fetchAndAddOrdered(-1);
	return ok;
}

bool ThrowingEngine::recognize(const QImage& /*image*/, const QString& /*language*/, QString& /*text*/, Error& /*error*/) {
	throw std::runtime_error("internal engine failure");
}

namespace TestHelpers {

bool writeTestPdf(const QString& filename, int nPages) {
	QPdfWriter writer(filename);
	writer.setPageSize(QPageSize(QPageSize::A4));
	writer.setResolution(72);
	QPainter painter;
	if(!painter.begin(&writer)) {
		return false;
	}
	QFont font;
	font.setPixelSize(48);
	painter.setFont(font);
	for(int page = 0; page < nPages; ++page) {
		if(page > 0) {
			writer.newPage();
		}
		painter.drawText(QPointF(72, 144), QString("Page %1").arg(page + 1));
	}
	return painter.end();
}

bool waitFor(const std::function<bool()>& predicate, int timeoutMs) {
	QElapsedTimer timer;
	timer.start();
	while(!predicate()) {
		if(timer.elapsed() > timeoutMs) {
			return false;
		}
		QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
		QThread::msleep(5);
	}
	return true;
}

}
