/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * PageRenderer.cc
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

#include <QImage>
#include <poppler-qt5.h>

#include "common.hh"
#include "PageRenderer.hh"

PDFRenderer::PDFRenderer(const QString& filename) : PageRenderer(filename) {
	m_document = Poppler::Document::load(filename);
	if(m_document) {
		m_document->setRenderHint(Poppler::Document::Antialiasing);
		m_document->setRenderHint(Poppler::Document::TextAntialiasing);
	}
}

PDFRenderer::~PDFRenderer() {
	delete m_document;
}

bool PDFRenderer::isLocked() const {
	QMutexLocker locker(&m_mutex);
	return m_document && m_document->isLocked();
}

bool PDFRenderer::unlock(const QByteArray& password) {
	QMutexLocker locker(&m_mutex);
	if(!m_document) {
		return false;
	}
	// Poppler returns true on failure
	if(m_document->unlock(password, password)) {
		return false;
	}
	m_document->setRenderHint(Poppler::Document::Antialiasing);
	m_document->setRenderHint(Poppler::Document::TextAntialiasing);
	return true;
}

QImage PDFRenderer::render(int page, double zoom, Error& error) const {
	if(!m_document) {
		error.set(Error::Code::Render, _("The document is not open"));
		return QImage();
	}
	if(page < 0 || page >= getNPages()) {
		error.set(Error::Code::Render, _("Page %1 is out of range").arg(page + 1));
		return QImage();
	}
	double resolution = 72. * pixelsPerUnit(zoom);
	QMutexLocker locker(&m_mutex);
	Poppler::Page* poppage = m_document->page(page);
	if(!poppage) {
		error.set(Error::Code::Render, _("Page %1 could not be decoded").arg(page + 1));
		return QImage();
	}
	QImage image = poppage->renderToImage(resolution, resolution);
	delete poppage;
	if(image.isNull()) {
		qWarning("Failed to render page %d of %s", page + 1, qPrintable(m_filename));
		error.set(Error::Code::Render, _("Page %1 could not be rendered").arg(page + 1));
		return QImage();
	}
	return image.convertToFormat(QImage::Format_RGB32);
}

int PDFRenderer::getNPages() const {
	QMutexLocker locker(&m_mutex);
	return m_document ? m_document->numPages() : 0;
}

QSizeF PDFRenderer::getPageSize(int page) const {
	QMutexLocker locker(&m_mutex);
	if(!m_document) {
		return QSizeF();
	}
	Poppler::Page* poppage = m_document->page(page);
	if(!poppage) {
		return QSizeF();
	}
	QSizeF size = poppage->pageSizeF();
	delete poppage;
	return size;
}
