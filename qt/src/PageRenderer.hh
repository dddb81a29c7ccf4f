/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * PageRenderer.hh
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

#ifndef PAGERENDERER_HH
#define PAGERENDERER_HH

#include <QByteArray>
#include <QMutex>
#include <QSizeF>
#include <QString>

#include "Error.hh"

class QImage;
namespace Poppler {
class Document;
}

/**
 * Rasterizes pages of an open document. Page indices are 0-based, page
 * sizes are in page-space units (PDF points). A page rendered at zoom z is
 * pageSize * renderScale * z pixels large.
 */
class PageRenderer {
public:
	PageRenderer(const QString& filename) : m_filename(filename) {}
	virtual ~PageRenderer() {}
	virtual QImage render(int page, double zoom, Error& error) const = 0;
	virtual int getNPages() const = 0;
	virtual QSizeF getPageSize(int page) const = 0;

	const QString& getFilename() const {
		return m_filename;
	}
	double getRenderScale() const {
		return m_renderScale;
	}
	void setRenderScale(double scale) {
		m_renderScale = scale;
	}
	double pixelsPerUnit(double zoom) const {
		return zoom * m_renderScale;
	}

protected:
	QString m_filename;
	double m_renderScale = 1.5;
};

class PDFRenderer : public PageRenderer {
public:
	PDFRenderer(const QString& filename);
	~PDFRenderer();

	bool isValid() const {
		return m_document != nullptr;
	}
	bool isLocked() const;
	bool unlock(const QByteArray& password);

	QImage render(int page, double zoom, Error& error) const override;
	int getNPages() const override;
	QSizeF getPageSize(int page) const override;

private:
	Poppler::Document* m_document;
	mutable QMutex m_mutex;
};

#endif // PAGERENDERER_HH
