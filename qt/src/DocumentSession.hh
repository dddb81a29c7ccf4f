/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DocumentSession.hh
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

#ifndef DOCUMENTSESSION_HH
#define DOCUMENTSESSION_HH

#include <QObject>
#include <QImage>
#include <QPointF>
#include <QRectF>
#include <functional>
#include <memory>

#include "Error.hh"
#include "OutputLog.hh"
#include "PageRenderer.hh"
#include "SelectionMapper.hh"

/**
 * State of the open document: the renderer, the current page, the zoom
 * factor, the active selection and the output log.
 *
 * Invariants: the page index lies in [0, getNPages()) while a document is
 * loaded, the zoom lies in [MinZoom, MaxZoom], a committed selection is
 * non-empty and clipped to the page.
 */
class DocumentSession : public QObject {
	Q_OBJECT
public:
	enum class State { Empty, Loaded, Selecting };
	typedef std::function<bool(QString& password)> PasswordCallback;

	static constexpr double MinZoom = 0.25;
	static constexpr double MaxZoom = 3.0;
	static constexpr double ZoomStep = 0.25;

	DocumentSession(QObject* parent = nullptr);

	bool openDocument(const QString& filename, Error& error, const PasswordCallback& askPassword = PasswordCallback());
	void setDocument(const std::shared_ptr<PageRenderer>& renderer);
	void closeDocument();

	State getState() const {
		return m_state;
	}
	bool isLoaded() const {
		return m_state != State::Empty;
	}
	QString getFilename() const;
	std::shared_ptr<PageRenderer> getRenderer() const {
		return m_renderer;
	}
	// Changes whenever a document is opened or closed
	quint64 getDocumentId() const {
		return m_documentId;
	}

	int getPage() const {
		return m_page;
	}
	int getNPages() const;
	QSizeF getPageSize() const;
	bool navigatePage(int delta);
	bool setPage(int page);

	double getZoom() const {
		return m_zoom;
	}
	double setZoom(double zoom);
	double zoomIn() {
		return setZoom(m_zoom + ZoomStep);
	}
	double zoomOut() {
		return setZoom(m_zoom - ZoomStep);
	}

	double getRenderScale() const {
		return m_renderScale;
	}
	void setRenderScale(double scale);

	SelectionMapper::DisplayTransform getDisplayTransform(const QPointF& scroll = QPointF()) const;
	QImage renderPage(Error& error) const;

	void beginSelection(const QPointF& screenPos, const QPointF& scroll);
	void updateSelection(const QPointF& screenPos, const QPointF& scroll);
	bool endSelection(Error& error);
	void clearSelection();
	bool hasSelection() const {
		return m_hasSelection;
	}
	QRectF getSelection() const {
		return m_selection;
	}
	// Page-space rectangle of the drag in progress
	QRectF getPendingSelection() const;

	OutputLog& getOutputLog() {
		return m_outputLog;
	}
	const OutputLog& getOutputLog() const {
		return m_outputLog;
	}

signals:
	void documentChanged();
	void pageChanged(int page);
	void zoomChanged(double zoom);
	void selectionChanged();

private:
	std::shared_ptr<PageRenderer> m_renderer;
	State m_state = State::Empty;
	quint64 m_documentId = 0;
	int m_page = 0;
	double m_zoom = 1.0;
	double m_renderScale = 1.5;

	bool m_hasSelection = false;
	QRectF m_selection;
	QPointF m_dragAnchor;
	QPointF m_dragPoint;
	SelectionMapper::DisplayTransform m_dragTransform;

	OutputLog m_outputLog;

	bool resetSelection();
};

#endif // DOCUMENTSESSION_HH
