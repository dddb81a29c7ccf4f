/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DocumentSession.cc
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

#include <algorithm>
#include <QFileInfo>

#include "common.hh"
#include "DocumentSession.hh"

constexpr double DocumentSession::MinZoom;
constexpr double DocumentSession::MaxZoom;
constexpr double DocumentSession::ZoomStep;

DocumentSession::DocumentSession(QObject* parent)
	: QObject(parent) {
}

bool DocumentSession::openDocument(const QString& filename, Error& error, const PasswordCallback& askPassword) {
	if(!QFileInfo(filename).isFile()) {
		error.set(Error::Code::DocumentLoad, _("The file %1 does not exist").arg(filename));
		return false;
	}
	std::shared_ptr<PDFRenderer> renderer = std::make_shared<PDFRenderer>(filename);
	if(!renderer->isValid()) {
		qWarning("Failed to load %s", qPrintable(filename));
		error.set(Error::Code::DocumentLoad, _("The file might not be a PDF or be corrupt:\n%1").arg(filename));
		return false;
	}
	if(renderer->isLocked()) {
		QString password;
		while(true) {
			if(!askPassword || !askPassword(password)) {
				error.set(Error::Code::DocumentLoad, _("The document %1 is password protected").arg(QFileInfo(filename).fileName()));
				return false;
			}
			if(renderer->unlock(password.toLocal8Bit())) {
				break;
			}
		}
	}
	if(renderer->getNPages() <= 0) {
		error.set(Error::Code::DocumentLoad, _("The document %1 has no pages").arg(filename));
		return false;
	}
	setDocument(renderer);
	qDebug("Opened %s (%d pages)", qPrintable(filename), renderer->getNPages());
	return true;
}

void DocumentSession::setDocument(const std::shared_ptr<PageRenderer>& renderer) {
	m_renderer = renderer;
	if(m_renderer) {
		m_renderer->setRenderScale(m_renderScale);
	}
	++m_documentId;
	m_state = m_renderer ? State::Loaded : State::Empty;
	m_page = 0;
	m_zoom = 1.0;
	m_hasSelection = false;
	m_selection = QRectF();
	emit documentChanged();
	emit pageChanged(m_page);
	emit zoomChanged(m_zoom);
	emit selectionChanged();
}

void DocumentSession::closeDocument() {
	if(m_renderer) {
		qDebug("Closed %s", qPrintable(m_renderer->getFilename()));
	}
	setDocument(nullptr);
}

QString DocumentSession::getFilename() const {
	return m_renderer ? m_renderer->getFilename() : QString();
}

int DocumentSession::getNPages() const {
	return m_renderer ? m_renderer->getNPages() : 0;
}

QSizeF DocumentSession::getPageSize() const {
	return m_renderer ? m_renderer->getPageSize(m_page) : QSizeF();
}

bool DocumentSession::navigatePage(int delta) {
	return setPage(m_page + delta);
}

bool DocumentSession::setPage(int page) {
	if(!isLoaded()) {
		return false;
	}
	page = std::max(0, std::min(page, getNPages() - 1));
	if(page == m_page) {
		return false;
	}
	m_page = page;
	bool selectionReset = resetSelection();
	selectionReset |= m_state == State::Selecting;
	m_state = State::Loaded;
	if(selectionReset) {
		emit selectionChanged();
	}
	emit pageChanged(m_page);
	return true;
}

double DocumentSession::setZoom(double zoom) {
	zoom = std::max(MinZoom, std::min(zoom, MaxZoom));
	if(zoom != m_zoom) {
		m_zoom = zoom;
		emit zoomChanged(m_zoom);
	}
	return m_zoom;
}

void DocumentSession::setRenderScale(double scale) {
	if(scale <= 0. || scale == m_renderScale) {
		return;
	}
	m_renderScale = scale;
	if(m_renderer) {
		m_renderer->setRenderScale(scale);
		emit zoomChanged(m_zoom);
	}
}

SelectionMapper::DisplayTransform DocumentSession::getDisplayTransform(const QPointF& scroll) const {
	SelectionMapper::DisplayTransform transform;
	transform.zoom = m_zoom;
	transform.pixelsPerUnit = m_renderScale;
	transform.scroll = scroll;
	return transform;
}

QImage DocumentSession::renderPage(Error& error) const {
	if(!m_renderer) {
		error.set(Error::Code::Render, _("No document is open"));
		return QImage();
	}
	return m_renderer->render(m_page, m_zoom, error);
}

void DocumentSession::beginSelection(const QPointF& screenPos, const QPointF& scroll) {
	if(!isLoaded()) {
		return;
	}
	resetSelection();
	m_state = State::Selecting;
	m_dragTransform = getDisplayTransform(scroll);
	m_dragAnchor = screenPos;
	m_dragPoint = screenPos;
	emit selectionChanged();
}

void DocumentSession::updateSelection(const QPointF& screenPos, const QPointF& scroll) {
	if(m_state != State::Selecting) {
		return;
	}
	// Keep the anchor fixed on the page if the view scrolled during the drag
	QPointF anchorPage = SelectionMapper::screenToPage(m_dragAnchor, m_dragTransform);
	m_dragTransform = getDisplayTransform(scroll);
	m_dragAnchor = SelectionMapper::pageToScreen(anchorPage, m_dragTransform);
	m_dragPoint = screenPos;
	emit selectionChanged();
}

bool DocumentSession::endSelection(Error& error) {
	if(m_state != State::Selecting) {
		error.set(Error::Code::InvalidSelection, _("No selection is in progress"));
		return false;
	}
	m_state = State::Loaded;
	QRectF pageRect;
	if(!SelectionMapper::screenToPage(QRectF(m_dragAnchor, m_dragPoint), m_dragTransform, pageRect, error)) {
		emit selectionChanged();
		return false;
	}
	QSizeF pageSize = getPageSize();
	pageRect = pageRect.intersected(QRectF(QPointF(0., 0.), pageSize));
	if(pageRect.width() <= 0. || pageRect.height() <= 0.) {
		error.set(Error::Code::InvalidSelection, _("The selection lies outside the page"));
		emit selectionChanged();
		return false;
	}
	m_selection = pageRect;
	m_hasSelection = true;
	emit selectionChanged();
	return true;
}

void DocumentSession::clearSelection() {
	bool changed = resetSelection();
	if(m_state == State::Selecting) {
		m_state = State::Loaded;
		changed = true;
	}
	if(changed) {
		emit selectionChanged();
	}
}

QRectF DocumentSession::getPendingSelection() const {
	if(m_state != State::Selecting) {
		return QRectF();
	}
	return QRectF(SelectionMapper::screenToPage(m_dragAnchor, m_dragTransform), SelectionMapper::screenToPage(m_dragPoint, m_dragTransform)).normalized();
}

bool DocumentSession::resetSelection() {
	bool had = m_hasSelection;
	m_hasSelection = false;
	m_selection = QRectF();
	return had;
}
