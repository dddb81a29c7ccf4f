/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Displayer.cc
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

#include "Displayer.hh"
#include "DisplaySelection.hh"
#include "DocumentSession.hh"
#include "Ui_MainWindow.hh"

#include <QGraphicsPixmapItem>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QScrollBar>
#include <QWheelEvent>


Displayer::Displayer(const UI_MainWindow& _ui, DocumentSession* session, QWidget* parent)
	: QGraphicsView(parent), ui(_ui), m_session(session) {
	m_scene = new QGraphicsScene(this);
	setScene(m_scene);
	setBackgroundBrush(Qt::gray);
	setFocusPolicy(Qt::StrongFocus);

	m_imageItem = new QGraphicsPixmapItem();
	m_scene->addItem(m_imageItem);
	m_selectionItem = new DisplaySelection();
	m_scene->addItem(m_selectionItem);

	m_renderTimer.setSingleShot(true);

	connect(ui.actionZoomIn, &QAction::triggered, this, [this] { m_session->zoomIn(); });
	connect(ui.actionZoomOut, &QAction::triggered, this, [this] { m_session->zoomOut(); });
	connect(ui.actionPrevPage, &QAction::triggered, this, [this] { m_session->navigatePage(-1); });
	connect(ui.actionNextPage, &QAction::triggered, this, [this] { m_session->navigatePage(+1); });
	connect(m_session, &DocumentSession::documentChanged, this, &Displayer::queueRenderPage);
	connect(m_session, &DocumentSession::pageChanged, this, &Displayer::queueRenderPage);
	connect(m_session, &DocumentSession::zoomChanged, this, &Displayer::queueRenderPage);
	connect(m_session, &DocumentSession::selectionChanged, this, &Displayer::updateSelection);
	connect(&m_renderTimer, &QTimer::timeout, this, &Displayer::renderPage);
}

Displayer::~Displayer() {
	m_renderTimer.stop();
}

QPointF Displayer::getScroll() const {
	return mapToScene(0, 0) / m_scale;
}

bool Displayer::hasImage() const {
	return !m_imageItem->pixmap().isNull();
}

void Displayer::queueRenderPage() {
	// Opening a document changes page and zoom at once, render only once
	m_renderTimer.start(0);
}

bool Displayer::renderPage() {
	m_renderTimer.stop();
	if(!m_session->isLoaded()) {
		m_imageItem->setPixmap(QPixmap());
		m_selectionItem->clearSelection();
		m_scene->setSceneRect(QRectF());
		m_renderedPage = -1;
		return false;
	}
	bool samePage = m_session->getDocumentId() == m_renderedDocument && m_session->getPage() == m_renderedPage;
	QPointF center = mapToScene(viewport()->rect().center()) / m_scale;

	Error error;
	QImage image = m_session->renderPage(error);
	if(image.isNull()) {
		m_imageItem->setPixmap(QPixmap());
		m_selectionItem->clearSelection();
		m_renderedPage = -1;
		emit renderFailed(error);
		return false;
	}
	m_scale = m_session->getDisplayTransform().scale();
	m_imageItem->setPixmap(QPixmap::fromImage(image));
	m_scene->setSceneRect(m_imageItem->boundingRect());
	m_renderedDocument = m_session->getDocumentId();
	m_renderedPage = m_session->getPage();

	if(samePage) {
		centerOn(center * m_scale);
	} else {
		horizontalScrollBar()->setValue(horizontalScrollBar()->minimum());
		verticalScrollBar()->setValue(verticalScrollBar()->minimum());
	}
	updateSelection();
	return true;
}

void Displayer::updateSelection() {
	if(m_session->getState() == DocumentSession::State::Selecting) {
		m_selectionItem->setSelection(m_session->getPendingSelection(), m_scale, true);
	} else if(m_session->hasSelection()) {
		m_selectionItem->setSelection(m_session->getSelection(), m_scale, false);
	} else {
		m_selectionItem->clearSelection();
	}
}

void Displayer::keyPressEvent(QKeyEvent* event) {
	if(event->key() == Qt::Key_PageUp) {
		m_session->navigatePage(-1);
		event->accept();
	} else if(event->key() == Qt::Key_PageDown) {
		m_session->navigatePage(+1);
		event->accept();
	} else {
		QGraphicsView::keyPressEvent(event);
	}
}

void Displayer::mousePressEvent(QMouseEvent* event) {
	if(event->button() == Qt::MiddleButton) {
		m_panPos = event->pos();
	} else if(event->button() == Qt::LeftButton && m_session->isLoaded() && hasImage()) {
		m_session->beginSelection(event->pos(), getScroll());
		event->accept();
	} else {
		QGraphicsView::mousePressEvent(event);
	}
}

void Displayer::mouseMoveEvent(QMouseEvent* event) {
	if((event->buttons() & Qt::MiddleButton) == Qt::MiddleButton) {
		QPoint delta = event->pos() - m_panPos;
		horizontalScrollBar()->setValue(horizontalScrollBar()->value() - delta.x());
		verticalScrollBar()->setValue(verticalScrollBar()->value() - delta.y());
		m_panPos = event->pos();
	} else if(m_session->getState() == DocumentSession::State::Selecting) {
		m_session->updateSelection(event->pos(), getScroll());
		event->accept();
	} else {
		QGraphicsView::mouseMoveEvent(event);
	}
}

void Displayer::mouseReleaseEvent(QMouseEvent* event) {
	if(event->button() == Qt::LeftButton && m_session->getState() == DocumentSession::State::Selecting) {
		m_session->updateSelection(event->pos(), getScroll());
		Error error;
		if(!m_session->endSelection(error)) {
			emit selectionFailed(error);
		}
		event->accept();
	} else {
		QGraphicsView::mouseReleaseEvent(event);
	}
}

void Displayer::wheelEvent(QWheelEvent* event) {
	if(event->modifiers() & Qt::ControlModifier) {
		if(event->angleDelta().y() > 0) {
			m_session->zoomIn();
		} else if(event->angleDelta().y() < 0) {
			m_session->zoomOut();
		}
		event->accept();
	} else if(event->modifiers() & Qt::ShiftModifier) {
		QScrollBar* hscroll = horizontalScrollBar();
		if(event->angleDelta().y() < 0) {
			hscroll->setValue(hscroll->value() + hscroll->singleStep());
		} else {
			hscroll->setValue(hscroll->value() - hscroll->singleStep());
		}
		event->accept();
	} else {
		QGraphicsView::wheelEvent(event);
	}
}
