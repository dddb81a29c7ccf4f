/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Displayer.hh
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

#ifndef DISPLAYER_HH
#define DISPLAYER_HH

#include <QGraphicsView>
#include <QPointF>
#include <QTimer>

#include "Error.hh"

class DisplaySelection;
class DocumentSession;
class QGraphicsPixmapItem;
class UI_MainWindow;

/**
 * Canvas showing the current page of the session at the current zoom.
 * The view itself is never transformed: the pixmap is rendered at the
 * display scale and placed at the scene origin, so a scene coordinate
 * divided by the scale is a page coordinate.
 */
class Displayer : public QGraphicsView {
	Q_OBJECT
public:
	Displayer(const UI_MainWindow& _ui, DocumentSession* session, QWidget* parent = nullptr);
	~Displayer();

	// Page-space point at the top-left corner of the viewport
	QPointF getScroll() const;
	bool hasImage() const;

public slots:
	bool renderPage();

signals:
	void renderFailed(const Error& error);
	void selectionFailed(const Error& error);

private:
	const UI_MainWindow& ui;
	DocumentSession* m_session;
	QGraphicsScene* m_scene;
	QGraphicsPixmapItem* m_imageItem = nullptr;
	DisplaySelection* m_selectionItem = nullptr;
	double m_scale = 1.0;
	quint64 m_renderedDocument = 0;
	int m_renderedPage = -1;
	QPoint m_panPos;
	QTimer m_renderTimer;

	void keyPressEvent(QKeyEvent* event) override;
	void mousePressEvent(QMouseEvent* event) override;
	void mouseMoveEvent(QMouseEvent* event) override;
	void mouseReleaseEvent(QMouseEvent* event) override;
	void wheelEvent(QWheelEvent* event) override;

private slots:
	void queueRenderPage();
	void updateSelection();
};

#endif // DISPLAYER_HH
