/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DisplaySelection.cc
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

#include "DisplaySelection.hh"

#include <QPainter>
#include <QPalette>

void DisplaySelection::setSelection(const QRectF& pageRect, double scale, bool pending) {
	m_pending = pending;
	setRect(QRectF(pageRect.topLeft() * scale, pageRect.bottomRight() * scale).normalized());
	setVisible(true);
	update();
}

void DisplaySelection::paint(QPainter* painter, const QStyleOptionGraphicsItem* option, QWidget* widget) {
	QColor c = QPalette().highlight().color();
	setBrush(QColor(c.red(), c.green(), c.blue(), m_pending ? 31 : 63));
	QPen pen;
	pen.setColor(c);
	pen.setCosmetic(true);
	pen.setWidth(1);
	if(m_pending) {
		pen.setStyle(Qt::DashLine);
	}
	setPen(pen);

	painter->setRenderHint(QPainter::Antialiasing, false);
	QGraphicsRectItem::paint(painter, option, widget);

	if(m_pending) {
		return;
	}
	// Corner handle
	QRectF r = rect();
	qreal w = qMin(8., qMin(r.width(), r.height()));
	painter->setBrush(QPalette().highlight());
	painter->drawRect(QRectF(r.x(), r.y(), w, w));
}
