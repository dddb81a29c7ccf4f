/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DisplaySelection.hh
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

#ifndef DISPLAYSELECTION_HH
#define DISPLAYSELECTION_HH

#include <QGraphicsRectItem>

/**
 * Scene item showing the page-space selection of the session. The rectangle
 * is given in page units and drawn scaled to the rendered pixmap.
 */
class DisplaySelection : public QGraphicsRectItem {
public:
	DisplaySelection() {
		setZValue(10);
		setVisible(false);
	}
	void setSelection(const QRectF& pageRect, double scale, bool pending);
	void clearSelection() {
		setVisible(false);
	}

private:
	bool m_pending = false;

	void paint(QPainter* painter, const QStyleOptionGraphicsItem* option, QWidget* widget) override;
};

#endif // DISPLAYSELECTION_HH
