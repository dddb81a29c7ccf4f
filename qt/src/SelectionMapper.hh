/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * SelectionMapper.hh
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

#ifndef SELECTIONMAPPER_HH
#define SELECTIONMAPPER_HH

#include <QImage>
#include <QPointF>
#include <QRect>
#include <QRectF>

#include "Error.hh"

namespace SelectionMapper {

/**
 * Maps page space to the widget. A page point p is shown at
 * (p - scroll) * zoom * pixelsPerUnit, scroll being the page-space point
 * at the top-left corner of the viewport.
 */
struct DisplayTransform {
	double zoom = 1.0;
	double pixelsPerUnit = 1.0;
	QPointF scroll;

	double scale() const {
		return zoom * pixelsPerUnit;
	}
};

QPointF pageToScreen(const QPointF& point, const DisplayTransform& transform);
QRectF pageToScreen(const QRectF& rect, const DisplayTransform& transform);
QPointF screenToPage(const QPointF& point, const DisplayTransform& transform);

// Fails with InvalidSelection if the mapped rectangle has no area
bool screenToPage(const QRectF& screenRect, const DisplayTransform& transform, QRectF& pageRect, Error& error);

// Pixel rectangle covered by pageRect in a bitmap rendered at scale pixels per unit
QRect pageToPixels(const QRectF& pageRect, double scale);

QImage crop(const QImage& image, const QRectF& pageRect, double scale, Error& error);

} // SelectionMapper

#endif // SELECTIONMAPPER_HH
