/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * SelectionMapper.cc
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

#include <cmath>

#include "common.hh"
#include "SelectionMapper.hh"

namespace SelectionMapper {

QPointF pageToScreen(const QPointF& point, const DisplayTransform& transform) {
	return (point - transform.scroll) * transform.scale();
}

QRectF pageToScreen(const QRectF& rect, const DisplayTransform& transform) {
	return QRectF(pageToScreen(rect.topLeft(), transform), pageToScreen(rect.bottomRight(), transform));
}

QPointF screenToPage(const QPointF& point, const DisplayTransform& transform) {
	return point / transform.scale() + transform.scroll;
}

bool screenToPage(const QRectF& screenRect, const DisplayTransform& transform, QRectF& pageRect, Error& error) {
	if(transform.scale() <= 0.) {
		error.set(Error::Code::InvalidSelection, _("The display scale is not positive"));
		return false;
	}
	QRectF rect = QRectF(screenToPage(screenRect.topLeft(), transform), screenToPage(screenRect.bottomRight(), transform)).normalized();
	if(rect.width() <= 0. || rect.height() <= 0.) {
		error.set(Error::Code::InvalidSelection, _("The selection is empty. Click and drag on the page to select an area."));
		return false;
	}
	pageRect = rect;
	return true;
}

QRect pageToPixels(const QRectF& pageRect, double scale) {
	QRectF r = pageRect.normalized();
	int x0 = int(std::floor(r.left() * scale));
	int y0 = int(std::floor(r.top() * scale));
	int x1 = int(std::ceil(r.right() * scale));
	int y1 = int(std::ceil(r.bottom() * scale));
	return QRect(QPoint(x0, y0), QPoint(x1 - 1, y1 - 1));
}

QImage crop(const QImage& image, const QRectF& pageRect, double scale, Error& error) {
	QRect pixels = pageToPixels(pageRect, scale).intersected(image.rect());
	if(pixels.isEmpty()) {
		error.set(Error::Code::InvalidSelection, _("The selection lies outside the page"));
		return QImage();
	}
	return image.copy(pixels);
}

} // SelectionMapper
