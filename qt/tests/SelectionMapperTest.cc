/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * SelectionMapperTest.cc
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
#include <gtest/gtest.h>

#include "SelectionMapper.hh"

using SelectionMapper::DisplayTransform;

static DisplayTransform makeTransform(double zoom, double ppu, const QPointF& scroll) {
	DisplayTransform transform;
	transform.zoom = zoom;
	transform.pixelsPerUnit = ppu;
	transform.scroll = scroll;
	return transform;
}

TEST(SelectionMapper, RoundTripsWithinOnePixel) {
	const double zooms[] = {0.25, 1.0, 1.75, 3.0};
	const QPointF scrolls[] = {QPointF(0, 0), QPointF(12.5, 40), QPointF(300, 7.25)};
	for(double zoom : zooms) {
		for(const QPointF& scroll : scrolls) {
			DisplayTransform transform = makeTransform(zoom, 1.5, scroll);
			QRectF screen(QPointF(17, 23), QPointF(211, 158));
			QRectF page;
			Error error;
			ASSERT_TRUE(SelectionMapper::screenToPage(screen, transform, page, error));
			QRectF back = SelectionMapper::pageToScreen(page, transform);
			EXPECT_LE(std::abs(back.left() - screen.left()), 1.);
			EXPECT_LE(std::abs(back.top() - screen.top()), 1.);
			EXPECT_LE(std::abs(back.right() - screen.right()), 1.);
			EXPECT_LE(std::abs(back.bottom() - screen.bottom()), 1.);
		}
	}
}

TEST(SelectionMapper, MapsScreenToPageUnits) {
	DisplayTransform transform = makeTransform(2.0, 1.5, QPointF(10, 20));
	QPointF page = SelectionMapper::screenToPage(QPointF(30, 60), transform);
	EXPECT_DOUBLE_EQ(page.x(), 20.);
	EXPECT_DOUBLE_EQ(page.y(), 40.);
}

TEST(SelectionMapper, NormalizesReversedDrag) {
	DisplayTransform transform = makeTransform(1.0, 1.0, QPointF());
	QRectF page;
	Error error;
	ASSERT_TRUE(SelectionMapper::screenToPage(QRectF(QPointF(50, 40), QPointF(10, 5)), transform, page, error));
	EXPECT_EQ(page, QRectF(10, 5, 40, 35));
}

TEST(SelectionMapper, ZeroAreaIsInvalid) {
	DisplayTransform transform = makeTransform(1.0, 1.5, QPointF());
	QRectF page(1, 2, 3, 4);
	Error error;
	EXPECT_FALSE(SelectionMapper::screenToPage(QRectF(QPointF(20, 20), QPointF(20, 20)), transform, page, error));
	EXPECT_EQ(error.code, Error::Code::InvalidSelection);
	EXPECT_EQ(page, QRectF(1, 2, 3, 4));

	error.clear();
	EXPECT_FALSE(SelectionMapper::screenToPage(QRectF(QPointF(20, 20), QPointF(80, 20)), transform, page, error));
	EXPECT_EQ(error.code, Error::Code::InvalidSelection);
}

TEST(SelectionMapper, PageToPixelsCoversPartialPixels) {
	QRect pixels = SelectionMapper::pageToPixels(QRectF(10.2, 20.2, 10, 10), 2.0);
	EXPECT_EQ(pixels.left(), 20);
	EXPECT_EQ(pixels.top(), 40);
	EXPECT_EQ(pixels.right(), 40);
	EXPECT_EQ(pixels.bottom(), 60);
}

TEST(SelectionMapper, CropIsClippedToImage) {
	QImage image(100, 80, QImage::Format_RGB32);
	image.fill(Qt::white);
	Error error;
	QImage cropped = SelectionMapper::crop(image, QRectF(40, 30, 100, 100), 1.0, error);
	ASSERT_FALSE(cropped.isNull());
	EXPECT_EQ(cropped.size(), QSize(60, 50));
}

TEST(SelectionMapper, CropOutsideImageFails) {
	QImage image(100, 80, QImage::Format_RGB32);
	image.fill(Qt::white);
	Error error;
	QImage cropped = SelectionMapper::crop(image, QRectF(200, 200, 10, 10), 1.0, error);
	EXPECT_TRUE(cropped.isNull());
	EXPECT_EQ(error.code, Error::Code::InvalidSelection);
}
