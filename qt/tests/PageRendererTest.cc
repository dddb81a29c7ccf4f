/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * PageRendererTest.cc
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

#include <QFile>
#include <QImage>
#include <QTemporaryDir>
#include <cstdlib>
#include <gtest/gtest.h>

#include "PageRenderer.hh"
#include "TestHelpers.hh"

class PDFRendererTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(m_dir.isValid());
		m_filename = m_dir.filePath("three.pdf");
		ASSERT_TRUE(TestHelpers::writeTestPdf(m_filename, 3));
	}

	QTemporaryDir m_dir;
	QString m_filename;
};

TEST_F(PDFRendererTest, LoadsDocument) {
	PDFRenderer renderer(m_filename);
	ASSERT_TRUE(renderer.isValid());
	EXPECT_FALSE(renderer.isLocked());
	EXPECT_EQ(renderer.getNPages(), 3);
	QSizeF size = renderer.getPageSize(0);
	EXPECT_GT(size.width(), 0.);
	EXPECT_GT(size.height(), size.width());
}

TEST_F(PDFRendererTest, RenderSizeFollowsZoom) {
	PDFRenderer renderer(m_filename);
	ASSERT_TRUE(renderer.isValid());
	Error error;
	QImage normal = renderer.render(0, 1.0, error);
	QImage doubled = renderer.render(0, 2.0, error);
	ASSERT_FALSE(normal.isNull());
	ASSERT_FALSE(doubled.isNull());
	EXPECT_LE(std::abs(doubled.width() - 2 * normal.width()), 2);
	EXPECT_LE(std::abs(doubled.height() - 2 * normal.height()), 2);

	QSizeF size = renderer.getPageSize(0);
	EXPECT_LE(std::abs(normal.width() - size.width() * renderer.getRenderScale()), 1.);
}

TEST_F(PDFRendererTest, RenderScaleChangesResolution) {
	PDFRenderer renderer(m_filename);
	ASSERT_TRUE(renderer.isValid());
	Error error;
	renderer.setRenderScale(1.0);
	QImage small = renderer.render(1, 1.0, error);
	renderer.setRenderScale(2.0);
	QImage large = renderer.render(1, 1.0, error);
	ASSERT_FALSE(small.isNull());
	ASSERT_FALSE(large.isNull());
	EXPECT_LE(std::abs(large.width() - 2 * small.width()), 2);
}

TEST_F(PDFRendererTest, PageOutOfRangeFails) {
	PDFRenderer renderer(m_filename);
	ASSERT_TRUE(renderer.isValid());
	Error error;
	EXPECT_TRUE(renderer.render(3, 1.0, error).isNull());
	EXPECT_EQ(error.code, Error::Code::Render);
	error.clear();
	EXPECT_TRUE(renderer.render(-1, 1.0, error).isNull());
	EXPECT_EQ(error.code, Error::Code::Render);
}

TEST(PDFRenderer, RejectsNonPdf) {
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	QString filename = dir.filePath("notes.pdf");
	QFile file(filename);
	ASSERT_TRUE(file.open(QIODevice::WriteOnly));
	file.write("this is not a pdf");
	file.close();
	PDFRenderer renderer(filename);
	EXPECT_FALSE(renderer.isValid());
	EXPECT_EQ(renderer.getNPages(), 0);
	Error error;
	EXPECT_TRUE(renderer.render(0, 1.0, error).isNull());
	EXPECT_EQ(error.code, Error::Code::Render);
}
