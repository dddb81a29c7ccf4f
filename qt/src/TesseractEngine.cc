/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractEngine.cc
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

#include <QElapsedTimer>
#include <exception>
#define USE_STD_NAMESPACE
#include <tesseract/baseapi.h>
#undef USE_STD_NAMESPACE

#include "common.hh"
#include "TesseractEngine.hh"
#include "Utils.hh"

bool TesseractEngine::isAvailable() const {
	return Utils::initTesseract(m_config.tessdataDir, m_config.language) != nullptr;
}

bool TesseractEngine::recognize(const QImage& image, const QString& language, QString& text, Error& error) {
	QString lang = languageOrDefault(language);
	QImage rgb = image.convertToFormat(QImage::Format_RGB32);
	QElapsedTimer timer;
	timer.start();
	try {
		std::unique_ptr<tesseract::TessBaseAPI> tess = Utils::initTesseract(m_config.tessdataDir, lang);
		if(!tess) {
			error.set(Error::Code::EngineUnavailable, _("Failed to initialize tesseract for language '%1'. Check that the language data is installed.").arg(lang));
			return false;
		}
		tess->SetPageSegMode(tesseract::PSM_AUTO);
		tess->SetImage(rgb.constBits(), rgb.width(), rgb.height(), 4, rgb.bytesPerLine());
		char* utf8 = tess->GetUTF8Text();
		text = QString::fromUtf8(utf8).trimmed();
		delete[] utf8;
		tess->End();
	} catch(const std::exception& e) {
		qWarning("tesseract failed: %s", e.what());
		error.set(Error::Code::EngineUnavailable, _("Tesseract failed: %1").arg(QString::fromLocal8Bit(e.what())));
		return false;
	}
	qDebug("tesseract: recognized %dx%d image in %lld ms", rgb.width(), rgb.height(), timer.elapsed());
	return true;
}
