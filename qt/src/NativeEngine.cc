/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * NativeEngine.cc
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

#include <QtGlobal>
#include <QElapsedTimer>
#include <QLocale>

#ifdef Q_OS_WIN
#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Globalization.h>
#include <winrt/Windows.Graphics.Imaging.h>
#include <winrt/Windows.Media.Ocr.h>
#include <winrt/Windows.Storage.Streams.h>
#endif

#include "common.hh"
#include "NativeEngine.hh"

#ifdef Q_OS_WIN

using winrt::Windows::Globalization::Language;
using winrt::Windows::Graphics::Imaging::BitmapPixelFormat;
using winrt::Windows::Graphics::Imaging::SoftwareBitmap;
namespace WinOcr = winrt::Windows::Media::Ocr;
using winrt::Windows::Storage::Streams::DataWriter;

// Prefers the hinted language, falls back to the user profile languages
static WinOcr::OcrEngine createWinOcrEngine(const QString& language) {
	QLocale locale(language);
	if(!language.isEmpty() && locale.language() != QLocale::C) {
		std::wstring tag = locale.bcp47Name().toStdWString();
		WinOcr::OcrEngine engine = WinOcr::OcrEngine::TryCreateFromLanguage(Language(tag));
		if(engine) {
			return engine;
		}
		qDebug("Windows OCR has no recognizer for '%s', using the user profile languages", qPrintable(language));
	}
	return WinOcr::OcrEngine::TryCreateFromUserProfileLanguages();
}

bool NativeEngine::isAvailable() const {
	try {
		return createWinOcrEngine(m_config.language) != nullptr;
	} catch(const winrt::hresult_error& e) {
		qWarning("Windows OCR is not available: %s", winrt::to_string(e.message()).c_str());
		return false;
	}
}

bool NativeEngine::recognize(const QImage& image, const QString& language, QString& text, Error& error) {
	QElapsedTimer timer;
	timer.start();
	try {
		winrt::init_apartment(winrt::apartment_type::multi_threaded);
	} catch(const winrt::hresult_error& e) {
		// Thread already joined a single threaded apartment, which works as well
		qDebug("init_apartment: %s", winrt::to_string(e.message()).c_str());
	}
	try {
		WinOcr::OcrEngine engine = createWinOcrEngine(languageOrDefault(language));
		if(!engine) {
			error.set(Error::Code::EngineUnavailable, _("Windows OCR has no recognizer for the installed languages"));
			return false;
		}
		QImage bgra = image.convertToFormat(QImage::Format_RGB32);
		DataWriter writer;
		for(int y = 0; y < bgra.height(); ++y) {
			const uint8_t* line = bgra.constScanLine(y);
			writer.WriteBytes(winrt::array_view<const uint8_t>(line, line + 4 * bgra.width()));
		}
		SoftwareBitmap bitmap = SoftwareBitmap::CreateCopyFromBuffer(writer.DetachBuffer(), BitmapPixelFormat::Bgra8, bgra.width(), bgra.height());
		auto result = engine.RecognizeAsync(bitmap).get();
		text = QString::fromStdWString(std::wstring(result.Text())).trimmed();
	} catch(const winrt::hresult_error& e) {
		QString message = QString::fromStdWString(std::wstring(e.message()));
		qWarning("Windows OCR failed: %s", qPrintable(message));
		error.set(Error::Code::EngineUnavailable, _("Windows OCR failed: %1").arg(message));
		return false;
	}
	qDebug("Windows OCR: recognized %dx%d image in %lld ms", image.width(), image.height(), timer.elapsed());
	return true;
}

#else // Q_OS_WIN

bool NativeEngine::isAvailable() const {
	return false;
}

bool NativeEngine::recognize(const QImage& /*image*/, const QString& /*language*/, QString& /*text*/, Error& error) {
	error.set(Error::Code::EnginePlatformUnsupported, _("Windows OCR is only available on Windows 10 and later"));
	return false;
}

#endif // Q_OS_WIN
