/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractEngine.hh
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

#ifndef TESSERACTENGINE_HH
#define TESSERACTENGINE_HH

#include "OcrEngine.hh"

class TesseractEngine : public OcrEngine {
public:
	using OcrEngine::OcrEngine;

	Type getType() const override {
		return Type::Traditional;
	}
	bool isAvailable() const override;
	bool recognize(const QImage& image, const QString& language, QString& text, Error& error) override;
};

#endif // TESSERACTENGINE_HH
