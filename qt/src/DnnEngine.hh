/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DnnEngine.hh
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

#ifndef DNNENGINE_HH
#define DNNENGINE_HH

#include <QMutex>

#include "OcrEngine.hh"

/**
 * Text detection (DB) followed by CRNN recognition of every detected box,
 * both through the OpenCV dnn module. The networks are loaded on first use
 * and shared by all instances for the lifetime of the process; only one
 * recognition may run on them at a time.
 */
class DnnEngine : public OcrEngine {
public:
	using OcrEngine::OcrEngine;

	Type getType() const override {
		return Type::DeepLearning;
	}
	bool isAvailable() const override;
	bool recognize(const QImage& image, const QString& language, QString& text, Error& error) override;

	// Drops the shared networks, they are reloaded on the next recognition
	static void releaseModel();
	static bool isModelLoaded();

private:
	struct Model;
	static Model* s_model;
	static QString s_modelKey;
	static QMutex s_mutex;

	QString modelKey() const;
	bool ensureModel(Error& error);
};

#endif // DNNENGINE_HH
