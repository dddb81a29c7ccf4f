/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OcrEngine.hh
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

#ifndef OCRENGINE_HH
#define OCRENGINE_HH

#include <QImage>
#include <QList>
#include <QMetaType>
#include <QString>
#include <memory>

#include "Error.hh"

struct EngineConfig {
	QString language = "eng";
	QString tessdataDir;
	QString detectorModel;
	QString recognizerModel;
	QString vocabulary;
};

/**
 * Text recognition backend. recognize() may block for seconds and must be
 * called off the UI thread. An empty language hint selects the configured
 * default language.
 */
class OcrEngine {
public:
	enum class Type { Traditional = 0, DeepLearning = 1, OsNative = 2 };

	static QList<Type> allTypes() {
		return {Type::Traditional, Type::DeepLearning, Type::OsNative};
	}
	static QString typeName(Type type);
	static QString typeDescription(Type type);
	static QString typeKey(Type type);
	static bool typeFromKey(const QString& key, Type& type);
	static std::shared_ptr<OcrEngine> create(Type type, const EngineConfig& config);

	OcrEngine(const EngineConfig& config) : m_config(config) {}
	virtual ~OcrEngine() {}

	virtual Type getType() const = 0;
	virtual bool isAvailable() const = 0;
	virtual bool recognize(const QImage& image, const QString& language, QString& text, Error& error) = 0;

	const EngineConfig& getConfig() const {
		return m_config;
	}

protected:
	EngineConfig m_config;

	QString languageOrDefault(const QString& language) const {
		return language.isEmpty() ? m_config.language : language;
	}
};

Q_DECLARE_METATYPE(OcrEngine::Type)

#endif // OCRENGINE_HH
