/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Utils.cc
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

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>
#include <clocale>
#include <exception>
#define USE_STD_NAMESPACE
#include <tesseract/baseapi.h>
#undef USE_STD_NAMESPACE

#include "Utils.hh"

QString Utils::documentsFolder() {
	QString documentsFolder;
	documentsFolder = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
	return (documentsFolder.isEmpty() || !QDir(documentsFolder).exists()) ? QDir::homePath() : documentsFolder;
}

QString Utils::makeOutputFilename(const QString& filename) {
	// Ensure directory exists
	QFileInfo finfo(filename);
	QDir dir = finfo.absoluteDir();
	if(!dir.exists()) {
		dir = QDir(Utils::documentsFolder());
	}
	// Generate non-existing file
	QString ext = finfo.completeSuffix();
	QString base = finfo.baseName().replace(QRegularExpression("_[0-9]+$"), "");
	QString newfilename = dir.absoluteFilePath(base + "." + ext);
	for(int i = 1; QFile(newfilename).exists(); ++i) {
		newfilename = dir.absoluteFilePath(QString("%1_%2.%3").arg(base).arg(i).arg(ext));
	}
	return newfilename;
}

std::unique_ptr<tesseract::TessBaseAPI> Utils::initTesseract(const QString& datapath, const QString& language) {
	QByteArray current = setlocale(LC_ALL, NULL);
	setlocale(LC_ALL, "C");
	std::unique_ptr<tesseract::TessBaseAPI> tess(new tesseract::TessBaseAPI());
	QByteArray path = datapath.toLocal8Bit();
	int ret = -1;
	try {
		ret = tess->Init(path.isEmpty() ? nullptr : path.constData(), language.toLocal8Bit().constData());
	} catch(const std::exception& e) {
		qWarning("tesseract initialization threw: %s", e.what());
	}
	setlocale(LC_ALL, current.constData());

	if(ret == -1) {
		qWarning("Failed to initialize tesseract (datapath '%s', language '%s')", path.constData(), qPrintable(language));
		return nullptr;
	}
	return tess;
}

QString Utils::tessdataLocation(const QString& datapath) {
	QByteArray current = setlocale(LC_ALL, NULL);
	setlocale(LC_ALL, "C");
	tesseract::TessBaseAPI tess;
	QByteArray path = datapath.toLocal8Bit();
	tess.Init(path.isEmpty() ? nullptr : path.constData(), nullptr);
	setlocale(LC_ALL, current.constData());
	return QString(tess.GetDatapath());
}
