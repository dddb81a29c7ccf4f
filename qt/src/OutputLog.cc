/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputLog.cc
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
#include <QStringList>

#include "common.hh"
#include "OutputLog.hh"

QString OcrResult::format() const {
	QString body = failed ? _("[Failed to recognize page %1: %2]").arg(page + 1).arg(errorMessage) : text;
	if(source == Source::Document) {
		return QString("%1\n%2\n").arg(OutputLog::pageMarker(page)).arg(body);
	}
	return body + "\n";
}

QString OcrResult::describe() const {
	QString engineName = OcrEngine::typeName(engine);
	switch(source) {
	case Source::Selection:
		return _("Selection on page %1 (%2)").arg(page + 1).arg(engineName);
	case Source::Document:
		return _("Entire Document (%1)").arg(engineName);
	case Source::Page:
		break;
	}
	return _("Page %1 (%2)").arg(page + 1).arg(engineName);
}

QString OutputLog::pageMarker(int page) {
	return QString("--- Page %1 ---").arg(page + 1);
}

int OutputLog::failedCount(const QList<OcrResult>& results) {
	int failed = 0;
	for(const OcrResult& result : results) {
		failed += result.failed;
	}
	return failed;
}

QString OutputLog::toPlainText() const {
	QStringList parts;
	for(const OcrResult& result : m_entries) {
		parts.append(result.format());
	}
	return parts.join("\n");
}

bool OutputLog::save(const QString& filename, Error& error, bool utf8) const {
	QFile file(filename);
	if(!file.open(QIODevice::WriteOnly)) {
		qWarning("Failed to open %s for writing: %s", qPrintable(filename), qPrintable(file.errorString()));
		error.set(Error::Code::Write, _("Check that you have writing permissions in the selected folder.\n%1").arg(file.errorString()));
		return false;
	}
	QString text = toPlainText();
	QByteArray data = utf8 ? text.toUtf8() : text.toLocal8Bit();
	if(file.write(data) != data.size() || !file.flush()) {
		qWarning("Failed to write %s: %s", qPrintable(filename), qPrintable(file.errorString()));
		error.set(Error::Code::Write, _("Failed to write %1: %2").arg(filename).arg(file.errorString()));
		return false;
	}
	return true;
}
