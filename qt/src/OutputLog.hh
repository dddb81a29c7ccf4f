/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputLog.hh
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

#ifndef OUTPUTLOG_HH
#define OUTPUTLOG_HH

#include <QList>
#include <QMetaType>
#include <QRectF>
#include <QString>

#include "Error.hh"
#include "OcrEngine.hh"

struct OcrResult {
	enum class Source { Page, Selection, Document };

	QString text;
	OcrEngine::Type engine = OcrEngine::Type::Traditional;
	Source source = Source::Page;
	int page = 0;
	bool hasArea = false;
	QRectF area;
	bool failed = false;
	QString errorMessage;

	// Text as it appears in the output log
	QString format() const;
	QString describe() const;
};

Q_DECLARE_METATYPE(OcrResult)

/**
 * Append-only record of recognition results. Entries are never modified,
 * the log is only appended to or cleared as a whole.
 */
class OutputLog {
public:
	void append(const OcrResult& result) {
		m_entries.append(result);
	}
	void append(const QList<OcrResult>& results) {
		m_entries.append(results);
	}
	void clear() {
		m_entries.clear();
	}
	bool isEmpty() const {
		return m_entries.isEmpty();
	}
	int size() const {
		return m_entries.size();
	}
	const QList<OcrResult>& getEntries() const {
		return m_entries;
	}

	QString toPlainText() const;
	bool save(const QString& filename, Error& error, bool utf8 = true) const;

	static QString pageMarker(int page);
	static int failedCount(const QList<OcrResult>& results);

private:
	QList<OcrResult> m_entries;
};

#endif // OUTPUTLOG_HH
