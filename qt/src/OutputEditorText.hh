/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputEditorText.hh
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

#ifndef OUTPUTEDITORTEXT_HH
#define OUTPUTEDITORTEXT_HH

#include <QList>
#include <QObject>

#include "OutputLog.hh"
#include "Ui_OutputEditorText.hh"

class DocumentSession;

/**
 * Output panel. Shows the session's output log as plain text and offers
 * saving, copying and clearing it.
 */
class OutputEditorText : public QObject {
	Q_OBJECT
public:
	OutputEditorText(DocumentSession* session);
	~OutputEditorText();

	QWidget* getUI() {
		return m_widget;
	}

public slots:
	void refresh();
	bool save(const QString& filename = "");
	void clear();
	void copy();

signals:
	void saved(const QString& filename);

private:
	QWidget* m_widget;
	UI_OutputEditorText ui;
	DocumentSession* m_session;
};

#endif // OUTPUTEDITORTEXT_HH
