/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputEditorText.cc
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

#include <QApplication>
#include <QClipboard>
#include <QDebug>
#include <QFileInfo>
#include <QMessageBox>
#include <QScrollBar>

#include "Config.hh"
#include "DocumentSession.hh"
#include "FileDialogs.hh"
#include "MainWindow.hh"
#include "OutputEditorText.hh"


OutputEditorText::OutputEditorText(DocumentSession* session)
	: m_session(session) {
	m_widget = new QWidget;
	ui.setupUi(m_widget);

	connect(ui.actionOutputSave, &QAction::triggered, this, [this] { save(); });
	connect(ui.actionOutputCopy, &QAction::triggered, this, &OutputEditorText::copy);
	connect(ui.actionOutputClear, &QAction::triggered, this, &OutputEditorText::clear);

	refresh();
}

OutputEditorText::~OutputEditorText() {
	delete m_widget;
}

void OutputEditorText::refresh() {
	const OutputLog& log = m_session->getOutputLog();
	ui.plainTextEditOutput->setPlainText(log.toPlainText());
	QScrollBar* vscroll = ui.plainTextEditOutput->verticalScrollBar();
	vscroll->setValue(vscroll->maximum());
	ui.actionOutputSave->setEnabled(!log.isEmpty());
	ui.actionOutputCopy->setEnabled(!log.isEmpty());
	ui.actionOutputClear->setEnabled(!log.isEmpty());
}

bool OutputEditorText::save(const QString& filename) {
	const OutputLog& log = m_session->getOutputLog();
	if(log.isEmpty()) {
		QMessageBox::warning(MAIN, _("Warning"), _("No text to save."));
		return false;
	}
	QString outname = filename;
	if(outname.isEmpty()) {
		QString suggestion = QFileInfo(m_session->getFilename()).completeBaseName();
		suggestion = suggestion.isEmpty() ? _("output") : suggestion;
		outname = FileDialogs::saveDialog(_("Save OCR Text"), suggestion + ".txt", "outputdir", QString("%1 (*.txt)").arg(_("Text Files")));
		if(outname.isEmpty()) {
			return false;
		}
	}
	Error error;
	if(!log.save(outname, error, MAIN->getConfig()->useUtf8())) {
		qWarning() << "Failed to save output to" << outname << ":" << error.message;
		MAIN->addNotification(Error::title(error.code), error.message);
		return false;
	}
	qInfo() << "Saved output to" << outname;
	emit saved(outname);
	return true;
}

void OutputEditorText::clear() {
	m_session->getOutputLog().clear();
	refresh();
}

void OutputEditorText::copy() {
	QApplication::clipboard()->setText(m_session->getOutputLog().toPlainText());
}
