/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Ui_OutputEditorText.hh
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

#ifndef UI_OUTPUTEDITORTEXT_HH
#define UI_OUTPUTEDITORTEXT_HH

#include <QAction>
#include <QFontDatabase>
#include <QPlainTextEdit>
#include <QStyle>
#include <QToolBar>
#include <QVBoxLayout>

#include "common.hh"

class UI_OutputEditorText {
public:
	QAction* actionOutputClear;
	QAction* actionOutputCopy;
	QAction* actionOutputSave;
	QToolBar* toolBarOutput;
	QPlainTextEdit* plainTextEditOutput;

	void setupUi(QWidget* widget) {
		widget->setLayout(new QVBoxLayout());
		widget->layout()->setContentsMargins(0, 0, 0, 0);
		widget->layout()->setSpacing(0);

		actionOutputSave = new QAction(QIcon::fromTheme("document-save-as"), gettext("Save Output"), widget);
		actionOutputSave->setToolTip(gettext("Save output"));
		actionOutputCopy = new QAction(QIcon::fromTheme("edit-copy"), gettext("Copy to Clipboard"), widget);
		actionOutputCopy->setToolTip(gettext("Copy output to clipboard"));
		actionOutputClear = new QAction(QIcon::fromTheme("edit-clear"), gettext("Clear Output"), widget);
		actionOutputClear->setToolTip(gettext("Clear output"));

		toolBarOutput = new QToolBar(widget);
		toolBarOutput->setToolButtonStyle(Qt::ToolButtonIconOnly);
		toolBarOutput->setIconSize(QSize(1, 1) * toolBarOutput->style()->pixelMetric(QStyle::PM_SmallIconSize));
		toolBarOutput->addAction(actionOutputSave);
		toolBarOutput->addAction(actionOutputCopy);
		toolBarOutput->addAction(actionOutputClear);

		widget->layout()->addWidget(toolBarOutput);

		plainTextEditOutput = new QPlainTextEdit(widget);
		plainTextEditOutput->setReadOnly(true);
		plainTextEditOutput->setLineWrapMode(QPlainTextEdit::WidgetWidth);
		plainTextEditOutput->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
		widget->layout()->addWidget(plainTextEditOutput);
	}
};

#endif // UI_OUTPUTEDITORTEXT_HH
