/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Ui_MainWindow.hh
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

#ifndef UI_MAINWINDOW_HH
#define UI_MAINWINDOW_HH

#include "common.hh"
#include "ui_MainWindow.h"
#include <QComboBox>
#include <QLabel>
#include <QMenu>
#include <QToolButton>
#include <QVBoxLayout>

class UI_MainWindow : public Ui_MainWindow {
public:
	QAction* actionPreferences;
	QAction* actionQuit;
	QComboBox* comboBoxEngine;
	QLabel* labelEngineInfo;
	QLabel* labelPage;
	QLabel* labelZoom;
	QMenu* menuAppMenu;
	QToolButton* toolButtonAppMenu;


	void setupUi(QMainWindow* MainWindow) {
		Ui_MainWindow::setupUi(MainWindow);

		// Do remaining things which are not possible in designer
		toolBarMain->setContextMenuPolicy(Qt::PreventContextMenu);

		// Remove & from some labels which designer insists in adding
		dockWidgetOutput->setWindowTitle(gettext("Output"));

		// Page label between the navigation buttons
		labelPage = new QLabel(MainWindow);
		labelPage->setContentsMargins(4, 0, 4, 0);
		toolBarMain->insertWidget(actionNextPage, labelPage);

		// Zoom label between the zoom buttons
		labelZoom = new QLabel(MainWindow);
		labelZoom->setContentsMargins(4, 0, 4, 0);
		labelZoom->setMinimumWidth(labelZoom->fontMetrics().horizontalAdvance("0000%"));
		labelZoom->setAlignment(Qt::AlignCenter);
		toolBarMain->insertWidget(actionZoomIn, labelZoom);

		QFont smallFont;
		smallFont.setPointSizeF(smallFont.pointSizeF() * 0.9);

		// Engine selector
		QWidget* engineWidget = new QWidget();
		engineWidget->setLayout(new QVBoxLayout());
		engineWidget->layout()->setContentsMargins(0, 0, 0, 0);
		engineWidget->layout()->setSpacing(0);
		QLabel* engineLabel = new QLabel(gettext("OCR engine:"));
		engineLabel->setFont(smallFont);
		engineWidget->layout()->addWidget(engineLabel);
		comboBoxEngine = new QComboBox();
		comboBoxEngine->setFont(smallFont);
		comboBoxEngine->setFrame(false);
		engineWidget->layout()->addWidget(comboBoxEngine);
		toolBarMain->insertWidget(actionOcrPage, engineWidget);

		labelEngineInfo = new QLabel(MainWindow);
		labelEngineInfo->setFont(smallFont);
		labelEngineInfo->setContentsMargins(4, 0, 4, 0);
		labelEngineInfo->setEnabled(false);
		toolBarMain->insertWidget(actionOcrPage, labelEngineInfo);

		// Spacer before app menu button
		QWidget* toolBarMainSpacer = new QWidget(toolBarMain);
		toolBarMainSpacer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
		toolBarMain->addWidget(toolBarMainSpacer);

		// App menu
		menuAppMenu = new QMenu(MainWindow);

		actionPreferences = new QAction(QIcon::fromTheme("preferences-system"), gettext("Preferences"), MainWindow);
		menuAppMenu->addAction(actionPreferences);

		menuAppMenu->addSeparator();

		actionQuit = new QAction(QIcon::fromTheme("application-exit"), gettext("Quit"), MainWindow);
		actionQuit->setShortcut(QKeySequence::Quit);
		menuAppMenu->addAction(actionQuit);

		// App menu button
		toolButtonAppMenu = new QToolButton(MainWindow);
		toolButtonAppMenu->setIcon(QIcon::fromTheme("preferences-system"));
		toolButtonAppMenu->setPopupMode(QToolButton::InstantPopup);
		toolButtonAppMenu->setMenu(menuAppMenu);
		toolBarMain->addWidget(toolButtonAppMenu);
	}
};

#endif // UI_MAINWINDOW_HH
