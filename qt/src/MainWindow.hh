/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * MainWindow.hh
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

#ifndef MAINWINDOW_HH
#define MAINWINDOW_HH

#include <QActionGroup>
#include <QList>
#include <QMainWindow>
#include <QTimer>
#include <memory>

#include "common.hh"
#include "Config.hh"
#include "Error.hh"
#include "OutputLog.hh"
#include "Recognizer.hh"
#include "StateStack.hh"
#include "ui_MainWindow.h"
#include "Ui_MainWindow.hh"

#define MAIN MainWindow::getInstance()

class Displayer;
class DocumentSession;
class OutputEditorText;
class QProgressBar;

class MainWindow : public QMainWindow {
	Q_OBJECT
public:
	typedef StateStack::State State;

	typedef void* Notification;

	static MainWindow* getInstance() {
		return s_instance;
	}

	MainWindow(const QString& file, const QString& engineKey = QString());
	~MainWindow();

	Config* getConfig() {
		return m_config;
	}
	void addNotification(const QString& title, const QString& message, Notification* handle = nullptr);
	bool openFile(const QString& filename);
	void showProgress(const std::shared_ptr<Recognizer::ProgressMonitor>& monitor, int updateInterval = 500);
	void hideProgress();

public slots:
	void popState();
	void pushState(MainWindow::State state, const QString& msg);
	void hideNotification(Notification handle);
	void showError(const Error& error);

private:
	static MainWindow* s_instance;

	UI_MainWindow ui;

	Config* m_config = nullptr;
	DocumentSession* m_session = nullptr;
	Displayer* m_displayer = nullptr;
	OutputEditorText* m_outputEditor = nullptr;
	Recognizer* m_recognizer = nullptr;

	QActionGroup m_idleActions;
	QActionGroup m_busyActions;
	QList<QWidget*> m_busyWidgets;
	StateStack m_stateStack;

	Notification m_errorHandle = nullptr;
	QString m_completedSource;

	QWidget* m_progressWidget = nullptr;
	QLabel* m_progressLabel = nullptr;
	QProgressBar* m_progressBar = nullptr;
	QTimer m_progressTimer;
	std::shared_ptr<Recognizer::ProgressMonitor> m_progressMonitor;

	void closeEvent(QCloseEvent* ev) override;
	void setState(State state);
	void setEngine(OcrEngine::Type type);

private slots:
	void openDocument();
	void onDocumentChanged();
	void onPageChanged(int page);
	void onZoomChanged(double zoom);
	void onSelectionChanged();
	void clearSelection();
	void recognizeCurrentPage();
	void recognizeSelection();
	void recognizeDocument();
	void onRecognitionStarted(Recognizer::Scope scope, const QString& message);
	void onPageStarted(int page, int nPages);
	void onResultsAvailable(const QList<OcrResult>& results);
	void onRecognitionFinished(Recognizer::Scope scope);
	void onEngineConfigChanged();
	void onEngineIndexChanged(int idx);
	void rebuildEngineList();
	void progressUpdate();
	void showConfig();
};

Q_DECLARE_METATYPE(MainWindow::State)

#endif
