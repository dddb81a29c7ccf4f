/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * MainWindow.cc
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

#include <QCloseEvent>
#include <QDebug>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QMessageBox>
#include <QProgressBar>
#include <QStatusBar>
#include <exception>

#include "MainWindow.hh"
#include "ConfigSettings.hh"
#include "Displayer.hh"
#include "DnnEngine.hh"
#include "DocumentSession.hh"
#include "FileDialogs.hh"
#include "OutputEditorText.hh"
#include "Recognizer.hh"


#if !(defined(__ARMEL__) || defined(__LCC__) && __LCC__ <= 121)
static void terminateHandler() {
	std::set_terminate(nullptr);
	std::exception_ptr exptr = std::current_exception();
	if (exptr != 0) {
		try {
			std::rethrow_exception(exptr);
		} catch (std::exception& ex) {
			qCritical("Terminated due to exception: %s", ex.what());
		} catch (...) {
			qCritical("Terminated due to unknown exception");
		}
	} else {
		qCritical("Terminated due to unknown reason");
	}
	std::abort();
}
#endif

MainWindow* MainWindow::s_instance = nullptr;

MainWindow::MainWindow(const QString& file, const QString& engineKey)
	: m_idleActions(0), m_busyActions(0), m_stateStack(_("Open a PDF to begin...")) {
	s_instance = this;

#if !(defined(__ARMEL__) || defined(__LCC__) && __LCC__ <= 121)
	std::set_terminate(terminateHandler);
#endif

	qRegisterMetaType<MainWindow::State>();

	ui.setupUi(this);

	m_config = new Config(this);
	m_session = new DocumentSession(this);
	m_session->setRenderScale(m_config->getRenderScale());
	m_displayer = new Displayer(ui, m_session);
	m_recognizer = new Recognizer(m_session, this);
	m_recognizer->setEngineConfig(m_config->getEngineConfig());
	m_outputEditor = new OutputEditorText(m_session);

	ui.centralwidget->layout()->addWidget(m_displayer);
	ui.dockWidgetOutput->setWidget(m_outputEditor->getUI());
	ui.toolBarMain->setLayoutDirection(Qt::LeftToRight);

	m_idleActions.setExclusive(false);
	m_idleActions.addAction(ui.actionPrevPage);
	m_idleActions.addAction(ui.actionNextPage);
	m_idleActions.addAction(ui.actionZoomIn);
	m_idleActions.addAction(ui.actionZoomOut);
	m_idleActions.addAction(ui.actionClearSelection);
	m_busyActions.setExclusive(false);
	m_busyActions.addAction(ui.actionOcrPage);
	m_busyActions.addAction(ui.actionOcrSelection);
	m_busyActions.addAction(ui.actionOcrDocument);
	m_busyActions.addAction(ui.actionPreferences);
	m_busyWidgets.append(ui.comboBoxEngine);

	connect(ui.actionOpen, &QAction::triggered, this, &MainWindow::openDocument);
	connect(ui.actionClearSelection, &QAction::triggered, this, &MainWindow::clearSelection);
	connect(ui.actionOcrPage, &QAction::triggered, this, &MainWindow::recognizeCurrentPage);
	connect(ui.actionOcrSelection, &QAction::triggered, this, &MainWindow::recognizeSelection);
	connect(ui.actionOcrDocument, &QAction::triggered, this, &MainWindow::recognizeDocument);
	connect(ui.actionSaveText, &QAction::triggered, m_outputEditor, [this] { m_outputEditor->save(); });
	connect(ui.actionToggleOutputPane, &QAction::toggled, ui.dockWidgetOutput, &QDockWidget::setVisible);
	connect(ui.actionPreferences, &QAction::triggered, this, &MainWindow::showConfig);
	connect(ui.actionQuit, &QAction::triggered, this, &MainWindow::close);
	connect(ui.comboBoxEngine, qOverload<int>(&QComboBox::currentIndexChanged), this, &MainWindow::onEngineIndexChanged);

	connect(m_session, &DocumentSession::documentChanged, this, &MainWindow::onDocumentChanged);
	connect(m_session, &DocumentSession::pageChanged, this, &MainWindow::onPageChanged);
	connect(m_session, &DocumentSession::zoomChanged, this, &MainWindow::onZoomChanged);
	connect(m_session, &DocumentSession::selectionChanged, this, &MainWindow::onSelectionChanged);
	connect(m_displayer, &Displayer::renderFailed, this, &MainWindow::showError);
	connect(m_displayer, &Displayer::selectionFailed, this, &MainWindow::showError);
	connect(m_recognizer, &Recognizer::recognitionStarted, this, &MainWindow::onRecognitionStarted);
	connect(m_recognizer, &Recognizer::pageStarted, this, &MainWindow::onPageStarted);
	connect(m_recognizer, &Recognizer::resultsAvailable, this, &MainWindow::onResultsAvailable);
	connect(m_recognizer, &Recognizer::recognitionFailed, this, &MainWindow::showError);
	connect(m_recognizer, &Recognizer::recognitionFinished, this, &MainWindow::onRecognitionFinished);
	connect(m_outputEditor, &OutputEditorText::saved, this, [this](const QString & filename) { ui.statusbar->showMessage(_("Saved to: %1").arg(filename)); });
	connect(m_config, &Config::engineConfigChanged, this, &MainWindow::onEngineConfigChanged);
	connect(m_config, &Config::renderScaleChanged, m_session, &DocumentSession::setRenderScale);

	ADD_SETTING(VarSetting<QByteArray>("wingeom"));
	ADD_SETTING(VarSetting<QByteArray>("winstate"));
	ADD_SETTING(VarSetting<int>("ocrengine", static_cast<int>(OcrEngine::Type::Traditional)));
	ADD_SETTING(ActionSetting("showoutput", ui.actionToggleOutputPane, true));

	m_progressWidget = new QWidget(this);
	m_progressWidget->setLayout(new QHBoxLayout());
	m_progressWidget->layout()->setContentsMargins(0, 0, 0, 0);
	m_progressWidget->layout()->setSpacing(2);
	m_progressLabel = new QLabel();
	m_progressWidget->layout()->addWidget(m_progressLabel);
	m_progressBar = new QProgressBar();
	m_progressBar->setRange(0, 100);
	m_progressBar->setMaximumWidth(100);
	m_progressTimer.setSingleShot(false);
	connect(&m_progressTimer, &QTimer::timeout, this, &MainWindow::progressUpdate);
	m_progressWidget->layout()->addWidget(m_progressBar);
	statusBar()->addPermanentWidget(m_progressWidget);
	m_progressWidget->setVisible(false);

	ui.statusbar->showMessage(m_stateStack.top().second);
	setState(State::Idle);
	onPageChanged(0);
	onZoomChanged(m_session->getZoom());

	restoreGeometry(ConfigSettings::get<VarSetting<QByteArray>>("wingeom")->getValue());
	restoreState(ConfigSettings::get<VarSetting<QByteArray>>("winstate")->getValue());
	ui.dockWidgetOutput->setVisible(ui.actionToggleOutputPane->isChecked());

	OcrEngine::Type engineType = static_cast<OcrEngine::Type>(ConfigSettings::get<VarSetting<int>>("ocrengine")->getValue());
	if(!engineKey.isEmpty() && !OcrEngine::typeFromKey(engineKey, engineType)) {
		qWarning() << "Unknown OCR engine" << engineKey << "requested on the command line";
	}
	m_recognizer->setEngineType(engineType);
	rebuildEngineList();

	if(!file.isEmpty()) {
		openFile(file);
	}
}

MainWindow::~MainWindow() {
	// Finish outstanding recognition before the session goes away
	m_recognizer->waitForDone();
	DnnEngine::releaseModel();
	delete m_outputEditor;
	delete m_displayer;
	delete m_recognizer;
	delete m_session;
	delete m_config;
	s_instance = nullptr;
}

void MainWindow::pushState(MainWindow::State state, const QString& msg) {
	m_stateStack.push(state, msg);
	ui.statusbar->showMessage(msg);
	setState(state);
	if(state == State::Busy) {
		QApplication::setOverrideCursor(Qt::BusyCursor);
	}
}

void MainWindow::popState() {
	if(m_stateStack.top().first == State::Busy) {
		QApplication::restoreOverrideCursor();
	}
	m_stateStack.pop();
	const StateStack::Entry& pair = m_stateStack.top();
	ui.statusbar->showMessage(pair.second);
	setState(pair.first);
}

void MainWindow::setState(State state) {
	bool isIdle = state == State::Idle;
	bool isBusy = state == State::Busy;
	m_idleActions.setEnabled(!isIdle);
	m_busyActions.setEnabled(!isBusy);
	for(QWidget* widget : m_busyWidgets) {
		widget->setEnabled(!isBusy);
	}
}

void MainWindow::closeEvent(QCloseEvent* ev) {
	if(m_recognizer->isBusy()) {
		qInfo() << "Waiting for outstanding recognition before closing";
	}
	if(!isMaximized()) {
		ConfigSettings::get<VarSetting<QByteArray>>("wingeom")->setValue(saveGeometry());
	}
	ConfigSettings::get<VarSetting<QByteArray>>("winstate")->setValue(saveState());
	ev->accept();
}

void MainWindow::openDocument() {
	QString filename = FileDialogs::openDialog(_("Open PDF"), "sourcedir", QString("%1 (*.pdf)").arg(_("PDF Files")));
	if(!filename.isEmpty()) {
		openFile(filename);
	}
}

bool MainWindow::openFile(const QString& filename) {
	Error error;
	auto askPassword = [this, &filename](QString & password) {
		bool ok = false;
		password = QInputDialog::getText(this, _("Protected PDF"), _("Enter password for %1:").arg(QFileInfo(filename).fileName()), QLineEdit::Password, QString(), &ok);
		return ok;
	};
	if(!m_session->openDocument(filename, error, askPassword)) {
		showError(error);
		return false;
	}
	return true;
}

void MainWindow::onDocumentChanged() {
	hideNotification(m_errorHandle);
	m_errorHandle = nullptr;
	bool topChanged = false;
	if(m_session->isLoaded()) {
		QString filename = m_session->getFilename();
		setWindowTitle(QString("%1 - %2").arg(QFileInfo(filename).fileName()).arg(PACKAGE_NAME));
		// Running jobs keep their status, the document entry below them is updated
		topChanged = m_stateStack.setDocumentMessage(_("Loaded: %1").arg(filename));
	} else {
		setWindowTitle(PACKAGE_NAME);
		topChanged = m_stateStack.clearDocument();
	}
	if(topChanged) {
		ui.statusbar->showMessage(m_stateStack.top().second);
		setState(m_stateStack.top().first);
	}
}

void MainWindow::onPageChanged(int page) {
	int nPages = m_session->getNPages();
	ui.labelPage->setText(_("Page: %1 / %2").arg(nPages > 0 ? page + 1 : 0).arg(nPages));
	ui.actionPrevPage->setEnabled(m_session->isLoaded() && page > 0);
	ui.actionNextPage->setEnabled(m_session->isLoaded() && page < nPages - 1);
}

void MainWindow::onZoomChanged(double zoom) {
	ui.labelZoom->setText(QString("%1%").arg(qRound(zoom * 100)));
	ui.actionZoomIn->setEnabled(m_session->isLoaded() && zoom < DocumentSession::MaxZoom);
	ui.actionZoomOut->setEnabled(m_session->isLoaded() && zoom > DocumentSession::MinZoom);
}

void MainWindow::onSelectionChanged() {
	if(m_session->getState() == DocumentSession::State::Selecting) {
		return;
	}
	if(m_session->hasSelection()) {
		QRectF rect = m_session->getSelection();
		ui.statusbar->showMessage(_("Selection: (%1, %2) to (%3, %4)").arg(rect.left(), 0, 'f', 1).arg(rect.top(), 0, 'f', 1).arg(rect.right(), 0, 'f', 1).arg(rect.bottom(), 0, 'f', 1));
	}
}

void MainWindow::clearSelection() {
	if(m_session->hasSelection()) {
		m_session->clearSelection();
		ui.statusbar->showMessage(_("Selection cleared."));
	}
}

void MainWindow::recognizeCurrentPage() {
	if(!m_session->isLoaded()) {
		QMessageBox::warning(this, _("Warning"), _("Please open a PDF first."));
		return;
	}
	Error error;
	if(!m_recognizer->recognizeCurrentPage(error)) {
		showError(error);
	}
}

void MainWindow::recognizeSelection() {
	if(!m_session->isLoaded()) {
		QMessageBox::warning(this, _("Warning"), _("Please open a PDF first."));
		return;
	}
	if(!m_session->hasSelection()) {
		QMessageBox::warning(this, _("Warning"), _("Please make a selection first. Click and drag on the PDF to select an area."));
		return;
	}
	Error error;
	if(!m_recognizer->recognizeSelection(error)) {
		showError(error);
	}
}

void MainWindow::recognizeDocument() {
	if(!m_session->isLoaded()) {
		QMessageBox::warning(this, _("Warning"), _("Please open a PDF first."));
		return;
	}
	Error error;
	std::shared_ptr<Recognizer::ProgressMonitor> monitor;
	if(!m_recognizer->recognizeDocument(error, &monitor)) {
		showError(error);
		return;
	}
	showProgress(monitor);
}

void MainWindow::onRecognitionStarted(Recognizer::Scope /*scope*/, const QString& message) {
	pushState(State::Busy, message);
}

void MainWindow::onPageStarted(int page, int nPages) {
	QString message = _("Processing page %1 of %2 using %3...").arg(page + 1).arg(nPages).arg(OcrEngine::typeName(m_recognizer->getEngineType()));
	m_progressLabel->setText(QString("%1 / %2").arg(page + 1).arg(nPages));
	ui.statusbar->showMessage(message);
}

void MainWindow::onResultsAvailable(const QList<OcrResult>& results) {
	m_outputEditor->refresh();
	m_completedSource = results.isEmpty() ? QString() : results.last().describe();
	ui.actionToggleOutputPane->setChecked(true);
	int failed = OutputLog::failedCount(results);
	if(failed > 0) {
		addNotification(_("Recognition errors occurred"), _("%1 of %2 pages could not be recognized.").arg(failed).arg(results.size()));
	}
}

void MainWindow::onRecognitionFinished(Recognizer::Scope scope) {
	if(scope == Recognizer::Scope::Document) {
		hideProgress();
	}
	popState();
	if(!m_completedSource.isEmpty()) {
		ui.statusbar->showMessage(_("OCR complete: %1").arg(m_completedSource));
		m_completedSource.clear();
	}
}

void MainWindow::setEngine(OcrEngine::Type type) {
	m_recognizer->setEngineType(type);
	ui.labelEngineInfo->setText(OcrEngine::typeDescription(type));
	ConfigSettings::get<VarSetting<int>>("ocrengine")->setValue(static_cast<int>(type));
}

void MainWindow::onEngineIndexChanged(int idx) {
	if(idx >= 0) {
		setEngine(static_cast<OcrEngine::Type>(ui.comboBoxEngine->itemData(idx).toInt()));
	}
}

void MainWindow::rebuildEngineList() {
	OcrEngine::Type current = m_recognizer->getEngineType();
	ui.comboBoxEngine->blockSignals(true);
	ui.comboBoxEngine->clear();
	int currentIdx = 0;
	for(OcrEngine::Type type : m_recognizer->getAvailableEngines()) {
		if(type == current) {
			currentIdx = ui.comboBoxEngine->count();
		}
		ui.comboBoxEngine->addItem(OcrEngine::typeName(type), static_cast<int>(type));
		ui.comboBoxEngine->setItemData(ui.comboBoxEngine->count() - 1, OcrEngine::typeDescription(type), Qt::ToolTipRole);
	}
	ui.comboBoxEngine->setCurrentIndex(currentIdx);
	ui.comboBoxEngine->blockSignals(false);
	OcrEngine::Type selected = static_cast<OcrEngine::Type>(ui.comboBoxEngine->currentData().toInt());
	if(selected != current) {
		qInfo() << OcrEngine::typeName(current) << "is not available, using" << OcrEngine::typeName(selected);
	}
	setEngine(selected);
}

void MainWindow::onEngineConfigChanged() {
	m_recognizer->setEngineConfig(m_config->getEngineConfig());
	rebuildEngineList();
}

void MainWindow::showConfig() {
	m_config->showDialog();
}

void MainWindow::showError(const Error& error) {
	if(!error.isSet()) {
		return;
	}
	qWarning() << Error::title(error.code) << ":" << error.message;
	hideNotification(m_errorHandle);
	m_errorHandle = nullptr;
	addNotification(Error::title(error.code), error.message, &m_errorHandle);
}

void MainWindow::addNotification(const QString& title, const QString& message, MainWindow::Notification* handle) {
	QFrame* frame = new QFrame();
	frame->setFrameStyle(QFrame::StyledPanel | QFrame::Raised);
	frame->setStyleSheet("background: #FFD000;");
	QHBoxLayout* layout = new QHBoxLayout(frame);
	layout->addWidget(new QLabel(QString("<b>%1</b>").arg(title), frame));
	QLabel* msgLabel = new QLabel(message, frame);
	msgLabel->setWordWrap(true);
	layout->addWidget(msgLabel, 1);
	QToolButton* closeBtn = new QToolButton(frame);
	closeBtn->setIcon(QIcon::fromTheme("dialog-close"));
	connect(closeBtn, &QToolButton::clicked, this, [this, frame, handle] {
		if(handle && *handle == frame) {
			*handle = nullptr;
		}
		hideNotification(frame);
	});
	layout->addWidget(closeBtn);
	static_cast<QVBoxLayout*>(ui.centralwidget->layout())->insertWidget(0, frame);
	if(handle) {
		*handle = frame;
	}
}

void MainWindow::hideNotification(Notification handle) {
	if(handle) {
		static_cast<QFrame*>(handle)->deleteLater();
	}
}

void MainWindow::showProgress(const std::shared_ptr<Recognizer::ProgressMonitor>& monitor, int updateInterval) {
	m_progressMonitor = monitor;
	m_progressTimer.start(updateInterval);
	m_progressBar->setValue(0);
	m_progressLabel->setText(QString("0 / %1").arg(monitor->getTotal()));
	m_progressWidget->show();
}

void MainWindow::hideProgress() {
	m_progressWidget->hide();
	m_progressTimer.stop();
	m_progressMonitor.reset();
}

void MainWindow::progressUpdate() {
	if(m_progressMonitor) {
		m_progressBar->setValue(m_progressMonitor->getProgress());
	}
}
