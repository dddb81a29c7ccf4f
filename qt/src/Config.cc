/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Config.cc
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

#include "Config.hh"
#include "ConfigSettings.hh"
#include "Utils.hh"

#include <QApplication>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>


Config::Config(QWidget* parent)
	: QDialog(parent) {
	ui.setupUi(this);

	QDir modelsDir(modelsLocation());

	connect(ui.toolButtonTessdata, &QToolButton::clicked, this, &Config::browseTessdataDir);
	connect(ui.toolButtonDetector, &QToolButton::clicked, this, [this] { browseFile(ui.lineEditDetector, _("Select detection model"), QString("%1 (*.onnx *.pb)").arg(_("Models"))); });
	connect(ui.toolButtonRecognizer, &QToolButton::clicked, this, [this] { browseFile(ui.lineEditRecognizer, _("Select recognition model"), QString("%1 (*.onnx *.pb)").arg(_("Models"))); });
	connect(ui.toolButtonVocabulary, &QToolButton::clicked, this, [this] { browseFile(ui.lineEditVocabulary, _("Select vocabulary"), QString("%1 (*.txt)").arg(_("Text Files"))); });
	for(QLineEdit* lineEdit : QList<QLineEdit*> {ui.lineEditLanguage, ui.lineEditTessdata, ui.lineEditDetector, ui.lineEditRecognizer, ui.lineEditVocabulary}) {
		connect(lineEdit, &QLineEdit::textChanged, this, &Config::markEngineConfigChanged);
	}
	for(QLineEdit* lineEdit : QList<QLineEdit*> {ui.lineEditTessdata, ui.lineEditDetector, ui.lineEditRecognizer, ui.lineEditVocabulary}) {
		connect(lineEdit, &QLineEdit::textChanged, this, &Config::validatePath);
	}

	ADD_SETTING(LineEditSetting("ocrlanguage", ui.lineEditLanguage, "eng"));
	ADD_SETTING(LineEditSetting("tessdatadir", ui.lineEditTessdata, ""));
	ADD_SETTING(LineEditSetting("dnndetmodel", ui.lineEditDetector, modelsDir.absoluteFilePath("text_detection_db.onnx")));
	ADD_SETTING(LineEditSetting("dnnrecmodel", ui.lineEditRecognizer, modelsDir.absoluteFilePath("text_recognition_crnn.onnx")));
	ADD_SETTING(LineEditSetting("dnnvocabulary", ui.lineEditVocabulary, modelsDir.absoluteFilePath("alphabet_94.txt")));
	ADD_SETTING(DoubleSpinSetting("renderscale", ui.doubleSpinBoxRenderScale, 1.5));
	ADD_SETTING(ComboSetting("textencoding", ui.comboBoxEncoding, 0));
	ADD_SETTING(VarSetting<QString> ("sourcedir", Utils::documentsFolder()));
	ADD_SETTING(VarSetting<QString> ("outputdir", Utils::documentsFolder()));

	connect(ConfigSettings::get<DoubleSpinSetting>("renderscale"), &DoubleSpinSetting::changed, this, [this] { emit renderScaleChanged(getRenderScale()); });

	m_engineConfigChanged = false;
}

void Config::showDialog() {
	m_engineConfigChanged = false;
	exec();
	if(m_engineConfigChanged) {
		qDebug() << "OCR engine configuration changed";
		emit engineConfigChanged();
	}
	m_engineConfigChanged = false;
}

EngineConfig Config::getEngineConfig() const {
	EngineConfig config;
	QString language = ConfigSettings::get<LineEditSetting>("ocrlanguage")->getValue().trimmed();
	if(!language.isEmpty()) {
		config.language = language;
	}
	config.tessdataDir = ConfigSettings::get<LineEditSetting>("tessdatadir")->getValue().trimmed();
	config.detectorModel = ConfigSettings::get<LineEditSetting>("dnndetmodel")->getValue().trimmed();
	config.recognizerModel = ConfigSettings::get<LineEditSetting>("dnnrecmodel")->getValue().trimmed();
	config.vocabulary = ConfigSettings::get<LineEditSetting>("dnnvocabulary")->getValue().trimmed();
	return config;
}

double Config::getRenderScale() const {
	return ConfigSettings::get<DoubleSpinSetting>("renderscale")->getValue();
}

bool Config::useUtf8() const {
	// 0: UTF-8, 1: system locale
	return ConfigSettings::get<ComboSetting>("textencoding")->getValue() == 0;
}

QString Config::modelsLocation() {
	// Relative to the executable first, then the install prefix
	QDir dataDir = QDir(QString("%1/../share/%2").arg(QApplication::applicationDirPath()).arg(GETTEXT_PACKAGE));
	if(!dataDir.exists()) {
		dataDir = QDir(PACKAGE_DATA_DIR);
	}
	return dataDir.absoluteFilePath("models");
}

void Config::browseFile(QLineEdit* lineEdit, const QString& title, const QString& filter) {
	QString dir = QFileInfo(lineEdit->text()).absolutePath();
	QString filename = QFileDialog::getOpenFileName(this, title, dir, filter);
	if(!filename.isEmpty()) {
		lineEdit->setText(filename);
	}
}

void Config::browseTessdataDir() {
	QString current = ui.lineEditTessdata->text();
	if(current.isEmpty()) {
		current = Utils::tessdataLocation();
	}
	QString dir = QFileDialog::getExistingDirectory(this, _("Select tessdata directory"), current);
	if(!dir.isEmpty()) {
		ui.lineEditTessdata->setText(dir);
	}
}

void Config::markEngineConfigChanged() {
	m_engineConfigChanged = true;
}

void Config::validatePath() {
	QLineEdit* lineEdit = static_cast<QLineEdit*> (QObject::sender());
	QString path = lineEdit->text();
	bool valid = path.isEmpty() || QFileInfo(path).exists();
	lineEdit->setStyleSheet(valid ? "" : "background: #FF7777; color: #FFFFFF;");
}
