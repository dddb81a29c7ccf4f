/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Config.hh
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

#ifndef CONFIG_HH
#define CONFIG_HH

#include "common.hh"
#include "OcrEngine.hh"
#include "ui_ConfigDialog.h"

class QLineEdit;

class Config : public QDialog {
	Q_OBJECT
public:
	Config(QWidget* parent = nullptr);

	void showDialog();

	EngineConfig getEngineConfig() const;
	double getRenderScale() const;
	bool useUtf8() const;

	static QString modelsLocation();

signals:
	void engineConfigChanged();
	void renderScaleChanged(double scale);

private:
	Ui::ConfigDialog ui;
	bool m_engineConfigChanged = false;

	void browseFile(QLineEdit* lineEdit, const QString& title, const QString& filter);

private slots:
	void browseTessdataDir();
	void markEngineConfigChanged();
	void validatePath();
};

#endif // CONFIG_HH
