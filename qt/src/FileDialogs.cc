/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * FileDialogs.cc
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

#include <QDir>
#include <QFileDialog>
#include <QFileInfo>

#include "ConfigSettings.hh"
#include "FileDialogs.hh"
#include "MainWindow.hh"
#include "Utils.hh"

namespace FileDialogs {

static QString initialDirectory(const QString& dirSetting) {
	VarSetting<QString>* setting = ConfigSettings::get<VarSetting<QString>>(dirSetting);
	QString dir = setting ? setting->getValue() : QString();
	return dir.isEmpty() || !QDir(dir).exists() ? Utils::documentsFolder() : dir;
}

static void rememberDirectory(const QString& dirSetting, const QString& filename) {
	VarSetting<QString>* setting = ConfigSettings::get<VarSetting<QString>>(dirSetting);
	if(setting) {
		setting->setValue(QFileInfo(filename).absolutePath());
	}
}

QString openDialog(const QString& title, const QString& dirSetting, const QString& filter, QWidget* parent) {
	parent = parent == nullptr ? MAIN : parent;
	QString filename = QFileDialog::getOpenFileName(parent, title, initialDirectory(dirSetting), filter);
	if(!filename.isEmpty()) {
		rememberDirectory(dirSetting, filename);
	}
	return filename;
}

QString saveDialog(const QString& title, const QString& suggestedName, const QString& dirSetting, const QString& filter, QWidget* parent) {
	parent = parent == nullptr ? MAIN : parent;
	QString suggestedFile = Utils::makeOutputFilename(QDir(initialDirectory(dirSetting)).absoluteFilePath(suggestedName));
	QString filename = QFileDialog::getSaveFileName(parent, title, suggestedFile, filter);
	if(!filename.isEmpty()) {
		if(QFileInfo(filename).suffix().isEmpty()) {
			filename += "." + QFileInfo(suggestedFile).suffix();
		}
		rememberDirectory(dirSetting, filename);
	}
	return filename;
}

} // FileDialogs
