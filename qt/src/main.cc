/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * main.cc
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
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QLibraryInfo>
#include <QLocale>
#include <QTranslator>
#include <cstdio>
#include <libintl.h>

#include "MainWindow.hh"

int main(int argc, char* argv[]) {
	QCoreApplication::setAttribute(Qt::AA_EnableHighDpiScaling);
	QApplication app(argc, argv);

	QDir dataDir = QDir(QString("%1/../share/").arg(QApplication::applicationDirPath()));

	QApplication::setOrganizationName(PACKAGE_NAME);
	QApplication::setApplicationName(PACKAGE_NAME);
	QApplication::setApplicationVersion(PACKAGE_VERSION);

#ifdef Q_OS_WIN
	QIcon::setThemeSearchPaths({dataDir.absoluteFilePath("icons") });
	QIcon::setThemeName("hicolor");
	QDir packageDir = QDir(QString("%1/../").arg(QApplication::applicationDirPath()));
	if (qgetenv("LANG").isEmpty()) {
		qputenv("LANG", QLocale::system().name().toLocal8Bit());
	}
#endif

	QTranslator qtTranslator;
	QString translationsPath = QLibraryInfo::location(QLibraryInfo::TranslationsPath);
#ifdef Q_OS_WIN
	translationsPath = packageDir.absolutePath() + translationsPath.mid(QLibraryInfo::location(QLibraryInfo::PrefixPath).length());
#endif
	if(!qtTranslator.load("qtbase_" + QLocale::system().name(), translationsPath)) {
		qDebug("No Qt translation for %s", qPrintable(QLocale::system().name()));
	}
	QApplication::instance()->installTranslator(&qtTranslator);

	bindtextdomain(GETTEXT_PACKAGE, dataDir.absoluteFilePath("locale").toLocal8Bit().data());
	bind_textdomain_codeset(GETTEXT_PACKAGE, "UTF-8");
	textdomain(GETTEXT_PACKAGE);

#ifdef Q_OS_WIN
	std::freopen(packageDir.absoluteFilePath("pdfocr.log").toLocal8Bit().data(), "w", stderr);
#endif

	QCommandLineParser parser;
	parser.setApplicationDescription(PACKAGE_DESCRIPTION);
	parser.addHelpOption();
	parser.addVersionOption();
	QCommandLineOption engineOption("engine", _("OCR engine to preselect: traditional, deeplearning or native."), "engine");
	parser.addOption(engineOption);
	parser.addPositionalArgument("file", _("PDF file to open, optionally."), "[file]");
	parser.process(app);

	QString file;
	for (const QString& arg : parser.positionalArguments()) {
		if (file.isEmpty() && QFile(arg).exists()) {
			qDebug("opening file: %s", arg.toUtf8().data());
			file = arg;
		} else {
			qInfo("ignoring argument: %s", arg.toUtf8().data());
		}
	}

	MainWindow* window = new MainWindow(file, parser.value(engineOption));
	window->show();

	int exitcode = app.exec();
	delete window;
	return exitcode;
}
