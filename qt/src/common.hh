/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * common.hh
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

#ifndef COMMON_HH
#define COMMON_HH

#include <QString>
#include <libintl.h>

#define _(x) QString(gettext(x))

#ifndef PACKAGE_NAME
#define PACKAGE_NAME "PdfOcr"
#endif

#ifndef GETTEXT_PACKAGE
#define GETTEXT_PACKAGE "pdfocr"
#endif

#ifndef PACKAGE_VERSION
#define PACKAGE_VERSION "1.0.0"
#endif

#ifndef PACKAGE_DESCRIPTION
#define PACKAGE_DESCRIPTION "PDF viewer with text recognition"
#endif

#ifndef PACKAGE_DATA_DIR
#define PACKAGE_DATA_DIR "/usr/share/pdfocr"
#endif

#endif // COMMON_HH
