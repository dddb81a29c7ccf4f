/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Error.cc
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

#include "common.hh"
#include "Error.hh"

QString Error::title(Code code) {
	switch(code) {
	case Code::DocumentLoad:
		return _("Failed to open PDF");
	case Code::Render:
		return _("Failed to render page");
	case Code::InvalidSelection:
		return _("Invalid selection");
	case Code::EngineUnavailable:
		return _("OCR engine unavailable");
	case Code::EnginePlatformUnsupported:
		return _("OCR engine not supported on this system");
	case Code::Write:
		return _("Failed to save output");
	case Code::None:
		break;
	}
	return QString();
}
