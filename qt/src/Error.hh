/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Error.hh
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

#ifndef ERROR_HH
#define ERROR_HH

#include <QMetaType>
#include <QString>

struct Error {
	enum class Code {
		None,
		DocumentLoad,
		Render,
		InvalidSelection,
		EngineUnavailable,
		EnginePlatformUnsupported,
		Write
	};

	Code code = Code::None;
	QString message;

	Error() = default;
	Error(Code _code, const QString& _message) : code(_code), message(_message) {}

	void set(Code _code, const QString& _message) {
		code = _code;
		message = _message;
	}
	void clear() {
		code = Code::None;
		message.clear();
	}
	bool isSet() const {
		return code != Code::None;
	}

	// Short user-visible title for the notification bar
	static QString title(Code code);
};

Q_DECLARE_METATYPE(Error)

#endif // ERROR_HH
