/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OcrEngine.cc
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
#include "DnnEngine.hh"
#include "NativeEngine.hh"
#include "OcrEngine.hh"
#include "TesseractEngine.hh"

QString OcrEngine::typeName(Type type) {
	switch(type) {
	case Type::Traditional:
		return _("Tesseract");
	case Type::DeepLearning:
		return _("Deep learning");
	case Type::OsNative:
		return _("Windows OCR");
	}
	return QString();
}

QString OcrEngine::typeDescription(Type type) {
	switch(type) {
	case Type::Traditional:
		return _("Fast, accurate, 100+ languages");
	case Type::DeepLearning:
		return _("Deep learning, good for complex layouts");
	case Type::OsNative:
		return _("Built-in Windows 10/11, fast");
	}
	return QString();
}

QString OcrEngine::typeKey(Type type) {
	switch(type) {
	case Type::Traditional:
		return "traditional";
	case Type::DeepLearning:
		return "deeplearning";
	case Type::OsNative:
		return "native";
	}
	return QString();
}

bool OcrEngine::typeFromKey(const QString& key, Type& type) {
	for(Type candidate : allTypes()) {
		if(typeKey(candidate) == key.toLower()) {
			type = candidate;
			return true;
		}
	}
	return false;
}

std::shared_ptr<OcrEngine> OcrEngine::create(Type type, const EngineConfig& config) {
	switch(type) {
	case Type::Traditional:
		return std::make_shared<TesseractEngine>(config);
	case Type::DeepLearning:
		return std::make_shared<DnnEngine>(config);
	case Type::OsNative:
		return std::make_shared<NativeEngine>(config);
	}
	return nullptr;
}
