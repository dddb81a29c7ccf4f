/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * DnnEngine.cc
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

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>
#include <algorithm>
#include <cmath>
#include <memory>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

#include "common.hh"
#include "DnnEngine.hh"

struct DnnEngine::Model {
	cv::dnn::TextDetectionModel_DB detector;
	cv::dnn::TextRecognitionModel recognizer;

	Model(const std::string& detectorPath, const std::string& recognizerPath)
		: detector(detectorPath), recognizer(recognizerPath) {}
};

DnnEngine::Model* DnnEngine::s_model = nullptr;
QString DnnEngine::s_modelKey;
QMutex DnnEngine::s_mutex;

static const cv::Size sDetectorInputSize(736, 736);
static const cv::Size sRecognizerInputSize(100, 32);

static void fourPointsTransform(const cv::Mat& frame, const cv::Point2f vertices[4], cv::Mat& result) {
	const cv::Point2f targetVertices[4] = {
		cv::Point2f(0, sRecognizerInputSize.height - 1),
		cv::Point2f(0, 0),
		cv::Point2f(sRecognizerInputSize.width - 1, 0),
		cv::Point2f(sRecognizerInputSize.width - 1, sRecognizerInputSize.height - 1)
	};
	cv::Mat transform = cv::getPerspectiveTransform(vertices, targetVertices);
	cv::warpPerspective(frame, result, transform, sRecognizerInputSize);
}

struct TextBox {
	cv::Rect rect;
	QString text;
};

// Groups boxes into lines, top to bottom, each line left to right
static QString joinLines(std::vector<TextBox> boxes) {
	std::sort(boxes.begin(), boxes.end(), [](const TextBox & a, const TextBox & b) {
		return a.rect.y + 0.5 * a.rect.height < b.rect.y + 0.5 * b.rect.height;
	});
	std::vector<std::vector<TextBox>> lines;
	for(const TextBox& box : boxes) {
		double center = box.rect.y + 0.5 * box.rect.height;
		if(!lines.empty()) {
			const TextBox& last = lines.back().back();
			double lastCenter = last.rect.y + 0.5 * last.rect.height;
			if(std::abs(center - lastCenter) < 0.5 * std::min(box.rect.height, last.rect.height)) {
				lines.back().push_back(box);
				continue;
			}
		}
		lines.push_back({box});
	}
	QStringList result;
	for(std::vector<TextBox>& line : lines) {
		std::sort(line.begin(), line.end(), [](const TextBox & a, const TextBox & b) {
			return a.rect.x < b.rect.x;
		});
		QStringList words;
		for(const TextBox& box : line) {
			if(!box.text.isEmpty()) {
				words.append(box.text);
			}
		}
		if(!words.isEmpty()) {
			result.append(words.join(" "));
		}
	}
	return result.join("\n");
}

bool DnnEngine::isAvailable() const {
	return QFileInfo(m_config.detectorModel).isFile() &&
	       QFileInfo(m_config.recognizerModel).isFile() &&
	       QFileInfo(m_config.vocabulary).isFile();
}

void DnnEngine::releaseModel() {
	QMutexLocker locker(&s_mutex);
	delete s_model;
	s_model = nullptr;
	s_modelKey.clear();
}

bool DnnEngine::isModelLoaded() {
	QMutexLocker locker(&s_mutex);
	return s_model != nullptr;
}

QString DnnEngine::modelKey() const {
	return QStringList({m_config.detectorModel, m_config.recognizerModel, m_config.vocabulary}).join('\n');
}

// Must be called with s_mutex held
bool DnnEngine::ensureModel(Error& error) {
	QString key = modelKey();
	if(s_model && s_modelKey == key) {
		return true;
	}
	delete s_model;
	s_model = nullptr;
	s_modelKey.clear();

	if(!isAvailable()) {
		error.set(Error::Code::EngineUnavailable, _("The text detection and recognition models could not be found. Check the model paths in the preferences."));
		return false;
	}
	QFile vocabularyFile(m_config.vocabulary);
	if(!vocabularyFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
		error.set(Error::Code::EngineUnavailable, _("Failed to read the vocabulary %1").arg(m_config.vocabulary));
		return false;
	}
	std::vector<std::string> vocabulary;
	QTextStream stream(&vocabularyFile);
	stream.setCodec("UTF-8");
	while(!stream.atEnd()) {
		QString line = stream.readLine();
		if(!line.isEmpty()) {
			vocabulary.push_back(line.toStdString());
		}
	}
	if(vocabulary.empty()) {
		error.set(Error::Code::EngineUnavailable, _("The vocabulary %1 is empty").arg(m_config.vocabulary));
		return false;
	}

	QElapsedTimer timer;
	timer.start();
	try {
		std::unique_ptr<Model> model(new Model(QFile::encodeName(m_config.detectorModel).toStdString(), QFile::encodeName(m_config.recognizerModel).toStdString()));
		model->detector.setBinaryThreshold(0.3)
		.setPolygonThreshold(0.5)
		.setMaxCandidates(200)
		.setUnclipRatio(2.0);
		model->detector.setInputParams(1.0 / 255.0, sDetectorInputSize, cv::Scalar(122.67891434, 116.66876762, 104.00698793));
		model->recognizer.setDecodeType("CTC-greedy");
		model->recognizer.setVocabulary(vocabulary);
		model->recognizer.setInputParams(1.0 / 127.5, sRecognizerInputSize, cv::Scalar(127.5, 127.5, 127.5));
		s_model = model.release();
	} catch(const cv::Exception& e) {
		qWarning("Failed to load text models: %s", e.what());
		error.set(Error::Code::EngineUnavailable, _("Failed to load the text models: %1").arg(QString::fromLocal8Bit(e.what())));
		return false;
	}
	s_modelKey = key;
	qInfo("Loaded text detection and recognition models in %lld ms", timer.elapsed());
	return true;
}

bool DnnEngine::recognize(const QImage& image, const QString& language, QString& text, Error& error) {
	if(!language.isEmpty() && language != m_config.language) {
		qDebug("Deep learning engine ignores language hint '%s'", qPrintable(language));
	}
	QMutexLocker locker(&s_mutex);
	if(!ensureModel(error)) {
		return false;
	}

	QImage rgb = image.convertToFormat(QImage::Format_RGB32);
	cv::Mat bgra(rgb.height(), rgb.width(), CV_8UC4, const_cast<uchar*>(rgb.constBits()), rgb.bytesPerLine());
	cv::Mat frame;
	cv::cvtColor(bgra, frame, cv::COLOR_BGRA2BGR);

	QElapsedTimer timer;
	timer.start();
	std::vector<TextBox> boxes;
	try {
		std::vector<std::vector<cv::Point>> detections;
		s_model->detector.detect(frame, detections);
		for(const std::vector<cv::Point>& quad : detections) {
			if(quad.size() != 4) {
				continue;
			}
			cv::Point2f vertices[4];
			for(int i = 0; i < 4; ++i) {
				vertices[i] = quad[i];
			}
			cv::Mat cropped;
			fourPointsTransform(frame, vertices, cropped);
			std::string word = s_model->recognizer.recognize(cropped);
			boxes.push_back({cv::boundingRect(quad), QString::fromStdString(word).trimmed()});
		}
	} catch(const cv::Exception& e) {
		qWarning("Text recognition failed: %s", e.what());
		error.set(Error::Code::EngineUnavailable, _("Text recognition failed: %1").arg(QString::fromLocal8Bit(e.what())));
		return false;
	}
	text = joinLines(boxes);
	qDebug("dnn: recognized %d text boxes in %lld ms", int(boxes.size()), timer.elapsed());
	return true;
}
