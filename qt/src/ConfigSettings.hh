/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * ConfigSettings.hh
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

#ifndef CONFIGSETTINGS_HH
#define CONFIGSETTINGS_HH

#include <QAction>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QLineEdit>
#include <QMap>
#include <QSettings>
#include <QString>

class AbstractSetting;

#define ADD_SETTING(...) ((new __VA_ARGS__)->setParent(this))

class ConfigSettings {
public:
	template<class T>
	static T* get(const QString& key) {
		auto it = s_settings.find(key);
		return it == s_settings.end() ? nullptr : static_cast<T*>(it.value());
	}

private:
	friend class AbstractSetting;
	static QMap<QString, AbstractSetting*> s_settings;

	static void add(AbstractSetting* setting);
	static void remove(const QString& key);
};


class AbstractSetting : public QObject {
	Q_OBJECT
public:
	AbstractSetting(const QString& key)
		: m_key(key) {
		ConfigSettings::add(this);
	}
	virtual ~AbstractSetting() {
		ConfigSettings::remove(m_key);
	}
	const QString& key() const {
		return m_key;
	}

public slots:
	virtual void serialize() {}

signals:
	void changed();

protected:
	QString m_key;
};

template <class T>
class VarSetting : public AbstractSetting {
public:
	VarSetting(const QString& key, const T& defaultValue = T())
		: AbstractSetting(key), m_defaultValue(QVariant::fromValue(defaultValue)) {}

	T getValue() const {
		return QSettings().value(m_key, m_defaultValue).template value<T>();
	}
	void setValue(const T& value) {
		QSettings().setValue(m_key, QVariant::fromValue(value));
		emit changed();
	}

private:
	QVariant m_defaultValue;
};

class ActionSetting : public AbstractSetting {
	Q_OBJECT
public:
	ActionSetting(const QString& key, QAction* action, bool defaultState = false)
		: AbstractSetting(key), m_action(action) {
		action->setChecked(QSettings().value(m_key, QVariant::fromValue(defaultState)).toBool());
		connect(action, &QAction::toggled, this, &ActionSetting::serialize);
	}

public slots:
	void serialize() override {
		QSettings().setValue(m_key, QVariant::fromValue(m_action->isChecked()));
		emit changed();
	}

private:
	QAction* m_action;
};

class ComboSetting : public AbstractSetting {
	Q_OBJECT
public:
	ComboSetting(const QString& key, QComboBox* combo, int defaultIndex = 0)
		: AbstractSetting(key), m_combo(combo) {
		combo->setCurrentIndex(QSettings().value(m_key, QVariant::fromValue(defaultIndex)).toInt());
		connect(combo, qOverload<int>(&QComboBox::currentIndexChanged), this, &ComboSetting::serialize);
	}
	int getValue() const {
		return m_combo->currentIndex();
	}

public slots:
	void serialize() override {
		QSettings().setValue(m_key, QVariant::fromValue(m_combo->currentIndex()));
		emit changed();
	}

private:
	QComboBox* m_combo;
};

class DoubleSpinSetting : public AbstractSetting {
	Q_OBJECT
public:
	DoubleSpinSetting(const QString& key, QDoubleSpinBox* spin, double defaultValue = 0.)
		: AbstractSetting(key), m_spin(spin) {
		spin->setValue(QSettings().value(m_key, QVariant::fromValue(defaultValue)).toDouble());
		connect(spin, qOverload<double>(&QDoubleSpinBox::valueChanged), this, &DoubleSpinSetting::serialize);
	}
	double getValue() const {
		return m_spin->value();
	}

public slots:
	void serialize() override {
		QSettings().setValue(m_key, QVariant::fromValue(m_spin->value()));
		emit changed();
	}

private:
	QDoubleSpinBox* m_spin;
};

class LineEditSetting : public AbstractSetting {
	Q_OBJECT
public:
	LineEditSetting(const QString& key, QLineEdit* lineEdit, const QString& defaultValue = "")
		: AbstractSetting(key), m_lineEdit(lineEdit) {
		lineEdit->setText(QSettings().value(m_key, QVariant::fromValue(defaultValue)).toString());
		connect(lineEdit, &QLineEdit::textChanged, this, &LineEditSetting::serialize);
	}
	QString getValue() const {
		return m_lineEdit->text();
	}

public slots:
	void serialize() override {
		QSettings().setValue(m_key, QVariant::fromValue(m_lineEdit->text()));
		emit changed();
	}

private:
	QLineEdit* m_lineEdit;
};

#endif // CONFIGSETTINGS_HH
