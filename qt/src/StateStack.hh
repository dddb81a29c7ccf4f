/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * StateStack.hh
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

#ifndef STATESTACK_HH
#define STATESTACK_HH

#include <QPair>
#include <QString>
#include <QVector>

/**
 * Window states with their status bar messages. The bottom entry is the
 * Idle state and is never popped. At most one Normal entry describes the
 * open document, Busy entries for running jobs stack on top of it.
 */
class StateStack {
public:
	enum class State { Idle, Normal, Busy };
	typedef QPair<State, QString> Entry;

	StateStack(const QString& idleMessage);

	void push(State state, const QString& message);
	void pop();
	const Entry& top() const {
		return m_entries.last();
	}
	int size() const {
		return m_entries.size();
	}
	const Entry& at(int i) const {
		return m_entries[i];
	}

	// Returns true if the document entry is on top afterwards
	bool setDocumentMessage(const QString& message);
	// Returns true if the top entry changed
	bool clearDocument();

private:
	QVector<Entry> m_entries;

	int documentIndex() const;
};

#endif // STATESTACK_HH
