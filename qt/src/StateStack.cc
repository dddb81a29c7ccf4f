/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * StateStack.cc
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

#include "StateStack.hh"

StateStack::StateStack(const QString& idleMessage) {
	m_entries.append(Entry(State::Idle, idleMessage));
}

void StateStack::push(State state, const QString& message) {
	m_entries.append(Entry(state, message));
}

void StateStack::pop() {
	if(m_entries.size() > 1) {
		m_entries.removeLast();
	}
}

// Topmost entry below the busy ones
int StateStack::documentIndex() const {
	int idx = m_entries.size() - 1;
	while(idx > 0 && m_entries[idx].first == State::Busy) {
		--idx;
	}
	return idx;
}

bool StateStack::setDocumentMessage(const QString& message) {
	int idx = documentIndex();
	if(m_entries[idx].first == State::Normal) {
		m_entries[idx].second = message;
	} else {
		++idx;
		m_entries.insert(idx, Entry(State::Normal, message));
	}
	return idx == m_entries.size() - 1;
}

bool StateStack::clearDocument() {
	int idx = documentIndex();
	if(m_entries[idx].first != State::Normal) {
		return false;
	}
	bool isTop = idx == m_entries.size() - 1;
	m_entries.remove(idx);
	return isTop;
}
