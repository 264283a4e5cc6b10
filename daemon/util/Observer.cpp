/*
 *  This file is part of nexget.
 *
 *  Copyright (C) 2023-2024 The nexget Authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include "nexget.h"
#include "Observer.h"
#include "Log.h"

void Subject::Attach(Observer* observer)
{
	Guard guard(m_observersMutex);
	m_observers.push_back(observer);
}

void Subject::Detach(Observer* observer)
{
	Guard guard(m_observersMutex);
	m_observers.remove(observer);
}

/*
 * Observers are called on the notifying thread. The list is copied
 * so that an observer may detach itself from within Update().
 */
void Subject::Notify(void* aspect)
{
	debug("Notifying observers");

	std::list<Observer*> observers;
	{
		Guard guard(m_observersMutex);
		observers = m_observers;
	}

	for (Observer* observer : observers)
	{
		observer->Update(this, aspect);
	}
}
