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


#ifndef CONSOLEFRONTEND_H
#define CONSOLEFRONTEND_H

#include "Thread.h"
#include "Log.h"
#include "Observer.h"
#include "DownloadEngine.h"

/*
 * Prints log messages targeted to the screen and a status block with
 * one line per running download. Colors and cursor movement are used
 * only when the output is a terminal.
 */
class ConsoleFrontend : public Thread, public Observer
{
public:
	ConsoleFrontend(DownloadEngine* engine);
	virtual ~ConsoleFrontend();
	virtual void Run();
	virtual void Stop();
	void Update(Subject* caller, void* aspect);

private:
	DownloadEngine* m_engine;
	bool m_colored;
	int m_statusLines = 0;
	uint32 m_neededLogFirstId = 0;
	int m_updateInterval;
	bool m_changed = false;
	Mutex m_waitMutex;
	ConditionVar m_waitCond;

	void Refresh();
	void BeforePrint();
	void PrintMessage(Message& message);
	void PrintSkip();
	void PrintStatus();
	void Wait(int milliseconds);
};

#endif
