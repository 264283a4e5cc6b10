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
#include "Log.h"
#include "Thread.h"

int Thread::m_threadCount = 1; // the main program thread
std::unique_ptr<Mutex> Thread::m_threadMutex;


void Thread::Init()
{
	debug("Initializing global thread data");

	m_threadMutex = std::make_unique<Mutex>();
}

Thread::Thread()
{
	debug("Creating Thread");
}

Thread::~Thread()
{
	debug("Destroying Thread");
}

void Thread::Start()
{
	debug("Starting Thread");

	m_running = true;

	// "m_threadMutex" keeps "t" alive until it is detached
	Guard guard(m_threadMutex);

	std::thread t([&]{
		{
			// wait until "Start()" has detached the thread
			Guard guard(m_threadMutex);
		}

		thread_handler();
	});

	t.detach();
}

void Thread::Stop()
{
	debug("Stopping Thread");

	m_stopped = true;
}

void Thread::Resume()
{
	debug("Resuming Thread");

	m_stopped = false;
}

bool Thread::WaitFinished(int timeoutMsec)
{
	Guard guard(m_finishMutex);
	return m_finishCond.WaitFor(m_finishMutex, timeoutMsec, [&]{ return !m_running; });
}

void Thread::thread_handler()
{
	{
		Guard guard(m_threadMutex);
		m_threadCount++;
	}

	debug("Entering Thread-func");

	Run();

	debug("Thread-func exited");

	{
		Guard guard(m_threadMutex);
		m_threadCount--;
	}

	if (m_autoDestroy)
	{
		debug("Autodestroying Thread-object");
		delete this;
		return;
	}

	Guard guard(m_finishMutex);
	m_running = false;
	m_finishCond.NotifyAll();
}

int Thread::GetThreadCount()
{
	Guard guard(m_threadMutex);
	return m_threadCount;
}
