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
#include "ConsoleFrontend.h"
#include "Options.h"
#include "Util.h"

ConsoleFrontend::ConsoleFrontend(DownloadEngine* engine) :
	m_engine(engine)
{
	debug("Creating ConsoleFrontend");

	m_colored = isatty(fileno(stdout));
	m_updateInterval = std::max(g_Options->GetProgressInterval(), 100);
	m_engine->GetProgressReporter()->Attach(this);
}

ConsoleFrontend::~ConsoleFrontend()
{
	m_engine->GetProgressReporter()->Detach(this);
}

void ConsoleFrontend::Run()
{
	debug("Entering ConsoleFrontend-loop");

	while (!IsStopped())
	{
		Refresh();
		Wait(m_updateInterval);
	}

	// printing the last messages
	Refresh();
	printf("\n");
	fflush(stdout);

	debug("Exiting ConsoleFrontend-loop");
}

void ConsoleFrontend::Stop()
{
	Thread::Stop();

	Guard guard(m_waitMutex);
	m_waitCond.NotifyAll();
}

void ConsoleFrontend::Update(Subject* caller, void* aspect)
{
	ProgressReporter::Event* event = (ProgressReporter::Event*)aspect;
	if (event->status != JobInfo::jsDownloading)
	{
		// status changes are shown without delay
		Guard guard(m_waitMutex);
		m_changed = true;
		m_waitCond.NotifyAll();
	}
}

void ConsoleFrontend::Wait(int milliseconds)
{
	Guard guard(m_waitMutex);
	m_waitCond.WaitFor(m_waitMutex, milliseconds, [&]{ return m_changed || IsStopped(); });
	m_changed = false;
}

void ConsoleFrontend::Refresh()
{
	BeforePrint();

	{
		GuardedMessageList messages = g_Log->GuardMessages();
		if (!messages->empty())
		{
			Message& firstMessage = messages->front();
			int start = m_neededLogFirstId - firstMessage.GetId() + 1;
			if (start < 0)
			{
				PrintSkip();
				start = 0;
			}
			for (uint32 i = (uint32)start; i < messages->size(); i++)
			{
				PrintMessage(messages->at(i));
				m_neededLogFirstId = messages->at(i).GetId();
			}
		}
	}

	PrintStatus();

	fflush(stdout);
}

void ConsoleFrontend::BeforePrint()
{
	if (m_colored && m_statusLines > 0)
	{
		// go back to the beginning of the status block
		printf("\r\033[%iA", m_statusLines);
	}
	m_statusLines = 0;
}

void ConsoleFrontend::PrintMessage(Message& message)
{
	const char* msg = message.GetText();

	if (!m_colored)
	{
		switch (message.GetKind())
		{
			case Message::mkDebug:
				printf("[DEBUG] %s\n", msg);
				break;
			case Message::mkError:
				printf("[ERROR] %s\n", msg);
				break;
			case Message::mkWarning:
				printf("[WARNING] %s\n", msg);
				break;
			case Message::mkInfo:
				printf("[INFO] %s\n", msg);
				break;
			case Message::mkDetail:
				printf("[DETAIL] %s\n", msg);
				break;
		}
		return;
	}

	switch (message.GetKind())
	{
		case Message::mkDebug:
			printf("[DEBUG] %s\033[K\n", msg);
			break;
		case Message::mkError:
			printf("\033[31m[ERROR]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkWarning:
			printf("\033[35m[WARNING]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkInfo:
			printf("\033[32m[INFO]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkDetail:
			printf("\033[32m[DETAIL]\033[39m %s\033[K\n", msg);
			break;
	}
}

void ConsoleFrontend::PrintSkip()
{
	printf(m_colored ? ".....\033[K\n" : ".....\n");
}

void ConsoleFrontend::PrintStatus()
{
	if (!m_colored)
	{
		// a status block can not be redrawn in a log
		return;
	}

	JobSnapshot jobs = m_engine->ListDownloads();

	int downloading = 0;
	int queued = 0;
	int paused = 0;
	int64 totalSpeed = 0;

	for (JobInfo& job : jobs)
	{
		switch (job.GetStatus())
		{
			case JobInfo::jsDownloading:
			{
				downloading++;
				totalSpeed += job.GetSpeed();

				BString<100> remaining;
				int64 seconds = job.GetSecondsRemaining();
				if (seconds >= 0)
				{
					remaining.Format(" (~ %s)", *Util::FormatDuration(seconds));
				}

				BString<100> progress;
				if (job.GetSizeKnown())
				{
					progress.Format("%i%% of %s", job.GetProgressPercent(), *Util::FormatSize(job.GetTotalBytes()));
				}
				else
				{
					progress.Format("%s", *Util::FormatSize(job.GetDownloadedBytes()));
				}

				printf(" [%i] %s: %s, %s%s\033[K\n", job.GetId(), job.GetTitle(), *progress,
					*Util::FormatSpeed(job.GetSpeed()), *remaining);
				m_statusLines++;
				break;
			}

			case JobInfo::jsQueued:
				queued++;
				break;

			case JobInfo::jsPaused:
				paused++;
				break;

			default:
				break;
		}
	}

	BString<100> downloadLimit;
	if (m_engine->GetDownloadRate() > 0)
	{
		downloadLimit.Format(", Limit %s", *Util::FormatSpeed(m_engine->GetDownloadRate()));
	}

	printf(" %i downloading, %i queued, %i paused, %s%s\033[K\n", downloading, queued, paused,
		*Util::FormatSpeed(totalSpeed), *downloadLimit);
	m_statusLines++;
}
