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
#include "ProgressReporter.h"
#include "Log.h"
#include "Util.h"

void ProgressReporter::SetLimits(int interval, int delta)
{
	Guard guard(m_publishedMutex);
	m_interval = interval;
	m_delta = delta;
}

ProgressReporter::Event ProgressReporter::MakeEvent(const JobInfo* job)
{
	Event event;
	event.jobId = job->GetId();
	event.downloadedBytes = job->GetDownloadedBytes();
	event.totalBytes = job->GetTotalBytes();
	event.status = job->GetStatus();
	event.speed = job->GetSpeed();
	return event;
}

int ProgressReporter::Percent(const Event& event)
{
	if (event.totalBytes <= 0)
	{
		return -1;
	}
	return (int)(event.downloadedBytes * 100 / event.totalBytes);
}

bool ProgressReporter::ReportProgress(const Event& event)
{
	int64 now = Util::CurrentTicks();
	int percent = Percent(event);

	{
		Guard guard(m_publishedMutex);

		PublishedMap::iterator it = m_published.find(event.jobId);
		if (it != m_published.end())
		{
			Published& last = it->second;
			bool due = now - last.ticks >= (int64)m_interval * 1000 ||
				(percent >= 0 && last.percent >= 0 && percent - last.percent >= m_delta) ||
				last.status != event.status;
			if (!due)
			{
				return false;
			}
		}

		m_published[event.jobId] = {now, percent, event.status};
	}

	Publish(event);
	return true;
}

void ProgressReporter::ReportStatus(const Event& event)
{
	{
		Guard guard(m_publishedMutex);
		if (event.status == JobInfo::jsCompleted || event.status == JobInfo::jsCancelled)
		{
			m_published.erase(event.jobId);
		}
		else
		{
			m_published[event.jobId] = {Util::CurrentTicks(), Percent(event), event.status};
		}
	}

	Publish(event);
}

void ProgressReporter::Forget(int jobId)
{
	Guard guard(m_publishedMutex);
	m_published.erase(jobId);
}

void ProgressReporter::Publish(const Event& event)
{
	debug("Job %i: %s, %" PRIi64 " of %" PRIi64 " bytes", event.jobId,
		JobInfo::StatusName(event.status), event.downloadedBytes, event.totalBytes);

	m_publishedCount++;
	Notify((void*)&event);
}
