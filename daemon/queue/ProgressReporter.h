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


#ifndef PROGRESSREPORTER_H
#define PROGRESSREPORTER_H

#include "Thread.h"
#include "Observer.h"
#include "JobInfo.h"

/*
 * Republishes job events to its observers. Progress of a job is passed on
 * at most once per interval unless the percentage advanced by at least
 * "delta"; status changes always pass. Observers receive a pointer to
 * ProgressReporter::Event as aspect.
 */
class ProgressReporter : public Subject
{
public:
	struct Event
	{
		int jobId;
		int64 downloadedBytes;
		int64 totalBytes;
		JobInfo::EStatus status;
		int speed;
	};

	ProgressReporter(int interval, int delta) : m_interval(interval), m_delta(delta) {}
	void SetLimits(int interval, int delta);
	/* Returns true if the event was published */
	bool ReportProgress(const Event& event);
	void ReportStatus(const Event& event);
	void Forget(int jobId);
	int GetPublishedCount() { return m_publishedCount; }

	static Event MakeEvent(const JobInfo* job);

private:
	struct Published
	{
		int64 ticks;
		int percent;
		JobInfo::EStatus status;
	};

	typedef std::map<int, Published> PublishedMap;

	PublishedMap m_published;
	Mutex m_publishedMutex;
	int m_interval;
	int m_delta;
	std::atomic<int> m_publishedCount{0};

	static int Percent(const Event& event);
	void Publish(const Event& event);
};

#endif
