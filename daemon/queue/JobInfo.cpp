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
#include "JobInfo.h"

JobInfo::JobInfo(const JobInfo& other)
{
	*this = other;
}

JobInfo& JobInfo::operator=(const JobInfo& other)
{
	if (this == &other)
	{
		return *this;
	}

	m_id = other.m_id;
	m_sourceRef = *other.m_sourceRef;
	m_title = *other.m_title;
	m_destFile = *other.m_destFile;
	m_totalBytes = other.m_totalBytes;
	m_sizeKnown = other.m_sizeKnown;
	m_downloadedBytes = other.m_downloadedBytes;
	m_prefixCrc = other.m_prefixCrc;
	m_priority = other.m_priority;
	m_status = other.m_status;
	m_attempt = other.m_attempt;
	m_restarts = other.m_restarts;
	m_createdAt = other.m_createdAt;
	m_updatedAt = other.m_updatedAt;
	m_errorKind = other.m_errorKind;
	m_lastError = *other.m_lastError;
	m_speed = other.m_speed;

	return *this;
}

int JobInfo::GetProgressPercent() const
{
	if (m_totalBytes <= 0)
	{
		return m_status == jsCompleted ? 100 : 0;
	}
	return (int)(m_downloadedBytes * 100 / m_totalBytes);
}

int64 JobInfo::GetSecondsRemaining() const
{
	if (!m_sizeKnown || m_speed <= 0 || m_status != jsDownloading)
	{
		return -1;
	}
	return (m_totalBytes - m_downloadedBytes) / m_speed;
}

bool JobInfo::AdmissionLess(const JobInfo* job1, const JobInfo* job2)
{
	if (job1->m_priority != job2->m_priority)
	{
		return job1->m_priority > job2->m_priority;
	}
	if (job1->m_createdAt != job2->m_createdAt)
	{
		return job1->m_createdAt < job2->m_createdAt;
	}
	return job1->m_id < job2->m_id;
}

const char* JobInfo::StatusName(EStatus status)
{
	switch (status)
	{
		case jsQueued: return "queued";
		case jsDownloading: return "downloading";
		case jsPaused: return "paused";
		case jsCompleted: return "completed";
		case jsCancelled: return "cancelled";
		case jsFailed: return "failed";
	}
	return "unknown";
}

const char* JobInfo::PriorityName(EPriority priority)
{
	switch (priority)
	{
		case jpLow: return "low";
		case jpNormal: return "normal";
		case jpHigh: return "high";
	}
	return "unknown";
}

const char* JobInfo::ErrorKindName(EErrorKind errorKind)
{
	switch (errorKind)
	{
		case ekNone: return "";
		case ekInvalidSourceRef: return "InvalidSourceRef";
		case ekTransientTransferError: return "TransientTransferError";
		case ekChecksumMismatch: return "ChecksumMismatch";
		case ekDiskExhausted: return "DiskExhausted";
		case ekNotFound: return "NotFound";
		case ekInvalidState: return "InvalidState";
		case ekSourceError: return "SourceError";
	}
	return "unknown";
}

bool JobInfo::ParsePriority(const char* name, EPriority& priority)
{
	if (!strcasecmp(name, "high"))
	{
		priority = jpHigh;
	}
	else if (!strcasecmp(name, "normal"))
	{
		priority = jpNormal;
	}
	else if (!strcasecmp(name, "low"))
	{
		priority = jpLow;
	}
	else
	{
		return false;
	}
	return true;
}

JobInfo* JobList::Find(int id)
{
	for (std::unique_ptr<JobInfo>& job : *this)
	{
		if (job->GetId() == id)
		{
			return job.get();
		}
	}

	return nullptr;
}

void JobList::Remove(int id)
{
	erase(std::remove_if(begin(), end(),
		[id](std::unique_ptr<JobInfo>& job)
		{
			return job->GetId() == id;
		}),
		end());
}
