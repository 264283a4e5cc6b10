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


#ifndef JOBINFO_H
#define JOBINFO_H

#include "NString.h"

class JobInfo
{
public:
	enum EStatus
	{
		jsQueued,
		jsDownloading,
		jsPaused,
		jsCompleted,
		jsCancelled,
		jsFailed
	};

	enum EPriority
	{
		jpLow,
		jpNormal,
		jpHigh
	};

	enum EErrorKind
	{
		ekNone,
		ekInvalidSourceRef,
		ekTransientTransferError,
		ekChecksumMismatch,
		ekDiskExhausted,
		ekNotFound,
		ekInvalidState,
		ekSourceError
	};

	JobInfo() {}
	JobInfo(const JobInfo& other);
	JobInfo& operator=(const JobInfo& other);

	int GetId() const { return m_id; }
	void SetId(int id) { m_id = id; }
	const char* GetSourceRef() const { return m_sourceRef.Str(); }
	void SetSourceRef(const char* sourceRef) { m_sourceRef = sourceRef; }
	const char* GetTitle() const { return m_title.Str(); }
	void SetTitle(const char* title) { m_title = title; }
	const char* GetDestFile() const { return m_destFile.Str(); }
	void SetDestFile(const char* destFile) { m_destFile = destFile; }
	int64 GetTotalBytes() const { return m_totalBytes; }
	void SetTotalBytes(int64 totalBytes) { m_totalBytes = totalBytes; }
	bool GetSizeKnown() const { return m_sizeKnown; }
	void SetSizeKnown(bool sizeKnown) { m_sizeKnown = sizeKnown; }
	int64 GetDownloadedBytes() const { return m_downloadedBytes; }
	void SetDownloadedBytes(int64 downloadedBytes) { m_downloadedBytes = downloadedBytes; }
	uint32 GetPrefixCrc() const { return m_prefixCrc; }
	void SetPrefixCrc(uint32 prefixCrc) { m_prefixCrc = prefixCrc; }
	EPriority GetPriority() const { return m_priority; }
	void SetPriority(EPriority priority) { m_priority = priority; }
	EStatus GetStatus() const { return m_status; }
	void SetStatus(EStatus status) { m_status = status; }
	int GetAttempt() const { return m_attempt; }
	void SetAttempt(int attempt) { m_attempt = attempt; }
	int GetRestarts() const { return m_restarts; }
	void SetRestarts(int restarts) { m_restarts = restarts; }
	time_t GetCreatedAt() const { return m_createdAt; }
	void SetCreatedAt(time_t createdAt) { m_createdAt = createdAt; }
	time_t GetUpdatedAt() const { return m_updatedAt; }
	void SetUpdatedAt(time_t updatedAt) { m_updatedAt = updatedAt; }
	EErrorKind GetErrorKind() const { return m_errorKind; }
	const char* GetLastError() const { return m_lastError.Str(); }
	void SetLastError(EErrorKind errorKind, const char* lastError) { m_errorKind = errorKind; m_lastError = lastError; }
	void ClearLastError() { m_errorKind = ekNone; m_lastError.Clear(); }
	int GetSpeed() const { return m_speed; }
	void SetSpeed(int speed) { m_speed = speed; }

	bool IsTerminal() const { return m_status == jsCompleted || m_status == jsCancelled; }
	bool IsActive() const { return m_status == jsQueued || m_status == jsDownloading || m_status == jsPaused; }
	int GetProgressPercent() const;
	/* -1 when the remaining time can not be estimated */
	int64 GetSecondsRemaining() const;

	/* Orders jobs for admission: higher priority first, then older, then lower id */
	static bool AdmissionLess(const JobInfo* job1, const JobInfo* job2);

	static const char* StatusName(EStatus status);
	static const char* PriorityName(EPriority priority);
	static const char* ErrorKindName(EErrorKind errorKind);
	static bool ParsePriority(const char* name, EPriority& priority);

private:
	int m_id = 0;
	CString m_sourceRef;
	CString m_title;
	CString m_destFile;
	int64 m_totalBytes = 0;
	bool m_sizeKnown = false;
	int64 m_downloadedBytes = 0;
	uint32 m_prefixCrc = 0;
	EPriority m_priority = jpNormal;
	EStatus m_status = jsQueued;
	int m_attempt = 0;
	int m_restarts = 0;
	time_t m_createdAt = 0;
	time_t m_updatedAt = 0;
	EErrorKind m_errorKind = ekNone;
	CString m_lastError;
	int m_speed = 0;
};

typedef std::deque<std::unique_ptr<JobInfo>> JobListBase;

class JobList : public JobListBase
{
public:
	JobInfo* Find(int id);
	void Remove(int id);
};

typedef std::vector<JobInfo> JobSnapshot;

#endif
