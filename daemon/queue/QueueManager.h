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


#ifndef QUEUEMANAGER_H
#define QUEUEMANAGER_H

#include "NString.h"
#include "Thread.h"
#include "Observer.h"
#include "JobInfo.h"
#include "Ledger.h"
#include "ProgressReporter.h"
#include "Source.h"
#include "TokenBucket.h"
#include "TransferUnit.h"
#include "WorkerPool.h"

/*
 * Owns all jobs. Every change of job state goes through this class and is
 * written to the ledger before the operation reports success.
 * The coordinator thread admits queued jobs into free worker slots and
 * passes job events to the progress reporter.
 */
class QueueManager : public Thread, public Observer
{
public:
	enum EErrorCode
	{
		ecOk,
		ecNotFound,
		ecInvalidState,
		ecInvalidSourceRef,
		ecLedgerError
	};

	QueueManager(Ledger* ledger, SourceFactory* sourceFactory, WorkerPool* workerPool,
		TokenBucket* tokenBucket, ProgressReporter* progressReporter);
	virtual ~QueueManager();
	/* Loads the ledger and recovers jobs interrupted by a crash */
	bool Init();
	virtual void Run();
	virtual void Stop();
	void Update(Subject* caller, void* aspect);

	EErrorCode Submit(const char* sourceRef, JobInfo::EPriority priority, const char* title,
		int& jobId, CString& errmsg);
	EErrorCode Pause(int jobId);
	EErrorCode Resume(int jobId);
	EErrorCode Cancel(int jobId);
	EErrorCode Retry(int jobId);
	void PauseAll();
	void ResumeAll();
	JobSnapshot List();
	bool GetJob(int jobId, JobInfo& job);
	/* Jobs in states downloading, paused or queued */
	int GetActiveCount();
	/* True while any job is queued or a transfer is still running */
	bool HasPendingWork();
	static const char* ErrorCodeName(EErrorCode errorCode);

private:
	typedef std::vector<std::pair<ProgressReporter::Event, bool>> Events;

	JobList m_jobs;
	int m_nextId = 1;
	Mutex m_queueMutex;
	ConditionVar m_waitCond;
	bool m_changed = true;
	bool m_progressDirty = false;
	int64 m_lastSaveTicks = 0;
	Events m_events;
	Ledger* m_ledger;
	SourceFactory* m_sourceFactory;
	WorkerPool* m_workerPool;
	TokenBucket* m_tokenBucket;
	ProgressReporter* m_progressReporter;

	bool SaveQueue();
	EErrorCode CommitChange(JobInfo* job, const JobInfo& backup);
	EErrorCode LockedPause(JobInfo* job);
	EErrorCode LockedResume(JobInfo* job);
	void AdmitJobs();
	void StartTransfer(JobInfo* job);
	void TransferProgress(TransferUnit* unit);
	void TransferFinished(TransferUnit* unit);
	void RecoverJob(JobInfo* job);
	void PurgeExpired();
	void WaitJobs();
	void DeletePartialFile(JobInfo* job);
	CString TempFilename(int jobId);
	void QueueEvent(JobInfo* job, bool statusChange);
	void PublishEvents(Events& events);
	void WakeUp();
};

#endif
