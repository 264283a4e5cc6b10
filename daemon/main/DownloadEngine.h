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


#ifndef DOWNLOADENGINE_H
#define DOWNLOADENGINE_H

#include "NString.h"
#include "JobInfo.h"
#include "Ledger.h"
#include "Source.h"
#include "TokenBucket.h"
#include "WorkerPool.h"
#include "ProgressReporter.h"
#include "QueueManager.h"

/*
 * Entry point for the embedding application. Builds the download machinery
 * from the global options; the source factory may be replaced (tests).
 */
class DownloadEngine
{
public:
	typedef QueueManager::EErrorCode EErrorCode;

	DownloadEngine(std::unique_ptr<SourceFactory> sourceFactory = nullptr);
	~DownloadEngine();
	/*
	 * Locks "LockFile" and loads the ledger; control operations are available
	 * afterwards. Fails while another engine holds the lock.
	 */
	bool Init();
	/* Starts admitting and transferring queued jobs */
	void Start();
	/* Stops running transfers at the next chunk boundary and waits for them */
	void Shutdown();
	bool IsStarted() { return m_started; }

	EErrorCode SubmitDownload(const char* sourceRef, JobInfo::EPriority priority, const char* title,
		int& jobId, CString& errmsg);
	EErrorCode PauseDownload(int jobId) { return m_queueManager->Pause(jobId); }
	EErrorCode ResumeDownload(int jobId) { return m_queueManager->Resume(jobId); }
	EErrorCode CancelDownload(int jobId) { return m_queueManager->Cancel(jobId); }
	EErrorCode RetryDownload(int jobId) { return m_queueManager->Retry(jobId); }
	EErrorCode PauseAllDownloads();
	EErrorCode ResumeAllDownloads();
	JobSnapshot ListDownloads() { return m_queueManager->List(); }
	bool GetDownload(int jobId, JobInfo& job) { return m_queueManager->GetJob(jobId, job); }
	int GetActiveCount() { return m_queueManager->GetActiveCount(); }
	bool HasPendingWork() { return m_queueManager->HasPendingWork(); }

	/* Bytes per second, 0 for unlimited */
	void SetDownloadRate(int rate);
	int GetDownloadRate() { return m_tokenBucket->GetRate(); }

	/* Attach observers here to receive ProgressReporter::Event */
	ProgressReporter* GetProgressReporter() { return m_progressReporter.get(); }

private:
	std::unique_ptr<SourceFactory> m_sourceFactory;
	std::unique_ptr<Ledger> m_ledger;
	std::unique_ptr<TokenBucket> m_tokenBucket;
	std::unique_ptr<WorkerPool> m_workerPool;
	std::unique_ptr<ProgressReporter> m_progressReporter;
	std::unique_ptr<QueueManager> m_queueManager;
	bool m_started = false;
	int m_lockFd = -1;

	bool AcquireLock();
	void ReleaseLock();
};

#endif
