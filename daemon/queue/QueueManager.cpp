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
#include "QueueManager.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

QueueManager::QueueManager(Ledger* ledger, SourceFactory* sourceFactory, WorkerPool* workerPool,
	TokenBucket* tokenBucket, ProgressReporter* progressReporter) :
	m_ledger(ledger), m_sourceFactory(sourceFactory), m_workerPool(workerPool),
	m_tokenBucket(tokenBucket), m_progressReporter(progressReporter)
{
	debug("Creating QueueManager");
}

QueueManager::~QueueManager()
{
	debug("Destroying QueueManager");
}

bool QueueManager::Init()
{
	CString errmsg;
	if (!FileSystem::ForceDirectories(m_ledger->GetDirectory(), errmsg))
	{
		error("Could not create directory %s: %s", m_ledger->GetDirectory(), *errmsg);
		return false;
	}

	Guard guard(m_queueMutex);

	if (m_ledger->Exists())
	{
		if (!m_ledger->Load(&m_jobs, m_nextId))
		{
			return false;
		}
		detail("Loaded %i download(s) from ledger", (int)m_jobs.size());
	}

	for (std::unique_ptr<JobInfo>& job : m_jobs)
	{
		RecoverJob(job.get());
	}

	PurgeExpired();

	return SaveQueue();
}

/*
 * A job found in state "downloading" was interrupted by a crash. It is
 * paused and its partial file is checked against the recorded prefix CRC.
 */
void QueueManager::RecoverJob(JobInfo* job)
{
	job->SetSpeed(0);

	if (job->GetStatus() != JobInfo::jsDownloading)
	{
		return;
	}

	job->SetStatus(JobInfo::jsPaused);
	info("Download %s was interrupted, pausing it", job->GetTitle());

	if (job->GetDownloadedBytes() == 0)
	{
		return;
	}

	CString tempFilename = TempFilename(job->GetId());
	uint32 crc = 0;
	if (!TransferUnit::CalcFileCrc(tempFilename, job->GetDownloadedBytes(), crc) ||
		crc != job->GetPrefixCrc())
	{
		warn("Partial file of %s could not be verified, the download starts over", job->GetTitle());
		job->SetDownloadedBytes(0);
		job->SetPrefixCrc(0);
	}
}

void QueueManager::Run()
{
	debug("Entering QueueManager-loop");

	Events events;

	while (!IsStopped())
	{
		{
			Guard guard(m_queueMutex);
			m_waitCond.WaitFor(m_queueMutex, 1000, [&]{ return m_changed || IsStopped(); });
			m_changed = false;

			if (!IsStopped())
			{
				AdmitJobs();
			}
			PurgeExpired();

			if (m_progressDirty && Util::CurrentTicks() - m_lastSaveTicks >= 1000000)
			{
				SaveQueue();
			}

			events.swap(m_events);
		}

		PublishEvents(events);
	}

	WaitJobs();

	{
		Guard guard(m_queueMutex);
		if (m_progressDirty)
		{
			SaveQueue();
		}
		events.swap(m_events);
	}
	PublishEvents(events);

	debug("Exiting QueueManager-loop");
}

void QueueManager::Stop()
{
	Thread::Stop();

	debug("Stopping transfers");
	m_workerPool->StopAll(TransferUnit::srShutdown);

	Guard guard(m_queueMutex);
	m_waitCond.NotifyAll();
}

void QueueManager::WaitJobs()
{
	debug("QueueManager: waiting for transfers to stop");

	while (m_workerPool->GetActiveCount() > 0)
	{
		Util::Sleep(100);
	}

	debug("QueueManager: transfers are stopped");
}

void QueueManager::WakeUp()
{
	m_changed = true;
	m_waitCond.NotifyAll();
}

bool QueueManager::SaveQueue()
{
	bool ok = m_ledger->Save(&m_jobs, m_nextId);
	if (ok)
	{
		m_progressDirty = false;
		m_lastSaveTicks = Util::CurrentTicks();
	}
	else
	{
		m_progressDirty = true;
		error("Could not save download ledger in %s", m_ledger->GetDirectory());
	}
	return ok;
}

/*
 * The change made to "job" becomes effective only if the ledger accepts it,
 * otherwise the job is restored from "backup".
 */
QueueManager::EErrorCode QueueManager::CommitChange(JobInfo* job, const JobInfo& backup)
{
	job->SetUpdatedAt(Util::CurrentTime());

	if (!SaveQueue())
	{
		*job = backup;
		return ecLedgerError;
	}

	QueueEvent(job, true);
	WakeUp();
	return ecOk;
}

QueueManager::EErrorCode QueueManager::Submit(const char* sourceRef, JobInfo::EPriority priority,
	const char* title, int& jobId, CString& errmsg)
{
	for (const char* p = sourceRef; p && *p; p++)
	{
		if ((uchar)*p < 32 || *p == 127)
		{
			errmsg = "source reference contains control characters";
			warn("Could not add download: %s", *errmsg);
			return ecInvalidSourceRef;
		}
	}

	CString defaultTitle;
	if (!m_sourceFactory->Validate(sourceRef, defaultTitle, errmsg))
	{
		warn("Could not add download %s: %s", sourceRef ? sourceRef : "", *errmsg);
		return ecInvalidSourceRef;
	}

	// titles are stored one per line
	CString jobTitle = !Util::EmptyStr(title) ? title : *defaultTitle;
	jobTitle.Replace('\n', ' ');
	jobTitle.Replace('\r', ' ');
	jobTitle.Replace('\t', ' ');

	Guard guard(m_queueMutex);

	std::unique_ptr<JobInfo> job = std::make_unique<JobInfo>();
	job->SetId(m_nextId);
	job->SetSourceRef(sourceRef);
	job->SetTitle(jobTitle);
	job->SetPriority(priority);
	job->SetStatus(JobInfo::jsQueued);
	job->SetCreatedAt(Util::CurrentTime());
	job->SetUpdatedAt(job->GetCreatedAt());

	JobInfo* newJob = job.get();
	m_jobs.push_back(std::move(job));
	m_nextId++;

	if (!SaveQueue())
	{
		m_jobs.pop_back();
		m_nextId--;
		errmsg = "could not save download ledger";
		return ecLedgerError;
	}

	jobId = newJob->GetId();
	info("Download %s added to queue with %s priority", newJob->GetTitle(),
		JobInfo::PriorityName(priority));

	QueueEvent(newJob, true);
	WakeUp();
	return ecOk;
}

QueueManager::EErrorCode QueueManager::Pause(int jobId)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(jobId);
	if (!job)
	{
		return ecNotFound;
	}

	return LockedPause(job);
}

QueueManager::EErrorCode QueueManager::LockedPause(JobInfo* job)
{
	switch (job->GetStatus())
	{
		case JobInfo::jsPaused:
			return ecOk;

		case JobInfo::jsQueued:
		case JobInfo::jsDownloading:
		{
			JobInfo backup = *job;
			job->SetStatus(JobInfo::jsPaused);
			job->SetSpeed(0);
			EErrorCode code = CommitChange(job, backup);
			if (code != ecOk)
			{
				return code;
			}

			// the unit stops at the next chunk boundary
			TransferUnit* unit = m_workerPool->Find(job->GetId());
			if (unit)
			{
				unit->Stop(TransferUnit::srPause);
			}
			info("Download %s paused", job->GetTitle());
			return ecOk;
		}

		default:
			return ecInvalidState;
	}
}

QueueManager::EErrorCode QueueManager::Resume(int jobId)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(jobId);
	if (!job)
	{
		return ecNotFound;
	}

	return LockedResume(job);
}

QueueManager::EErrorCode QueueManager::LockedResume(JobInfo* job)
{
	switch (job->GetStatus())
	{
		case JobInfo::jsQueued:
		case JobInfo::jsDownloading:
			return ecOk;

		case JobInfo::jsPaused:
		{
			JobInfo backup = *job;
			job->SetStatus(JobInfo::jsQueued);
			EErrorCode code = CommitChange(job, backup);
			if (code == ecOk)
			{
				info("Download %s resumed", job->GetTitle());
			}
			return code;
		}

		default:
			return ecInvalidState;
	}
}

QueueManager::EErrorCode QueueManager::Cancel(int jobId)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(jobId);
	if (!job)
	{
		return ecNotFound;
	}

	if (job->IsTerminal())
	{
		return ecOk;
	}

	JobInfo backup = *job;
	job->SetStatus(JobInfo::jsCancelled);
	job->SetSpeed(0);
	EErrorCode code = CommitChange(job, backup);
	if (code != ecOk)
	{
		return code;
	}

	TransferUnit* unit = m_workerPool->Find(jobId);
	if (unit)
	{
		// the unit deletes the partial file when it exits
		unit->Stop(TransferUnit::srCancel);
	}
	else
	{
		DeletePartialFile(job);
	}

	info("Download %s cancelled", job->GetTitle());
	return ecOk;
}

QueueManager::EErrorCode QueueManager::Retry(int jobId)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(jobId);
	if (!job)
	{
		return ecNotFound;
	}

	if (job->GetStatus() != JobInfo::jsFailed)
	{
		return ecInvalidState;
	}

	JobInfo backup = *job;
	job->SetStatus(JobInfo::jsQueued);
	job->SetRestarts(job->GetRestarts() + 1);
	job->SetAttempt(0);
	job->ClearLastError();
	EErrorCode code = CommitChange(job, backup);
	if (code == ecOk)
	{
		info("Download %s queued for retry", job->GetTitle());
	}
	return code;
}

void QueueManager::PauseAll()
{
	Guard guard(m_queueMutex);

	for (std::unique_ptr<JobInfo>& job : m_jobs)
	{
		if (job->GetStatus() == JobInfo::jsQueued || job->GetStatus() == JobInfo::jsDownloading)
		{
			EErrorCode code = LockedPause(job.get());
			if (code != ecOk)
			{
				debug("Could not pause job %i: %s", job->GetId(), ErrorCodeName(code));
			}
		}
	}
}

void QueueManager::ResumeAll()
{
	Guard guard(m_queueMutex);

	for (std::unique_ptr<JobInfo>& job : m_jobs)
	{
		if (job->GetStatus() == JobInfo::jsPaused)
		{
			EErrorCode code = LockedResume(job.get());
			if (code != ecOk)
			{
				debug("Could not resume job %i: %s", job->GetId(), ErrorCodeName(code));
			}
		}
	}
}

JobSnapshot QueueManager::List()
{
	Guard guard(m_queueMutex);

	JobSnapshot snapshot;
	snapshot.reserve(m_jobs.size());
	for (std::unique_ptr<JobInfo>& job : m_jobs)
	{
		snapshot.push_back(*job);
	}
	return snapshot;
}

bool QueueManager::GetJob(int jobId, JobInfo& job)
{
	Guard guard(m_queueMutex);

	JobInfo* found = m_jobs.Find(jobId);
	if (found)
	{
		job = *found;
	}
	return found != nullptr;
}

int QueueManager::GetActiveCount()
{
	Guard guard(m_queueMutex);

	return (int)std::count_if(m_jobs.begin(), m_jobs.end(),
		[](std::unique_ptr<JobInfo>& job) { return job->IsActive(); });
}

bool QueueManager::HasPendingWork()
{
	Guard guard(m_queueMutex);

	for (std::unique_ptr<JobInfo>& job : m_jobs)
	{
		if (job->GetStatus() == JobInfo::jsQueued || job->GetStatus() == JobInfo::jsDownloading)
		{
			return true;
		}
	}

	return m_workerPool->GetActiveCount() > 0;
}

/*
 * Promotes queued jobs to "downloading" while slots are free.
 * A job whose previous unit is still winding down waits for it.
 */
void QueueManager::AdmitJobs()
{
	while (m_workerPool->HasFreeSlot())
	{
		JobInfo* next = nullptr;
		for (std::unique_ptr<JobInfo>& job : m_jobs)
		{
			if (job->GetStatus() == JobInfo::jsQueued && !m_workerPool->Find(job->GetId()) &&
				(!next || JobInfo::AdmissionLess(job.get(), next)))
			{
				next = job.get();
			}
		}

		if (!next)
		{
			return;
		}

		JobInfo backup = *next;
		next->SetStatus(JobInfo::jsDownloading);
		if (CommitChange(next, backup) != ecOk)
		{
			// the ledger is not writable, try again on the next round
			return;
		}

		StartTransfer(next);
	}
}

void QueueManager::StartTransfer(JobInfo* job)
{
	detail("Starting download %s", job->GetTitle());

	TransferUnit* unit = new TransferUnit();
	unit->SetAutoDestroy(true);
	unit->Attach(this);
	unit->SetJobId(job->GetId());
	unit->SetSourceRef(job->GetSourceRef());
	unit->SetTitle(job->GetTitle());
	unit->SetPriority(job->GetPriority());
	unit->SetTempFilename(TempFilename(job->GetId()));
	unit->SetDestDir(g_Options->GetDestDir());
	unit->SetSourceFactory(m_sourceFactory);
	unit->SetTokenBucket(m_tokenBucket);
	unit->SetChunkSize(g_Options->GetChunkSize());
	unit->SetChunkRetries(g_Options->GetChunkRetries());
	unit->SetRetryDelay(g_Options->GetRetryBaseDelay(), g_Options->GetRetryMaxDelay());
	unit->SetResume(job->GetDownloadedBytes(), job->GetPrefixCrc());
	unit->SetSize(job->GetTotalBytes(), job->GetSizeKnown());

	if (!m_workerPool->Lease(unit))
	{
		error("Internal error: no free slot for download %s", job->GetTitle());
		delete unit;
		JobInfo backup = *job;
		job->SetStatus(JobInfo::jsQueued);
		if (CommitChange(job, backup) != ecOk)
		{
			// the ledger still says "downloading", recovery pauses it on the next start
			job->SetStatus(JobInfo::jsPaused);
		}
	}
}

void QueueManager::Update(Subject* caller, void* aspect)
{
	TransferUnit* unit = (TransferUnit*)caller;
	TransferUnit::EAspect unitAspect = *(TransferUnit::EAspect*)aspect;

	if (unitAspect == TransferUnit::uaProgress)
	{
		TransferProgress(unit);
	}
	else
	{
		TransferFinished(unit);
	}
}

void QueueManager::TransferProgress(TransferUnit* unit)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(unit->GetJobId());
	if (!job)
	{
		return;
	}

	job->SetDownloadedBytes(unit->GetDownloadedBytes());
	job->SetPrefixCrc(unit->GetPrefixCrc());
	job->SetTotalBytes(unit->GetTotalBytes());
	job->SetSizeKnown(unit->GetSizeKnown());
	job->SetSpeed(unit->GetSpeed());
	job->SetAttempt(unit->GetAttempt());
	m_progressDirty = true;

	QueueEvent(job, false);
	WakeUp();
}

void QueueManager::TransferFinished(TransferUnit* unit)
{
	Guard guard(m_queueMutex);

	JobInfo* job = m_jobs.Find(unit->GetJobId());
	if (!job)
	{
		m_workerPool->Release(unit);
		WakeUp();
		return;
	}

	JobInfo::EStatus oldStatus = job->GetStatus();
	TransferUnit::EStatus status = unit->GetStatus();

	job->SetDownloadedBytes(unit->GetDownloadedBytes());
	job->SetPrefixCrc(unit->GetPrefixCrc());
	job->SetTotalBytes(unit->GetTotalBytes());
	job->SetSizeKnown(unit->GetSizeKnown());
	job->SetAttempt(unit->GetAttempt());
	job->SetSpeed(0);

	if (oldStatus == JobInfo::jsCancelled)
	{
		// cancelled while the unit was finishing
		if (status == TransferUnit::tsCompleted && FileSystem::FileExists(unit->GetDestFile()) &&
			!FileSystem::DeleteFile(unit->GetDestFile()))
		{
			warn("Could not delete file %s: %s", unit->GetDestFile(), *FileSystem::GetLastErrorMessage());
		}
		else if (status != TransferUnit::tsCancelled)
		{
			DeletePartialFile(job);
		}
	}
	else
	{
		switch (status)
		{
			case TransferUnit::tsCompleted:
				job->SetStatus(JobInfo::jsCompleted);
				job->SetDestFile(unit->GetDestFile());
				job->ClearLastError();
				info("Download %s completed", job->GetTitle());
				break;

			case TransferUnit::tsFailed:
				job->SetStatus(JobInfo::jsFailed);
				job->SetLastError(unit->GetErrorKind(), unit->GetErrorMessage());
				error("Download %s failed: %s", job->GetTitle(), unit->GetErrorMessage());
				break;

			case TransferUnit::tsPaused:
				if (oldStatus == JobInfo::jsDownloading)
				{
					// stopped by shutdown, continues on the next start
					job->SetStatus(unit->GetStopReason() == TransferUnit::srShutdown ?
						JobInfo::jsQueued : JobInfo::jsPaused);
				}
				break;

			case TransferUnit::tsCancelled:
				job->SetStatus(JobInfo::jsCancelled);
				break;

			case TransferUnit::tsRunning:
				break;
		}
	}

	job->SetUpdatedAt(Util::CurrentTime());
	SaveQueue();

	m_workerPool->Release(unit);
	QueueEvent(job, true);
	WakeUp();
}

void QueueManager::PurgeExpired()
{
	time_t expiry = Util::CurrentTime() - g_Options->GetCompletedRetention();
	bool purged = false;

	for (JobList::iterator it = m_jobs.begin(); it != m_jobs.end(); )
	{
		JobInfo* job = it->get();
		if (job->GetStatus() == JobInfo::jsCompleted && job->GetUpdatedAt() <= expiry && !m_workerPool->Find(job->GetId()))
		{
			detail("Removing download %s from list", job->GetTitle());
			m_progressReporter->Forget(job->GetId());
			it = m_jobs.erase(it);
			purged = true;
		}
		else
		{
			it++;
		}
	}

	if (purged)
	{
		SaveQueue();
	}
}

void QueueManager::DeletePartialFile(JobInfo* job)
{
	CString tempFilename = TempFilename(job->GetId());
	if (FileSystem::FileExists(tempFilename) && !FileSystem::DeleteFile(tempFilename))
	{
		warn("Could not delete partial file %s: %s", *tempFilename, *FileSystem::GetLastErrorMessage());
	}
}

CString QueueManager::TempFilename(int jobId)
{
	return CString::FormatStr("%s%c%i.part", g_Options->GetTempDir(), PATH_SEPARATOR, jobId);
}

void QueueManager::QueueEvent(JobInfo* job, bool statusChange)
{
	m_events.emplace_back(ProgressReporter::MakeEvent(job), statusChange);
}

void QueueManager::PublishEvents(Events& events)
{
	for (std::pair<ProgressReporter::Event, bool>& event : events)
	{
		if (event.second)
		{
			m_progressReporter->ReportStatus(event.first);
		}
		else
		{
			m_progressReporter->ReportProgress(event.first);
		}
	}
	events.clear();
}

const char* QueueManager::ErrorCodeName(EErrorCode errorCode)
{
	switch (errorCode)
	{
		case ecOk: return "ok";
		case ecNotFound: return "not found";
		case ecInvalidState: return "invalid state";
		case ecInvalidSourceRef: return "invalid source reference";
		case ecLedgerError: return "ledger error";
	}
	return "unknown";
}
