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
#include "DownloadEngine.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

DownloadEngine::DownloadEngine(std::unique_ptr<SourceFactory> sourceFactory) :
	m_sourceFactory(std::move(sourceFactory))
{
	debug("Creating DownloadEngine");

	if (!m_sourceFactory)
	{
		m_sourceFactory = std::make_unique<SourceFactory>();
	}

	m_ledger = std::make_unique<Ledger>(g_Options->GetQueueDir());

	m_tokenBucket = std::make_unique<TokenBucket>(g_Options->GetDownloadRate(), g_Options->GetChunkSize());
	m_tokenBucket->SetWeights(g_Options->GetHighWeight(), g_Options->GetNormalWeight(), g_Options->GetLowWeight());
	m_tokenBucket->SetWaitInterval(g_Options->GetTokenWaitInterval());

	m_workerPool = std::make_unique<WorkerPool>(g_Options->GetMaxConcurrency());

	m_progressReporter = std::make_unique<ProgressReporter>(g_Options->GetProgressInterval(),
		g_Options->GetProgressDelta());

	m_queueManager = std::make_unique<QueueManager>(m_ledger.get(), m_sourceFactory.get(),
		m_workerPool.get(), m_tokenBucket.get(), m_progressReporter.get());
}

DownloadEngine::~DownloadEngine()
{
	debug("Destroying DownloadEngine");

	Shutdown();
	ReleaseLock();
}

bool DownloadEngine::Init()
{
	if (!AcquireLock())
	{
		return false;
	}

	return m_queueManager->Init();
}

/*
 * Only one engine may work on a queue directory, a second process would
 * overwrite the ledger behind the first one's back.
 */
bool DownloadEngine::AcquireLock()
{
	const char* lockFile = g_Options->GetLockFile();
	if (Util::EmptyStr(lockFile) || m_lockFd > -1)
	{
		return true;
	}

	m_lockFd = open(lockFile, O_RDWR | O_CREAT, 0640);
	if (m_lockFd < 0)
	{
		error("Could not create lock-file %s: %s", lockFile, *FileSystem::GetLastErrorMessage());
		return false;
	}

	if (flock(m_lockFd, LOCK_EX | LOCK_NB) < 0)
	{
		error("Downloads in %s are used by another nexget process (lock-file %s)",
			g_Options->GetQueueDir(), lockFile);
		close(m_lockFd);
		m_lockFd = -1;
		return false;
	}

	// record pid to lock-file
	BString<20> pid("%i\n", (int)getpid());
	if (ftruncate(m_lockFd, 0) < 0 || write(m_lockFd, pid, pid.Length()) < 0)
	{
		warn("Could not write pid to lock-file %s: %s", lockFile, *FileSystem::GetLastErrorMessage());
	}

	return true;
}

void DownloadEngine::ReleaseLock()
{
	if (m_lockFd > -1)
	{
		// closing the descriptor releases the lock
		close(m_lockFd);
		m_lockFd = -1;
	}
}

void DownloadEngine::Start()
{
	if (m_started)
	{
		return;
	}

	debug("Starting QueueManager");
	m_queueManager->Start();
	m_started = true;
}

void DownloadEngine::Shutdown()
{
	if (!m_started)
	{
		return;
	}

	debug("Stopping QueueManager");
	m_queueManager->Stop();
	while (!m_queueManager->WaitFinished(1000))
	{
		debug("Waiting for QueueManager to stop");
	}
	m_started = false;
}

DownloadEngine::EErrorCode DownloadEngine::SubmitDownload(const char* sourceRef, JobInfo::EPriority priority,
	const char* title, int& jobId, CString& errmsg)
{
	return m_queueManager->Submit(sourceRef, priority, title, jobId, errmsg);
}

DownloadEngine::EErrorCode DownloadEngine::PauseAllDownloads()
{
	m_queueManager->PauseAll();
	return QueueManager::ecOk;
}

DownloadEngine::EErrorCode DownloadEngine::ResumeAllDownloads()
{
	m_queueManager->ResumeAll();
	return QueueManager::ecOk;
}

void DownloadEngine::SetDownloadRate(int rate)
{
	m_tokenBucket->SetRate(rate);
	g_Options->SetDownloadRate(rate);

	if (rate > 0)
	{
		info("Download speed limit set to %s", *Util::FormatSpeed(rate));
	}
	else
	{
		info("Download speed limit removed");
	}
}
