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

#include <catch2/catch.hpp>

#include "DownloadEngine.h"
#include "FileSystem.h"
#include "TestUtil.h"
#include "TestSource.h"

class StatusCounter : public Observer
{
public:
	int GetCount(JobInfo::EStatus status)
	{
		Guard guard(m_countsMutex);
		return m_counts[status];
	}

protected:
	virtual void Update(Subject* caller, void* aspect)
	{
		Guard guard(m_countsMutex);
		m_counts[((ProgressReporter::Event*)aspect)->status]++;
	}

private:
	std::map<int, int> m_counts;
	Mutex m_countsMutex;
};

TEST_CASE("DownloadEngine: downloading into the library", "[DownloadEngine][Slow]")
{
	TestUtil::PrepareWorkingDir("manifest");
	TestOptions options;

	std::unique_ptr<TestSourceFactory> factory = std::make_unique<TestSourceFactory>();
	TestSourceFactory* testFactory = factory.get();
	SourcePlan* plan = testFactory->Plan("checked.bin");
	plan->size = 5000;
	plan->sha256 = TestSource::PatternSha256(5000);

	DownloadEngine engine(std::move(factory));
	StatusCounter counter;
	engine.GetProgressReporter()->Attach(&counter);
	REQUIRE(engine.Init());
	engine.Start();
	REQUIRE(engine.IsStarted());

	int checkedId = 0;
	int manifestId = 0;
	CString errmsg;
	REQUIRE(engine.SubmitDownload("test:checked.bin", JobInfo::jpNormal, nullptr, checkedId, errmsg) ==
		QueueManager::ecOk);
	CString manifestRef = CString::FormatStr("manifest:%s/game.xml", TestUtil::WorkingDir().c_str());
	REQUIRE(engine.SubmitDownload(manifestRef, JobInfo::jpHigh, nullptr, manifestId, errmsg) ==
		QueueManager::ecOk);

	REQUIRE(TestUtil::WaitFor([&]{ return !engine.HasPendingWork(); }));
	engine.Shutdown();
	REQUIRE_FALSE(engine.IsStarted());

	JobInfo job;
	REQUIRE(engine.GetDownload(checkedId, job));
	REQUIRE(job.GetStatus() == JobInfo::jsCompleted);
	REQUIRE(FileSystem::FileSize(job.GetDestFile()) == 5000);

	REQUIRE(engine.GetDownload(manifestId, job));
	REQUIRE(job.GetStatus() == JobInfo::jsCompleted);
	REQUIRE(!strcmp(job.GetTitle(), "Space Game & Friends"));
	REQUIRE(FileSystem::FileSize(job.GetDestFile()) == 1000);

	REQUIRE(engine.ListDownloads().size() == 2);
	REQUIRE(engine.GetActiveCount() == 0);
	REQUIRE(counter.GetCount(JobInfo::jsCompleted) == 2);
}

TEST_CASE("DownloadEngine: controls before start", "[DownloadEngine]")
{
	TestUtil::PrepareWorkingDir("");
	TestOptions options({"DownloadRate=100"});

	DownloadEngine engine(std::make_unique<TestSourceFactory>());
	REQUIRE(engine.GetDownloadRate() == 100 * 1024);
	REQUIRE(engine.Init());

	int jobId = 0;
	CString errmsg;
	REQUIRE(engine.SubmitDownload("test:game.bin", JobInfo::jpLow, "Game", jobId, errmsg) == QueueManager::ecOk);
	REQUIRE(engine.PauseAllDownloads() == QueueManager::ecOk);

	JobInfo job;
	REQUIRE(engine.GetDownload(jobId, job));
	REQUIRE(job.GetStatus() == JobInfo::jsPaused);

	REQUIRE(engine.ResumeAllDownloads() == QueueManager::ecOk);
	REQUIRE(engine.GetDownload(jobId, job));
	REQUIRE(job.GetStatus() == JobInfo::jsQueued);
	REQUIRE(engine.CancelDownload(jobId) == QueueManager::ecOk);
	REQUIRE(engine.RetryDownload(jobId) == QueueManager::ecInvalidState);
	REQUIRE(engine.ResumeDownload(jobId) == QueueManager::ecInvalidState);
	REQUIRE_FALSE(engine.GetDownload(jobId + 1, job));

	engine.SetDownloadRate(0);
	REQUIRE(engine.GetDownloadRate() == 0);
	REQUIRE(options->GetDownloadRate() == 0);
}

TEST_CASE("DownloadEngine: one engine per queue directory", "[DownloadEngine]")
{
	TestUtil::PrepareWorkingDir("");
	TestOptions options;

	int jobId = 0;
	{
		DownloadEngine engine(std::make_unique<TestSourceFactory>());
		REQUIRE(engine.Init());
		REQUIRE(FileSystem::FileExists(options->GetLockFile()));

		// a control command from a second process must not touch the ledger
		DownloadEngine second(std::make_unique<TestSourceFactory>());
		REQUIRE_FALSE(second.Init());

		CString errmsg;
		REQUIRE(engine.SubmitDownload("test:game.bin", JobInfo::jpNormal, nullptr, jobId, errmsg) ==
			QueueManager::ecOk);
	}

	// the lock is gone with the first engine
	DownloadEngine engine(std::make_unique<TestSourceFactory>());
	REQUIRE(engine.Init());
	JobInfo job;
	REQUIRE(engine.GetDownload(jobId, job));
	REQUIRE(job.GetStatus() == JobInfo::jsQueued);
}
