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

#include "JobInfo.h"

static std::unique_ptr<JobInfo> MakeJob(int id, JobInfo::EPriority priority, time_t createdAt)
{
	std::unique_ptr<JobInfo> job = std::make_unique<JobInfo>();
	job->SetId(id);
	job->SetPriority(priority);
	job->SetCreatedAt(createdAt);
	return job;
}

TEST_CASE("JobInfo: admission order", "[JobInfo][Quick]")
{
	std::unique_ptr<JobInfo> oldLow = MakeJob(1, JobInfo::jpLow, 100);
	std::unique_ptr<JobInfo> newHigh = MakeJob(2, JobInfo::jpHigh, 200);
	std::unique_ptr<JobInfo> oldNormal = MakeJob(3, JobInfo::jpNormal, 100);
	std::unique_ptr<JobInfo> newNormal = MakeJob(4, JobInfo::jpNormal, 300);
	std::unique_ptr<JobInfo> sameNormal = MakeJob(5, JobInfo::jpNormal, 100);

	REQUIRE(JobInfo::AdmissionLess(newHigh.get(), oldLow.get()));
	REQUIRE_FALSE(JobInfo::AdmissionLess(oldLow.get(), newHigh.get()));
	REQUIRE(JobInfo::AdmissionLess(oldNormal.get(), newNormal.get()));
	REQUIRE(JobInfo::AdmissionLess(oldNormal.get(), sameNormal.get()));
	REQUIRE_FALSE(JobInfo::AdmissionLess(sameNormal.get(), oldNormal.get()));
	REQUIRE_FALSE(JobInfo::AdmissionLess(oldNormal.get(), oldNormal.get()));

	std::vector<JobInfo*> jobs = {oldLow.get(), newNormal.get(), sameNormal.get(), newHigh.get(), oldNormal.get()};
	std::sort(jobs.begin(), jobs.end(), JobInfo::AdmissionLess);
	REQUIRE(jobs[0]->GetId() == 2);
	REQUIRE(jobs[1]->GetId() == 3);
	REQUIRE(jobs[2]->GetId() == 5);
	REQUIRE(jobs[3]->GetId() == 4);
	REQUIRE(jobs[4]->GetId() == 1);
}

TEST_CASE("JobInfo: names", "[JobInfo][Quick]")
{
	REQUIRE(!strcmp(JobInfo::StatusName(JobInfo::jsQueued), "queued"));
	REQUIRE(!strcmp(JobInfo::StatusName(JobInfo::jsDownloading), "downloading"));
	REQUIRE(!strcmp(JobInfo::StatusName(JobInfo::jsFailed), "failed"));
	REQUIRE(!strcmp(JobInfo::PriorityName(JobInfo::jpHigh), "high"));
	REQUIRE(!strcmp(JobInfo::ErrorKindName(JobInfo::ekChecksumMismatch), "ChecksumMismatch"));
	REQUIRE(!strcmp(JobInfo::ErrorKindName(JobInfo::ekNone), ""));

	JobInfo::EPriority priority = JobInfo::jpNormal;
	REQUIRE(JobInfo::ParsePriority("HIGH", priority));
	REQUIRE(priority == JobInfo::jpHigh);
	REQUIRE(JobInfo::ParsePriority("low", priority));
	REQUIRE(priority == JobInfo::jpLow);
	REQUIRE_FALSE(JobInfo::ParsePriority("urgent", priority));
	REQUIRE(priority == JobInfo::jpLow);
}

TEST_CASE("JobInfo: copies own their text", "[JobInfo][Quick]")
{
	JobInfo job;
	job.SetId(7);
	job.SetSourceRef("test:game.bin");
	job.SetTitle("Game");
	job.SetLastError(JobInfo::ekSourceError, "gone");
	job.SetTotalBytes(1000);
	job.SetSizeKnown(true);

	JobInfo copy(job);
	JobInfo assigned;
	assigned = copy;

	job.SetSourceRef("test:other.bin");
	job.SetTitle("Other");
	job.ClearLastError();

	REQUIRE(!strcmp(copy.GetSourceRef(), "test:game.bin"));
	REQUIRE(!strcmp(assigned.GetTitle(), "Game"));
	REQUIRE(!strcmp(assigned.GetLastError(), "gone"));
	REQUIRE(assigned.GetErrorKind() == JobInfo::ekSourceError);
	REQUIRE(assigned.GetId() == 7);
	REQUIRE(assigned.GetTotalBytes() == 1000);
	REQUIRE(!strcmp(assigned.GetDestFile(), ""));
}

TEST_CASE("JobInfo: progress and remaining time", "[JobInfo][Quick]")
{
	JobInfo job;
	REQUIRE(job.GetProgressPercent() == 0);
	REQUIRE(job.GetSecondsRemaining() == -1);

	job.SetStatus(JobInfo::jsDownloading);
	job.SetTotalBytes(1000);
	job.SetSizeKnown(true);
	job.SetDownloadedBytes(400);
	REQUIRE(job.GetProgressPercent() == 40);
	REQUIRE(job.GetSecondsRemaining() == -1);

	job.SetSpeed(100);
	REQUIRE(job.GetSecondsRemaining() == 6);

	job.SetStatus(JobInfo::jsPaused);
	REQUIRE(job.GetSecondsRemaining() == -1);

	JobInfo empty;
	empty.SetStatus(JobInfo::jsCompleted);
	REQUIRE(empty.GetProgressPercent() == 100);
	REQUIRE(empty.IsTerminal());
	REQUIRE_FALSE(empty.IsActive());
}

TEST_CASE("JobList: find and remove", "[JobInfo][Quick]")
{
	JobList jobs;
	jobs.push_back(MakeJob(1, JobInfo::jpLow, 0));
	jobs.push_back(MakeJob(7, JobInfo::jpLow, 0));

	REQUIRE(jobs.Find(7) != nullptr);
	REQUIRE(jobs.Find(3) == nullptr);

	jobs.Remove(7);
	REQUIRE(jobs.size() == 1);
	REQUIRE(jobs.Find(7) == nullptr);
}
