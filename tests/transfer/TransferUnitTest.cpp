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

#include "TransferUnit.h"
#include "FileSystem.h"
#include "Util.h"
#include "TestUtil.h"
#include "TestSource.h"

class UnitProgressRecorder : public Observer
{
public:
	std::vector<int64> GetProgress() { Guard guard(m_mutex); return m_progress; }
	int GetFinishedCount() { Guard guard(m_mutex); return m_finished; }

protected:
	virtual void Update(Subject* caller, void* aspect)
	{
		TransferUnit* unit = (TransferUnit*)caller;
		Guard guard(m_mutex);
		if (*(TransferUnit::EAspect*)aspect == TransferUnit::uaProgress)
		{
			m_progress.push_back(unit->GetDownloadedBytes());
		}
		else
		{
			m_finished++;
		}
	}

private:
	Mutex m_mutex;
	std::vector<int64> m_progress;
	int m_finished = 0;
};

class UnitTestBed
{
public:
	TestSourceFactory factory;
	TransferUnit unit;
	UnitProgressRecorder recorder;
	std::string tempFile;
	std::string destDir;

	UnitTestBed(const char* name)
	{
		TestUtil::PrepareWorkingDir("");
		tempFile = TestUtil::WorkingDir() + "/tmp/1.part";
		destDir = TestUtil::WorkingDir() + "/dst";

		unit.SetJobId(1);
		unit.SetSourceRef(CString::FormatStr("test:%s", name));
		unit.SetTitle(name);
		unit.SetTempFilename(tempFile.c_str());
		unit.SetDestDir(destDir.c_str());
		unit.SetSourceFactory(&factory);
		unit.SetChunkSize(100);
		unit.SetChunkRetries(2);
		unit.SetRetryDelay(1, 4);
		unit.Attach(&recorder);
	}

	TransferUnit::EStatus Run()
	{
		unit.Start();
		REQUIRE(unit.WaitFinished(20000));
		return unit.GetStatus();
	}
};

static bool FileHasPattern(const char* filename, int64 size)
{
	CharBuffer content;
	if (!FileSystem::LoadFileIntoBuffer(filename, content, false) || content.Size() != size)
	{
		return false;
	}
	for (int64 i = 0; i < size; i++)
	{
		if (content[i] != TestSource::PatternByte(i))
		{
			return false;
		}
	}
	return true;
}

TEST_CASE("TransferUnit: complete download", "[TransferUnit][Slow]")
{
	UnitTestBed bed("game.bin");
	bed.factory.Plan("game.bin")->size = 1000;

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);
	REQUIRE(bed.unit.GetDownloadedBytes() == 1000);
	REQUIRE(bed.unit.GetTotalBytes() == 1000);
	REQUIRE(bed.unit.GetPrefixCrc() == TestSource::PatternCrc(0, 1000));
	REQUIRE(std::string(bed.unit.GetDestFile()) == bed.destDir + "/game.bin");
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 1000));
	REQUIRE_FALSE(FileSystem::FileExists(bed.tempFile.c_str()));

	std::vector<int64> progress = bed.recorder.GetProgress();
	REQUIRE(progress.size() == 10);
	REQUIRE(std::is_sorted(progress.begin(), progress.end()));
	REQUIRE(progress.back() == 1000);
	REQUIRE(bed.recorder.GetFinishedCount() == 1);
}

TEST_CASE("TransferUnit: transient failures resume at the same offset", "[TransferUnit][Slow]")
{
	UnitTestBed bed("flaky.bin");
	SourcePlan* plan = bed.factory.Plan("flaky.bin");
	plan->size = 1000;
	plan->failAt = 400;
	plan->failOpens = 1;

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);

	std::vector<int64> expectedOpens = {0, 400, 400};
	REQUIRE(bed.factory.GetOpens("flaky.bin") == expectedOpens);
	REQUIRE(bed.unit.GetAttempt() == 0);
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 1000));
}

TEST_CASE("TransferUnit: gives up after retries", "[TransferUnit][Slow]")
{
	UnitTestBed bed("broken.bin");
	SourcePlan* plan = bed.factory.Plan("broken.bin");
	plan->size = 1000;
	plan->failAt = 400;
	plan->failOpens = 10;

	REQUIRE(bed.Run() == TransferUnit::tsFailed);
	REQUIRE(bed.unit.GetErrorKind() == JobInfo::ekTransientTransferError);
	REQUIRE(bed.unit.GetAttempt() == 3);
	REQUIRE(bed.unit.GetDownloadedBytes() == 400);
	REQUIRE(bed.unit.GetPrefixCrc() == TestSource::PatternCrc(0, 400));

	std::vector<int64> expectedOpens = {0, 400, 400};
	REQUIRE(bed.factory.GetOpens("broken.bin") == expectedOpens);

	// the partial file stays for a later retry
	REQUIRE(FileSystem::FileSize(bed.tempFile.c_str()) == 400);
}

TEST_CASE("TransferUnit: resume from partial file", "[TransferUnit][Slow]")
{
	UnitTestBed bed("resume.bin");
	bed.factory.Plan("resume.bin")->size = 1000;

	CString errmsg;
	REQUIRE(FileSystem::ForceDirectories((TestUtil::WorkingDir() + "/tmp").c_str(), errmsg));
	std::string written = TestUtil::WritePatternFile("tmp/1.part", 300);
	REQUIRE(written == bed.tempFile);
	bed.unit.SetResume(300, TestSource::PatternCrc(0, 300));

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);

	std::vector<int64> expectedOpens = {300};
	REQUIRE(bed.factory.GetOpens("resume.bin") == expectedOpens);
	REQUIRE(bed.unit.GetPrefixCrc() == TestSource::PatternCrc(0, 1000));
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 1000));
}

TEST_CASE("TransferUnit: source without resume support", "[TransferUnit][Slow]")
{
	UnitTestBed bed("noresume.bin");
	SourcePlan* plan = bed.factory.Plan("noresume.bin");
	plan->size = 500;
	plan->ignoreOffset = true;

	CString errmsg;
	REQUIRE(FileSystem::ForceDirectories((TestUtil::WorkingDir() + "/tmp").c_str(), errmsg));
	TestUtil::WritePatternFile("tmp/1.part", 200);
	bed.unit.SetResume(200, TestSource::PatternCrc(0, 200));

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 500));
}

TEST_CASE("TransferUnit: corrupted chunk is fetched again", "[TransferUnit][Slow]")
{
	UnitTestBed bed("chunks.bin");
	SourcePlan* plan = bed.factory.Plan("chunks.bin");
	plan->size = 450;
	plan->corruptAt = 250;
	plan->chunkCrcSize = 100;
	for (int64 offset = 0; offset < 450; offset += 100)
	{
		plan->chunkCrcs.push_back(TestSource::PatternCrc(offset, std::min((int64)100, 450 - offset)));
	}

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);

	std::vector<int64> expectedOpens = {0, 200};
	REQUIRE(bed.factory.GetOpens("chunks.bin") == expectedOpens);
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 450));
}

TEST_CASE("TransferUnit: whole file checksums", "[TransferUnit][Slow]")
{
	SECTION("matching sha256")
	{
		UnitTestBed bed("sha.bin");
		SourcePlan* plan = bed.factory.Plan("sha.bin");
		plan->size = 777;
		plan->sha256 = TestSource::PatternSha256(777);

		REQUIRE(bed.Run() == TransferUnit::tsCompleted);
	}

	SECTION("mismatching sha256")
	{
		UnitTestBed bed("badsha.bin");
		SourcePlan* plan = bed.factory.Plan("badsha.bin");
		plan->size = 777;
		plan->sha256 = "0000000000000000000000000000000000000000000000000000000000000000";

		REQUIRE(bed.Run() == TransferUnit::tsFailed);
		REQUIRE(bed.unit.GetErrorKind() == JobInfo::ekChecksumMismatch);
		REQUIRE(bed.unit.GetDownloadedBytes() == 0);
		REQUIRE_FALSE(FileSystem::FileExists(bed.tempFile.c_str()));
		REQUIRE_FALSE(FileSystem::FileExists((bed.destDir + "/badsha.bin").c_str()));
	}

	SECTION("mismatching crc32")
	{
		UnitTestBed bed("badcrc.bin");
		SourcePlan* plan = bed.factory.Plan("badcrc.bin");
		plan->size = 300;
		plan->hasFileCrc = true;
		plan->fileCrc = TestSource::PatternCrc(0, 300) ^ 1;

		REQUIRE(bed.Run() == TransferUnit::tsFailed);
		REQUIRE(bed.unit.GetErrorKind() == JobInfo::ekChecksumMismatch);
	}
}

TEST_CASE("TransferUnit: unknown size", "[TransferUnit][Slow]")
{
	UnitTestBed bed("stream.bin");
	SourcePlan* plan = bed.factory.Plan("stream.bin");
	plan->size = 350;
	plan->sizeKnown = false;

	REQUIRE(bed.Run() == TransferUnit::tsCompleted);
	REQUIRE(bed.unit.GetSizeKnown());
	REQUIRE(bed.unit.GetTotalBytes() == 350);
	REQUIRE(FileHasPattern(bed.unit.GetDestFile(), 350));
}

TEST_CASE("TransferUnit: source error is not retried", "[TransferUnit][Slow]")
{
	UnitTestBed bed("gone.bin");
	bed.factory.Plan("gone.bin")->failed = true;

	REQUIRE(bed.Run() == TransferUnit::tsFailed);
	REQUIRE(bed.unit.GetErrorKind() == JobInfo::ekSourceError);
	REQUIRE(bed.factory.GetOpens("gone.bin").size() == 1);
}

TEST_CASE("TransferUnit: pause and cancel", "[TransferUnit][Slow]")
{
	SECTION("pause keeps the partial file")
	{
		UnitTestBed bed("slow.bin");
		SourcePlan* plan = bed.factory.Plan("slow.bin");
		plan->size = 100000;
		plan->readSize = 50;
		plan->readDelay = 5;

		bed.unit.Start();
		REQUIRE(TestUtil::WaitFor([&]{ return bed.recorder.GetProgress().size() >= 2; }));
		bed.unit.Stop(TransferUnit::srPause);
		REQUIRE(bed.unit.WaitFinished(20000));

		REQUIRE(bed.unit.GetStatus() == TransferUnit::tsPaused);
		int64 downloaded = bed.unit.GetDownloadedBytes();
		REQUIRE(downloaded > 0);
		REQUIRE(downloaded < 100000);
		REQUIRE(downloaded % 100 == 0);
		REQUIRE(FileSystem::FileSize(bed.tempFile.c_str()) == downloaded);
		REQUIRE(bed.unit.GetPrefixCrc() == TestSource::PatternCrc(0, downloaded));
	}

	SECTION("cancel deletes the partial file")
	{
		UnitTestBed bed("slow.bin");
		SourcePlan* plan = bed.factory.Plan("slow.bin");
		plan->size = 100000;
		plan->readSize = 50;
		plan->readDelay = 5;

		bed.unit.Start();
		REQUIRE(TestUtil::WaitFor([&]{ return bed.recorder.GetProgress().size() >= 2; }));
		bed.unit.Stop(TransferUnit::srCancel);
		REQUIRE(bed.unit.WaitFinished(20000));

		REQUIRE(bed.unit.GetStatus() == TransferUnit::tsCancelled);
		REQUIRE_FALSE(FileSystem::FileExists(bed.tempFile.c_str()));
		REQUIRE(bed.recorder.GetFinishedCount() == 1);
	}
}

TEST_CASE("TransferUnit: file checksum helpers", "[TransferUnit][Quick]")
{
	TestUtil::PrepareWorkingDir("");
	std::string filename = TestUtil::WritePatternFile("pattern.bin", 1000);

	uint32 crc = 0;
	REQUIRE(TransferUnit::CalcFileCrc(filename.c_str(), 1000, crc));
	REQUIRE(crc == TestSource::PatternCrc(0, 1000));
	REQUIRE(TransferUnit::CalcFileCrc(filename.c_str(), 10, crc));
	REQUIRE(crc == TestSource::PatternCrc(0, 10));
	REQUIRE_FALSE(TransferUnit::CalcFileCrc(filename.c_str(), 2000, crc));

	CString digest;
	REQUIRE(TransferUnit::CalcFileSha256(filename.c_str(), digest));
	REQUIRE(!strcmp(digest, TestSource::PatternSha256(1000)));
}
