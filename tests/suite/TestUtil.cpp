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
#include <iostream>
#include <catch2/catch.hpp>

#include "Util.h"
#include "FileSystem.h"
#include "TestUtil.h"

bool TestUtil::m_usedWorkingDir = false;
std::string DataDir;

class NullStreamBuf : public std::streambuf
{
public:
	int sputc ( char c ) { return (int) c; }
} NullStreamBufSuiteInstance;

std::streambuf* oldcoutbuf;

void TestUtil::Init(const char* argv0)
{
	m_usedWorkingDir = false;

	CString filename = FileSystem::GetExeFileName(argv0);
	FileSystem::NormalizePathSeparators(filename);
	char* end = strrchr(filename, PATH_SEPARATOR);
	if (end) *end = '\0';
	DataDir = filename;
	DataDir += "/testdata";
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = filename;
		DataDir += "/tests/testdata";
	}
#ifdef TESTDATA_DIR
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = TESTDATA_DIR;
	}
#endif
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = "";
	}
}

void TestUtil::Final()
{
	if (m_usedWorkingDir)
	{
		CleanupWorkingDir();
	}
}

const std::string TestUtil::TestDataDir()
{
	if (DataDir == "")
	{
		printf("ERROR: Directory \"testdata\" not found.\n");
		exit(1);
	}
	return DataDir;
}

const std::string TestUtil::WorkingDir()
{
	return TestDataDir() + "/temp";
}

void TestUtil::PrepareWorkingDir(const std::string templateDir)
{
	m_usedWorkingDir = true;

	std::string workDir = WorkingDir();

	CString errmsg;
	int retries = 20;

	FileSystem::DeleteDirectoryWithContent(workDir.c_str(), errmsg);
	while (FileSystem::DirectoryExists(workDir.c_str()) && retries > 0)
	{
		Util::Sleep(100);
		retries--;
		FileSystem::DeleteDirectoryWithContent(workDir.c_str(), errmsg);
	}
	REQUIRE_FALSE(FileSystem::DirectoryExists(workDir.c_str()));
	REQUIRE(FileSystem::CreateDirectory(workDir.c_str()));

	if (!templateDir.empty())
	{
		CopyAllFiles(workDir, TestDataDir() + "/" + templateDir);
	}
}

void TestUtil::CopyAllFiles(const std::string destDir, const std::string srcDir)
{
	DirBrowser dir(srcDir.c_str());
	while (const char* filename = dir.Next())
	{
		std::string srcFile(srcDir + "/" + filename);
		std::string dstFile(destDir + "/" + filename);
		REQUIRE(FileSystem::CopyFile(srcFile.c_str(), dstFile.c_str()));
	}
}

void TestUtil::CleanupWorkingDir()
{
	CString errmsg;
	FileSystem::DeleteDirectoryWithContent(WorkingDir().c_str(), errmsg);
}

void TestUtil::DisableCout()
{
	oldcoutbuf = std::cout.rdbuf(&NullStreamBufSuiteInstance);
}

void TestUtil::EnableCout()
{
	std::cout.rdbuf(oldcoutbuf);
}

std::string TestUtil::WritePatternFile(const char* filename, int size)
{
	std::string path = WorkingDir() + "/" + filename;
	CharBuffer buffer(size > 0 ? size : 1);
	for (int i = 0; i < size; i++)
	{
		buffer[i] = (char)('a' + i % 26);
	}
	REQUIRE(FileSystem::SaveBufferIntoFile(path.c_str(), buffer, size));
	return path;
}

bool TestUtil::WaitFor(std::function<bool()> check, int timeout)
{
	int64 until = Util::CurrentTicks() + (int64)timeout * 1000;
	while (!check())
	{
		if (Util::CurrentTicks() > until)
		{
			return false;
		}
		Util::Sleep(10);
	}
	return true;
}

TestOptions::TestOptions(std::initializer_list<const char*> extra)
{
	m_strings.emplace_back(CString::FormatStr("MainDir=%s", TestUtil::WorkingDir().c_str()));
	m_strings.emplace_back("DestDir=${MainDir}/dst");
	m_strings.emplace_back("TempDir=${MainDir}/tmp");
	m_strings.emplace_back("QueueDir=${MainDir}/queue");
	m_strings.emplace_back("LogFile=${MainDir}/nexget.log");
	m_strings.emplace_back("ChunkRetries=2");
	m_strings.emplace_back("RetryBaseDelay=10");
	m_strings.emplace_back("RetryMaxDelay=40");
	m_strings.emplace_back("TokenWaitInterval=10");
	m_strings.emplace_back("ProgressInterval=0");
	m_strings.emplace_back("ProgressDelta=0");
	m_strings.emplace_back("InfoTarget=none");
	m_strings.emplace_back("WarningTarget=none");
	m_strings.emplace_back("ErrorTarget=none");
	m_strings.emplace_back("DetailTarget=none");
	for (const char* option : extra)
	{
		m_strings.emplace_back(option);
	}

	for (CString& option : m_strings)
	{
		m_cmdOpts.push_back(option);
	}

	m_options = std::make_unique<Options>(&m_cmdOpts);
}
