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
#include "NString.h"
#include "Ledger.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

static const char* FORMATVERSION_SIGNATURE = "nexget ledger file version ";
const int LEDGER_FORMAT_VERSION = 1;

class StateDiskFile : public DiskFile
{
public:
	int64 PrintLine(const char* format, ...) PRINTF_SYNTAX(2);
	void PrintText(const char* text);
	char* ReadLine(char* buffer, int64 size);
	bool ReadText(CString& text);
	int ScanLine(const char* format, ...) SCANF_SYNTAX(2);
	bool GetWriteError() { return m_writeError; }

private:
	bool m_writeError = false;
};


int64 StateDiskFile::PrintLine(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	CString str;
	int len = str.FormatV(format, ap);
	va_end(ap);

	// replacing terminating <NULL> with <LF>
	str[len++] = '\n';

	if (Write(*str, len) != len)
	{
		m_writeError = true;
	}

	return len;
}

/*
 * Writes a free text field of any length as one line.
 * Line breaks in the text become spaces.
 */
void StateDiskFile::PrintText(const char* text)
{
	CString line = text ? text : "";
	line.Replace('\n', ' ');
	line.Replace('\r', ' ');
	line.Append("\n");

	int len = line.Length();
	if (Write(*line, len) != len)
	{
		m_writeError = true;
	}
}

char* StateDiskFile::ReadLine(char* buffer, int64 size)
{
	if (!DiskFile::ReadLine(buffer, size))
	{
		return nullptr;
	}

	// remove traling '\n'
	if (*buffer)
	{
		if (buffer[strlen(buffer) - 1] != '\n')
		{
			// the line is longer than "size", scroll file position to the end of the line
			for (char skipbuf[1024]; DiskFile::ReadLine(skipbuf, 1024) && *skipbuf && skipbuf[strlen(skipbuf) - 1] != '\n'; ) ;
		}
		else
		{
			buffer[strlen(buffer) - 1] = 0;
		}
	}

	return buffer;
}

bool StateDiskFile::ReadText(CString& text)
{
	text = "";
	char buf[1024];
	while (DiskFile::ReadLine(buf, sizeof(buf)) && *buf)
	{
		int len = (int)strlen(buf);
		bool complete = buf[len - 1] == '\n';
		if (complete)
		{
			buf[len - 1] = '\0';
		}
		text.Append(buf);
		if (complete)
		{
			return true;
		}
	}
	return false;
}

/*
* Standard "fscanf" scans beyond current line if the next line is empty.
* This wrapper fixes that.
*/
int StateDiskFile::ScanLine(const char* format, ...)
{
	char line[1024];
	if (!ReadLine(line, sizeof(line)))
	{
		return 0;
	}

	va_list ap;
	va_start(ap, format);
	int res = vsscanf(line, format, ap);
	va_end(ap);

	return res;
}


class StateFile
{
public:
	StateFile(const char* directory, const char* filename, int formatVersion);
	void Discard();
	bool FileExists();
	StateDiskFile* BeginWrite();
	bool FinishWrite();
	StateDiskFile* BeginRead();
	int GetFileVersion() { return m_fileVersion; }
	const char* GetDestFilename() { return m_destFilename; }

private:
	BString<1024> m_destFilename;
	BString<1024> m_tempFilename;
	int m_formatVersion;
	int m_fileVersion = 0;
	StateDiskFile m_file;

	int ParseFormatVersion(const char* formatSignature);
	bool GetFlush() { return !g_Options || g_Options->GetFlushLedger(); }
};


StateFile::StateFile(const char* directory, const char* filename, int formatVersion) :
	m_formatVersion(formatVersion)
{
	m_destFilename.Format("%s%c%s", directory, PATH_SEPARATOR, filename);
	m_tempFilename.Format("%s%c%s.new", directory, PATH_SEPARATOR, filename);
}

void StateFile::Discard()
{
	FileSystem::DeleteFile(m_destFilename);
	FileSystem::DeleteFile(m_tempFilename);
}

/* Parse signature and return format version number
*/
int StateFile::ParseFormatVersion(const char* formatSignature)
{
	if (strncmp(formatSignature, FORMATVERSION_SIGNATURE, strlen(FORMATVERSION_SIGNATURE)))
	{
		return 0;
	}

	return atoi(formatSignature + strlen(FORMATVERSION_SIGNATURE));
}

bool StateFile::FileExists()
{
	return FileSystem::FileExists(m_destFilename) || FileSystem::FileExists(m_tempFilename);
}

StateDiskFile* StateFile::BeginWrite()
{
	if (!m_file.Open(m_tempFilename, StateDiskFile::omWrite))
	{
		error("Error saving ledger: Could not create file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return nullptr;
	}

	m_file.PrintLine("%s%i", FORMATVERSION_SIGNATURE, m_formatVersion);

	return &m_file;
}

bool StateFile::FinishWrite()
{
	if (GetFlush())
	{
		debug("Flushing data for file %s", FileSystem::BaseFileName(m_tempFilename));
		CString errmsg;
		if (!m_file.Flush() || !m_file.Sync(errmsg))
		{
			warn("Could not flush file %s into disk: %s", *m_tempFilename, *errmsg);
		}
	}

	bool writeError = m_file.GetWriteError() || m_file.Error();
	if (!m_file.Close() || writeError)
	{
		error("Error saving ledger: Could not write file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		FileSystem::DeleteFile(m_tempFilename);
		return false;
	}

	// now rename to dest file name
	FileSystem::DeleteFile(m_destFilename);
	if (!FileSystem::MoveFile(m_tempFilename, m_destFilename))
	{
		error("Error saving ledger: Could not rename file %s to %s: %s",
			*m_tempFilename, *m_destFilename, *FileSystem::GetLastErrorMessage());
		return false;
	}

	// flush directory buffer after renaming
	if (GetFlush())
	{
		debug("Flushing directory for file %s", FileSystem::BaseFileName(m_destFilename));
		CString errmsg;
		if (!FileSystem::FlushDirBuffers(m_destFilename, errmsg))
		{
			warn("Could not flush directory buffers for file %s into disk: %s", *m_destFilename, *errmsg);
		}
	}

	return true;
}

StateDiskFile* StateFile::BeginRead()
{
	if (!FileSystem::FileExists(m_destFilename) && FileSystem::FileExists(m_tempFilename))
	{
		// disaster recovery: temp-file exists but the dest-file doesn't
		warn("Restoring ledger file %s from %s", FileSystem::BaseFileName(m_destFilename), FileSystem::BaseFileName(m_tempFilename));
		if (!FileSystem::MoveFile(m_tempFilename, m_destFilename))
		{
			error("Error restoring ledger: Could not rename file %s to %s: %s",
				*m_tempFilename, *m_destFilename, *FileSystem::GetLastErrorMessage());
			return nullptr;
		}
	}

	if (!m_file.Open(m_destFilename, StateDiskFile::omRead))
	{
		error("Error reading ledger: could not open file %s: %s", *m_destFilename,
			*FileSystem::GetLastErrorMessage());
		return nullptr;
	}

	char FileSignatur[128];
	if (!m_file.ReadLine(FileSignatur, sizeof(FileSignatur)))
	{
		FileSignatur[0] = '\0';
	}
	m_fileVersion = ParseFormatVersion(FileSignatur);
	if (m_fileVersion == 0 || m_fileVersion > m_formatVersion)
	{
		error("Could not load ledger file %s due to file version mismatch", *m_destFilename);
		m_file.Close();
		return nullptr;
	}

	return &m_file;
}


bool Ledger::Exists()
{
	StateFile stateFile(m_directory, "ledger", LEDGER_FORMAT_VERSION);
	return stateFile.FileExists();
}

void Ledger::Discard()
{
	StateFile stateFile(m_directory, "ledger", LEDGER_FORMAT_VERSION);
	stateFile.Discard();
}

bool Ledger::Save(JobList* jobs, int nextId)
{
	debug("Saving ledger to disk");

	StateFile stateFile(m_directory, "ledger", LEDGER_FORMAT_VERSION);
	StateDiskFile* outfile = stateFile.BeginWrite();
	if (!outfile)
	{
		return false;
	}

	outfile->PrintLine("%i", nextId);
	outfile->PrintLine("%i", (int)jobs->size());
	for (std::unique_ptr<JobInfo>& job : *jobs)
	{
		SaveJob(job.get(), *outfile);
	}

	// now rename to dest file name
	return stateFile.FinishWrite();
}

void Ledger::SaveJob(JobInfo* job, StateDiskFile& outfile)
{
	outfile.PrintLine("%i", job->GetId());
	outfile.PrintText(job->GetSourceRef());
	outfile.PrintText(job->GetTitle());
	outfile.PrintText(job->GetDestFile());
	outfile.PrintLine("%i,%i,%i,%i,%i", (int)job->GetStatus(), (int)job->GetPriority(),
		job->GetAttempt(), job->GetRestarts(), (int)job->GetSizeKnown());

	uint32 high, low;
	Util::SplitInt64(job->GetTotalBytes(), &high, &low);
	outfile.PrintLine("%u,%u", high, low);
	Util::SplitInt64(job->GetDownloadedBytes(), &high, &low);
	outfile.PrintLine("%u,%u", high, low);

	outfile.PrintLine("%u", job->GetPrefixCrc());
	outfile.PrintLine("%i,%i", (int)job->GetCreatedAt(), (int)job->GetUpdatedAt());

	outfile.PrintLine("%i", (int)job->GetErrorKind());
	outfile.PrintText(job->GetLastError());
}

bool Ledger::Load(JobList* jobs, int& nextId)
{
	debug("Loading ledger from disk");

	StateFile stateFile(m_directory, "ledger", LEDGER_FORMAT_VERSION);
	StateDiskFile* infile = stateFile.BeginRead();
	if (!infile)
	{
		return false;
	}

	bool ok = false;
	int size;
	JobList loaded;

	if (infile->ScanLine("%i", &nextId) != 1) goto error;
	if (infile->ScanLine("%i", &size) != 1) goto error;
	for (int i = 0; i < size; i++)
	{
		std::unique_ptr<JobInfo> job = std::make_unique<JobInfo>();
		if (!LoadJob(job.get(), *infile, stateFile.GetFileVersion())) goto error;
		if (job->GetId() >= nextId)
		{
			nextId = job->GetId() + 1;
		}
		loaded.push_back(std::move(job));
	}

	ok = true;

error:
	infile->Close();

	if (!ok)
	{
		error("Error reading ledger file %s", stateFile.GetDestFilename());
		return false;
	}

	for (std::unique_ptr<JobInfo>& job : loaded)
	{
		jobs->push_back(std::move(job));
	}

	return true;
}

bool Ledger::LoadJob(JobInfo* job, StateDiskFile& infile, int formatVersion)
{
	CString text;

	int id;
	if (infile.ScanLine("%i", &id) != 1 || id <= 0) return false;
	job->SetId(id);

	if (!infile.ReadText(text)) return false;
	job->SetSourceRef(text);

	if (!infile.ReadText(text)) return false;
	job->SetTitle(text);

	if (!infile.ReadText(text)) return false;
	job->SetDestFile(text);

	int status, priority, attempt, restarts, sizeKnown;
	if (infile.ScanLine("%i,%i,%i,%i,%i", &status, &priority, &attempt, &restarts, &sizeKnown) != 5) return false;
	if (status < JobInfo::jsQueued || status > JobInfo::jsFailed) return false;
	if (priority < JobInfo::jpLow || priority > JobInfo::jpHigh) return false;
	job->SetStatus((JobInfo::EStatus)status);
	job->SetPriority((JobInfo::EPriority)priority);
	job->SetAttempt(attempt);
	job->SetRestarts(restarts);
	job->SetSizeKnown(sizeKnown != 0);

	uint32 high, low;
	if (infile.ScanLine("%u,%u", &high, &low) != 2) return false;
	job->SetTotalBytes(Util::JoinInt64(high, low));
	if (infile.ScanLine("%u,%u", &high, &low) != 2) return false;
	job->SetDownloadedBytes(Util::JoinInt64(high, low));
	if (job->GetSizeKnown() && job->GetDownloadedBytes() > job->GetTotalBytes()) return false;

	uint32 prefixCrc;
	if (infile.ScanLine("%u", &prefixCrc) != 1) return false;
	job->SetPrefixCrc(prefixCrc);

	int createdAt, updatedAt;
	if (infile.ScanLine("%i,%i", &createdAt, &updatedAt) != 2) return false;
	job->SetCreatedAt((time_t)createdAt);
	job->SetUpdatedAt((time_t)updatedAt);

	int errorKind;
	if (infile.ScanLine("%i", &errorKind) != 1) return false;
	if (errorKind < JobInfo::ekNone || errorKind > JobInfo::ekSourceError) return false;
	if (!infile.ReadText(text)) return false;
	if (errorKind != JobInfo::ekNone)
	{
		job->SetLastError((JobInfo::EErrorKind)errorKind, text);
	}

	return true;
}
