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
#include "TransferUnit.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

TransferUnit::TransferUnit()
{
	debug("Creating TransferUnit");
}

TransferUnit::~TransferUnit()
{
	debug("Destroying TransferUnit");
}

void TransferUnit::Stop(EStopReason reason)
{
	debug("Stopping TransferUnit for job %i", m_jobId);

	// cancel wins over pause
	if (m_stopReason != srCancel)
	{
		m_stopReason = reason;
	}
	Thread::Stop();

	if (reason == srCancel || reason == srShutdown)
	{
		Guard guard(m_sourceMutex);
		if (m_source)
		{
			m_source->Cancel();
		}
	}
}

void TransferUnit::Run()
{
	debug("Transfer of job %i started", m_jobId);

	m_status = Download();

	if (m_outFile.Active())
	{
		m_outFile.Close();
	}
	CloseSource();

	if (m_status == tsCancelled && FileSystem::FileExists(m_tempFilename))
	{
		if (!FileSystem::DeleteFile(m_tempFilename))
		{
			warn("Could not delete partial file %s: %s", *m_tempFilename,
				*FileSystem::GetLastErrorMessage());
		}
	}

	debug("Transfer of job %i finished with status %i", m_jobId, (int)m_status);

	EAspect aspect = uaFinished;
	Notify(&aspect);
}

TransferUnit::EStatus TransferUnit::Download()
{
	{
		Guard guard(m_sourceMutex);
		m_source = m_sourceFactory->Create(m_sourceRef);
	}
	if (!m_source)
	{
		return Fail(JobInfo::ekInvalidSourceRef, "Unsupported source reference %s", *m_sourceRef);
	}

	if (!PrepareTempFile())
	{
		return tsFailed;
	}

	CharBuffer buffer(m_chunkSize);
	bool needOpen = true;

	while (true)
	{
		if (IsStopped())
		{
			return StoppedStatus();
		}

		if (needOpen)
		{
			Source::EStatus openStatus = m_source->Open(m_downloadedBytes);
			if (openStatus == Source::ssFailed)
			{
				return Fail(JobInfo::ekSourceError, "%s", m_source->GetErrorMessage());
			}
			if (openStatus != Source::ssOk)
			{
				if (IsStopped())
				{
					return StoppedStatus();
				}
				if (!RetryAfterError(JobInfo::ekTransientTransferError, m_source->GetErrorMessage()))
				{
					return tsFailed;
				}
				continue;
			}
			if (!AcceptOpenedSource())
			{
				return tsFailed;
			}
			needOpen = false;
		}

		if (m_sizeKnown && m_downloadedBytes >= m_totalBytes)
		{
			break;
		}

		int chunkSize = m_source->GetChunkCrcSize() > 0 ? m_source->GetChunkCrcSize() : m_chunkSize;
		if (m_sizeKnown && m_totalBytes - m_downloadedBytes < chunkSize)
		{
			chunkSize = (int)(m_totalBytes - m_downloadedBytes);
		}
		if (buffer.Size() < chunkSize)
		{
			buffer.Reserve(chunkSize);
		}

		if (m_tokenBucket && m_tokenBucket->Acquire(chunkSize, m_priority,
			[this]{ return IsStopped(); }) == TokenBucket::trCancelled)
		{
			return StoppedStatus();
		}

		int len = 0;
		Source::EStatus readStatus = ReadChunk(buffer, chunkSize, len);

		if (readStatus == Source::ssFailed)
		{
			return Fail(JobInfo::ekSourceError, "%s", m_source->GetErrorMessage());
		}

		if (readStatus == Source::ssTransient)
		{
			if (IsStopped())
			{
				return StoppedStatus();
			}
			m_source->Close();
			needOpen = true;
			if (!RetryAfterError(JobInfo::ekTransientTransferError, m_source->GetErrorMessage()))
			{
				return tsFailed;
			}
			continue;
		}

		if (len > 0)
		{
			Crc32 crc32;
			crc32.Append((const uchar*)(char*)buffer, len);
			uint32 crc = crc32.Finish();

			if (!VerifyChunk(buffer, len, crc))
			{
				m_source->Close();
				needOpen = true;
				BString<1024> msg("Chunk at offset %" PRIi64 " is corrupted", m_downloadedBytes);
				if (!RetryAfterError(JobInfo::ekChecksumMismatch, msg))
				{
					return tsFailed;
				}
				continue;
			}

			if (!WriteChunk(buffer, len, crc))
			{
				return tsFailed;
			}
			m_attempt = 0;
			ReportProgress();
		}

		if (readStatus == Source::ssEof)
		{
			if (!m_sizeKnown)
			{
				m_totalBytes = m_downloadedBytes;
				m_sizeKnown = true;
				break;
			}
			if (m_downloadedBytes < m_totalBytes)
			{
				m_source->Close();
				needOpen = true;
				BString<1024> msg("Source ended at %" PRIi64 " of %" PRIi64 " bytes",
					m_downloadedBytes, m_totalBytes);
				if (!RetryAfterError(JobInfo::ekTransientTransferError, msg))
				{
					return tsFailed;
				}
			}
		}
	}

	return Complete();
}

bool TransferUnit::PrepareTempFile()
{
	BString<1024> tempDir = *m_tempFilename;
	char* slash = strrchr(tempDir, PATH_SEPARATOR);
	if (slash)
	{
		*slash = '\0';
		CString errmsg;
		if (!FileSystem::ForceDirectories(tempDir, errmsg))
		{
			Fail(DiskErrorKind(), "Could not create directory %s: %s", *tempDir, *errmsg);
			return false;
		}
	}

	if (m_downloadedBytes > 0)
	{
		int64 fileSize = FileSystem::FileExists(m_tempFilename) ? FileSystem::FileSize(m_tempFilename) : -1;
		if (fileSize < m_downloadedBytes)
		{
			warn("Partial file %s is shorter than expected, restarting job %i from the beginning",
				*m_tempFilename, m_jobId);
			m_downloadedBytes = 0;
			m_prefixCrc = 0;
		}
	}

	return RestartFrom(m_downloadedBytes);
}

/*
 * Cuts the temp file at "offset" and positions the output there.
 * The caller is responsible for a matching "m_prefixCrc".
 */
bool TransferUnit::RestartFrom(int64 offset)
{
	if (m_outFile.Active())
	{
		m_outFile.Close();
	}

	if (offset > 0 && !FileSystem::TruncateFile(m_tempFilename, offset))
	{
		Fail(DiskErrorKind(), "Could not truncate file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return false;
	}

	if (!m_outFile.Open(m_tempFilename, offset > 0 ? DiskFile::omReadWrite : DiskFile::omWrite) ||
		!m_outFile.Seek(offset))
	{
		Fail(DiskErrorKind(), "Could not open file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return false;
	}

	m_downloadedBytes = offset;
	if (offset == 0)
	{
		m_prefixCrc = 0;
	}

	return true;
}

bool TransferUnit::AcceptOpenedSource()
{
	if (m_source->GetSizeKnown())
	{
		if (m_source->GetSize() < m_downloadedBytes)
		{
			warn("Source of job %i is smaller than the downloaded part, restarting from the beginning", m_jobId);
			m_source->Close();
			if (!RestartFrom(0))
			{
				return false;
			}
			Source::EStatus status = m_source->Open(0);
			if (status != Source::ssOk)
			{
				Fail(status == Source::ssFailed ? JobInfo::ekSourceError : JobInfo::ekTransientTransferError,
					"%s", m_source->GetErrorMessage());
				return false;
			}
		}
		m_totalBytes = m_source->GetSize();
		m_sizeKnown = true;
	}
	else
	{
		m_totalBytes = 0;
		m_sizeKnown = false;
	}

	if (m_source->GetOffset() != m_downloadedBytes)
	{
		if (m_source->GetOffset() != 0)
		{
			Fail(JobInfo::ekSourceError, "Source of job %i started at unexpected offset %" PRIi64,
				m_jobId, m_source->GetOffset());
			return false;
		}

		detail("Source of job %i can not resume, restarting from the beginning", m_jobId);
		if (!RestartFrom(0))
		{
			return false;
		}
	}

	if (!AlignToChunks())
	{
		return false;
	}

	return CheckDiskSpace();
}

/*
 * With declared chunk checksums every chunk must start at a multiple of
 * the chunk size. A resume point from a different chunk size is moved back.
 */
bool TransferUnit::AlignToChunks()
{
	int crcSize = m_source->GetChunkCrcSize();
	if (crcSize <= 0 || m_downloadedBytes % crcSize == 0)
	{
		return true;
	}

	int64 aligned = m_downloadedBytes - m_downloadedBytes % crcSize;
	debug("Aligning resume point of job %i to %" PRIi64, m_jobId, aligned);

	uint32 crc = 0;
	if (!CalcFileCrc(m_tempFilename, aligned, crc))
	{
		Fail(DiskErrorKind(), "Could not read file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return false;
	}

	m_source->Close();
	if (!RestartFrom(aligned))
	{
		return false;
	}
	m_prefixCrc = crc;

	Source::EStatus status = m_source->Open(aligned);
	if (status != Source::ssOk)
	{
		Fail(status == Source::ssFailed ? JobInfo::ekSourceError : JobInfo::ekTransientTransferError,
			"%s", m_source->GetErrorMessage());
		return false;
	}

	return true;
}

bool TransferUnit::CheckDiskSpace()
{
	if (!m_sizeKnown)
	{
		return true;
	}

	BString<1024> tempDir = *m_tempFilename;
	char* slash = strrchr(tempDir, PATH_SEPARATOR);
	if (slash)
	{
		*slash = '\0';
	}

	int64 freeSpace = FileSystem::FreeDiskSize(tempDir);
	int64 required = m_totalBytes - m_downloadedBytes;
	if (freeSpace >= 0 && freeSpace < required)
	{
		Fail(JobInfo::ekDiskExhausted, "Not enough disk space in %s: %s needed, %s available",
			*tempDir, *Util::FormatSize(required), *Util::FormatSize(freeSpace));
		return false;
	}

	return true;
}

Source::EStatus TransferUnit::ReadChunk(char* buffer, int size, int& bytesRead)
{
	bytesRead = 0;
	while (bytesRead < size)
	{
		int len = 0;
		Source::EStatus status = m_source->Read(buffer + bytesRead, size - bytesRead, len);
		if (status != Source::ssOk)
		{
			return status;
		}
		bytesRead += len;
	}
	return Source::ssOk;
}

bool TransferUnit::VerifyChunk(const char* buffer, int len, uint32 crc)
{
	int crcSize = m_source->GetChunkCrcSize();
	if (crcSize <= 0)
	{
		return true;
	}

	uint64 index = (uint64)(m_downloadedBytes / crcSize);
	Source::ChunkCrcs* crcs = m_source->GetChunkCrcs();
	if (index >= crcs->size())
	{
		return false;
	}

	return crcs->at(index) == crc;
}

bool TransferUnit::WriteChunk(const char* buffer, int len, uint32 crc)
{
	if (m_outFile.Write(buffer, len) != len || !m_outFile.Flush())
	{
		Fail(DiskErrorKind(), "Could not write file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return false;
	}

	m_prefixCrc = m_downloadedBytes > 0 ? Crc32::Combine(m_prefixCrc, crc, len) : crc;
	m_downloadedBytes += len;
	m_speedMeter.AddSpeedReading(len);
	return true;
}

/*
 * Counts the failed attempt and sleeps for the backoff delay.
 * Returns false if the retries are exhausted.
 */
bool TransferUnit::RetryAfterError(JobInfo::EErrorKind errorKind, const char* message)
{
	m_attempt++;
	m_errorKind = errorKind;
	m_errorMessage = message;

	if (m_attempt > m_chunkRetries)
	{
		Fail(errorKind, "%s (gave up after %i retries)", message, m_chunkRetries);
		return false;
	}

	int delay = m_retryBaseDelay;
	for (int i = 1; i < m_attempt && delay < m_retryMaxDelay; i++)
	{
		delay *= 2;
	}
	delay = std::min(delay, m_retryMaxDelay);

	detail("Job %i: %s, retrying in %i ms (%i/%i)", m_jobId, message, delay, m_attempt, m_chunkRetries);

	int64 until = Util::CurrentTicks() + (int64)delay * 1000;
	while (!IsStopped() && Util::CurrentTicks() < until)
	{
		Util::Sleep(std::min(100, (int)((until - Util::CurrentTicks()) / 1000) + 1));
	}

	return true;
}

TransferUnit::EStatus TransferUnit::Complete()
{
	if (!m_outFile.Close())
	{
		return Fail(DiskErrorKind(), "Could not close file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
	}

	bool verified = true;
	if (!Util::EmptyStr(m_source->GetSha256()))
	{
		CString digest;
		if (!CalcFileSha256(m_tempFilename, digest))
		{
			return Fail(DiskErrorKind(), "Could not read file %s: %s", *m_tempFilename,
				*FileSystem::GetLastErrorMessage());
		}
		verified = !strcasecmp(digest, m_source->GetSha256());
	}
	else if (m_source->GetHasFileCrc())
	{
		verified = m_prefixCrc == m_source->GetFileCrc();
	}

	if (!verified)
	{
		m_downloadedBytes = 0;
		m_prefixCrc = 0;
		if (!FileSystem::DeleteFile(m_tempFilename))
		{
			warn("Could not delete file %s: %s", *m_tempFilename, *FileSystem::GetLastErrorMessage());
		}
		return Fail(JobInfo::ekChecksumMismatch, "Checksum of %s does not match", *m_title);
	}

	CString errmsg;
	if (!FileSystem::ForceDirectories(m_destDir, errmsg))
	{
		return Fail(DiskErrorKind(), "Could not create directory %s: %s", *m_destDir, *errmsg);
	}

	CString destFile = FileSystem::MakeUniqueFilename(m_destDir, FileSystem::MakeValidFilename(m_title));
	if (!FileSystem::MoveFile(m_tempFilename, destFile))
	{
		return Fail(DiskErrorKind(), "Could not move file %s to %s: %s", *m_tempFilename,
			*destFile, *FileSystem::GetLastErrorMessage());
	}

	m_destFile = std::move(destFile);
	m_speed = 0;
	return tsCompleted;
}

TransferUnit::EStatus TransferUnit::StoppedStatus()
{
	return m_stopReason == srCancel ? tsCancelled : tsPaused;
}

TransferUnit::EStatus TransferUnit::Fail(JobInfo::EErrorKind errorKind, const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	m_errorMessage.FormatV(format, ap);
	va_end(ap);

	m_errorKind = errorKind;
	m_speed = 0;
	return tsFailed;
}

JobInfo::EErrorKind TransferUnit::DiskErrorKind()
{
	return errno == ENOSPC || errno == EDQUOT ? JobInfo::ekDiskExhausted : JobInfo::ekTransientTransferError;
}

void TransferUnit::CloseSource()
{
	Guard guard(m_sourceMutex);
	if (m_source)
	{
		m_source->Close();
		m_source.reset();
	}
}

void TransferUnit::ReportProgress()
{
	m_speed = m_speedMeter.CalcCurrentSpeed();
	EAspect aspect = uaProgress;
	Notify(&aspect);
}

bool TransferUnit::CalcFileCrc(const char* filename, int64 length, uint32& crc)
{
	DiskFile file;
	if (!file.Open(filename, DiskFile::omRead))
	{
		return false;
	}

	CharBuffer buffer(1024 * 64);
	Crc32 crc32;
	int64 remaining = length;
	while (remaining > 0)
	{
		int64 len = file.Read(buffer, std::min((int64)buffer.Size(), remaining));
		if (len <= 0)
		{
			return false;
		}
		crc32.Append((const uchar*)(char*)buffer, (uint32)len);
		remaining -= len;
	}

	crc = crc32.Finish();
	return true;
}

bool TransferUnit::CalcFileSha256(const char* filename, CString& digest)
{
	DiskFile file;
	if (!file.Open(filename, DiskFile::omRead))
	{
		return false;
	}

	Sha256 sha256;
	CharBuffer buffer(1024 * 64);
	while (true)
	{
		int64 len = file.Read(buffer, buffer.Size());
		if (len < 0 || file.Error())
		{
			return false;
		}
		if (len == 0)
		{
			break;
		}
		if (!sha256.Append(buffer, (int)len))
		{
			return false;
		}
	}

	digest = sha256.Finish();
	return !digest.Empty();
}
