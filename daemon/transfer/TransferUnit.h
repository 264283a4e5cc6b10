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


#ifndef TRANSFERUNIT_H
#define TRANSFERUNIT_H

#include "NString.h"
#include "Thread.h"
#include "Observer.h"
#include "FileSystem.h"
#include "JobInfo.h"
#include "Source.h"
#include "TokenBucket.h"
#include "SpeedMeter.h"

/*
 * Moves the bytes of one job from its source into "<TempDir>/<id>.part"
 * chunk by chunk, then verifies and moves the file to the destination.
 * Observers get aspect "uaProgress" after every written chunk and
 * "uaFinished" once, as the last action of the thread.
 */
class TransferUnit : public Thread, public Subject
{
public:
	enum EStatus
	{
		tsRunning,
		tsCompleted,
		tsPaused,
		tsCancelled,
		tsFailed
	};

	enum EStopReason
	{
		srNone,
		srPause,
		srShutdown,	// like pause, but also interrupts blocking source reads
		srCancel
	};

	enum EAspect
	{
		uaProgress,
		uaFinished
	};

	TransferUnit();
	virtual ~TransferUnit();
	virtual void Run();
	virtual void Stop() { Stop(srPause); }
	void Stop(EStopReason reason);

	void SetJobId(int jobId) { m_jobId = jobId; }
	int GetJobId() { return m_jobId; }
	void SetSourceRef(const char* sourceRef) { m_sourceRef = sourceRef; }
	void SetTitle(const char* title) { m_title = title; }
	void SetTempFilename(const char* tempFilename) { m_tempFilename = tempFilename; }
	const char* GetTempFilename() { return m_tempFilename; }
	void SetDestDir(const char* destDir) { m_destDir = destDir; }
	void SetPriority(JobInfo::EPriority priority) { m_priority = priority; }
	void SetSourceFactory(SourceFactory* sourceFactory) { m_sourceFactory = sourceFactory; }
	void SetTokenBucket(TokenBucket* tokenBucket) { m_tokenBucket = tokenBucket; }
	void SetChunkSize(int chunkSize) { m_chunkSize = chunkSize; }
	void SetChunkRetries(int chunkRetries) { m_chunkRetries = chunkRetries; }
	void SetRetryDelay(int baseDelay, int maxDelay) { m_retryBaseDelay = baseDelay; m_retryMaxDelay = maxDelay; }
	/* Resume point, the file prefix is trusted to match "prefixCrc" */
	void SetResume(int64 downloadedBytes, uint32 prefixCrc) { m_downloadedBytes = downloadedBytes; m_prefixCrc = prefixCrc; }
	/* Size recorded by an earlier attempt, replaced by what the source reports */
	void SetSize(int64 totalBytes, bool sizeKnown) { m_totalBytes = totalBytes; m_sizeKnown = sizeKnown; }

	EStatus GetStatus() { return m_status; }
	EStopReason GetStopReason() { return m_stopReason; }
	int64 GetDownloadedBytes() { return m_downloadedBytes; }
	int64 GetTotalBytes() { return m_totalBytes; }
	bool GetSizeKnown() { return m_sizeKnown; }
	uint32 GetPrefixCrc() { return m_prefixCrc; }
	int GetSpeed() { return m_speed; }
	int GetAttempt() { return m_attempt; }
	JobInfo::EErrorKind GetErrorKind() { return m_errorKind; }
	const char* GetErrorMessage() { return m_errorMessage; }
	const char* GetDestFile() { return m_destFile; }

	/* CRC-32 of the first "length" bytes of the file */
	static bool CalcFileCrc(const char* filename, int64 length, uint32& crc);
	static bool CalcFileSha256(const char* filename, CString& digest);

private:
	int m_jobId = 0;
	CString m_sourceRef;
	CString m_title;
	CString m_tempFilename;
	CString m_destDir;
	CString m_destFile;
	JobInfo::EPriority m_priority = JobInfo::jpNormal;
	SourceFactory* m_sourceFactory = nullptr;
	TokenBucket* m_tokenBucket = nullptr;
	int m_chunkSize = 256 * 1024;
	int m_chunkRetries = 3;
	int m_retryBaseDelay = 500;
	int m_retryMaxDelay = 10000;

	std::unique_ptr<Source> m_source;
	Mutex m_sourceMutex;
	DiskFile m_outFile;
	SpeedMeter m_speedMeter;
	std::atomic<EStopReason> m_stopReason{srNone};
	EStatus m_status = tsRunning;
	int64 m_downloadedBytes = 0;
	int64 m_totalBytes = 0;
	bool m_sizeKnown = false;
	uint32 m_prefixCrc = 0;
	int m_speed = 0;
	int m_attempt = 0;
	JobInfo::EErrorKind m_errorKind = JobInfo::ekNone;
	CString m_errorMessage;

	EStatus Download();
	bool PrepareTempFile();
	bool RestartFrom(int64 offset);
	bool AcceptOpenedSource();
	bool AlignToChunks();
	Source::EStatus ReadChunk(char* buffer, int size, int& bytesRead);
	bool VerifyChunk(const char* buffer, int len, uint32 crc);
	bool WriteChunk(const char* buffer, int len, uint32 crc);
	bool RetryAfterError(JobInfo::EErrorKind errorKind, const char* message);
	bool CheckDiskSpace();
	EStatus Complete();
	EStatus StoppedStatus();
	EStatus Fail(JobInfo::EErrorKind errorKind, const char* format, ...) PRINTF_SYNTAX(3);
	JobInfo::EErrorKind DiskErrorKind();
	void CloseSource();
	void ReportProgress();
};

#endif
