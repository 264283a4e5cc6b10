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


#ifndef SOURCE_H
#define SOURCE_H

#include "NString.h"

/*
 * Readable byte stream behind a source reference, with the checksums the
 * source declares for its content.
 */
class Source
{
public:
	enum EStatus
	{
		ssOk,
		ssEof,
		ssTransient,	// retryable, e.g. connection lost
		ssFailed		// not retryable, e.g. resource not found
	};

	typedef std::vector<uint32> ChunkCrcs;

	virtual ~Source() {}

	/*
	 * Positions the stream at "offset". A source which can not seek
	 * may start from zero, GetOffset() tells where it actually starts.
	 */
	virtual EStatus Open(int64 offset) = 0;
	virtual EStatus Read(char* buffer, int size, int& bytesRead) = 0;
	virtual void Close() = 0;
	/* Interrupts a blocking Open or Read from another thread */
	virtual void Cancel() {}

	int64 GetOffset() { return m_offset; }
	int64 GetSize() { return m_size; }
	bool GetSizeKnown() { return m_sizeKnown; }
	const char* GetSha256() { return m_sha256; }
	bool GetHasFileCrc() { return m_hasFileCrc; }
	uint32 GetFileCrc() { return m_fileCrc; }
	int GetChunkCrcSize() { return m_chunkCrcSize; }
	ChunkCrcs* GetChunkCrcs() { return &m_chunkCrcs; }
	const char* GetErrorMessage() { return m_errorMessage; }

protected:
	int64 m_offset = 0;
	int64 m_size = 0;
	bool m_sizeKnown = false;
	CString m_sha256;
	bool m_hasFileCrc = false;
	uint32 m_fileCrc = 0;
	int m_chunkCrcSize = 0;
	ChunkCrcs m_chunkCrcs;
	CString m_errorMessage;

	EStatus SetError(EStatus status, const char* format, ...) PRINTF_SYNTAX(3);
};

/*
 * Resolves source references:
 *  - "file://<path>" or a plain path: local file;
 *  - "manifest:<path>": xml-manifest describing the payload and its checksums;
 *  - "http://host[:port]/resource": web resource, resumed with range requests.
 */
class SourceFactory
{
public:
	virtual ~SourceFactory() {}
	/* Checks that the reference is well formed and resolvable; suggests a title */
	virtual bool Validate(const char* sourceRef, CString& title, CString& errmsg);
	virtual std::unique_ptr<Source> Create(const char* sourceRef);

	static bool IsFileRef(const char* sourceRef);
	static bool IsManifestRef(const char* sourceRef);
	static bool IsHttpRef(const char* sourceRef);
	static const char* FilePath(const char* sourceRef);
};

#endif
