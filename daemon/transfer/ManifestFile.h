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


#ifndef MANIFESTFILE_H
#define MANIFESTFILE_H

#include "NString.h"
#include "Thread.h"
#include "Source.h"

/*
 * Parser for xml-manifests:
 *
 * <manifest>
 *   <title>Display name</title>
 *   <payload size="1000" sha256="..." crc32="1a2b3c4d">file.bin</payload>
 *   <chunks size="256">
 *     <chunk crc32="..."/>
 *   </chunks>
 * </manifest>
 *
 * A relative payload path is resolved against the directory of the manifest.
 */
class ManifestFile
{
public:
	ManifestFile(const char* filename) : m_filename(filename) {}
	bool Parse();
	const char* GetFilename() { return m_filename; }
	const char* GetTitle() { return m_title; }
	const char* GetPayload() { return m_payload; }
	int64 GetSize() { return m_size; }
	bool GetSizeKnown() { return m_sizeKnown; }
	const char* GetSha256() { return m_sha256; }
	bool GetHasCrc() { return m_hasCrc; }
	uint32 GetCrc() { return m_crc; }
	int GetChunkSize() { return m_chunkSize; }
	Source::ChunkCrcs* GetChunkCrcs() { return &m_chunkCrcs; }
	const char* GetErrorMessage() { return m_errorMessage; }

private:
	CString m_filename;
	CString m_title;
	CString m_payload;
	int64 m_size = 0;
	bool m_sizeKnown = false;
	CString m_sha256;
	bool m_hasCrc = false;
	uint32 m_crc = 0;
	int m_chunkSize = 0;
	Source::ChunkCrcs m_chunkCrcs;
	CString m_errorMessage;
	CString m_tagContent;
	bool m_hasRoot = false;
	bool m_inChunks = false;
	bool m_ignoreNextError = false;

	bool ParseCrc(const char* value, uint32& crc);
	void ResolvePayload();
	void SetError(const char* format, ...) PRINTF_SYNTAX(2);

	static void SAX_StartElement(ManifestFile* file, const char *name, const char **atts);
	static void SAX_EndElement(ManifestFile* file, const char *name);
	static void SAX_characters(ManifestFile* file, const char *  xmlstr, int len);
	static void* SAX_getEntity(ManifestFile* file, const char *  name);
	static void SAX_error(ManifestFile* file, const char *msg, ...);
	void Parse_StartElement(const char *name, const char **atts);
	void Parse_EndElement(const char *name);
	void Parse_Content(const char *buf, int len);
};

/*
 * Reads the payload named in a manifest and declares the manifest's checksums.
 */
class ManifestSource : public Source
{
public:
	ManifestSource(const char* manifestFilename, SourceFactory* factory) :
		m_manifestFilename(manifestFilename), m_factory(factory) {}
	virtual EStatus Open(int64 offset);
	virtual EStatus Read(char* buffer, int size, int& bytesRead);
	virtual void Close();
	virtual void Cancel();

private:
	CString m_manifestFilename;
	SourceFactory* m_factory;
	std::unique_ptr<Source> m_payload;
	Mutex m_payloadMutex;
};

#endif
