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
#include "ManifestFile.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

bool ManifestFile::Parse()
{
	xmlSAXHandler SAX_handler = {0};
	SAX_handler.startElement = reinterpret_cast<startElementSAXFunc>(SAX_StartElement);
	SAX_handler.endElement = reinterpret_cast<endElementSAXFunc>(SAX_EndElement);
	SAX_handler.characters = reinterpret_cast<charactersSAXFunc>(SAX_characters);
	SAX_handler.error = reinterpret_cast<errorSAXFunc>(SAX_error);
	SAX_handler.getEntity = reinterpret_cast<getEntitySAXFunc>(SAX_getEntity);

	m_ignoreNextError = false;

	int ret = xmlSAXUserParseFile(&SAX_handler, this, m_filename);

	if (ret != 0)
	{
		if (m_errorMessage.Empty())
		{
			SetError("could not read file %s", FileSystem::BaseFileName(m_filename));
		}
		return false;
	}

	if (!m_errorMessage.Empty())
	{
		return false;
	}

	if (!m_hasRoot)
	{
		SetError("tag <manifest> not found");
		return false;
	}

	if (m_payload.Empty())
	{
		SetError("tag <payload> not found");
		return false;
	}

	if (m_chunkSize > 0 && m_sizeKnown &&
		(int64)m_chunkCrcs.size() != (m_size + m_chunkSize - 1) / m_chunkSize)
	{
		SetError("number of chunks does not match the payload size");
		return false;
	}

	ResolvePayload();

	if (m_title.Empty())
	{
		m_title = FileSystem::BaseFileName(m_payload);
	}

	return true;
}

void ManifestFile::ResolvePayload()
{
	if (strstr(m_payload, "://") || m_payload[0] == PATH_SEPARATOR ||
		SourceFactory::IsManifestRef(m_payload))
	{
		return;
	}

	BString<1024> directory = *m_filename;
	char* baseName = FileSystem::BaseFileName(directory);
	*baseName = '\0';
	m_payload = CString::FormatStr("%s%s", *directory, *m_payload);
}

void ManifestFile::SetError(const char* format, ...)
{
	if (!m_errorMessage.Empty())
	{
		// keep the first error
		return;
	}

	va_list ap;
	va_start(ap, format);
	m_errorMessage.FormatV(format, ap);
	va_end(ap);
}

bool ManifestFile::ParseCrc(const char* value, uint32& crc)
{
	char* endptr;
	unsigned long val = strtoul(value, &endptr, 16);
	if (Util::EmptyStr(value) || *endptr != '\0')
	{
		SetError("invalid crc32 value \"%s\"", value);
		return false;
	}
	crc = (uint32)val;
	return true;
}

void ManifestFile::Parse_StartElement(const char *name, const char **atts)
{
	m_tagContent.Clear();

	if (!strcmp("manifest", name))
	{
		m_hasRoot = true;
	}
	else if (!strcmp("payload", name))
	{
		for (int i = 0; atts && atts[i]; i += 2)
		{
			const char* attrname = atts[i];
			const char* attrvalue = atts[i + 1];
			if (!strcmp("size", attrname))
			{
				char* endptr;
				m_size = strtoll(attrvalue, &endptr, 10);
				m_sizeKnown = *endptr == '\0' && m_size >= 0;
				if (!m_sizeKnown)
				{
					SetError("invalid payload size \"%s\"", attrvalue);
				}
			}
			else if (!strcmp("sha256", attrname))
			{
				m_sha256 = attrvalue;
				for (char* p = m_sha256; *p; p++) *p = tolower(*p);
				if (m_sha256.Length() != 64)
				{
					SetError("invalid sha256 value \"%s\"", attrvalue);
				}
			}
			else if (!strcmp("crc32", attrname))
			{
				m_hasCrc = ParseCrc(attrvalue, m_crc);
			}
		}
	}
	else if (!strcmp("chunks", name))
	{
		m_inChunks = true;
		for (int i = 0; atts && atts[i]; i += 2)
		{
			if (!strcmp("size", atts[i]))
			{
				m_chunkSize = atoi(atts[i + 1]);
			}
		}
		if (m_chunkSize <= 0)
		{
			SetError("tag <chunks> must have a positive size attribute");
		}
	}
	else if (!strcmp("chunk", name))
	{
		if (!m_inChunks)
		{
			SetError("tag <chunk> outside of tag <chunks>");
			return;
		}

		uint32 crc = 0;
		bool found = false;
		for (int i = 0; atts && atts[i]; i += 2)
		{
			if (!strcmp("crc32", atts[i]))
			{
				found = ParseCrc(atts[i + 1], crc);
			}
		}
		if (!found)
		{
			SetError("tag <chunk> must have a crc32 attribute");
			return;
		}
		m_chunkCrcs.push_back(crc);
	}
}

void ManifestFile::Parse_EndElement(const char *name)
{
	const char* content = m_tagContent.Empty() ? "" : Util::Trim(m_tagContent);

	if (!strcmp("title", name))
	{
		m_title = content;
	}
	else if (!strcmp("payload", name))
	{
		m_payload = content;
	}
	else if (!strcmp("chunks", name))
	{
		m_inChunks = false;
	}
	m_tagContent.Clear();
}

void ManifestFile::Parse_Content(const char *buf, int len)
{
	m_tagContent.Append(buf, len);
}

void ManifestFile::SAX_StartElement(ManifestFile* file, const char *name, const char **atts)
{
	file->Parse_StartElement(name, atts);
}

void ManifestFile::SAX_EndElement(ManifestFile* file, const char *name)
{
	file->Parse_EndElement(name);
}

void ManifestFile::SAX_characters(ManifestFile* file, const char * xmlstr, int len)
{
	// content may arrive in several pieces, it is trimmed at the end of the tag
	file->Parse_Content(xmlstr, len);
}

void* ManifestFile::SAX_getEntity(ManifestFile* file, const char * name)
{
	xmlEntityPtr e = xmlGetPredefinedEntity((xmlChar* )name);
	if (!e)
	{
		warn("Manifest %s: entity %s not found", FileSystem::BaseFileName(file->m_filename), name);
		file->m_ignoreNextError = true;
	}

	return e;
}

void ManifestFile::SAX_error(ManifestFile* file, const char *msg, ...)
{
	if (file->m_ignoreNextError)
	{
		file->m_ignoreNextError = false;
		return;
	}

	va_list argp;
	va_start(argp, msg);
	char errMsg[1024];
	vsnprintf(errMsg, sizeof(errMsg), msg, argp);
	errMsg[1024-1] = '\0';
	va_end(argp);

	// remove trailing CRLF
	for (char* pend = errMsg + strlen(errMsg) - 1; pend >= errMsg && (*pend == '\n' || *pend == '\r' || *pend == ' '); pend--) *pend = '\0';

	file->SetError("%s", errMsg);
}


Source::EStatus ManifestSource::Open(int64 offset)
{
	ManifestFile manifest(m_manifestFilename);
	if (!manifest.Parse())
	{
		return SetError(ssFailed, "invalid manifest %s: %s", *m_manifestFilename, manifest.GetErrorMessage());
	}

	std::unique_ptr<Source> payload = m_factory->Create(manifest.GetPayload());
	if (!payload || SourceFactory::IsManifestRef(manifest.GetPayload()))
	{
		return SetError(ssFailed, "unsupported payload %s in manifest %s", manifest.GetPayload(), *m_manifestFilename);
	}

	{
		Guard guard(m_payloadMutex);
		m_payload = std::move(payload);
	}

	EStatus status = m_payload->Open(offset);
	if (status != ssOk)
	{
		return SetError(status, "%s", m_payload->GetErrorMessage());
	}

	m_offset = m_payload->GetOffset();
	m_sizeKnown = manifest.GetSizeKnown() || m_payload->GetSizeKnown();
	m_size = manifest.GetSizeKnown() ? manifest.GetSize() : m_payload->GetSize();
	if (manifest.GetSizeKnown() && m_payload->GetSizeKnown() && manifest.GetSize() != m_payload->GetSize())
	{
		m_payload->Close();
		return SetError(ssFailed, "payload %s has size %" PRId64 ", manifest declares %" PRId64,
			manifest.GetPayload(), m_payload->GetSize(), manifest.GetSize());
	}

	m_sha256 = manifest.GetSha256();
	m_hasFileCrc = manifest.GetHasCrc();
	m_fileCrc = manifest.GetCrc();
	m_chunkCrcSize = manifest.GetChunkSize();
	m_chunkCrcs = *manifest.GetChunkCrcs();

	return ssOk;
}

Source::EStatus ManifestSource::Read(char* buffer, int size, int& bytesRead)
{
	EStatus status = m_payload->Read(buffer, size, bytesRead);
	if (status == ssTransient || status == ssFailed)
	{
		SetError(status, "%s", m_payload->GetErrorMessage());
	}
	return status;
}

void ManifestSource::Close()
{
	if (m_payload)
	{
		m_payload->Close();
	}
}

void ManifestSource::Cancel()
{
	Guard guard(m_payloadMutex);
	if (m_payload)
	{
		m_payload->Cancel();
	}
}
