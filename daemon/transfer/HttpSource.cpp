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
#include "HttpSource.h"
#include "Log.h"
#include "Util.h"

static const int MAX_REDIRECTS = 5;

Source::EStatus HttpSource::Open(int64 offset)
{
	m_cancelled = false;
	CString address = *m_url;

	for (int redirects = 0; redirects <= MAX_REDIRECTS; redirects++)
	{
		int httpCode = 0;
		EStatus status = Request(address, offset, httpCode);
		if (status != ssOk)
		{
			FreeConnection();
			return status;
		}

		if (httpCode / 100 != 3)
		{
			return ssOk;
		}

		FreeConnection();

		if (m_redirectUrl.Empty())
		{
			return SetError(ssFailed, "%s: redirect without location", *address);
		}
		debug("Redirecting %s to %s", *address, *m_redirectUrl);
		address = std::move(m_redirectUrl);
	}

	return SetError(ssFailed, "%s: too many redirects", *m_url);
}

Source::EStatus HttpSource::Request(const char* address, int64 offset, int& httpCode)
{
	URL url(address);
	if (!url.IsValid() || strcasecmp(url.GetProtocol(), "http"))
	{
		return SetError(ssFailed, "unsupported url %s", address);
	}

	int port = url.GetPort();
	if (port == 0)
	{
		port = 80;
	}

	{
		Guard guard(m_connectionMutex);
		m_connection = std::make_unique<Connection>(url.GetHost(), port);
		m_connection->SetTimeout(m_timeout);
	}

	if (!m_connection->Connect())
	{
		return SetError(m_cancelled ? ssFailed : ssTransient, "%s", m_connection->GetLastError());
	}

	if (m_cancelled)
	{
		return SetError(ssFailed, "%s: cancelled", address);
	}

	detail("Requesting %s from position %" PRId64, address, offset);

	if (!SendHeaders(&url, offset))
	{
		return SetError(m_cancelled ? ssFailed : ssTransient, "%s", m_connection->GetLastError());
	}

	m_contentLen = -1;
	m_received = 0;
	m_offset = 0;
	m_size = 0;
	m_sizeKnown = false;
	m_redirectUrl.Clear();
	m_pendingLen = 0;
	m_pendingPos = 0;

	CharBuffer lineBuf(1024*10);
	bool firstLine = true;

	// Headers
	while (true)
	{
		int len = 0;
		char* line = m_connection->ReadLine(lineBuf, lineBuf.Size(), &len);

		if (!line)
		{
			if (m_cancelled)
			{
				return SetError(ssFailed, "%s: cancelled", address);
			}
			return SetError(ssTransient, "%s: connection closed by remote host", address);
		}

		if (firstLine)
		{
			EStatus status = CheckResponse(line, httpCode);
			if (status != ssOk)
			{
				return SetError(status, "%s failed: %s", address, *m_errorMessage);
			}
			firstLine = false;
			continue;
		}

		// detect body of response
		if (*line == '\r' || *line == '\n')
		{
			break;
		}

		Util::TrimRight(line);
		debug("Header: %s", line);

		if (httpCode / 100 == 3)
		{
			if (!strncasecmp(line, "Location: ", 10))
			{
				const char* location = line + 10;
				if (location[0] == '/')
				{
					m_redirectUrl = CString::FormatStr("http://%s:%i%s", url.GetHost(), port, location);
				}
				else
				{
					m_redirectUrl = location;
				}
			}
			continue;
		}

		ProcessHeader(line);
	}

	// keep the part of the body which was read together with the headers
	char* pending;
	m_connection->ReadBuffer(&pending, &m_pendingLen);
	m_pendingPos = 0;
	if (m_pendingLen > 0)
	{
		m_readBuf.Reserve(m_pendingLen);
		memcpy(m_readBuf, pending, m_pendingLen);
	}

	if (httpCode == 200)
	{
		m_offset = 0;
		m_sizeKnown = m_contentLen >= 0;
		m_size = m_sizeKnown ? m_contentLen : 0;
	}
	else if (httpCode == 206)
	{
		m_offset = offset;
		if (!m_sizeKnown && m_contentLen >= 0)
		{
			m_sizeKnown = true;
			m_size = offset + m_contentLen;
		}
	}

	return ssOk;
}

bool HttpSource::SendHeaders(URL* url, int64 offset)
{
	BString<1024> host = url->GetHost();
	if (url->GetPort() != 80 && url->GetPort() != 0)
	{
		host.AppendFmt(":%i", url->GetPort());
	}

	BString<1024> range;
	if (offset > 0)
	{
		range.Format("Range: bytes=%" PRId64 "-\r\n", offset);
	}

	CString request = CString::FormatStr("GET %s HTTP/1.0\r\n"
		"User-Agent: nexget/%s\r\n"
		"Host: %s\r\n"
		"%s"
		"Accept: */*\r\n"
		"Connection: close\r\n"
		"\r\n",
		url->GetResource(), Util::VersionRevision(), *host, *range);

	return m_connection->WriteLine(request);
}

Source::EStatus HttpSource::CheckResponse(const char* response, int& httpCode)
{
	const char* hTTPResponse = strchr(response, ' ');
	if (strncmp(response, "HTTP", 4) || !hTTPResponse)
	{
		return SetError(ssTransient, "invalid response %s", response);
	}

	hTTPResponse++;
	httpCode = atoi(hTTPResponse);

	BString<1024> status = hTTPResponse;
	Util::TrimRight(status);

	if (httpCode == 200 || httpCode == 206)
	{
		return ssOk;
	}
	else if (httpCode == 301 || httpCode == 302 || httpCode == 303 ||
		httpCode == 307 || httpCode == 308)
	{
		return ssOk;
	}
	else if (httpCode == 408 || httpCode == 429 || httpCode / 100 == 5)
	{
		// server busy or temporary failure, try again later
		return SetError(ssTransient, "HTTP %s", *status);
	}
	else
	{
		// not found, forbidden or unknown error
		return SetError(ssFailed, "HTTP %s", *status);
	}
}

void HttpSource::ProcessHeader(const char* line)
{
	if (!strncasecmp(line, "Content-Length: ", 16))
	{
		m_contentLen = atoll(line + 16);
	}
	else if (!strncasecmp(line, "Content-Range: ", 15))
	{
		// Content-Range: bytes 400-999/1000
		const char* slash = strchr(line + 15, '/');
		if (slash && slash[1] != '*')
		{
			m_size = atoll(slash + 1);
			m_sizeKnown = true;
		}
	}
}

Source::EStatus HttpSource::Read(char* buffer, int size, int& bytesRead)
{
	bytesRead = 0;

	if (m_contentLen >= 0 && m_received >= m_contentLen)
	{
		return ssEof;
	}

	int maxLen = size;
	if (m_contentLen >= 0 && m_contentLen - m_received < maxLen)
	{
		maxLen = (int)(m_contentLen - m_received);
	}

	int len;
	if (m_pendingPos < m_pendingLen)
	{
		// body bytes received together with the headers
		len = std::min(maxLen, m_pendingLen - m_pendingPos);
		memcpy(buffer, m_readBuf + m_pendingPos, len);
		m_pendingPos += len;
	}
	else
	{
		len = m_connection->TryRecv(buffer, maxLen);
	}

	if (len < 0 || m_cancelled)
	{
		return SetError(ssTransient, "%s: %s", *m_url, m_cancelled ? "cancelled" : m_connection->GetLastError());
	}

	if (len == 0)
	{
		if (m_contentLen == -1)
		{
			return ssEof;
		}
		return SetError(ssTransient, "%s: unexpected end of file", *m_url);
	}

	m_received += len;
	bytesRead = len;
	return ssOk;
}

void HttpSource::Close()
{
	FreeConnection();
}

void HttpSource::Cancel()
{
	m_cancelled = true;

	Guard guard(m_connectionMutex);
	if (m_connection)
	{
		m_connection->Cancel();
	}
}

void HttpSource::FreeConnection()
{
	Guard guard(m_connectionMutex);
	if (m_connection)
	{
		m_connection->Disconnect();
		m_connection.reset();
	}
}
