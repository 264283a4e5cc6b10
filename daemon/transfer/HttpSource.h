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


#ifndef HTTPSOURCE_H
#define HTTPSOURCE_H

#include "Source.h"
#include "Connection.h"
#include "Thread.h"
#include "Util.h"

/*
 * Web resource fetched with HTTP/1.0 GET.
 * A resume position is requested with header "Range"; a server answering
 * with the whole content restarts the transfer from zero.
 */
class HttpSource : public Source
{
public:
	HttpSource(const char* url) : m_url(url) {}
	virtual EStatus Open(int64 offset);
	virtual EStatus Read(char* buffer, int size, int& bytesRead);
	virtual void Close();
	virtual void Cancel();
	void SetTimeout(int timeout) { m_timeout = timeout; }

private:
	CString m_url;
	int m_timeout = 60;
	std::unique_ptr<Connection> m_connection;
	Mutex m_connectionMutex;
	std::atomic<bool> m_cancelled{false};
	int64 m_contentLen = -1;
	int64 m_received = 0;
	CString m_redirectUrl;
	CharBuffer m_readBuf;
	int m_pendingLen = 0;
	int m_pendingPos = 0;

	EStatus Request(const char* address, int64 offset, int& httpCode);
	bool SendHeaders(URL* url, int64 offset);
	EStatus CheckResponse(const char* response, int& httpCode);
	void ProcessHeader(const char* line);
	void FreeConnection();
};

#endif
