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


#ifndef CONNECTION_H
#define CONNECTION_H

#include "NString.h"

/*
 * Blocking TCP stream with line-oriented reading, used by the web source.
 * A listening connection (Bind + Accept) serves local endpoints.
 * Errors are kept in GetLastError() and logged at debug level only,
 * callers decide how to report them.
 */
class Connection
{
public:
	enum EStatus
	{
		csConnected,
		csDisconnected,
		csListening,
		csCancelled,
		csBroken
	};

	Connection(const char* host, int port);
	Connection(SOCKET socket);
	~Connection();
	bool Connect();
	bool Disconnect();
	bool Bind();
	std::unique_ptr<Connection> Accept();
	/* Interrupts a blocking call made by another thread */
	void Cancel();
	bool Send(const char* buffer, int size);
	bool WriteLine(const char* line) { return Send(line, (int)strlen(line)); }
	/* Returns nullptr on end of stream or error, the line keeps its '\n' */
	char* ReadLine(char* buffer, int size, int* bytesRead);
	/* Hands over the bytes buffered by ReadLine but not yet consumed */
	void ReadBuffer(char** buffer, int* bufLen);
	int TryRecv(char* buffer, int size);
	/* Port of a listening socket, useful after binding to port 0 */
	int GetLocalPort();
	void SetTimeout(int timeout) { m_timeout = timeout; }
	EStatus GetStatus() { return m_status; }
	const char* GetLastError() { return m_lastError; }

private:
	CString m_host;
	int m_port;
	SOCKET m_socket = INVALID_SOCKET;
	CharBuffer m_readBuf;
	int m_bufAvail = 0;
	char* m_bufPtr = nullptr;
	std::atomic<EStatus> m_status{csDisconnected};
	int m_timeout = 60;
	BString<1024> m_lastError;

	bool Resolve(bool passive, struct addrinfo** addrList);
	bool ConnectWithTimeout(struct sockaddr* address, socklen_t addressLen);
	bool SetSocketTimeouts(SOCKET socket);
	void CloseSocket();
	void ReportError(const char* format, ...) PRINTF_SYNTAX(2);
};

#endif
