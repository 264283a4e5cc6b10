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
#include "Connection.h"
#include "Log.h"

static const int READBUFFER_SIZE = 4096;

Connection::Connection(const char* host, int port) :
	m_host(host), m_port(port)
{
	m_readBuf.Reserve(READBUFFER_SIZE + 1);
}

Connection::Connection(SOCKET socket) :
	m_host("client"), m_port(0), m_socket(socket)
{
	m_status = csConnected;
	m_readBuf.Reserve(READBUFFER_SIZE + 1);
}

Connection::~Connection()
{
	Disconnect();
}

void Connection::ReportError(const char* format, ...)
{
	int errcode = errno;

	BString<1024> prefix;
	va_list ap;
	va_start(ap, format);
	prefix.FormatV(format, ap);
	va_end(ap);

	m_lastError.Format("%s: %s", *prefix, strerror(errcode));
	debug("%s", *m_lastError);
}

bool Connection::Resolve(bool passive, struct addrinfo** addrList)
{
	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	if (passive)
	{
		hints.ai_flags = AI_PASSIVE;
	}

	BString<16> portStr("%i", m_port);
	int res = getaddrinfo(m_host, portStr, &hints, addrList);
	if (res != 0)
	{
		m_lastError.Format("Could not resolve hostname %s: %s", *m_host,
			res == EAI_SYSTEM ? strerror(errno) : gai_strerror(res));
		debug("%s", *m_lastError);
		return false;
	}

	return true;
}

bool Connection::Connect()
{
	if (m_status == csConnected)
	{
		return true;
	}

	debug("Connecting to %s:%i", *m_host, m_port);

	struct addrinfo* addrList;
	if (!Resolve(false, &addrList))
	{
		return false;
	}

	for (struct addrinfo* addr = addrList; addr; addr = addr->ai_next)
	{
		m_socket = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
		if (m_socket == INVALID_SOCKET)
		{
			ReportError("Socket creation failed for %s", *m_host);
			continue;
		}

		if (ConnectWithTimeout(addr->ai_addr, addr->ai_addrlen) && SetSocketTimeouts(m_socket))
		{
			break;
		}

		CloseSocket();
	}

	freeaddrinfo(addrList);

	if (m_socket == INVALID_SOCKET)
	{
		return false;
	}

	m_status = csConnected;
	m_bufAvail = 0;
	return true;
}

bool Connection::ConnectWithTimeout(struct sockaddr* address, socklen_t addressLen)
{
	int flags = fcntl(m_socket, F_GETFL, 0);
	if (flags < 0 || fcntl(m_socket, F_SETFL, flags | O_NONBLOCK) < 0)
	{
		ReportError("Could not prepare socket for %s", *m_host);
		return false;
	}

	if (connect(m_socket, address, addressLen) < 0)
	{
		if (errno != EINPROGRESS)
		{
			ReportError("Connection to %s failed", *m_host);
			return false;
		}

		fd_set wset;
		FD_ZERO(&wset);
		FD_SET(m_socket, &wset);
		struct timeval tv;
		tv.tv_sec = m_timeout;
		tv.tv_usec = 0;

		int res = select((int)m_socket + 1, nullptr, &wset, nullptr, m_timeout ? &tv : nullptr);
		if (res == 0)
		{
			errno = ETIMEDOUT;
		}
		if (res <= 0)
		{
			ReportError("Connection to %s failed", *m_host);
			return false;
		}

		int sockError = 0;
		socklen_t len = sizeof(sockError);
		if (getsockopt(m_socket, SOL_SOCKET, SO_ERROR, &sockError, &len) < 0 || sockError)
		{
			if (sockError)
			{
				errno = sockError;
			}
			ReportError("Connection to %s failed", *m_host);
			return false;
		}
	}

	// back to blocking mode, reads are limited by SO_RCVTIMEO
	if (fcntl(m_socket, F_SETFL, flags) < 0)
	{
		ReportError("Could not prepare socket for %s", *m_host);
		return false;
	}

	return true;
}

bool Connection::SetSocketTimeouts(SOCKET socket)
{
	struct timeval tv;
	tv.tv_sec = m_timeout;
	tv.tv_usec = 0;

	if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
		setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
	{
		ReportError("Socket initialization failed for %s", *m_host);
		return false;
	}

	return true;
}

void Connection::CloseSocket()
{
	if (m_socket != INVALID_SOCKET)
	{
		closesocket(m_socket);
		m_socket = INVALID_SOCKET;
	}
}

bool Connection::Disconnect()
{
	if (m_status == csDisconnected)
	{
		return true;
	}

	CloseSocket();
	m_status = csDisconnected;
	m_bufAvail = 0;
	return true;
}

bool Connection::Bind()
{
	if (m_status == csListening)
	{
		return true;
	}

	struct addrinfo* addrList;
	if (!Resolve(true, &addrList))
	{
		return false;
	}

	for (struct addrinfo* addr = addrList; addr; addr = addr->ai_next)
	{
		m_socket = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
		if (m_socket == INVALID_SOCKET)
		{
			continue;
		}

		int opt = 1;
		setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
		if (bind(m_socket, addr->ai_addr, addr->ai_addrlen) == 0)
		{
			break;
		}

		ReportError("Binding socket failed for %s", *m_host);
		CloseSocket();
	}

	freeaddrinfo(addrList);

	if (m_socket == INVALID_SOCKET)
	{
		return false;
	}

	if (listen(m_socket, 100) < 0)
	{
		ReportError("Listen on socket failed for %s", *m_host);
		CloseSocket();
		return false;
	}

	m_status = csListening;
	return true;
}

std::unique_ptr<Connection> Connection::Accept()
{
	if (m_status != csListening)
	{
		return nullptr;
	}

	SOCKET socket = accept(m_socket, nullptr, nullptr);
	if (socket == INVALID_SOCKET)
	{
		if (m_status != csCancelled)
		{
			ReportError("Could not accept connection for %s", *m_host);
		}
		return nullptr;
	}

	std::unique_ptr<Connection> connection = std::make_unique<Connection>(socket);
	connection->SetTimeout(m_timeout);
	if (!connection->SetSocketTimeouts(socket))
	{
		m_lastError = connection->GetLastError();
		return nullptr;
	}
	return connection;
}

/*
 * The socket itself stays open until the owner calls Disconnect().
 */
void Connection::Cancel()
{
	debug("Cancelling connection to %s", *m_host);

	if (m_socket != INVALID_SOCKET)
	{
		m_status = csCancelled;
		shutdown(m_socket, SHUT_RDWR);
	}
}

int Connection::GetLocalPort()
{
	struct sockaddr_storage addr;
	socklen_t addrLen = sizeof(addr);
	if (getsockname(m_socket, (struct sockaddr*)&addr, &addrLen) < 0)
	{
		return 0;
	}

	if (addr.ss_family == AF_INET6)
	{
		return ntohs(((struct sockaddr_in6*)&addr)->sin6_port);
	}
	return ntohs(((struct sockaddr_in*)&addr)->sin_port);
}

bool Connection::Send(const char* buffer, int size)
{
	if (m_status != csConnected)
	{
		return false;
	}

	for (int sent = 0; sent < size; )
	{
		int res = send(m_socket, buffer + sent, size - sent, MSG_NOSIGNAL);
		if (res <= 0)
		{
			ReportError("Could not send data to %s", *m_host);
			m_status = csBroken;
			return false;
		}
		sent += res;
	}

	return true;
}

char* Connection::ReadLine(char* buffer, int size, int* bytesRead)
{
	if (m_status != csConnected)
	{
		return nullptr;
	}

	int len = 0;
	bool eol = false;

	// one byte is reserved for the terminating zero
	while (len < size - 1 && !eol)
	{
		if (m_bufAvail == 0)
		{
			int received = recv(m_socket, m_readBuf, READBUFFER_SIZE, 0);
			if (received < 0)
			{
				ReportError("Could not receive data from %s", *m_host);
				m_status = csBroken;
				break;
			}
			if (received == 0)
			{
				break;
			}
			m_bufPtr = m_readBuf;
			m_bufAvail = received;
		}

		int count = std::min(m_bufAvail, size - 1 - len);
		char* newline = (char*)memchr(m_bufPtr, '\n', count);
		if (newline)
		{
			count = (int)(newline - m_bufPtr + 1);
			eol = true;
		}

		memcpy(buffer + len, m_bufPtr, count);
		len += count;
		m_bufPtr += count;
		m_bufAvail -= count;
	}

	buffer[len] = '\0';

	if (bytesRead)
	{
		*bytesRead = len;
	}

	return len > 0 ? buffer : nullptr;
}

void Connection::ReadBuffer(char** buffer, int* bufLen)
{
	*buffer = m_bufPtr;
	*bufLen = m_bufAvail;
	m_bufAvail = 0;
}

int Connection::TryRecv(char* buffer, int size)
{
	int received = recv(m_socket, buffer, size, 0);
	if (received < 0)
	{
		ReportError("Could not receive data from %s", *m_host);
	}
	return received;
}
