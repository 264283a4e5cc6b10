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

#include <catch2/catch.hpp>

#include "HttpSource.h"
#include "Connection.h"
#include "Thread.h"
#include "TestSource.h"

static const int PAYLOAD_SIZE = 1000;

/*
 * Minimal web server on a random local port. Serves the test pattern and
 * a few broken resources, one request per connection.
 */
class TestHttpServer : public Thread
{
public:
	TestHttpServer() : m_listener("127.0.0.1", 0) {}
	bool Bind() { return m_listener.Bind(); }
	int GetPort() { return m_listener.GetLocalPort(); }
	CString Url(const char* resource) { return CString::FormatStr("http://127.0.0.1:%i%s", GetPort(), resource); }
	virtual void Stop();
	int GetRequestCount() { return m_requestCount; }

protected:
	virtual void Run();

private:
	Connection m_listener;
	std::atomic<int> m_requestCount{0};

	void Serve(Connection* connection);
	void SendPayload(Connection* connection, int64 from, int64 count);
};

void TestHttpServer::Stop()
{
	Thread::Stop();
	m_listener.Cancel();
}

void TestHttpServer::Run()
{
	while (!IsStopped())
	{
		std::unique_ptr<Connection> connection = m_listener.Accept();
		if (!connection)
		{
			break;
		}
		Serve(connection.get());
		connection->Disconnect();
	}
}

void TestHttpServer::Serve(Connection* connection)
{
	CharBuffer lineBuf(1024);
	CString resource;
	int64 rangeFrom = -1;

	for (bool firstLine = true; ; firstLine = false)
	{
		char* line = connection->ReadLine(lineBuf, lineBuf.Size(), nullptr);
		if (!line)
		{
			return;
		}
		if (*line == '\r' || *line == '\n')
		{
			break;
		}
		Util::TrimRight(line);

		if (firstLine)
		{
			// GET /resource HTTP/1.0
			char* start = strchr(line, ' ');
			char* end = start ? strchr(start + 1, ' ') : nullptr;
			if (start && end)
			{
				resource.Set(start + 1, (int)(end - start - 1));
			}
		}
		else if (!strncasecmp(line, "Range: bytes=", 13))
		{
			rangeFrom = atoll(line + 13);
		}
	}

	m_requestCount++;

	if (!strcmp(resource, "/game.bin") && rangeFrom > 0)
	{
		BString<1024> headers("HTTP/1.0 206 Partial Content\r\n"
			"Content-Length: %" PRId64 "\r\n"
			"Content-Range: bytes %" PRId64 "-%i/%i\r\n\r\n",
			(int64)PAYLOAD_SIZE - rangeFrom, rangeFrom, PAYLOAD_SIZE - 1, PAYLOAD_SIZE);
		connection->Send(headers, headers.Length());
		SendPayload(connection, rangeFrom, PAYLOAD_SIZE - rangeFrom);
	}
	else if (!strcmp(resource, "/game.bin") || !strcmp(resource, "/norange.bin"))
	{
		BString<1024> headers("HTTP/1.0 200 OK\r\nContent-Length: %i\r\n\r\n", PAYLOAD_SIZE);
		connection->Send(headers, headers.Length());
		SendPayload(connection, 0, PAYLOAD_SIZE);
	}
	else if (!strcmp(resource, "/stream.bin"))
	{
		// no content length, the end of the body is the end of the connection
		const char* headers = "HTTP/1.0 200 OK\r\n\r\n";
		connection->Send(headers, strlen(headers));
		SendPayload(connection, 0, 300);
	}
	else if (!strcmp(resource, "/redirect"))
	{
		const char* headers = "HTTP/1.0 302 Found\r\nLocation: /game.bin\r\n\r\n";
		connection->Send(headers, strlen(headers));
	}
	else if (!strcmp(resource, "/loop"))
	{
		const char* headers = "HTTP/1.0 302 Found\r\nLocation: /loop\r\n\r\n";
		connection->Send(headers, strlen(headers));
	}
	else if (!strcmp(resource, "/busy"))
	{
		const char* headers = "HTTP/1.0 503 Service Unavailable\r\n\r\n";
		connection->Send(headers, strlen(headers));
	}
	else if (!strcmp(resource, "/truncated"))
	{
		BString<1024> headers("HTTP/1.0 200 OK\r\nContent-Length: %i\r\n\r\n", PAYLOAD_SIZE);
		connection->Send(headers, headers.Length());
		SendPayload(connection, 0, 400);
	}
	else
	{
		const char* headers = "HTTP/1.0 404 Not Found\r\n\r\n";
		connection->Send(headers, strlen(headers));
	}
}

void TestHttpServer::SendPayload(Connection* connection, int64 from, int64 count)
{
	CharBuffer data((int)count);
	for (int64 i = 0; i < count; i++)
	{
		data[(int)i] = TestSource::PatternByte(from + i);
	}
	connection->Send(data, (int)count);
}

class ServerRunner
{
public:
	ServerRunner()
	{
		REQUIRE(server.Bind());
		server.Start();
	}
	~ServerRunner()
	{
		server.Stop();
		server.WaitFinished(10000);
	}

	TestHttpServer server;
};

static std::string ReadAll(Source& source, Source::EStatus& lastStatus)
{
	std::string content;
	char buf[128];
	while (true)
	{
		int bytesRead = 0;
		lastStatus = source.Read(buf, sizeof(buf), bytesRead);
		if (lastStatus != Source::ssOk)
		{
			return content;
		}
		content.append(buf, bytesRead);
	}
}

static std::string Pattern(int64 from, int64 count)
{
	std::string content;
	for (int64 i = 0; i < count; i++)
	{
		content += TestSource::PatternByte(from + i);
	}
	return content;
}

TEST_CASE("HttpSource: whole resource", "[HttpSource][Slow]")
{
	ServerRunner runner;
	HttpSource source(runner.server.Url("/game.bin"));
	source.SetTimeout(5);

	REQUIRE(source.Open(0) == Source::ssOk);
	REQUIRE(source.GetOffset() == 0);
	REQUIRE(source.GetSizeKnown());
	REQUIRE(source.GetSize() == PAYLOAD_SIZE);

	Source::EStatus status;
	std::string content = ReadAll(source, status);
	source.Close();

	REQUIRE(status == Source::ssEof);
	REQUIRE(content == Pattern(0, PAYLOAD_SIZE));
}

TEST_CASE("HttpSource: resuming with range request", "[HttpSource][Slow]")
{
	ServerRunner runner;
	HttpSource source(runner.server.Url("/game.bin"));
	source.SetTimeout(5);

	REQUIRE(source.Open(400) == Source::ssOk);
	REQUIRE(source.GetOffset() == 400);
	REQUIRE(source.GetSizeKnown());
	REQUIRE(source.GetSize() == PAYLOAD_SIZE);

	Source::EStatus status;
	std::string content = ReadAll(source, status);
	source.Close();

	REQUIRE(status == Source::ssEof);
	REQUIRE(content == Pattern(400, PAYLOAD_SIZE - 400));
}

TEST_CASE("HttpSource: server ignoring range starts from zero", "[HttpSource][Slow]")
{
	ServerRunner runner;
	HttpSource source(runner.server.Url("/norange.bin"));
	source.SetTimeout(5);

	REQUIRE(source.Open(400) == Source::ssOk);
	REQUIRE(source.GetOffset() == 0);
	REQUIRE(source.GetSize() == PAYLOAD_SIZE);

	Source::EStatus status;
	std::string content = ReadAll(source, status);
	source.Close();
	REQUIRE(content == Pattern(0, PAYLOAD_SIZE));
}

TEST_CASE("HttpSource: content without length", "[HttpSource][Slow]")
{
	ServerRunner runner;
	HttpSource source(runner.server.Url("/stream.bin"));
	source.SetTimeout(5);

	REQUIRE(source.Open(0) == Source::ssOk);
	REQUIRE_FALSE(source.GetSizeKnown());

	Source::EStatus status;
	std::string content = ReadAll(source, status);
	source.Close();

	REQUIRE(status == Source::ssEof);
	REQUIRE(content == Pattern(0, 300));
}

TEST_CASE("HttpSource: following redirects", "[HttpSource][Slow]")
{
	ServerRunner runner;

	HttpSource source(runner.server.Url("/redirect"));
	source.SetTimeout(5);
	REQUIRE(source.Open(0) == Source::ssOk);
	REQUIRE(source.GetSize() == PAYLOAD_SIZE);
	source.Close();
	REQUIRE(runner.server.GetRequestCount() == 2);

	HttpSource loop(runner.server.Url("/loop"));
	loop.SetTimeout(5);
	REQUIRE(loop.Open(0) == Source::ssFailed);
	REQUIRE(std::string(loop.GetErrorMessage()).find("too many redirects") != std::string::npos);
}

TEST_CASE("HttpSource: classifying errors", "[HttpSource][Slow]")
{
	ServerRunner runner;

	HttpSource missing(runner.server.Url("/missing"));
	missing.SetTimeout(5);
	REQUIRE(missing.Open(0) == Source::ssFailed);
	REQUIRE(std::string(missing.GetErrorMessage()).find("404") != std::string::npos);

	HttpSource busy(runner.server.Url("/busy"));
	busy.SetTimeout(5);
	REQUIRE(busy.Open(0) == Source::ssTransient);

	HttpSource ftp("ftp://127.0.0.1/game.bin");
	REQUIRE(ftp.Open(0) == Source::ssFailed);
}

TEST_CASE("HttpSource: connection closed too early", "[HttpSource][Slow]")
{
	ServerRunner runner;
	HttpSource source(runner.server.Url("/truncated"));
	source.SetTimeout(5);

	REQUIRE(source.Open(0) == Source::ssOk);

	Source::EStatus status;
	std::string content = ReadAll(source, status);
	source.Close();

	REQUIRE(status == Source::ssTransient);
	REQUIRE(content == Pattern(0, 400));
	REQUIRE(std::string(source.GetErrorMessage()).find("unexpected end of file") != std::string::npos);
}
