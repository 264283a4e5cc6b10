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
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

Log* g_Log = nullptr;

static const char* MESSAGE_TYPE_NAMES[] = { "INFO", "WARNING", "ERROR", "DEBUG", "DETAIL" };

// before options are loaded everything goes to the screen buffer
static Options::EMessageTarget MessageTarget(Message::EKind kind)
{
	if (!g_Options)
	{
		return Options::mtScreen;
	}

	switch (kind)
	{
		case Message::mkError:
			return g_Options->GetErrorTarget();
		case Message::mkWarning:
			return g_Options->GetWarningTarget();
		case Message::mkDetail:
			return g_Options->GetDetailTarget();
		case Message::mkDebug:
			return g_Options->GetDebugTarget();
		case Message::mkInfo:
			break;
	}
	return g_Options->GetInfoTarget();
}

static bool ToScreen(Options::EMessageTarget target)
{
	return target == Options::mtScreen || target == Options::mtBoth;
}

static bool ToFile(Options::EMessageTarget target)
{
	return target == Options::mtLog || target == Options::mtBoth;
}

Log::Log()
{
	g_Log = this;
}

Log::~Log()
{
	g_Log = nullptr;
}

void Log::WriteToFile(Message::EKind kind, const char* text)
{
	if (m_logFilename.Empty())
	{
		return;
	}

	time_t now = Util::CurrentTime();
	bool newDay = now / 86400 != m_lastWritten / 86400;
	m_lastWritten = now;

	if (newDay && g_Options && g_Options->GetWriteLog() == Options::wlRotate)
	{
		m_logFile.reset();
		SwitchDailyFile();
	}

	if (!m_logFile)
	{
		m_logFile = std::make_unique<DiskFile>();
		if (!m_logFile->Open(m_logFilename, DiskFile::omAppend))
		{
			perror(m_logFilename);
			m_logFile.reset();
			return;
		}
	}

	char timestamp[50];
	Util::FormatTime(now, timestamp, sizeof(timestamp));
	m_logFile->Print("%s\t%s\t%s%s", timestamp, MESSAGE_TYPE_NAMES[kind], text, LINE_ENDING);
	m_logFile->Flush();
}

void Log::Dispatch(Message::EKind kind, const char* format, va_list ap)
{
	Options::EMessageTarget target = MessageTarget(kind);
	if (target == Options::mtNone)
	{
		return;
	}

	CString text;
	text.FormatV(format, ap);

	Guard guard(m_logMutex);
	if (ToScreen(target))
	{
		AddMessage(kind, text);
	}
	if (ToFile(target))
	{
		WriteToFile(kind, text);
	}
}

#ifdef DEBUG
#undef debug
void debug(const char* filename, const char* funcname, int lineNr, const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	Options::EMessageTarget target = MessageTarget(Message::mkDebug);
	if (target == Options::mtNone)
	{
		return;
	}

	CString text;
	va_list ap;
	va_start(ap, msg);
	text.FormatV(msg, ap);
	va_end(ap);
	text.AppendFmt(" (%s:%i:%s)", FileSystem::BaseFileName(filename), lineNr, funcname ? funcname : "");

	Guard guard(g_Log->m_logMutex);
	if (ToScreen(target))
	{
		g_Log->AddMessage(Message::mkDebug, text);
	}
	if (ToFile(target))
	{
		g_Log->WriteToFile(Message::mkDebug, text);
	}
}
#endif

void error(const char* msg, ...)
{
	if (g_Log)
	{
		va_list ap;
		va_start(ap, msg);
		g_Log->Dispatch(Message::mkError, msg, ap);
		va_end(ap);
	}
}

void warn(const char* msg, ...)
{
	if (g_Log)
	{
		va_list ap;
		va_start(ap, msg);
		g_Log->Dispatch(Message::mkWarning, msg, ap);
		va_end(ap);
	}
}

void info(const char* msg, ...)
{
	if (g_Log)
	{
		va_list ap;
		va_start(ap, msg);
		g_Log->Dispatch(Message::mkInfo, msg, ap);
		va_end(ap);
	}
}

void detail(const char* msg, ...)
{
	if (g_Log)
	{
		va_list ap;
		va_start(ap, msg);
		g_Log->Dispatch(Message::mkDetail, msg, ap);
		va_end(ap);
	}
}

void Log::AddMessage(Message::EKind kind, const char* text)
{
	m_messages.emplace_back(++m_idGen, kind, text);

	if (m_optInit && g_Options)
	{
		while (m_messages.size() > (uint32)g_Options->GetLogBuffer())
		{
			m_messages.pop_front();
		}
	}
}

/*
 * Switches to the log-file of the current day ("name-YYYY-MM-DD.ext")
 * and deletes daily files older than option "RotateLog".
 */
void Log::SwitchDailyFile()
{
	BString<1024> directory = g_Options->GetLogFile();

	// split the full filename into path, basename and extension
	char* baseName = FileSystem::BaseFileName(directory);
	if (baseName > directory)
	{
		baseName[-1] = '\0';
	}

	BString<1024> baseExt;
	char* ext = strrchr(baseName, '.');
	if (ext && ext > baseName)
	{
		baseExt = ext;
		ext[0] = '\0';
	}

	time_t curTime = Util::CurrentTime();
	int curDay = (int)curTime / 86400;
	int baseLen = strlen(baseName);
	int extLen = baseExt.Length();

	DirBrowser dir(directory);
	while (const char* filename = dir.Next())
	{
		// expected form: <baseName>-YYYY-MM-DD<baseExt>
		int len = strlen(filename);
		if (len != baseLen + 11 + extLen ||
			strncmp(filename, baseName, baseLen) || filename[baseLen] != '-' ||
			strcmp(filename + baseLen + 11, baseExt))
		{
			continue;
		}

		struct tm tm;
		memset(&tm, 0, sizeof(tm));
		if (sscanf(filename + baseLen + 1, "%4d-%2d-%2d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday) != 3)
		{
			continue;
		}
		tm.tm_year -= 1900;
		tm.tm_mon -= 1;
		int fileDay = (int)timegm(&tm) / 86400;

		if (fileDay <= curDay - g_Options->GetRotateLog())
		{
			AddMessage(Message::mkInfo, BString<1024>("Deleting old log-file %s", filename));
			FileSystem::DeleteFile(BString<1024>("%s%c%s", *directory, PATH_SEPARATOR, filename));
		}
	}

	struct tm tm;
	gmtime_r(&curTime, &tm);
	m_logFilename.Format("%s%c%s-%i-%.2i-%.2i%s", *directory, PATH_SEPARATOR,
		baseName, tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, *baseExt);
}

/*
 * Startup messages are written into the log-file where requested,
 * dropped from the screen buffer where not requested and renumbered.
 */
void Log::InitOptions()
{
	Guard guard(m_logMutex);

	if (g_Options->GetWriteLog() != Options::wlNone && !Util::EmptyStr(g_Options->GetLogFile()))
	{
		m_logFilename = g_Options->GetLogFile();
		if (g_Options->GetServerMode() && g_Options->GetWriteLog() == Options::wlReset)
		{
			FileSystem::DeleteFile(m_logFilename);
		}
	}

	m_idGen = 0;

	for (MessageList::iterator it = m_messages.begin(); it != m_messages.end(); )
	{
		Options::EMessageTarget target = MessageTarget(it->GetKind());

		if (ToFile(target))
		{
			WriteToFile(it->GetKind(), it->GetText());
		}

		if (ToScreen(target))
		{
			it->m_id = ++m_idGen;
			it++;
		}
		else
		{
			it = m_messages.erase(it);
		}
	}

	m_optInit = true;
}
