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


#ifndef LOG_H
#define LOG_H

#include "NString.h"
#include "Thread.h"

void error(const char* msg, ...) PRINTF_SYNTAX(1);
void warn(const char* msg, ...) PRINTF_SYNTAX(1);
void info(const char* msg, ...) PRINTF_SYNTAX(1);
void detail(const char* msg, ...) PRINTF_SYNTAX(1);

#ifdef DEBUG
void debug(const char* filename, const char* funcname, int lineNr, const char* msg, ...) PRINTF_SYNTAX(4);
#endif

/* One entry of the screen buffer; ids grow by one per message */
class Message
{
public:
	enum EKind
	{
		mkInfo,
		mkWarning,
		mkError,
		mkDebug,
		mkDetail
	};

	Message(uint32 id, EKind kind, const char* text) :
		m_id(id), m_kind(kind), m_text(text) {}
	uint32 GetId() { return m_id; }
	EKind GetKind() { return m_kind; }
	const char* GetText() { return m_text; }

private:
	uint32 m_id;
	EKind m_kind;
	CString m_text;

	friend class Log;
};

typedef std::deque<Message> MessageList;
typedef GuardedPtr<MessageList> GuardedMessageList;

class DiskFile;

/*
 * Sink of all messages. Each kind goes to the screen buffer, the log-file,
 * both or nowhere as told by the "*Target" options.
 */
class Log
{
public:
	Log();
	~Log();
	GuardedMessageList GuardMessages() { return GuardedMessageList(&m_messages, &m_logMutex); }
	/* Applies log options to messages collected during startup */
	void InitOptions();

private:
	Mutex m_logMutex;
	MessageList m_messages;
	CString m_logFilename;
	std::unique_ptr<DiskFile> m_logFile;
	uint32 m_idGen = 0;
	time_t m_lastWritten = 0;
	bool m_optInit = false;

	void WriteToFile(Message::EKind kind, const char* text);
	void AddMessage(Message::EKind kind, const char* text);
	void SwitchDailyFile();
	void Dispatch(Message::EKind kind, const char* format, va_list ap);

	friend void error(const char* msg, ...);
	friend void warn(const char* msg, ...);
	friend void info(const char* msg, ...);
	friend void detail(const char* msg, ...);
#ifdef DEBUG
	friend void debug(const char* filename, const char* funcname, int lineNr, const char* msg, ...);
#endif
};

#ifdef DEBUG
#define debug(...) debug(__FILE__, __func__, __LINE__, __VA_ARGS__)
#else
#define debug(...) do { } while(0)
#endif

extern Log* g_Log;

#endif
