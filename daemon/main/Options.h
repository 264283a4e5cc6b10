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


#ifndef OPTIONS_H
#define OPTIONS_H

#include "NString.h"
#include "Thread.h"
#include "Util.h"

class Options
{
public:
	enum EWriteLog
	{
		wlNone,
		wlAppend,
		wlReset,
		wlRotate
	};
	enum EMessageTarget
	{
		mtNone,
		mtScreen,
		mtLog,
		mtBoth
	};

	class OptEntry
	{
	public:
		OptEntry(const char* name, const char* value) :
			m_name(name), m_value(value) {}
		void SetName(const char* name) { m_name = name; }
		const char* GetName() { return m_name; }
		void SetValue(const char* value);
		const char* GetValue() { return m_value; }
		const char* GetDefValue() { return m_defValue; }
		int GetLineNo() { return m_lineNo; }

	private:
		CString m_name;
		CString m_value;
		CString m_defValue;
		int m_lineNo = 0;

		void SetLineNo(int lineNo) { m_lineNo = lineNo; }

		friend class Options;
	};

	typedef std::deque<OptEntry> OptEntriesBase;

	class OptEntries: public OptEntriesBase
	{
	public:
		OptEntry* FindOption(const char* name);
	};

	typedef GuardedPtr<OptEntries> GuardedOptEntries;
	typedef std::vector<const char*> CmdOptList;

	Options(const char* exeName, const char* configFilename, bool noConfig,
		CmdOptList* commandLineOptions);
	/* Builds options from defaults and command line only, without touching the disk */
	Options(CmdOptList* commandLineOptions);
	~Options();

	bool SplitOptionString(const char* option, CString& optName, CString& optValue);
	bool GetFatalError() { return m_fatalError; }
	GuardedOptEntries GuardOptEntries() { return GuardedOptEntries(&m_optEntries, &m_optEntriesMutex); }

	// Options
	const char* GetConfigFilename() { return m_configFilename; }
	bool GetConfigErrors() { return m_configErrors; }
	const char* GetAppDir() { return m_appDir; }
	const char* GetMainDir() { return m_mainDir; }
	const char* GetDestDir() { return m_destDir; }
	const char* GetTempDir() { return m_tempDir; }
	const char* GetQueueDir() { return m_queueDir; }
	const char* GetLogFile() { return m_logFile; }
	const char* GetLockFile() { return m_lockFile; }
	EWriteLog GetWriteLog() { return m_writeLog; }
	int GetRotateLog() { return m_rotateLog; }
	int GetLogBuffer() { return m_logBuffer; }
	EMessageTarget GetInfoTarget() const { return m_infoTarget; }
	EMessageTarget GetWarningTarget() const { return m_warningTarget; }
	EMessageTarget GetErrorTarget() const { return m_errorTarget; }
	EMessageTarget GetDebugTarget() const { return m_debugTarget; }
	EMessageTarget GetDetailTarget() const { return m_detailTarget; }
	int GetMaxConcurrency() { return m_maxConcurrency; }
	int GetChunkSize() { return m_chunkSize; }
	int GetChunkRetries() { return m_chunkRetries; }
	int GetRetryBaseDelay() { return m_retryBaseDelay; }
	int GetRetryMaxDelay() { return m_retryMaxDelay; }
	int GetTokenWaitInterval() { return m_tokenWaitInterval; }
	int GetProgressInterval() { return m_progressInterval; }
	int GetProgressDelta() { return m_progressDelta; }
	bool GetFlushLedger() { return m_flushLedger; }
	int GetCompletedRetention() { return m_completedRetention; }
	int GetUrlTimeout() { return m_urlTimeout; }
	int GetHighWeight() { return m_highWeight; }
	int GetNormalWeight() { return m_normalWeight; }
	int GetLowWeight() { return m_lowWeight; }

	// Current state
	void SetServerMode(bool serverMode) { m_serverMode = serverMode; }
	bool GetServerMode() { return m_serverMode; }
	void SetDownloadRate(int rate) { m_downloadRate = rate; }
	int GetDownloadRate() const { return m_downloadRate; }

private:
	OptEntries m_optEntries;
	Mutex m_optEntriesMutex;
	bool m_noDiskAccess = false;
	bool m_noConfig = false;
	bool m_fatalError = false;
	bool m_configErrors = false;
	int m_configLine = 0;

	// Options
	CString m_configFilename;
	CString m_appDir;
	CString m_mainDir;
	CString m_destDir;
	CString m_tempDir;
	CString m_queueDir;
	CString m_logFile;
	CString m_lockFile;
	EWriteLog m_writeLog = wlAppend;
	int m_rotateLog = 0;
	int m_logBuffer = 0;
	EMessageTarget m_infoTarget = mtScreen;
	EMessageTarget m_warningTarget = mtScreen;
	EMessageTarget m_errorTarget = mtScreen;
	EMessageTarget m_debugTarget = mtNone;
	EMessageTarget m_detailTarget = mtScreen;
	int m_maxConcurrency = 0;
	int m_chunkSize = 0;
	int m_chunkRetries = 0;
	int m_retryBaseDelay = 0;
	int m_retryMaxDelay = 0;
	int m_tokenWaitInterval = 0;
	int m_progressInterval = 0;
	int m_progressDelta = 0;
	bool m_flushLedger = false;
	int m_completedRetention = 0;
	int m_urlTimeout = 0;
	int m_highWeight = 0;
	int m_normalWeight = 0;
	int m_lowWeight = 0;

	// Current state
	bool m_serverMode = false;
	std::atomic<int> m_downloadRate{0};

	void Init(const char* exeName, const char* configFilename, bool noConfig,
		CmdOptList* commandLineOptions, bool noDiskAccess);
	void InitDefaults();
	void InitOptions();
	void InitOptFile();
	void InitCommandLineOptions(CmdOptList* commandLineOptions);
	void CheckOptions();
	int ParseEnumValue(const char* OptName, int argc, const char* argn[], const int argv[]);
	int ParseIntValue(const char* OptName, int base);
	int ParseRangeValue(const char* OptName, int minValue, int maxValue);
	OptEntry* FindOption(const char* optname);
	const char* GetOption(const char* optname);
	void SetOption(const char* optname, const char* value);
	bool SetOptionString(const char* option);
	bool ValidateOptionName(const char* optname);
	void LoadConfigFile();
	void CheckDir(CString& dir, const char* optionName, const char* parentDir,
		bool allowEmpty, bool create);
	void LocateOptionSrcPos(const char *optionName);
	void ConfigError(const char* msg, ...);
	void ConfigWarn(const char* msg, ...);
};

extern Options* g_Options;

#endif
