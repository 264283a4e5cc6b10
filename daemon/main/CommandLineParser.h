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


#ifndef COMMANDLINEPARSER_H
#define COMMANDLINEPARSER_H

#include "NString.h"
#include "JobInfo.h"

class CommandLineParser
{
public:
	enum EOperation
	{
		opNoOperation,
		opAddDownload,
		opListDownloads,
		opEditDownloads,
		opPauseAll,
		opResumeAll
	};
	enum EEditAction
	{
		eaPause,
		eaResume,
		eaCancel,
		eaRetry
	};

	typedef std::vector<int> IdList;
	typedef std::vector<CString> NameList;

	CommandLineParser(int argc, const char* argv[]);
	void PrintUsage(const char* com);
	bool GetErrors() { return m_errors; }
	bool GetNoConfig() { return m_noConfig; }
	const char* GetConfigFilename() { return m_configFilename; }
	bool GetServerMode() { return m_serverMode; }
	bool GetDaemonMode() { return m_daemonMode; }
	EOperation GetOperation() { return m_operation; }
	NameList* GetOptionList() { return &m_optionList; }
	EEditAction GetEditAction() { return m_editAction; }
	IdList* GetEditIdList() { return &m_editIdList; }
	const char* GetSourceRef() { return m_sourceRef; }
	JobInfo::EPriority GetAddPriority() { return m_addPriority; }
	const char* GetAddTitle() { return m_addTitle; }
	/* Bytes per second, -1 if not given */
	int GetSetRate() { return m_setRate; }
	bool GetPrintOptions() { return m_printOptions; }
	bool GetPrintVersion() { return m_printVersion; }
	bool GetPrintUsage() { return m_printUsage; }

private:
	bool m_noConfig = false;
	CString m_configFilename;

	// Parsed command-line parameters
	bool m_errors = false;
	bool m_printVersion = false;
	bool m_printUsage = false;
	bool m_printOptions = false;
	bool m_serverMode = false;
	bool m_daemonMode = false;
	EOperation m_operation = opNoOperation;
	NameList m_optionList;
	EEditAction m_editAction = eaPause;
	IdList m_editIdList;
	CString m_sourceRef;
	JobInfo::EPriority m_addPriority = JobInfo::jpNormal;
	CString m_addTitle;
	int m_setRate = -1;

	void InitCommandLine(int argc, const char* argv[]);
	void InitFileArg(int argc, const char* argv[]);
	void ParseIdList(int argc, const char* argv[], int optind);
	void ReportError(const char* errMessage);
};

#endif
