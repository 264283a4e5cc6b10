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
#include "Util.h"
#include "FileSystem.h"
#include "Options.h"
#include "Log.h"

// Program options
static const char* OPTION_CONFIGFILE			= "ConfigFile";
static const char* OPTION_APPBIN				= "AppBin";
static const char* OPTION_APPDIR				= "AppDir";
static const char* OPTION_VERSION				= "Version";
static const char* OPTION_MAINDIR				= "MainDir";
static const char* OPTION_DESTDIR				= "DestDir";
static const char* OPTION_TEMPDIR				= "TempDir";
static const char* OPTION_QUEUEDIR				= "QueueDir";
static const char* OPTION_LOGFILE				= "LogFile";
static const char* OPTION_LOCKFILE				= "LockFile";
static const char* OPTION_WRITELOG				= "WriteLog";
static const char* OPTION_ROTATELOG				= "RotateLog";
static const char* OPTION_LOGBUFFER				= "LogBuffer";
static const char* OPTION_INFOTARGET			= "InfoTarget";
static const char* OPTION_WARNINGTARGET			= "WarningTarget";
static const char* OPTION_ERRORTARGET			= "ErrorTarget";
static const char* OPTION_DEBUGTARGET			= "DebugTarget";
static const char* OPTION_DETAILTARGET			= "DetailTarget";
static const char* OPTION_MAXCONCURRENCY		= "MaxConcurrency";
static const char* OPTION_DOWNLOADRATE			= "DownloadRate";
static const char* OPTION_CHUNKSIZE				= "ChunkSize";
static const char* OPTION_CHUNKRETRIES			= "ChunkRetries";
static const char* OPTION_RETRYBASEDELAY		= "RetryBaseDelay";
static const char* OPTION_RETRYMAXDELAY			= "RetryMaxDelay";
static const char* OPTION_TOKENWAITINTERVAL		= "TokenWaitInterval";
static const char* OPTION_PROGRESSINTERVAL		= "ProgressInterval";
static const char* OPTION_PROGRESSDELTA			= "ProgressDelta";
static const char* OPTION_FLUSHLEDGER			= "FlushLedger";
static const char* OPTION_COMPLETEDRETENTION	= "CompletedRetention";
static const char* OPTION_URLTIMEOUT			= "UrlTimeout";
static const char* OPTION_HIGHWEIGHT			= "HighWeight";
static const char* OPTION_NORMALWEIGHT			= "NormalWeight";
static const char* OPTION_LOWWEIGHT				= "LowWeight";

const char* BoolNames[] = { "yes", "no", "true", "false", "1", "0", "on", "off", "enable", "disable", "enabled", "disabled" };
const int BoolValues[] = { 1, 0, 1, 0, 1, 0, 1, 0, 1, 0, 1, 0 };
const int BoolCount = 12;

const char* PossibleConfigLocations[] =
	{
		"~/.nexget",
		"/etc/nexget.conf",
		"/usr/etc/nexget.conf",
		"/usr/local/etc/nexget.conf",
		"/opt/etc/nexget.conf",
		nullptr
	};

Options* g_Options = nullptr;

void Options::OptEntry::SetValue(const char* value)
{
	m_value = value;
	if (!m_defValue)
	{
		m_defValue = value;
	}
}

Options::OptEntry* Options::OptEntries::FindOption(const char* name)
{
	if (!name)
	{
		return nullptr;
	}

	for (OptEntry& optEntry : *this)
	{
		if (!strcasecmp(optEntry.GetName(), name))
		{
			return &optEntry;
		}
	}

	return nullptr;
}


Options::Options(const char* exeName, const char* configFilename, bool noConfig,
	CmdOptList* commandLineOptions)
{
	Init(exeName, configFilename, noConfig, commandLineOptions, false);
}

Options::Options(CmdOptList* commandLineOptions)
{
	Init("nexget/nexget", nullptr, true, commandLineOptions, true);
}

void Options::Init(const char* exeName, const char* configFilename, bool noConfig,
	CmdOptList* commandLineOptions, bool noDiskAccess)
{
	g_Options = this;
	m_noDiskAccess = noDiskAccess;
	m_noConfig = noConfig;
	m_configFilename = configFilename;

	SetOption(OPTION_CONFIGFILE, "");

	CString filename;
	if (m_noDiskAccess)
	{
		filename = exeName;
	}
	else
	{
		filename = FileSystem::GetExeFileName(exeName);
	}
	FileSystem::NormalizePathSeparators(filename);
	SetOption(OPTION_APPBIN, filename);
	char* end = strrchr(filename, PATH_SEPARATOR);
	if (end) *end = '\0';
	SetOption(OPTION_APPDIR, filename);
	m_appDir = *filename;

	SetOption(OPTION_VERSION, Util::VersionRevision());

	InitDefaults();

	InitOptFile();
	if (m_fatalError)
	{
		return;
	}

	if (commandLineOptions)
	{
		InitCommandLineOptions(commandLineOptions);
	}

	if (!m_configFilename && !noConfig)
	{
		printf("No configuration-file found\n");
		printf("Please use option \"-c\" or put configuration-file in one of the following locations:\n");
		int p = 0;
		while (const char* filename = PossibleConfigLocations[p++])
		{
			printf("%s\n", filename);
		}
		m_fatalError = true;
		return;
	}

	InitOptions();
	CheckOptions();
}

Options::~Options()
{
	g_Options = nullptr;
}

void Options::ConfigError(const char* msg, ...)
{
	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	const char* configName = m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>";
	printf("%s(%i): %s\n", configName, m_configLine, tmp2);
	error("%s(%i): %s", configName, m_configLine, tmp2);

	m_configErrors = true;
}

void Options::ConfigWarn(const char* msg, ...)
{
	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	const char* configName = m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>";
	printf("%s(%i): %s\n", configName, m_configLine, tmp2);
	warn("%s(%i): %s", configName, m_configLine, tmp2);
}

void Options::LocateOptionSrcPos(const char *optionName)
{
	OptEntry* optEntry = FindOption(optionName);
	m_configLine = optEntry ? optEntry->GetLineNo() : 0;
}

void Options::InitDefaults()
{
	SetOption(OPTION_MAINDIR, "~/nexget");
	SetOption(OPTION_DESTDIR, "${MainDir}/dst");
	SetOption(OPTION_TEMPDIR, "${MainDir}/tmp");
	SetOption(OPTION_QUEUEDIR, "${MainDir}/queue");
	SetOption(OPTION_LOGFILE, "${MainDir}/nexget.log");
	SetOption(OPTION_LOCKFILE, "${MainDir}/nexget.lock");
	SetOption(OPTION_WRITELOG, "append");
	SetOption(OPTION_ROTATELOG, "3");
	SetOption(OPTION_LOGBUFFER, "1000");
	SetOption(OPTION_INFOTARGET, "both");
	SetOption(OPTION_WARNINGTARGET, "both");
	SetOption(OPTION_ERRORTARGET, "both");
	SetOption(OPTION_DEBUGTARGET, "none");
	SetOption(OPTION_DETAILTARGET, "log");
	SetOption(OPTION_MAXCONCURRENCY, "2");
	SetOption(OPTION_DOWNLOADRATE, "0");
	SetOption(OPTION_CHUNKSIZE, "256");
	SetOption(OPTION_CHUNKRETRIES, "3");
	SetOption(OPTION_RETRYBASEDELAY, "500");
	SetOption(OPTION_RETRYMAXDELAY, "10000");
	SetOption(OPTION_TOKENWAITINTERVAL, "100");
	SetOption(OPTION_PROGRESSINTERVAL, "500");
	SetOption(OPTION_PROGRESSDELTA, "1");
	SetOption(OPTION_FLUSHLEDGER, "yes");
	SetOption(OPTION_COMPLETEDRETENTION, "86400");
	SetOption(OPTION_URLTIMEOUT, "60");
	SetOption(OPTION_HIGHWEIGHT, "4");
	SetOption(OPTION_NORMALWEIGHT, "2");
	SetOption(OPTION_LOWWEIGHT, "1");
}

void Options::InitOptFile()
{
	if (!m_configFilename && !m_noConfig)
	{
		// look in the exe-directory first
		BString<1024> filename("%s/nexget.conf", *m_appDir);

		if (FileSystem::FileExists(filename))
		{
			m_configFilename = filename;
		}
		else
		{
			int p = 0;
			while (const char* altfilename = PossibleConfigLocations[p++])
			{
				CString expanded = FileSystem::ExpandHomePath(altfilename);
				if (FileSystem::FileExists(expanded))
				{
					m_configFilename = *expanded;
					break;
				}
			}
		}
	}

	if (m_configFilename)
	{
		// normalize path in filename
		CString filename = FileSystem::ExpandFileName(m_configFilename);
		filename = FileSystem::ExpandHomePath(filename);
		m_configFilename = *filename;

		SetOption(OPTION_CONFIGFILE, m_configFilename);
		LoadConfigFile();
	}
}

void Options::CheckDir(CString& dir, const char* optionName,
	const char* parentDir, bool allowEmpty, bool create)
{
	const char* tempdir = GetOption(optionName);

	if (m_noDiskAccess)
	{
		dir = tempdir;
		return;
	}

	if (Util::EmptyStr(tempdir))
	{
		if (!allowEmpty)
		{
			ConfigError("Invalid value for option \"%s\": <empty>", optionName);
		}
		dir = "";
		return;
	}

	dir = tempdir;
	FileSystem::NormalizePathSeparators(dir);
	if (dir.Length() > 1 && dir[dir.Length() - 1] == PATH_SEPARATOR)
	{
		// remove trailing slash
		dir[dir.Length() - 1] = '\0';
	}

	if (dir[0] != PATH_SEPARATOR && !Util::EmptyStr(parentDir))
	{
		// convert relative path to absolute path
		int plen = strlen(parentDir);

		BString<1024> usedir2;
		if (parentDir[plen-1] == PATH_SEPARATOR)
		{
			usedir2.Format("%s%s", parentDir, *dir);
		}
		else
		{
			usedir2.Format("%s%c%s", parentDir, PATH_SEPARATOR, *dir);
		}

		FileSystem::NormalizePathSeparators(usedir2);
		dir = usedir2;
		SetOption(optionName, usedir2);
	}

	CString errmsg;
	if (create && !FileSystem::ForceDirectories(dir, errmsg))
	{
		ConfigError("Invalid value for option \"%s\" (%s): %s", optionName, *dir, *errmsg);
	}
}

void Options::InitOptions()
{
	m_mainDir = GetOption(OPTION_MAINDIR);

	CheckDir(m_destDir, OPTION_DESTDIR, m_mainDir, false, true);
	CheckDir(m_tempDir, OPTION_TEMPDIR, m_mainDir, false, true);
	CheckDir(m_queueDir, OPTION_QUEUEDIR, m_mainDir, false, true);

	m_logFile = GetOption(OPTION_LOGFILE);
	m_lockFile = GetOption(OPTION_LOCKFILE);

	m_rotateLog				= ParseRangeValue(OPTION_ROTATELOG, 1, 3650);
	m_logBuffer				= ParseRangeValue(OPTION_LOGBUFFER, 1, 1000000);
	m_maxConcurrency		= ParseRangeValue(OPTION_MAXCONCURRENCY, 1, 64);
	m_downloadRate			= ParseRangeValue(OPTION_DOWNLOADRATE, 0, 1024 * 1024) * 1024;
	m_chunkSize				= ParseRangeValue(OPTION_CHUNKSIZE, 1, 64 * 1024) * 1024;
	m_chunkRetries			= ParseRangeValue(OPTION_CHUNKRETRIES, 0, 100);
	m_retryBaseDelay		= ParseRangeValue(OPTION_RETRYBASEDELAY, 0, 3600 * 1000);
	m_retryMaxDelay			= ParseRangeValue(OPTION_RETRYMAXDELAY, 0, 3600 * 1000);
	m_tokenWaitInterval		= ParseRangeValue(OPTION_TOKENWAITINTERVAL, 1, 10000);
	m_progressInterval		= ParseRangeValue(OPTION_PROGRESSINTERVAL, 0, 3600 * 1000);
	m_progressDelta			= ParseRangeValue(OPTION_PROGRESSDELTA, 0, 100);
	m_completedRetention	= ParseRangeValue(OPTION_COMPLETEDRETENTION, 0, 365 * 86400);
	m_urlTimeout			= ParseRangeValue(OPTION_URLTIMEOUT, 1, 3600);
	m_highWeight			= ParseRangeValue(OPTION_HIGHWEIGHT, 1, 100);
	m_normalWeight			= ParseRangeValue(OPTION_NORMALWEIGHT, 1, 100);
	m_lowWeight				= ParseRangeValue(OPTION_LOWWEIGHT, 1, 100);

	m_flushLedger = (bool)ParseEnumValue(OPTION_FLUSHLEDGER, BoolCount, BoolNames, BoolValues);

	const char* TargetNames[] = { "screen", "log", "both", "none" };
	const int TargetValues[] = { mtScreen, mtLog, mtBoth, mtNone };
	const int TargetCount = 4;
	m_infoTarget = (EMessageTarget)ParseEnumValue(OPTION_INFOTARGET, TargetCount, TargetNames, TargetValues);
	m_warningTarget = (EMessageTarget)ParseEnumValue(OPTION_WARNINGTARGET, TargetCount, TargetNames, TargetValues);
	m_errorTarget = (EMessageTarget)ParseEnumValue(OPTION_ERRORTARGET, TargetCount, TargetNames, TargetValues);
	m_debugTarget = (EMessageTarget)ParseEnumValue(OPTION_DEBUGTARGET, TargetCount, TargetNames, TargetValues);
	m_detailTarget = (EMessageTarget)ParseEnumValue(OPTION_DETAILTARGET, TargetCount, TargetNames, TargetValues);

	const char* WriteLogNames[] = { "none", "append", "reset", "rotate" };
	const int WriteLogValues[] = { wlNone, wlAppend, wlReset, wlRotate };
	const int WriteLogCount = 4;
	m_writeLog = (EWriteLog)ParseEnumValue(OPTION_WRITELOG, WriteLogCount, WriteLogNames, WriteLogValues);
}

int Options::ParseEnumValue(const char* OptName, int argc, const char * argn[], const int argv[])
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return argv[0];
	}

	int defNum = 0;

	for (int i = 0; i < argc; i++)
	{
		if (!strcasecmp(optEntry->GetValue(), argn[i]))
		{
			// normalizing option value in option list, for example "NO" -> "no"
			for (int j = 0; j < argc; j++)
			{
				if (argv[j] == argv[i])
				{
					if (strcmp(argn[j], optEntry->GetValue()))
					{
						optEntry->SetValue(argn[j]);
					}
					break;
				}
			}

			return argv[i];
		}

		if (!strcasecmp(optEntry->GetDefValue(), argn[i]))
		{
			defNum = i;
		}
	}

	m_configLine = optEntry->GetLineNo();
	ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
	optEntry->SetValue(argn[defNum]);
	return argv[defNum];
}

int Options::ParseIntValue(const char* OptName, int base)
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return 0;
	}

	char *endptr;
	int val = strtol(optEntry->GetValue(), &endptr, base);

	if (Util::EmptyStr(optEntry->GetValue()) || (endptr && *endptr != '\0'))
	{
		m_configLine = optEntry->GetLineNo();
		ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
		optEntry->SetValue(optEntry->GetDefValue());
		val = strtol(optEntry->GetDefValue(), nullptr, base);
	}

	return val;
}

/*
 * Parses a decimal option and checks its range.
 * An out of range value is replaced with the default value.
 */
int Options::ParseRangeValue(const char* OptName, int minValue, int maxValue)
{
	int val = ParseIntValue(OptName, 10);
	if (val < minValue || val > maxValue)
	{
		OptEntry* optEntry = FindOption(OptName);
		m_configLine = optEntry->GetLineNo();
		ConfigWarn("Value for option \"%s\" out of range (%i..%i): \"%s\", using default \"%s\"",
			OptName, minValue, maxValue, optEntry->GetValue(), optEntry->GetDefValue());
		optEntry->SetValue(optEntry->GetDefValue());
		val = strtol(optEntry->GetDefValue(), nullptr, 10);
	}
	return val;
}

void Options::SetOption(const char* optname, const char* value)
{
	OptEntry* optEntry = FindOption(optname);
	if (!optEntry)
	{
		m_optEntries.emplace_back(optname, nullptr);
		optEntry = &m_optEntries.back();
	}

	CString curvalue;

	if (value && (value[0] == '~') && (value[1] == '/') && !m_noDiskAccess)
	{
		curvalue = FileSystem::ExpandHomePath(value);
	}
	else
	{
		curvalue = value;
	}

	optEntry->SetLineNo(m_configLine);

	// expand variables
	while (const char* dollar = strstr(curvalue, "${"))
	{
		const char* end = strchr(dollar, '}');
		if (!end)
		{
			break;
		}

		int varlen = (int)(end - dollar - 2);
		BString<100> variable;
		variable.Set(dollar + 2, varlen);
		const char* varvalue = GetOption(variable);
		if (!varvalue)
		{
			break;
		}

		CString expanded;
		if (dollar > curvalue)
		{
			expanded.Append(curvalue, (int)(dollar - curvalue));
		}
		expanded.Append(varvalue);
		expanded.Append(end + 1);
		curvalue = std::move(expanded);
	}

	optEntry->SetValue(curvalue);
}

Options::OptEntry* Options::FindOption(const char* optname)
{
	OptEntry* optEntry = m_optEntries.FindOption(optname);

	// normalize option name in option list; for example "maxconcurrency" -> "MaxConcurrency"
	if (optEntry && strcmp(optEntry->GetName(), optname))
	{
		optEntry->SetName(optname);
	}

	return optEntry;
}

const char* Options::GetOption(const char* optname)
{
	OptEntry* optEntry = FindOption(optname);
	if (optEntry)
	{
		if (optEntry->GetLineNo() > 0)
		{
			m_configLine = optEntry->GetLineNo();
		}
		return optEntry->GetValue();
	}
	return nullptr;
}

void Options::LoadConfigFile()
{
	SetOption(OPTION_CONFIGFILE, m_configFilename);

	DiskFile infile;

	if (!infile.Open(m_configFilename, DiskFile::omRead))
	{
		ConfigError("Could not open file %s", *m_configFilename);
		m_fatalError = true;
		return;
	}

	m_configLine = 0;
	int bufLen = (int)FileSystem::FileSize(m_configFilename) + 1;
	CharBuffer buf(bufLen);

	int line = 0;
	while (infile.ReadLine(buf, buf.Size() - 1))
	{
		m_configLine = ++line;

		if (buf[0] != 0 && buf[strlen(buf)-1] == '\n')
		{
			buf[strlen(buf)-1] = 0; // remove traling '\n'
		}
		if (buf[0] != 0 && buf[strlen(buf)-1] == '\r')
		{
			buf[strlen(buf)-1] = 0; // remove traling '\r' (for windows line endings)
		}

		if (buf[0] == 0 || buf[0] == '#' || strspn(buf, " ") == strlen(buf))
		{
			continue;
		}

		SetOptionString(buf);
	}

	infile.Close();

	m_configLine = 0;
}

void Options::InitCommandLineOptions(CmdOptList* commandLineOptions)
{
	for (const char* option : *commandLineOptions)
	{
		SetOptionString(option);
	}
}

bool Options::SetOptionString(const char* option)
{
	CString optname;
	CString optvalue;

	if (!SplitOptionString(option, optname, optvalue))
	{
		ConfigError("Invalid option \"%s\"", option);
		return false;
	}

	bool ok = ValidateOptionName(optname);
	if (ok)
	{
		SetOption(optname, optvalue);
	}
	else
	{
		ConfigError("Invalid option \"%s\"", *optname);
	}

	return ok;
}

/*
 * Splits option string into name and value;
 * Returns true if the option string has name and value;
 */
bool Options::SplitOptionString(const char* option, CString& optName, CString& optValue)
{
	const char* eq = strchr(option, '=');
	if (!eq || eq == option)
	{
		return false;
	}

	optName.Set(option, (int)(eq - option));
	optValue.Set(eq + 1);

	return true;
}

bool Options::ValidateOptionName(const char* optname)
{
	if (!strcasecmp(optname, OPTION_CONFIGFILE) || !strcasecmp(optname, OPTION_APPBIN) ||
		!strcasecmp(optname, OPTION_APPDIR) || !strcasecmp(optname, OPTION_VERSION))
	{
		// read-only options
		return false;
	}

	// only predefined options are accepted
	return GetOption(optname) != nullptr;
}

void Options::CheckOptions()
{
	if (m_retryMaxDelay < m_retryBaseDelay)
	{
		LocateOptionSrcPos(OPTION_RETRYMAXDELAY);
		ConfigWarn("Option \"%s\" is less than \"%s\", using %i", OPTION_RETRYMAXDELAY,
			OPTION_RETRYBASEDELAY, m_retryBaseDelay);
		m_retryMaxDelay = m_retryBaseDelay;
	}

	if (!(m_highWeight >= m_normalWeight && m_normalWeight >= m_lowWeight))
	{
		LocateOptionSrcPos(OPTION_HIGHWEIGHT);
		ConfigWarn("Weights \"%s\", \"%s\" and \"%s\" should not increase with lower priority",
			OPTION_HIGHWEIGHT, OPTION_NORMALWEIGHT, OPTION_LOWWEIGHT);
	}

	if (!m_noDiskAccess && m_writeLog != wlNone && Util::EmptyStr(m_logFile))
	{
		LocateOptionSrcPos(OPTION_LOGFILE);
		ConfigError("Invalid value for option \"%s\": <empty>", OPTION_LOGFILE);
		m_writeLog = wlNone;
	}
}
