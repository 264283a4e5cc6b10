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
#include "CommandLineParser.h"
#include "Log.h"
#include "FileSystem.h"
#include "Util.h"
#include "Source.h"

#ifdef HAVE_GETOPT_LONG
static struct option long_options[] =
	{
		{"help", no_argument, 0, 'h'},
		{"configfile", required_argument, 0, 'c'},
		{"noconfigfile", no_argument, 0, 'n'},
		{"printconfig", no_argument, 0, 'p'},
		{"server", no_argument, 0, 's' },
		{"daemon", no_argument, 0, 'D' },
		{"version", no_argument, 0, 'v'},
		{"option", required_argument, 0, 'o'},
		{"append", no_argument, 0, 'A'},
		{"list", no_argument, 0, 'L'},
		{"edit", required_argument, 0, 'E'},
		{"pause", no_argument, 0, 'P'},
		{"unpause", no_argument, 0, 'U'},
		{"rate", required_argument, 0, 'R'},
		{0, 0, 0, 0}
	};
#endif

static char short_options[] = "c:hno:psvADE:LPR:U";


CommandLineParser::CommandLineParser(int argc, const char* argv[])
{
	InitCommandLine(argc, argv);

	if (argc == 1)
	{
		m_printUsage = true;
		return;
	}

	if (!m_errors && !m_printOptions && !m_printUsage && !m_printVersion)
	{
		InitFileArg(argc, argv);
	}
}

void CommandLineParser::InitCommandLine(int argc, const char* const_argv[])
{
	std::vector<CString> argv;
	argv.reserve(argc);
	for (int i = 0; i < argc; i++)
	{
		argv.emplace_back(const_argv[i]);
	}

	// reset getopt
	optind = 0;

	while (true)
	{
		int c;

#ifdef HAVE_GETOPT_LONG
		int option_index  = 0;
		c = getopt_long(argc, (char**)argv.data(), short_options, long_options, &option_index);
#else
		c = getopt(argc, (char**)argv.data(), short_options);
#endif

		if (c == -1) break;

		switch (c)
		{
			case 'c':
				m_configFilename = optarg;
				break;
			case 'n':
				m_configFilename = nullptr;
				m_noConfig = true;
				break;
			case 'h':
				m_printUsage = true;
				return;
			case 'v':
				m_printVersion = true;
				return;
			case 'p':
				m_printOptions = true;
				break;
			case 'o':
				m_optionList.push_back(optarg);
				break;
			case 's':
				m_serverMode = true;
				break;
			case 'D':
				m_serverMode = true;
				m_daemonMode = true;
				break;
			case 'A':
				m_operation = opAddDownload;

				while (true)
				{
					optind++;
					optarg = optind > argc ? nullptr : (char*)argv[optind-1];
					if (optarg && !strcasecmp(optarg, "I"))
					{
						optind++;
						if (optind > argc || !JobInfo::ParsePriority(argv[optind-1], m_addPriority))
						{
							ReportError("Could not parse value of option 'A'");
							return;
						}
					}
					else if (optarg && !strcasecmp(optarg, "T"))
					{
						optind++;
						if (optind > argc)
						{
							ReportError("Could not parse value of option 'A'");
							return;
						}
						m_addTitle = std::move(argv[optind-1]);
					}
					else
					{
						optind--;
						break;
					}
				}
				break;
			case 'L':
				m_operation = opListDownloads;
				break;
			case 'E':
				m_operation = opEditDownloads;
				if (!strcasecmp(optarg, "P"))
				{
					m_editAction = eaPause;
				}
				else if (!strcasecmp(optarg, "U"))
				{
					m_editAction = eaResume;
				}
				else if (!strcasecmp(optarg, "D"))
				{
					m_editAction = eaCancel;
				}
				else if (!strcasecmp(optarg, "R"))
				{
					m_editAction = eaRetry;
				}
				else
				{
					ReportError("Could not parse value of option 'E'");
					return;
				}
				break;
			case 'P':
				m_operation = opPauseAll;
				break;
			case 'U':
				m_operation = opResumeAll;
				break;
			case 'R':
			{
				double rate = atof(optarg);
				if (rate < 0)
				{
					ReportError("Could not parse value of option 'R'");
					return;
				}
				m_setRate = (int)(rate * 1024);
				break;
			}
			case '?':
				m_errors = true;
				return;
		}
	}
}

void CommandLineParser::PrintUsage(const char* com)
{
	printf("Usage:\n"
		"  %s [switches]\n\n"
		"Switches:\n"
		"  -h, --help                Print this help-message\n"
		"  -v, --version             Print version and exit\n"
		"  -c, --configfile <file>   Filename of configuration-file\n"
		"  -n, --noconfigfile        Prevent loading of configuration-file\n"
		"                            (required options must be passed with --option)\n"
		"  -p, --printconfig         Print configuration and exit\n"
		"  -o, --option <name=value> Set or override option in configuration-file\n"
		"  -s, --server              Process the download queue in console-mode\n"
		"                            until no download is queued or running\n"
		"  -D, --daemon              Same as -s but detached from the console\n"
		"  -R, --rate <speed>        Download speed limit in KB/s for this run,\n"
		"                            0 for unlimited\n"
		"  -A, --append [<options>] <source>  Add a download and process the queue\n"
		"       I <priority>         Priority: high, normal or low (default normal)\n"
		"       T <title>            Display title (default derived from the source)\n"
		"    <source>                Local file path or file://<path>,\n"
		"                            manifest:<path-to-xml-manifest>,\n"
		"                            http://host[:port]/resource\n"
		"  -L, --list                List downloads\n"
		"  -P, --pause               Pause all downloads\n"
		"  -U, --unpause             Resume all paused downloads\n"
		"  -E, --edit <action> <IDs> Edit downloads\n"
		"       <action> is one of:\n"
		"       P                    Pause\n"
		"       U                    Resume\n"
		"       D                    Cancel and delete the partial file\n"
		"       R                    Retry a failed download\n"
		"    <IDs>                   Comma-separated list of download-ids or\n"
		"                            ranges of download-ids, e. g.: 1-5,3,10-22\n",
		FileSystem::BaseFileName(com));
}

void CommandLineParser::InitFileArg(int argc, const char* argv[])
{
	if (optind >= argc)
	{
		if (m_operation == opAddDownload)
		{
			ReportError("Source not specified");
		}
		else if (m_operation == opEditDownloads)
		{
			ReportError("Download-IDs not specified");
		}
		else if (!m_serverMode && m_operation == opNoOperation)
		{
			ReportError("Nothing to do, use -s to process the download queue");
		}
	}
	else if (m_operation == opEditDownloads)
	{
		ParseIdList(argc, argv, optind);
	}
	else if (m_operation == opAddDownload)
	{
		const char* sourceRef = argv[optind];

		// plain paths are stored absolute, the daemon may run in another directory
		if (SourceFactory::IsFileRef(sourceRef) && !Util::StartsWith(sourceRef, "file://", false))
		{
			char* absPath = realpath(sourceRef, nullptr);
			if (absPath)
			{
				m_sourceRef = absPath;
				free(absPath);
			}
			else
			{
				m_sourceRef = sourceRef;
			}
		}
		else
		{
			m_sourceRef = sourceRef;
		}

		if (optind + 1 < argc)
		{
			ReportError("Too many arguments");
		}
	}
	else
	{
		ReportError("Too many arguments");
	}
}

void CommandLineParser::ParseIdList(int argc, const char* argv[], int optind)
{
	m_editIdList.clear();

	while (optind < argc)
	{
		CString writableIdList = argv[optind++];

		char* optarg = strtok(writableIdList, ", ");
		while (optarg)
		{
			int idFrom = 0;
			int idTo = 0;
			const char* p = strchr(optarg, '-');
			if (p)
			{
				BString<100> buf;
				buf.Set(optarg, (int)(p - optarg));
				idFrom = atoi(buf);
				idTo = atoi(p + 1);
			}
			else
			{
				idFrom = atoi(optarg);
				idTo = idFrom;
			}

			if (idFrom <= 0 || idTo <= 0)
			{
				ReportError("invalid list of download IDs");
				return;
			}

			int step = idFrom <= idTo ? 1 : -1;
			for (int id = idFrom; id != idTo + step; id += step)
			{
				m_editIdList.push_back(id);
			}

			optarg = strtok(nullptr, ", ");
		}
	}
}

void CommandLineParser::ReportError(const char* errMessage)
{
	m_errors = true;
	printf("%s\n", errMessage);
}
