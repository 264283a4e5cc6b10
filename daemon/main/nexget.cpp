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
#include "Log.h"
#include "Options.h"
#include "CommandLineParser.h"
#include "Thread.h"
#include "DownloadEngine.h"
#include "ConsoleFrontend.h"
#include "StackTrace.h"
#include "Util.h"
#include "FileSystem.h"

// Prototypes
int RunMain();

// Globals
int g_ArgumentCount;
char* (*g_Arguments)[] = nullptr;


/*
 * Main entry point
 */
int main(int argc, char *argv[])
{
	Util::Init();

	g_ArgumentCount = argc;
	g_Arguments = (char*(*)[])argv;

	srand((unsigned int)Util::CurrentTime());

	return RunMain();
}


class NexGet
{
public:
	~NexGet();
	int Run();
	void Stop();

private:
	std::unique_ptr<Log> m_log;
	std::unique_ptr<Options> m_options;
	std::unique_ptr<CommandLineParser> m_commandLineParser;
	std::unique_ptr<DownloadEngine> m_engine;
	std::unique_ptr<ConsoleFrontend> m_frontend;

	bool m_daemonized = false;
	bool m_stopped = false;
	Mutex m_waitMutex;
	ConditionVar m_waitCond;

	bool Init();
	bool BootConfig();
	void PrintOptions();
	void PrintDownloads();
	bool ProcessDirect();
	bool AddDownload();
	bool EditDownloads();
	void StartFrontend();
	void StopFrontend();
	void DoMainLoop();
	void Daemonize();
};

std::unique_ptr<NexGet> g_NexGet;

NexGet::~NexGet()
{
	debug("Cleaning up global objects");

	m_frontend.reset();
	m_engine.reset();
	m_options.reset();
	m_log.reset();
}

bool NexGet::Init()
{
	m_log = std::make_unique<Log>();

	debug("nexget %s", Util::VersionRevision());

	Thread::Init();

	if (!BootConfig())
	{
		return false;
	}

	if (m_commandLineParser->GetDaemonMode())
	{
		Daemonize();
		info("nexget %s daemon-mode", Util::VersionRevision());
	}
	else if (m_options->GetServerMode())
	{
		info("nexget %s server-mode", Util::VersionRevision());
	}

	InstallErrorHandler();

	m_engine = std::make_unique<DownloadEngine>();
	if (!m_engine->Init())
	{
		error("Could not load downloads from %s", m_options->GetQueueDir());
		return false;
	}

	if (m_commandLineParser->GetSetRate() > -1)
	{
		m_engine->SetDownloadRate(m_commandLineParser->GetSetRate());
	}

	return true;
}

bool NexGet::BootConfig()
{
	debug("Parsing command line");
	m_commandLineParser = std::make_unique<CommandLineParser>(g_ArgumentCount, (const char**)(*g_Arguments));
	if (m_commandLineParser->GetPrintVersion())
	{
		printf("nexget version: %s\n", Util::VersionRevision());
		exit(0);
	}
	if (m_commandLineParser->GetPrintUsage() || m_commandLineParser->GetErrors() || g_ArgumentCount <= 1)
	{
		m_commandLineParser->PrintUsage(((const char**)(*g_Arguments))[0]);
		exit(m_commandLineParser->GetPrintUsage() ? 0 : 1);
	}

	debug("Reading options");
	std::vector<const char*> cmdOptions;
	for (CString& option : *m_commandLineParser->GetOptionList())
	{
		cmdOptions.push_back(option);
	}
	m_options = std::make_unique<Options>((*g_Arguments)[0], m_commandLineParser->GetConfigFilename(),
		m_commandLineParser->GetNoConfig(), &cmdOptions);
	m_options->SetServerMode(m_commandLineParser->GetServerMode());

	m_log->InitOptions();

	if (m_options->GetFatalError())
	{
		return false;
	}

	if (m_commandLineParser->GetPrintOptions())
	{
		PrintOptions();
	}

	return true;
}

void NexGet::PrintOptions()
{
	for (Options::OptEntry& optEntry : g_Options->GuardOptEntries())
	{
		printf("%s = \"%s\"\n", optEntry.GetName(), optEntry.GetValue());
	}
	exit(0);
}

/*
 * Executes control commands directly on the ledger.
 * Returns false if the command failed.
 */
bool NexGet::ProcessDirect()
{
	switch (m_commandLineParser->GetOperation())
	{
		case CommandLineParser::opListDownloads:
			PrintDownloads();
			return true;

		case CommandLineParser::opEditDownloads:
			return EditDownloads();

		case CommandLineParser::opPauseAll:
			m_engine->PauseAllDownloads();
			info("All downloads paused");
			return true;

		case CommandLineParser::opResumeAll:
			m_engine->ResumeAllDownloads();
			info("All paused downloads resumed");
			return true;

		case CommandLineParser::opAddDownload:
			return AddDownload();

		case CommandLineParser::opNoOperation:
			return true;
	}

	return true;
}

bool NexGet::AddDownload()
{
	int jobId = 0;
	CString errmsg;
	DownloadEngine::EErrorCode code = m_engine->SubmitDownload(m_commandLineParser->GetSourceRef(),
		m_commandLineParser->GetAddPriority(), m_commandLineParser->GetAddTitle(), jobId, errmsg);
	if (code != QueueManager::ecOk)
	{
		error("Could not add %s: %s", m_commandLineParser->GetSourceRef(),
			errmsg.Empty() ? QueueManager::ErrorCodeName(code) : *errmsg);
		return false;
	}

	return true;
}

bool NexGet::EditDownloads()
{
	bool ok = true;

	for (int jobId : *m_commandLineParser->GetEditIdList())
	{
		DownloadEngine::EErrorCode code = QueueManager::ecOk;
		switch (m_commandLineParser->GetEditAction())
		{
			case CommandLineParser::eaPause:
				code = m_engine->PauseDownload(jobId);
				break;

			case CommandLineParser::eaResume:
				code = m_engine->ResumeDownload(jobId);
				break;

			case CommandLineParser::eaCancel:
				code = m_engine->CancelDownload(jobId);
				break;

			case CommandLineParser::eaRetry:
				code = m_engine->RetryDownload(jobId);
				break;
		}

		if (code != QueueManager::ecOk)
		{
			error("Could not edit download %i: %s", jobId, QueueManager::ErrorCodeName(code));
			ok = false;
		}
	}

	return ok;
}

void NexGet::PrintDownloads()
{
	JobSnapshot jobs = m_engine->ListDownloads();

	printf("Downloads: %i active, %i total\n", m_engine->GetActiveCount(), (int)jobs.size());
	printf("-----------------------------------\n");

	for (JobInfo& job : jobs)
	{
		BString<100> size;
		if (job.GetSizeKnown())
		{
			size.Format("%i%% of %s", job.GetProgressPercent(), *Util::FormatSize(job.GetTotalBytes()));
		}
		else
		{
			size.Format("%s", *Util::FormatSize(job.GetDownloadedBytes()));
		}

		BString<100> remaining;
		int64 seconds = job.GetSecondsRemaining();
		if (job.GetStatus() == JobInfo::jsDownloading && seconds >= 0)
		{
			remaining.Format(", %s, ~ %s", *Util::FormatSpeed(job.GetSpeed()), *Util::FormatDuration(seconds));
		}

		printf("[%i] %s (%s, %s priority, %s%s)\n", job.GetId(), job.GetTitle(),
			JobInfo::StatusName(job.GetStatus()), JobInfo::PriorityName(job.GetPriority()),
			*size, *remaining);

		if (job.GetErrorKind() != JobInfo::ekNone)
		{
			printf("    %s: %s\n", JobInfo::ErrorKindName(job.GetErrorKind()), job.GetLastError());
		}
	}
}

void NexGet::StartFrontend()
{
	if (!m_commandLineParser->GetDaemonMode())
	{
		m_frontend = std::make_unique<ConsoleFrontend>(m_engine.get());
		m_frontend->Start();
	}
}

void NexGet::StopFrontend()
{
	if (m_frontend)
	{
		debug("Stopping Frontend");
		m_frontend->Stop();
		while (!m_frontend->WaitFinished(1000))
		{
			debug("Waiting for Frontend");
		}
		debug("Frontend stopped");
	}
}

void NexGet::DoMainLoop()
{
	debug("Entering main program loop");

	m_engine->Start();

	// run until the queue drains or a stop signal arrives
	while (m_engine->HasPendingWork())
	{
		Guard guard(m_waitMutex);
		if (m_stopped)
		{
			break;
		}
		m_waitCond.WaitFor(m_waitMutex, 200, [&]{ return m_stopped; });
	}

	m_engine->Shutdown();

	debug("Main program loop terminated");
}

int NexGet::Run()
{
	if (!Init())
	{
		return 1;
	}

	bool ok = ProcessDirect();

	bool process = m_commandLineParser->GetServerMode() ||
		(ok && m_commandLineParser->GetOperation() == CommandLineParser::opAddDownload);

	if (process)
	{
		StartFrontend();
		DoMainLoop();
		StopFrontend();
	}
	else
	{
		// messages of control commands
		for (Message& message : g_Log->GuardMessages())
		{
			printf("%s\n", message.GetText());
		}
	}

	return ok ? 0 : 1;
}

void NexGet::Stop()
{
	info("Stopping, please wait...");

	// trigger stop signal
	Guard guard(m_waitMutex);
	m_stopped = true;
	m_waitCond.NotifyAll();
}

void NexGet::Daemonize()
{
	int f = fork();
	if (f < 0) exit(1); /* fork error */
	if (f > 0) exit(0); /* parent exits */

	/* child (daemon) continues */
	m_daemonized = true;

	// obtain a new process group
	setsid();

	// redirect standard I/O
	int d = open("/dev/null", O_RDWR);
	dup2(d, 0);
	dup2(d, 1);
	dup2(d, 2);
	close(d);

	// ignore unwanted signals
	signal(SIGCHLD, SIG_IGN);
	signal(SIGTSTP, SIG_IGN);
	signal(SIGTTOU, SIG_IGN);
	signal(SIGTTIN, SIG_IGN);
}

int RunMain()
{
	g_NexGet = std::make_unique<NexGet>();
	int exitCode = g_NexGet->Run();
	g_NexGet.reset();
	return exitCode;
}

void ExitProc()
{
	if (g_NexGet)
	{
		g_NexGet->Stop();
	}
}
