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

#include "CommandLineParser.h"

TEST_CASE("Command line parser: initializing without configuration file", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-p", nullptr};
	CommandLineParser commandLineParser(3, argv);

	REQUIRE(commandLineParser.GetNoConfig());
	REQUIRE(commandLineParser.GetConfigFilename() == nullptr);
	REQUIRE(commandLineParser.GetPrintOptions());
	REQUIRE(commandLineParser.GetOperation() == CommandLineParser::opNoOperation);
}

TEST_CASE("Command line parser: initializing with configuration file", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-c", "/home/user/nexget.conf", "-s", nullptr};
	CommandLineParser commandLineParser(4, argv);

	REQUIRE_FALSE(commandLineParser.GetErrors());
	REQUIRE(strcmp(commandLineParser.GetConfigFilename(), "/home/user/nexget.conf") == 0);
	REQUIRE(commandLineParser.GetServerMode());
	REQUIRE_FALSE(commandLineParser.GetDaemonMode());
}

TEST_CASE("Command line parser: extra options", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-o", "MaxConcurrency=4", "-o", "DownloadRate=50", "-p", nullptr};
	CommandLineParser commandLineParser(7, argv);

	REQUIRE(commandLineParser.GetOptionList()->size() == 2);
	REQUIRE(strcmp(commandLineParser.GetOptionList()->at(0), "MaxConcurrency=4") == 0);
	REQUIRE(strcmp(commandLineParser.GetOptionList()->at(1), "DownloadRate=50") == 0);
}

TEST_CASE("Command line parser: adding a download", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-A", "I", "high", "T", "My Game", "http://cdn.example.com/game.bin", nullptr};
	CommandLineParser commandLineParser(8, argv);

	REQUIRE_FALSE(commandLineParser.GetErrors());
	REQUIRE(commandLineParser.GetOperation() == CommandLineParser::opAddDownload);
	REQUIRE(commandLineParser.GetAddPriority() == JobInfo::jpHigh);
	REQUIRE(strcmp(commandLineParser.GetAddTitle(), "My Game") == 0);
	REQUIRE(strcmp(commandLineParser.GetSourceRef(), "http://cdn.example.com/game.bin") == 0);
}

TEST_CASE("Command line parser: adding without source", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-A", "I", "low", nullptr};
	CommandLineParser commandLineParser(5, argv);

	REQUIRE(commandLineParser.GetErrors());
}

TEST_CASE("Command line parser: invalid priority", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-A", "I", "urgent", "game.bin", nullptr};
	CommandLineParser commandLineParser(6, argv);

	REQUIRE(commandLineParser.GetErrors());
}

TEST_CASE("Command line parser: editing downloads", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", "-E", "D", "3,7-9", "12", nullptr};
	CommandLineParser commandLineParser(6, argv);

	REQUIRE_FALSE(commandLineParser.GetErrors());
	REQUIRE(commandLineParser.GetOperation() == CommandLineParser::opEditDownloads);
	REQUIRE(commandLineParser.GetEditAction() == CommandLineParser::eaCancel);

	CommandLineParser::IdList expected = {3, 7, 8, 9, 12};
	REQUIRE(*commandLineParser.GetEditIdList() == expected);
}

TEST_CASE("Command line parser: invalid edit action and ids", "[CommandLineParser][Quick]")
{
	const char* argv1[] = {"nexget", "-n", "-E", "X", "1", nullptr};
	CommandLineParser parser1(5, argv1);
	REQUIRE(parser1.GetErrors());

	const char* argv2[] = {"nexget", "-n", "-E", "P", "0", nullptr};
	CommandLineParser parser2(5, argv2);
	REQUIRE(parser2.GetErrors());

	const char* argv3[] = {"nexget", "-n", "-E", "R", nullptr};
	CommandLineParser parser3(4, argv3);
	REQUIRE(parser3.GetErrors());
}

TEST_CASE("Command line parser: pause, resume and rate", "[CommandLineParser][Quick]")
{
	const char* argv1[] = {"nexget", "-n", "-P", nullptr};
	CommandLineParser parser1(3, argv1);
	REQUIRE(parser1.GetOperation() == CommandLineParser::opPauseAll);
	REQUIRE(parser1.GetSetRate() == -1);

	const char* argv2[] = {"nexget", "-n", "-D", "-R", "250", nullptr};
	CommandLineParser parser2(5, argv2);
	REQUIRE_FALSE(parser2.GetErrors());
	REQUIRE(parser2.GetDaemonMode());
	REQUIRE(parser2.GetServerMode());
	REQUIRE(parser2.GetSetRate() == 250 * 1024);

	const char* argv3[] = {"nexget", "-n", "-U", nullptr};
	CommandLineParser parser3(3, argv3);
	REQUIRE(parser3.GetOperation() == CommandLineParser::opResumeAll);
}

TEST_CASE("Command line parser: nothing to do", "[CommandLineParser][Quick]")
{
	const char* argv[] = {"nexget", "-n", nullptr};
	CommandLineParser commandLineParser(2, argv);

	REQUIRE(commandLineParser.GetErrors());
}
