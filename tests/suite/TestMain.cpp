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

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "Thread.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"
#include "TestUtil.h"

int main(int argc, char* argv[])
{
	Util::Init();
	TestUtil::Init(argv[0]);
	Log log;
	Thread::Init();

	if (argc == 1)
	{
		printf("Unit and integration tests for nexget-%s.\nUse '%s [quick]' to run only quick tests or '%s -h' for more options.\n",
			Util::VersionRevision(), FileSystem::BaseFileName(argv[0]), FileSystem::BaseFileName(argv[0]));
	}

	int ret = Catch::Session().run(argc, argv);

	TestUtil::Final();

	return ret;
}
