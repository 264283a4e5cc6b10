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


#ifndef LEDGER_H
#define LEDGER_H

#include "NString.h"
#include "JobInfo.h"

class StateDiskFile;

/*
 * Durable record of all jobs kept in file "ledger" inside the queue directory.
 * Every save rewrites the whole file via "ledger.new" followed by a rename,
 * so a crash leaves either the old or the new content.
 */
class Ledger
{
public:
	Ledger(const char* directory) : m_directory(directory) {}
	bool Save(JobList* jobs, int nextId);
	bool Load(JobList* jobs, int& nextId);
	bool Exists();
	void Discard();
	const char* GetDirectory() { return m_directory; }

private:
	CString m_directory;

	void SaveJob(JobInfo* job, StateDiskFile& outfile);
	bool LoadJob(JobInfo* job, StateDiskFile& infile, int formatVersion);
};

#endif
