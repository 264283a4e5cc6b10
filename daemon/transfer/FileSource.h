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


#ifndef FILESOURCE_H
#define FILESOURCE_H

#include "Source.h"
#include "FileSystem.h"

class FileSource : public Source
{
public:
	FileSource(const char* filename) : m_filename(filename) {}
	virtual EStatus Open(int64 offset);
	virtual EStatus Read(char* buffer, int size, int& bytesRead);
	virtual void Close();

private:
	CString m_filename;
	DiskFile m_file;
};

#endif
