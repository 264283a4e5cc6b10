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
#include "FileSource.h"
#include "Log.h"
#include "FileSystem.h"

Source::EStatus FileSource::Open(int64 offset)
{
	m_size = FileSystem::FileSize(m_filename);
	if (m_size < 0)
	{
		return SetError(ssFailed, "file %s does not exist", *m_filename);
	}
	m_sizeKnown = true;

	if (!m_file.Open(m_filename, DiskFile::omRead))
	{
		return SetError(ssTransient, "could not open file %s: %s", *m_filename,
			*FileSystem::GetLastErrorMessage());
	}

	if (!m_file.Seek(offset))
	{
		m_file.Close();
		return SetError(ssTransient, "could not seek in file %s: %s", *m_filename,
			*FileSystem::GetLastErrorMessage());
	}

	m_offset = offset;
	return ssOk;
}

Source::EStatus FileSource::Read(char* buffer, int size, int& bytesRead)
{
	bytesRead = (int)m_file.Read(buffer, size);
	if (bytesRead > 0)
	{
		return ssOk;
	}

	if (m_file.Error())
	{
		return SetError(ssTransient, "could not read file %s: %s", *m_filename,
			*FileSystem::GetLastErrorMessage());
	}

	return ssEof;
}

void FileSource::Close()
{
	if (m_file.Active())
	{
		m_file.Close();
	}
}
