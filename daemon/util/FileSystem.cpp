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
#include "FileSystem.h"
#include "Util.h"

// characters not allowed in names of finished downloads
static const char* RESERVED_FILENAME_CHARS = "\"*/:<>?\\|";

static bool SyncDescriptor(int fd, CString& errmsg)
{
#ifdef HAVE_FDATASYNC
	bool ok = fdatasync(fd) == 0;
#else
	bool ok = fsync(fd) == 0;
#endif
	if (!ok)
	{
		errmsg = FileSystem::GetLastErrorMessage();
	}
	return ok;
}

CString FileSystem::GetLastErrorMessage()
{
	return errno != 0 ? strerror(errno) : "";
}

void FileSystem::NormalizePathSeparators(char* path)
{
	for (char* p = path; *p; p++)
	{
		if (*p == ALT_PATH_SEPARATOR)
		{
			*p = PATH_SEPARATOR;
		}
	}
}

bool FileSystem::ForceDirectories(const char* path, CString& errmsg)
{
	errmsg.Clear();
	BString<1024> normPath = path;
	NormalizePathSeparators(normPath);
	int len = strlen(normPath);
	if ((len > 0) && normPath[len - 1] == PATH_SEPARATOR)
	{
		normPath[len - 1] = '\0';
	}

	struct stat buffer;
	bool ok = !stat(normPath, &buffer);
	if (!ok && errno != ENOENT)
	{
		errmsg.Format("could not read information for directory %s: errno %i, %s",
			*normPath, errno, *GetLastErrorMessage());
		return false;
	}

	if (ok && !S_ISDIR(buffer.st_mode))
	{
		errmsg.Format("path %s is not a directory", *normPath);
		return false;
	}

	if (!ok)
	{
		BString<1024> parentPath = *normPath;
		char* p = (char*)strrchr(parentPath, PATH_SEPARATOR);
		if (p && p > parentPath)
		{
			*p = '\0';
			if (!ForceDirectories(parentPath, errmsg))
			{
				return false;
			}
		}

		if (mkdir(normPath, S_DIRMODE) != 0 && errno != EEXIST)
		{
			errmsg.Format("could not create directory %s: %s", *normPath, *GetLastErrorMessage());
			return false;
		}

		if (!DirectoryExists(normPath))
		{
			errmsg.Format("path %s is not a directory", *normPath);
			return false;
		}
	}

	return true;
}

bool FileSystem::LoadFileIntoBuffer(const char* filename, CharBuffer& buffer, bool addTrailingNull)
{
	DiskFile file;
	if (!file.Open(filename, DiskFile::omRead))
	{
		return false;
	}

	int64 fileSize = FileSize(filename);
	if (fileSize < 0)
	{
		return false;
	}
	int size = (int)fileSize;

	buffer.Reserve(size + (addTrailingNull ? 1 : 0));

	int readBytes = (int)file.Read(buffer, size);
	file.Close();

	if (addTrailingNull)
	{
		buffer[size] = 0;
	}

	return readBytes == size;
}

bool FileSystem::SaveBufferIntoFile(const char* filename, const char* buffer, int bufLen)
{
	DiskFile file;
	if (!file.Open(filename, DiskFile::omWrite))
	{
		return false;
	}

	int writtenBytes = (int)file.Write(buffer, bufLen);
	bool closed = file.Close();

	return writtenBytes == bufLen && closed;
}

bool FileSystem::TruncateFile(const char* filename, int64 size)
{
	return truncate(filename, (off_t)size) == 0;
}

char* FileSystem::BaseFileName(const char* filename)
{
	char* p = (char*)strrchr(filename, PATH_SEPARATOR);
	char* p1 = (char*)strrchr(filename, ALT_PATH_SEPARATOR);
	if (p1 && (!p || p < p1))
	{
		p = p1;
	}
	return p ? p + 1 : (char*)filename;
}

// replace bad chars in filename
CString FileSystem::MakeValidFilename(const char* filename)
{
	CString result = filename;

	for (char* p = result; p && *p; p++)
	{
		if ((uchar)*p < 32 || strchr(RESERVED_FILENAME_CHARS, *p))
		{
			*p = '_';
		}
	}

	// trailing dots and spaces, also "." and ".."
	for (int len = result.Length(); len > 0 && (result[len - 1] == '.' || result[len - 1] == ' '); len--)
	{
		result[len - 1] = '\0';
	}

	if (result.Empty())
	{
		result = "download";
	}

	return result;
}

CString FileSystem::MakeUniqueFilename(const char* destDir, const char* basename)
{
	CString result;
	result.Format("%s%c%s", destDir, PATH_SEPARATOR, basename);

	int dupeNumber = 0;
	while (FileExists(result))
	{
		dupeNumber++;

		const char* extension = strrchr(basename, '.');
		if (extension && extension != basename)
		{
			BString<1024> filenameWithoutExt;
			filenameWithoutExt.Set(basename, (int)(extension - basename));
			result.Format("%s%c%s.duplicate%d%s", destDir, PATH_SEPARATOR,
				*filenameWithoutExt, dupeNumber, extension);
		}
		else
		{
			result.Format("%s%c%s.duplicate%d", destDir, PATH_SEPARATOR,
				basename, dupeNumber);
		}
	}

	return result;
}

bool FileSystem::MoveFile(const char* srcFilename, const char* dstFilename)
{
	bool ok = rename(srcFilename, dstFilename) == 0;
	if (!ok && errno == EXDEV)
	{
		ok = CopyFile(srcFilename, dstFilename) && DeleteFile(srcFilename);
	}
	return ok;
}

bool FileSystem::CopyFile(const char* srcFilename, const char* dstFilename)
{
	DiskFile infile;
	if (!infile.Open(srcFilename, DiskFile::omRead))
	{
		return false;
	}

	DiskFile outfile;
	if (!outfile.Open(dstFilename, DiskFile::omWrite))
	{
		return false;
	}

	CharBuffer buffer(1024 * 64);

	int cnt = buffer.Size();
	while (cnt == buffer.Size())
	{
		cnt = (int)infile.Read(buffer, buffer.Size());
		if (outfile.Write(buffer, cnt) != cnt)
		{
			return false;
		}
	}

	return !infile.Error() && outfile.Close();
}

bool FileSystem::DeleteFile(const char* filename)
{
	return remove(filename) == 0;
}

bool FileSystem::FileExists(const char* filename)
{
	struct stat buffer;
	bool exists = !stat(filename, &buffer) && S_ISREG(buffer.st_mode);
	return exists;
}

bool FileSystem::DirectoryExists(const char* dirFilename)
{
	struct stat buffer;
	bool exists = !stat(dirFilename, &buffer) && S_ISDIR(buffer.st_mode);
	return exists;
}

bool FileSystem::CreateDirectory(const char* dirFilename)
{
	return (mkdir(dirFilename, S_DIRMODE) == 0 || errno == EEXIST) && DirectoryExists(dirFilename);
}

bool FileSystem::DeleteDirectoryWithContent(const char* dirFilename, CString& errmsg)
{
	errmsg.Clear();

	bool del = false;
	bool ok = true;

	{
		DirBrowser dir(dirFilename);
		while (const char* filename = dir.Next())
		{
			BString<1024> fullFilename("%s%c%s", dirFilename, PATH_SEPARATOR, filename);

			if (FileSystem::DirectoryExists(fullFilename))
			{
				del = DeleteDirectoryWithContent(fullFilename, errmsg);
			}
			else
			{
				del = DeleteFile(fullFilename);
			}
			ok &= del;
			if (!del && errmsg.Empty())
			{
				errmsg.Format("could not delete %s: %s", *fullFilename, *GetLastErrorMessage());
			}
		}
	}

	del = rmdir(dirFilename) == 0;
	ok &= del;
	if (!del && errmsg.Empty())
	{
		errmsg = GetLastErrorMessage();
	}
	return ok;
}

int64 FileSystem::FileSize(const char* filename)
{
	struct stat buffer;
	if (stat(filename, &buffer) != 0)
	{
		return -1;
	}
	return buffer.st_size;
}

int64 FileSystem::FreeDiskSize(const char* path)
{
	struct statvfs diskdata;
	if (!statvfs(path, &diskdata))
	{
		return (int64)diskdata.f_frsize * (int64)diskdata.f_bavail;
	}
	return -1;
}

CString FileSystem::ExpandHomePath(const char* filename)
{
	CString result;

	if (filename && (filename[0] == '~') && (filename[1] == '/'))
	{
		// expand home-dir

		char* home = getenv("HOME");
		if (!home)
		{
			struct passwd *pw = getpwuid(getuid());
			if (pw)
			{
				home = pw->pw_dir;
			}
		}

		if (!home)
		{
			return filename;
		}

		if (home[strlen(home)-1] == '/')
		{
			result.Format("%s%s", home, filename + 2);
		}
		else
		{
			result.Format("%s/%s", home, filename + 2);
		}
	}
	else
	{
		result.Append(filename ? filename : "");
	}

	return result;
}

CString FileSystem::ExpandFileName(const char* filename)
{
	CString result;
	char* absPath = realpath(filename, nullptr);
	if (absPath)
	{
		result = absPath;
		free(absPath);
	}
	return result;
}

CString FileSystem::GetExeFileName(const char* argv0)
{
	char exename[1024];
	int r = readlink("/proc/self/exe", exename, sizeof(exename) - 1);
	if (r > 0)
	{
		exename[r] = '\0';
		return exename;
	}

	return ExpandFileName(argv0);
}

bool FileSystem::FlushDirBuffers(const char* filename, CString& errmsg)
{
	BString<1024> parentPath = filename;
	char* p = (char*)strrchr(parentPath, PATH_SEPARATOR);
	if (p)
	{
		*p = '\0';
	}

	FILE* file = fopen(parentPath, FOPEN_RB);
	if (!file)
	{
		errmsg = GetLastErrorMessage();
		return false;
	}
	bool ok = SyncDescriptor(fileno(file), errmsg);
	fclose(file);
	return ok;
}


DirBrowser::DirBrowser(const char* path)
{
	DIR* dir = opendir(path);
	if (!dir)
	{
		return;
	}

	while (struct dirent* entry = readdir(dir))
	{
		if (strcmp(entry->d_name, ".") && strcmp(entry->d_name, ".."))
		{
			m_names.emplace_back(entry->d_name);
		}
	}
	closedir(dir);
}

const char* DirBrowser::Next()
{
	return m_pos < m_names.size() ? *m_names[m_pos++] : nullptr;
}


DiskFile::~DiskFile()
{
	if (m_file)
	{
		Close();
	}
}

bool DiskFile::Open(const char* filename, EOpenMode mode)
{
	const char* strmode = mode == omRead ? FOPEN_RB : mode == omReadWrite ?
		FOPEN_RBP : mode == omWrite ? FOPEN_WB : FOPEN_AB;
	m_file = fopen(filename, strmode);
	return m_file;
}

// returns true on success
bool DiskFile::Close()
{
	if (!m_file)
	{
		return false;
	}

	int ret = fclose(m_file);
	m_file = nullptr;
	return ret == 0;
}

int64 DiskFile::Read(void* buffer, int64 size)
{
	return fread(buffer, 1, (size_t)size, m_file);
}

int64 DiskFile::Write(const void* buffer, int64 size)
{
	return fwrite(buffer, 1, (size_t)size, m_file);
}

int64 DiskFile::Print(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	int ret = vfprintf(m_file, format, ap);
	va_end(ap);
	return ret;
}

char* DiskFile::ReadLine(char* buffer, int64 size)
{
	return fgets(buffer, (int)size, m_file);
}

bool DiskFile::Seek(int64 position)
{
	return fseeko(m_file, (off_t)position, SEEK_SET) == 0;
}

bool DiskFile::Error()
{
	return ferror(m_file) != 0;
}

bool DiskFile::Flush()
{
	return fflush(m_file) == 0;
}

bool DiskFile::Sync(CString& errmsg)
{
	return SyncDescriptor(fileno(m_file), errmsg);
}
