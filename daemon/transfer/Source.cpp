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
#include "Source.h"
#include "FileSource.h"
#include "ManifestFile.h"
#include "HttpSource.h"
#include "Options.h"
#include "Util.h"
#include "FileSystem.h"

Source::EStatus Source::SetError(EStatus status, const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	m_errorMessage.FormatV(format, ap);
	va_end(ap);
	return status;
}

bool SourceFactory::IsManifestRef(const char* sourceRef)
{
	return Util::StartsWith(sourceRef, "manifest:", false);
}

bool SourceFactory::IsHttpRef(const char* sourceRef)
{
	return Util::StartsWith(sourceRef, "http://", false);
}

bool SourceFactory::IsFileRef(const char* sourceRef)
{
	// a reference without scheme is a plain path
	return Util::StartsWith(sourceRef, "file://", false) ||
		(!strstr(sourceRef, "://") && !IsManifestRef(sourceRef));
}

const char* SourceFactory::FilePath(const char* sourceRef)
{
	if (Util::StartsWith(sourceRef, "file://", false))
	{
		return sourceRef + 7;
	}
	if (IsManifestRef(sourceRef))
	{
		return sourceRef + 9;
	}
	return sourceRef;
}

bool SourceFactory::Validate(const char* sourceRef, CString& title, CString& errmsg)
{
	if (Util::EmptyStr(sourceRef))
	{
		errmsg = "empty source reference";
		return false;
	}

	if (IsHttpRef(sourceRef))
	{
		URL url(sourceRef);
		if (!url.IsValid())
		{
			errmsg.Format("malformed url %s", sourceRef);
			return false;
		}
		const char* resource = url.GetResource();
		const char* baseName = strrchr(resource, '/');
		title = baseName ? baseName + 1 : resource;
		// strip query string
		char* query = strchr(title, '?');
		if (query) *query = '\0';
		if (title.Empty())
		{
			title = url.GetHost();
		}
		return true;
	}

	if (IsManifestRef(sourceRef))
	{
		ManifestFile manifest(FilePath(sourceRef));
		if (!manifest.Parse())
		{
			errmsg.Format("invalid manifest %s: %s", FilePath(sourceRef), manifest.GetErrorMessage());
			return false;
		}
		if (IsManifestRef(manifest.GetPayload()))
		{
			errmsg.Format("manifest %s refers to another manifest", FilePath(sourceRef));
			return false;
		}
		CString payloadTitle;
		if (!Validate(manifest.GetPayload(), payloadTitle, errmsg))
		{
			return false;
		}
		title = manifest.GetTitle();
		return true;
	}

	if (IsFileRef(sourceRef))
	{
		const char* path = FilePath(sourceRef);
		if (Util::EmptyStr(path) || !FileSystem::FileExists(path))
		{
			errmsg.Format("file %s does not exist", path);
			return false;
		}
		title = FileSystem::BaseFileName(path);
		return true;
	}

	errmsg.Format("unknown scheme in source reference %s", sourceRef);
	return false;
}

std::unique_ptr<Source> SourceFactory::Create(const char* sourceRef)
{
	if (IsHttpRef(sourceRef))
	{
		std::unique_ptr<HttpSource> source = std::make_unique<HttpSource>(sourceRef);
		if (g_Options)
		{
			source->SetTimeout(g_Options->GetUrlTimeout());
		}
		return std::move(source);
	}

	if (IsManifestRef(sourceRef))
	{
		return std::make_unique<ManifestSource>(FilePath(sourceRef), this);
	}

	if (IsFileRef(sourceRef))
	{
		return std::make_unique<FileSource>(FilePath(sourceRef));
	}

	return nullptr;
}
