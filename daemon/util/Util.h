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


#ifndef UTIL_H
#define UTIL_H

#include "NString.h"

class Util
{
public:
	static int64 JoinInt64(uint32 Hi, uint32 Lo);
	static void SplitInt64(int64 Int64, uint32* Hi, uint32* Lo);

	static void TrimRight(char* str);
	static char* Trim(char* str);
	static bool EmptyStr(const char* str) { return !str || !*str; }
	static std::vector<CString> SplitStr(const char* str, const char* separators);
	static bool StartsWith(const char* str, const char* prefix, bool caseSensitive);

	static time_t CurrentTime();

	/* Microseconds from an arbitrary but fixed point */
	static int64 CurrentTicks();
	static void Sleep(int milliseconds);

	static void FormatTime(time_t timeSec, char* buffer, int bufsize);
	static CString FormatTime(time_t timeSec);

	static CString FormatSpeed(int64 bytesPerSecond);
	static CString FormatSize(int64 fileSize);

	/* "h:mm:ss" */
	static CString FormatDuration(int64 seconds);

	/*
	* Returns program version formatted like "1.2.0".
	*/
	static const char* VersionRevision() { return VersionRevisionString; };

	static const char* VersionRevisionString;

	static void Init();
};

class URL
{
public:
	URL(const char* address);
	bool IsValid() { return m_valid; }
	const char* GetAddress() { return m_address; }
	const char* GetProtocol() { return m_protocol; }
	const char* GetUser() { return m_user; }
	const char* GetPassword() { return m_password; }
	const char* GetHost() { return m_host; }
	const char* GetResource() { return m_resource; }
	int GetPort() { return m_port; }

private:
	CString m_address;
	CString m_protocol;
	CString m_user;
	CString m_password;
	CString m_host;
	CString m_resource;
	int m_port = 0;
	bool m_valid = false;

	void ParseUrl();
};

class Tokenizer
{
public:
	Tokenizer(const char* dataString, const char* separators);
	char* Next();

private:
	CString m_dataString;
	const char* m_separators;
	char* m_savePtr = nullptr;
	bool m_working = false;
};

/*
Incremental CRC-32 (zlib polynomial).
 */
class Crc32
{
public:
	Crc32() { Reset(); }
	void Reset() { m_crc = crc32(0L, Z_NULL, 0); }
	void Append(const uchar* block, uint32 length) { m_crc = crc32(m_crc, block, length); }
	uint32 Finish() { return (uint32)m_crc; }

	/* CRC of the concatenation of two blocks, given the length of the second one */
	static uint32 Combine(uint32 crc1, uint32 crc2, int64 len2);

private:
	uLong m_crc;
};

/*
Incremental SHA-256 via OpenSSL EVP interface.
 */
class Sha256
{
public:
	Sha256();
	Sha256(const Sha256&) = delete;
	~Sha256();
	bool Reset();
	bool Append(const void* block, int length);

	/* Returns lowercase hex digest or empty string on failure */
	CString Finish();

	static CString HexDigest(const uchar* digest, int len);

private:
	EVP_MD_CTX* m_context = nullptr;
	bool m_ok = false;
};

#endif
