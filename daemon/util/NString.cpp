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
#include "NString.h"

template <int size>
BString<size>::BString(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	FormatV(format, ap);
	va_end(ap);
}

template <int size>
void BString<size>::Set(const char* str, int len)
{
	m_data[0] = '\0';
	if (!str)
	{
		return;
	}
	int addLen = len > 0 ? std::min(size - 1, len) : size - 1;
	strncpy(m_data, str, addLen);
	m_data[addLen] = '\0';
}

template <int size>
void BString<size>::Append(const char* str, int len)
{
	if (len == 0)
	{
		len = strlen(str);
	}
	int curLen = strlen(m_data);
	int addLen = std::min(size - curLen - 1, len);
	if (addLen > 0)
	{
		memcpy(m_data + curLen, str, addLen);
		m_data[curLen + addLen] = '\0';
	}
}

template <int size>
void BString<size>::AppendFmt(const char* format, ...)
{
	int curLen = strlen(m_data);
	if (curLen >= size - 1)
	{
		return;
	}

	va_list ap;
	va_start(ap, format);
	vsnprintf(m_data + curLen, size - curLen, format, ap);
	va_end(ap);
}

template <int size>
int BString<size>::Format(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	int len = FormatV(format, ap);
	va_end(ap);
	return len;
}

template <int size>
int BString<size>::FormatV(const char* format, va_list ap)
{
	// the result is truncated to capacity, the returned length too
	int len = std::max(vsnprintf(m_data, size, format, ap), 0);
	return std::min(len, size - 1);
}

bool CString::operator==(const char* other) const
{
	return (!m_data && !other) ||
		(m_data && other && !strcmp(m_data, other));
}

void CString::Set(const char* str, int len)
{
	if (!str)
	{
		Clear();
		return;
	}

	if (len == 0)
	{
		len = strlen(str);
	}
	char* newData = (char*)malloc(len + 1);
	strncpy(newData, str, len);
	newData[len] = '\0';
	free(m_data);
	m_data = newData;
}

void CString::Append(const char* str, int len)
{
	if (len == 0)
	{
		len = strlen(str);
	}
	int curLen = Length();
	m_data = (char*)realloc(m_data, curLen + len + 1);
	memcpy(m_data + curLen, str, len);
	m_data[curLen + len] = '\0';
}

void CString::AppendFmt(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	CString tail;
	tail.FormatV(format, ap);
	va_end(ap);

	if (!tail.Empty())
	{
		Append(tail);
	}
}

int CString::Format(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	int len = FormatV(format, ap);
	va_end(ap);
	return len;
}

int CString::FormatV(const char* format, va_list ap)
{
	va_list ap2;
	va_copy(ap2, ap);

	int newLen = std::max(vsnprintf(nullptr, 0, format, ap), 0);

	char* newData = (char*)malloc(newLen + 1);
	newLen = vsnprintf(newData, newLen + 1, format, ap2);
	va_end(ap2);

	free(m_data);
	m_data = newData;
	return newLen;
}

CString CString::FormatStr(const char* format, ...)
{
	CString result;
	va_list ap;
	va_start(ap, format);
	result.FormatV(format, ap);
	va_end(ap);
	return result;
}

int CString::Find(const char* str, int pos) const
{
	if (!m_data || pos > Length())
	{
		return -1;
	}
	char* res = strstr(m_data + pos, str);
	return res ? (int)(res - m_data) : -1;
}

void CString::Replace(char from, char to)
{
	for (char* p = m_data; p && *p; p++)
	{
		if (*p == from)
		{
			*p = to;
		}
	}
}

void CString::Reserve(int capacity)
{
	int curLen = Length();
	if (capacity > curLen || !m_data)
	{
		m_data = (char*)realloc(m_data, capacity + 1);
		m_data[curLen] = '\0';
	}
}

void CString::TrimRight()
{
	int len = Length();
	if (len == 0)
	{
		return;
	}

	char* end = m_data + len - 1;
	while (end >= m_data && (*end == '\n' || *end == '\r' || *end == ' ' || *end == '\t'))
	{
		*end = '\0';
		end--;
	}
}


template class BString<1024>;
template class BString<100>;
template class BString<20>;
template class BString<16>;
