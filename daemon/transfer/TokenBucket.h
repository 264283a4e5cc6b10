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


#ifndef TOKENBUCKET_H
#define TOKENBUCKET_H

#include "Thread.h"
#include "JobInfo.h"

/*
 * Decides which priority class is served next (start-time fair queuing).
 * Every class carries a virtual time advanced by bytes/weight on each grant;
 * the waiting class with the lowest virtual time goes first, ties go to the
 * higher priority. Within a class waiters are served in arrival order.
 */
class WeightedFairQueue
{
public:
	static const int ClassCount = 3;

	WeightedFairQueue();
	void SetWeights(int high, int normal, int low);
	void Enqueue(JobInfo::EPriority priority, uint64 ticket);
	void Remove(JobInfo::EPriority priority, uint64 ticket);
	bool IsHead(JobInfo::EPriority priority, uint64 ticket) const;
	/* Removes the head of the given class and charges "bytes" to it */
	void Served(JobInfo::EPriority priority, int bytes);
	/* Class whose head is served next, -1 if nobody waits */
	int NextClass() const;
	bool Empty() const;

private:
	typedef std::deque<uint64> Tickets;

	Tickets m_tickets[ClassCount];
	int m_weights[ClassCount];
	double m_virtualTime[ClassCount];
	double m_systemTime = 0;
};

class TokenBucket
{
public:
	enum EResult
	{
		trGranted,
		trCancelled
	};

	typedef std::function<bool()> CancelCheck;

	/* rate in bytes per second, 0 for unlimited */
	TokenBucket(int rate, int chunkSize);
	void SetRate(int rate);
	int GetRate();
	void SetWeights(int high, int normal, int low);
	void SetWaitInterval(int waitInterval) { m_waitInterval = waitInterval; }

	/*
	 * Blocks until "bytes" may be transferred. "cancelled" is polled at least
	 * every wait interval; a pending cancellation abandons the wait.
	 */
	EResult Acquire(int bytes, JobInfo::EPriority priority, CancelCheck cancelled);

private:
	Mutex m_mutex;
	ConditionVar m_cond;
	WeightedFairQueue m_scheduler;
	int m_rate;
	int m_chunkSize;
	int m_waitInterval = 100;
	double m_tokens = 0;
	int64 m_lastRefill = 0;
	uint64 m_ticketGen = 0;

	int64 GetCapacity() { return std::max(m_rate, m_chunkSize); }
	void Refill();
};

#endif
