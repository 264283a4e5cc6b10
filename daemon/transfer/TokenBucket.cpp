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
#include "TokenBucket.h"
#include "Log.h"
#include "Util.h"

WeightedFairQueue::WeightedFairQueue()
{
	SetWeights(4, 2, 1);
	for (int i = 0; i < ClassCount; i++)
	{
		m_virtualTime[i] = 0;
	}
}

void WeightedFairQueue::SetWeights(int high, int normal, int low)
{
	m_weights[JobInfo::jpHigh] = std::max(high, 1);
	m_weights[JobInfo::jpNormal] = std::max(normal, 1);
	m_weights[JobInfo::jpLow] = std::max(low, 1);
}

void WeightedFairQueue::Enqueue(JobInfo::EPriority priority, uint64 ticket)
{
	if (m_tickets[priority].empty())
	{
		// an idle class does not save up service
		m_virtualTime[priority] = std::max(m_virtualTime[priority], m_systemTime);
	}
	m_tickets[priority].push_back(ticket);
}

void WeightedFairQueue::Remove(JobInfo::EPriority priority, uint64 ticket)
{
	Tickets& tickets = m_tickets[priority];
	tickets.erase(std::remove(tickets.begin(), tickets.end(), ticket), tickets.end());
}

bool WeightedFairQueue::IsHead(JobInfo::EPriority priority, uint64 ticket) const
{
	return NextClass() == priority && m_tickets[priority].front() == ticket;
}

void WeightedFairQueue::Served(JobInfo::EPriority priority, int bytes)
{
	if (m_tickets[priority].empty())
	{
		return;
	}
	m_tickets[priority].pop_front();
	m_systemTime = std::max(m_systemTime, m_virtualTime[priority]);
	m_virtualTime[priority] += (double)bytes / m_weights[priority];
}

int WeightedFairQueue::NextClass() const
{
	int next = -1;
	for (int i = ClassCount - 1; i >= 0; i--)
	{
		if (!m_tickets[i].empty() && (next == -1 || m_virtualTime[i] < m_virtualTime[next]))
		{
			next = i;
		}
	}
	return next;
}

bool WeightedFairQueue::Empty() const
{
	for (int i = 0; i < ClassCount; i++)
	{
		if (!m_tickets[i].empty())
		{
			return false;
		}
	}
	return true;
}


TokenBucket::TokenBucket(int rate, int chunkSize) :
	m_rate(rate), m_chunkSize(chunkSize)
{
	m_tokens = (double)GetCapacity();
	m_lastRefill = Util::CurrentTicks();
}

void TokenBucket::SetRate(int rate)
{
	Guard guard(m_mutex);
	Refill();
	m_rate = rate;
	m_tokens = std::min(m_tokens, (double)GetCapacity());
	m_cond.NotifyAll();
	debug("Download rate set to %i", rate);
}

int TokenBucket::GetRate()
{
	Guard guard(m_mutex);
	return m_rate;
}

void TokenBucket::SetWeights(int high, int normal, int low)
{
	Guard guard(m_mutex);
	m_scheduler.SetWeights(high, normal, low);
}

void TokenBucket::Refill()
{
	int64 now = Util::CurrentTicks();
	int64 elapsed = now - m_lastRefill;
	m_lastRefill = now;

	if (m_rate > 0 && elapsed > 0)
	{
		m_tokens = std::min(m_tokens + (double)m_rate * elapsed / 1000000.0, (double)GetCapacity());
	}
}

TokenBucket::EResult TokenBucket::Acquire(int bytes, JobInfo::EPriority priority, CancelCheck cancelled)
{
	Guard guard(m_mutex);

	uint64 ticket = ++m_ticketGen;
	m_scheduler.Enqueue(priority, ticket);

	while (true)
	{
		if (cancelled && cancelled())
		{
			m_scheduler.Remove(priority, ticket);
			m_cond.NotifyAll();
			return trCancelled;
		}

		Refill();

		if (m_scheduler.IsHead(priority, ticket))
		{
			int64 need = std::min((int64)bytes, GetCapacity());
			if (m_rate == 0 || m_tokens >= need)
			{
				if (m_rate > 0)
				{
					m_tokens -= bytes;
				}
				m_scheduler.Served(priority, bytes);
				m_cond.NotifyAll();
				return trGranted;
			}
		}

		int waitTime = m_waitInterval;
		if (m_rate > 0 && m_scheduler.IsHead(priority, ticket))
		{
			int64 need = std::min((int64)bytes, GetCapacity());
			int refillTime = (int)((need - m_tokens) * 1000 / m_rate) + 1;
			waitTime = std::max(1, std::min(waitTime, refillTime));
		}

		m_cond.WaitFor(m_mutex, waitTime);
	}
}
