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
#include "WorkerPool.h"
#include "Log.h"
#include "Util.h"

void WorkerPool::SetSlots(int slots)
{
	Guard guard(m_slotsMutex);
	m_slotCount = slots;
}

int WorkerPool::GetSlots()
{
	Guard guard(m_slotsMutex);
	return m_slotCount;
}

bool WorkerPool::HasFreeSlot()
{
	Guard guard(m_slotsMutex);
	return LockedActiveCount() < m_slotCount;
}

int WorkerPool::GetActiveCount()
{
	Guard guard(m_slotsMutex);
	return LockedActiveCount();
}

int WorkerPool::LockedActiveCount()
{
	int count = 0;
	for (Slot& slot : m_slots)
	{
		if (slot.GetInUse())
		{
			count++;
		}
	}
	return count;
}

bool WorkerPool::Lease(TransferUnit* unit)
{
	Guard guard(m_slotsMutex);

	if (LockedActiveCount() >= m_slotCount)
	{
		return false;
	}

	Slot* freeSlot = nullptr;
	for (Slot& slot : m_slots)
	{
		if (!slot.GetInUse())
		{
			freeSlot = &slot;
			break;
		}
	}

	if (!freeSlot)
	{
		m_slots.emplace_back();
		freeSlot = &m_slots.back();
	}

	freeSlot->SetUnit(unit);
	freeSlot->SetLeaseTime(Util::CurrentTime());

	debug("Slot leased to job %i", unit->GetJobId());

	unit->Start();
	return true;
}

void WorkerPool::Release(TransferUnit* unit)
{
	Guard guard(m_slotsMutex);

	for (Slot& slot : m_slots)
	{
		if (slot.GetUnit() == unit)
		{
			debug("Slot of job %i released after %i s", unit->GetJobId(),
				(int)(Util::CurrentTime() - slot.GetLeaseTime()));
			slot.SetUnit(nullptr);
			return;
		}
	}

	error("Internal error: releasing unknown transfer unit of job %i", unit->GetJobId());
}

TransferUnit* WorkerPool::Find(int jobId)
{
	Guard guard(m_slotsMutex);

	for (Slot& slot : m_slots)
	{
		if (slot.GetInUse() && slot.GetUnit()->GetJobId() == jobId)
		{
			return slot.GetUnit();
		}
	}

	return nullptr;
}

WorkerPool::JobIds WorkerPool::GetActiveJobs()
{
	Guard guard(m_slotsMutex);

	JobIds jobIds;
	for (Slot& slot : m_slots)
	{
		if (slot.GetInUse())
		{
			jobIds.push_back(slot.GetUnit()->GetJobId());
		}
	}
	return jobIds;
}

void WorkerPool::StopAll(TransferUnit::EStopReason reason)
{
	Guard guard(m_slotsMutex);

	for (Slot& slot : m_slots)
	{
		if (slot.GetInUse())
		{
			slot.GetUnit()->Stop(reason);
		}
	}
}
