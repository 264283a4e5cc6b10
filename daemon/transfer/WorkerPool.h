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


#ifndef WORKERPOOL_H
#define WORKERPOOL_H

#include "Thread.h"
#include "TransferUnit.h"

/*
 * Bounded set of execution slots. A leased slot runs exactly one transfer
 * unit; the slot is freed when the unit reports that it has finished.
 */
class WorkerPool
{
public:
	typedef std::vector<int> JobIds;

	WorkerPool(int slots) : m_slotCount(slots) {}
	/* Shrinking never interrupts running units, it only blocks new leases */
	void SetSlots(int slots);
	int GetSlots();
	bool HasFreeSlot();
	int GetActiveCount();
	bool Lease(TransferUnit* unit);
	void Release(TransferUnit* unit);
	TransferUnit* Find(int jobId);
	JobIds GetActiveJobs();
	void StopAll(TransferUnit::EStopReason reason);

private:
	class Slot
	{
	public:
		TransferUnit* GetUnit() { return m_unit; }
		void SetUnit(TransferUnit* unit) { m_unit = unit; }
		bool GetInUse() { return m_unit != nullptr; }
		time_t GetLeaseTime() { return m_leaseTime; }
		void SetLeaseTime(time_t leaseTime) { m_leaseTime = leaseTime; }
	private:
		TransferUnit* m_unit = nullptr;
		time_t m_leaseTime = 0;
	};

	typedef std::vector<Slot> Slots;

	Slots m_slots;
	int m_slotCount;
	Mutex m_slotsMutex;

	int LockedActiveCount();
};

#endif
