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

#include <catch2/catch.hpp>

#include "WorkerPool.h"
#include "TestUtil.h"
#include "TestSource.h"

class PoolReleaser : public Observer
{
public:
	PoolReleaser(WorkerPool* pool) : m_pool(pool) {}

protected:
	virtual void Update(Subject* caller, void* aspect)
	{
		if (*(TransferUnit::EAspect*)aspect == TransferUnit::uaFinished)
		{
			m_pool->Release((TransferUnit*)caller);
		}
	}

private:
	WorkerPool* m_pool;
};

TEST_CASE("WorkerPool: leasing slots", "[WorkerPool][Slow]")
{
	TestUtil::PrepareWorkingDir("");

	TestSourceFactory factory;
	SourcePlan* plan = factory.Plan("slow.bin");
	plan->size = 1000000;
	plan->readSize = 100;
	plan->readDelay = 5;

	WorkerPool pool(2);
	PoolReleaser releaser(&pool);

	std::vector<std::unique_ptr<TransferUnit>> units;
	for (int i = 1; i <= 3; i++)
	{
		std::unique_ptr<TransferUnit> unit = std::make_unique<TransferUnit>();
		unit->SetJobId(i);
		unit->SetSourceRef("test:slow.bin");
		unit->SetTitle("slow.bin");
		unit->SetTempFilename(CString::FormatStr("%s/tmp/%i.part", TestUtil::WorkingDir().c_str(), i));
		unit->SetDestDir(CString::FormatStr("%s/dst", TestUtil::WorkingDir().c_str()));
		unit->SetSourceFactory(&factory);
		unit->SetChunkSize(100);
		unit->Attach(&releaser);
		units.push_back(std::move(unit));
	}

	REQUIRE(pool.GetSlots() == 2);
	REQUIRE(pool.HasFreeSlot());
	REQUIRE(pool.Lease(units[0].get()));
	REQUIRE(pool.Lease(units[1].get()));
	REQUIRE_FALSE(pool.HasFreeSlot());
	REQUIRE_FALSE(pool.Lease(units[2].get()));
	REQUIRE_FALSE(units[2]->IsRunning());

	REQUIRE(pool.GetActiveCount() == 2);
	REQUIRE(pool.Find(1) == units[0].get());
	REQUIRE(pool.Find(3) == nullptr);
	WorkerPool::JobIds expected = {1, 2};
	REQUIRE(pool.GetActiveJobs() == expected);

	// shrinking blocks new leases but keeps running units
	pool.SetSlots(1);
	REQUIRE(pool.GetActiveCount() == 2);
	REQUIRE_FALSE(pool.HasFreeSlot());

	units[0]->Stop(TransferUnit::srPause);
	REQUIRE(units[0]->WaitFinished(20000));
	REQUIRE(pool.GetActiveCount() == 1);
	REQUIRE(pool.Find(1) == nullptr);
	REQUIRE_FALSE(pool.HasFreeSlot());

	pool.SetSlots(2);
	REQUIRE(pool.Lease(units[2].get()));
	REQUIRE(pool.Find(3) == units[2].get());

	pool.StopAll(TransferUnit::srShutdown);
	REQUIRE(units[1]->WaitFinished(20000));
	REQUIRE(units[2]->WaitFinished(20000));
	REQUIRE(pool.GetActiveCount() == 0);
	REQUIRE(units[1]->GetStatus() == TransferUnit::tsPaused);
	REQUIRE(units[1]->GetStopReason() == TransferUnit::srShutdown);
}
