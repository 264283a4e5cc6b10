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

#include "TokenBucket.h"
#include "Util.h"

static std::string ServeAll(WeightedFairQueue& scheduler)
{
	std::string order;
	int next;
	while ((next = scheduler.NextClass()) >= 0)
	{
		order += next == JobInfo::jpHigh ? 'H' : next == JobInfo::jpNormal ? 'N' : 'L';
		scheduler.Served((JobInfo::EPriority)next, 1000);
	}
	return order;
}

TEST_CASE("WeightedFairQueue: weights decide the share", "[TokenBucket][Quick]")
{
	WeightedFairQueue scheduler;
	uint64 ticket = 0;

	for (int i = 0; i < 6; i++)
	{
		scheduler.Enqueue(JobInfo::jpHigh, ++ticket);
	}
	scheduler.Enqueue(JobInfo::jpLow, ++ticket);

	REQUIRE(ServeAll(scheduler) == "HLHHHHH");
	REQUIRE(scheduler.Empty());
}

TEST_CASE("WeightedFairQueue: all classes", "[TokenBucket][Quick]")
{
	WeightedFairQueue scheduler;
	scheduler.SetWeights(2, 1, 1);
	uint64 ticket = 0;

	for (int i = 0; i < 4; i++)
	{
		scheduler.Enqueue(JobInfo::jpHigh, ++ticket);
		scheduler.Enqueue(JobInfo::jpNormal, ++ticket);
		scheduler.Enqueue(JobInfo::jpLow, ++ticket);
	}

	REQUIRE(ServeAll(scheduler) == "HNLHHNLHNLNL");
}

TEST_CASE("WeightedFairQueue: class leaving between chunks keeps its share", "[TokenBucket][Quick]")
{
	WeightedFairQueue scheduler;
	uint64 ticket = 0;

	// every waiter leaves after its grant and comes back with the next chunk
	std::string order;
	scheduler.Enqueue(JobInfo::jpHigh, ++ticket);
	scheduler.Enqueue(JobInfo::jpNormal, ++ticket);
	scheduler.Enqueue(JobInfo::jpLow, ++ticket);
	for (int i = 0; i < 14; i++)
	{
		int next = scheduler.NextClass();
		REQUIRE(next >= 0);
		order += next == JobInfo::jpHigh ? 'H' : next == JobInfo::jpNormal ? 'N' : 'L';
		scheduler.Served((JobInfo::EPriority)next, 1000);
		scheduler.Enqueue((JobInfo::EPriority)next, ++ticket);
	}

	REQUIRE(std::count(order.begin(), order.end(), 'H') == 8);
	REQUIRE(std::count(order.begin(), order.end(), 'N') == 4);
	REQUIRE(std::count(order.begin(), order.end(), 'L') == 2);
}

TEST_CASE("WeightedFairQueue: idle class does not save up turns", "[TokenBucket][Quick]")
{
	WeightedFairQueue scheduler;
	uint64 ticket = 0;

	for (int i = 0; i < 10; i++)
	{
		scheduler.Enqueue(JobInfo::jpHigh, ++ticket);
		REQUIRE(scheduler.NextClass() == JobInfo::jpHigh);
		scheduler.Served(JobInfo::jpHigh, 1000);
	}

	for (int i = 0; i < 8; i++)
	{
		scheduler.Enqueue(JobInfo::jpHigh, ++ticket);
	}
	scheduler.Enqueue(JobInfo::jpLow, ++ticket);
	scheduler.Enqueue(JobInfo::jpLow, ++ticket);

	REQUIRE(ServeAll(scheduler) == "LHHHHLHHHH");
}

TEST_CASE("WeightedFairQueue: arrival order within a class", "[TokenBucket][Quick]")
{
	WeightedFairQueue scheduler;
	scheduler.Enqueue(JobInfo::jpNormal, 10);
	scheduler.Enqueue(JobInfo::jpNormal, 11);
	scheduler.Enqueue(JobInfo::jpNormal, 12);

	REQUIRE(scheduler.IsHead(JobInfo::jpNormal, 10));
	REQUIRE_FALSE(scheduler.IsHead(JobInfo::jpNormal, 11));

	scheduler.Remove(JobInfo::jpNormal, 10);
	REQUIRE(scheduler.IsHead(JobInfo::jpNormal, 11));

	scheduler.Enqueue(JobInfo::jpHigh, 13);
	REQUIRE(scheduler.IsHead(JobInfo::jpHigh, 13));
	REQUIRE_FALSE(scheduler.IsHead(JobInfo::jpNormal, 11));

	// asking does not change the answer
	for (int i = 0; i < 5; i++)
	{
		REQUIRE(scheduler.NextClass() == JobInfo::jpHigh);
	}
}

TEST_CASE("TokenBucket: unlimited rate", "[TokenBucket][Quick]")
{
	TokenBucket bucket(0, 1000);

	int64 start = Util::CurrentTicks();
	for (int i = 0; i < 1000; i++)
	{
		REQUIRE(bucket.Acquire(1000, JobInfo::jpNormal, nullptr) == TokenBucket::trGranted);
	}
	REQUIRE(Util::CurrentTicks() - start < 1000000);
}

TEST_CASE("TokenBucket: rate limit", "[TokenBucket][Slow]")
{
	TokenBucket bucket(10000, 1000);
	bucket.SetWaitInterval(10);
	REQUIRE(bucket.GetRate() == 10000);

	int64 start = Util::CurrentTicks();
	for (int i = 0; i < 20; i++)
	{
		REQUIRE(bucket.Acquire(1000, JobInfo::jpNormal, nullptr) == TokenBucket::trGranted);
	}
	int64 elapsed = Util::CurrentTicks() - start;

	// the first 10000 bytes come from the full bucket
	REQUIRE(elapsed >= 800000);
	REQUIRE(elapsed < 5000000);
}

TEST_CASE("TokenBucket: cancelled wait", "[TokenBucket][Slow]")
{
	TokenBucket bucket(1, 1000);
	bucket.SetWaitInterval(10);

	REQUIRE(bucket.Acquire(1000, JobInfo::jpHigh, nullptr) == TokenBucket::trGranted);

	int64 deadline = Util::CurrentTicks() + 100000;
	TokenBucket::EResult result = bucket.Acquire(1000, JobInfo::jpHigh,
		[deadline]{ return Util::CurrentTicks() > deadline; });
	REQUIRE(result == TokenBucket::trCancelled);

	// changing the rate wakes up waiters and takes effect immediately
	bucket.SetRate(0);
	REQUIRE(bucket.Acquire(1000, JobInfo::jpLow, nullptr) == TokenBucket::trGranted);
}

TEST_CASE("TokenBucket: priority share among waiting transfers", "[TokenBucket][Slow]")
{
	TokenBucket bucket(20000, 1000);
	bucket.SetWaitInterval(5);
	bucket.SetWeights(4, 2, 1);

	std::atomic<bool> stop{false};
	std::atomic<int> granted[WeightedFairQueue::ClassCount];
	for (int i = 0; i < WeightedFairQueue::ClassCount; i++)
	{
		granted[i] = 0;
	}

	std::vector<std::thread> threads;
	for (int priority = JobInfo::jpLow; priority <= JobInfo::jpHigh; priority++)
	{
		threads.emplace_back([&, priority]
		{
			while (!stop)
			{
				if (bucket.Acquire(1000, (JobInfo::EPriority)priority, [&]{ return (bool)stop; }) ==
					TokenBucket::trGranted)
				{
					granted[priority]++;
				}
			}
		});
	}

	// the full bucket at start is handed out before all threads are waiting
	Util::Sleep(500);
	int startHigh = granted[JobInfo::jpHigh];
	int startNormal = granted[JobInfo::jpNormal];
	int startLow = granted[JobInfo::jpLow];

	Util::Sleep(2000);
	stop = true;
	for (std::thread& thread : threads)
	{
		thread.join();
	}

	int high = granted[JobInfo::jpHigh] - startHigh;
	int normal = granted[JobInfo::jpNormal] - startNormal;
	int low = granted[JobInfo::jpLow] - startLow;
	REQUIRE(high > normal);
	REQUIRE(normal > low);
	REQUIRE(low > 0);
}
