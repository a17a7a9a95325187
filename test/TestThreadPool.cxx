// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "event/Loop.hxx"
#include "thread/Pool.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace {

struct Counters {
	EventLoop &event_loop;
	std::atomic_uint n_run{0};
	unsigned n_done = 0, n_expected = 0;
	bool main_thread_only = true;
	const std::thread::id main_thread = std::this_thread::get_id();
};

class CountingJob final : public ThreadJob {
	Counters &counters;

public:
	bool ran = false;

	explicit CountingJob(Counters &_counters) noexcept
		:counters(_counters) {}

	void Run() noexcept override {
		ran = true;
		++counters.n_run;
	}

	void Done() noexcept override {
		if (std::this_thread::get_id() != counters.main_thread)
			counters.main_thread_only = false;

		if (++counters.n_done == counters.n_expected)
			counters.event_loop.Break();
	}
};

}

TEST(ThreadPool, Run)
{
	EventLoop event_loop;
	Counters counters{event_loop};

	ThreadPool pool(event_loop, 4);
	pool.Start();

	std::vector<std::unique_ptr<CountingJob>> jobs;
	counters.n_expected = 64;
	for (unsigned i = 0; i < counters.n_expected; ++i) {
		jobs.emplace_back(std::make_unique<CountingJob>(counters));
		pool.GetQueue().Add(*jobs.back());
	}

	event_loop.Dispatch();

	EXPECT_EQ(counters.n_run.load(), 64U);
	EXPECT_EQ(counters.n_done, 64U);
	EXPECT_TRUE(counters.main_thread_only);

	for (const auto &job : jobs)
		EXPECT_TRUE(job->IsIdle());

	pool.StopAndJoin();
}

TEST(ThreadPool, Cancel)
{
	EventLoop event_loop;
	Counters counters{event_loop};

	/* no worker threads: jobs stay in the queue */
	ThreadPool pool(event_loop, 0);
	pool.Start();

	CountingJob a(counters), b(counters);
	auto &queue = pool.GetQueue();
	queue.Add(a);
	queue.Add(b);

	EXPECT_TRUE(queue.Cancel(a));
	EXPECT_TRUE(a.IsIdle());

	/* pending jobs are finished without running them */
	pool.StopAndJoin();

	EXPECT_FALSE(a.ran);
	EXPECT_FALSE(b.ran);
	EXPECT_EQ(counters.n_done, 1U);
	EXPECT_TRUE(b.IsIdle());
}
