// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A queue that manages work for worker threads.
 */

#include "Queue.hxx"

#include <cassert>

ThreadQueue::ThreadQueue(EventLoop &event_loop)
	:notify(event_loop, [this]{ WakeupCallback(); })
{
	notify.Disable();
}

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive);
	assert(IsEmpty());
}

void
ThreadQueue::WakeupCallback() noexcept
{
	std::unique_lock lock{mutex};

	while (!done.empty()) {
		ThreadJob &job = done.front();
		assert(job.state == ThreadJob::State::DONE);
		done.pop_front();

		job.state = ThreadJob::State::INITIAL;

		lock.unlock();
		job.Done();
		lock.lock();
	}

	const bool empty = IsEmpty();

	lock.unlock();

	if (empty)
		notify.Disable();
}

void
ThreadQueue::Stop() noexcept
{
	const std::scoped_lock lock{mutex};
	alive = false;
	cond.notify_all();
}

void
ThreadQueue::Add(ThreadJob &job) noexcept
{
	{
		const std::scoped_lock lock{mutex};
		assert(alive);

		if (job.state == ThreadJob::State::INITIAL) {
			job.state = ThreadJob::State::WAITING;
			waiting.push_back(job);
			cond.notify_one();
		}
	}

	notify.Enable();
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		if (!alive)
			return nullptr;

		if (!waiting.empty()) {
			auto &job = waiting.front();
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			waiting.pop_front();
			busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		cond.wait(lock);
	}
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	assert(job.state == ThreadJob::State::BUSY);

	{
		const std::scoped_lock lock{mutex};

		job.state = ThreadJob::State::DONE;
		busy.erase(busy.iterator_to(job));
		done.push_back(job);
	}

	notify.Signal();
}

bool
ThreadQueue::Cancel(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};

	switch (job.state) {
	case ThreadJob::State::INITIAL:
		/* already idle */
		return true;

	case ThreadJob::State::WAITING:
		/* cancel it */
		waiting.erase(waiting.iterator_to(job));
		job.state = ThreadJob::State::INITIAL;
		return true;

	case ThreadJob::State::BUSY:
		/* no chance */
		return false;

	case ThreadJob::State::DONE:
		/* the Done() callback is about to be invoked by
		   WakeupCallback() */
		return false;
	}

	return false;
}

void
ThreadQueue::Drain() noexcept
{
	assert(!alive);
	assert(busy.empty());

	JobList pending;

	{
		const std::scoped_lock lock{mutex};
		pending.splice(pending.end(), waiting);
		pending.splice(pending.end(), done);
	}

	while (!pending.empty()) {
		ThreadJob &job = pending.front();
		pending.pop_front();
		job.state = ThreadJob::State::INITIAL;
		job.Done();
	}

	notify.Disable();
}
