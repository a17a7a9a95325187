// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A queue that manages work for worker threads.
 */

#pragma once

#include "Job.hxx"
#include "event/Notify.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

class EventLoop;

class ThreadQueue {
	std::mutex mutex;
	std::condition_variable cond;

	bool alive = true;

	using JobList = boost::intrusive::list<ThreadJob,
					       boost::intrusive::constant_time_size<false>>;

	JobList waiting, busy, done;

	Notify notify;

public:
	/**
	 * Throws on error.
	 */
	explicit ThreadQueue(EventLoop &event_loop);
	~ThreadQueue() noexcept;

	ThreadQueue(const ThreadQueue &) = delete;
	ThreadQueue &operator=(const ThreadQueue &) = delete;

	/**
	 * Cancel all Wait() calls and refuse all further calls.  This is
	 * used to initiate shutdown of all threads connected to this
	 * queue.
	 */
	void Stop() noexcept;

	/**
	 * Enqueue a job, and wake up an idle thread (if there is any).
	 */
	void Add(ThreadJob &job) noexcept;

	/**
	 * Dequeue an existing job or wait for a new job, and reserve it.
	 *
	 * @return nullptr if Stop() has been called
	 */
	ThreadJob *Wait() noexcept;

	/**
	 * Mark the specified job (returned by Wait()) as "done".
	 */
	void Done(ThreadJob &job) noexcept;

	/**
	 * Cancel a job that has been queued.
	 *
	 * @return true if the job is now canceled, false if the job is
	 * currently being processed
	 */
	bool Cancel(ThreadJob &job) noexcept;

	/**
	 * Invoke ThreadJob::Done() on all jobs which are still queued.
	 * Must be called after all worker threads have been joined.
	 */
	void Drain() noexcept;

private:
	bool IsEmpty() const noexcept {
		return waiting.empty() && busy.empty() && done.empty();
	}

	void WakeupCallback() noexcept;
};
