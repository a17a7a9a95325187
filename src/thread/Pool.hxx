// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A fixed set of worker threads serving one #ThreadQueue.
 */

#pragma once

#include "Queue.hxx"

#include <vector>

#include <pthread.h>

class ThreadPool {
	ThreadQueue queue;

	std::vector<pthread_t> threads;

	const unsigned n_threads;

public:
	/**
	 * Throws on error.
	 */
	ThreadPool(EventLoop &event_loop, unsigned _n_threads);

	~ThreadPool() noexcept;

	ThreadQueue &GetQueue() noexcept {
		return queue;
	}

	/**
	 * Launch the worker threads.  Throws on error.
	 */
	void Start();

	/**
	 * Stop the queue, wait for all threads to exit and finish all
	 * jobs which are still pending.
	 */
	void StopAndJoin() noexcept;

private:
	static void *Run(void *ctx) noexcept;
};
