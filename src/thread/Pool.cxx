// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A fixed set of worker threads serving one #ThreadQueue.
 */

#include "Pool.hxx"

#include <system_error>

ThreadPool::ThreadPool(EventLoop &event_loop, unsigned _n_threads)
	:queue(event_loop), n_threads(_n_threads)
{
}

ThreadPool::~ThreadPool() noexcept
{
	StopAndJoin();
}

void *
ThreadPool::Run(void *ctx) noexcept
{
	/* reduce glibc's thread cancellation overhead */
	pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);

	auto &q = *(ThreadQueue *)ctx;

	ThreadJob *job;
	while ((job = q.Wait()) != nullptr) {
		job->Run();
		q.Done(*job);
	}

	return nullptr;
}

void
ThreadPool::Start()
{
	pthread_attr_t attr;
	pthread_attr_init(&attr);

	/* libcurl with TLS needs more than the default minimum */
	pthread_attr_setstacksize(&attr, 1024 * 1024);

	threads.reserve(n_threads);

	for (unsigned i = 0; i < n_threads; ++i) {
		pthread_t thread;
		int error = pthread_create(&thread, &attr, Run, &queue);
		if (error != 0) {
			pthread_attr_destroy(&attr);
			throw std::system_error(error, std::system_category(),
						"Failed to create worker thread");
		}

		threads.push_back(thread);
	}

	pthread_attr_destroy(&attr);
}

void
ThreadPool::StopAndJoin() noexcept
{
	queue.Stop();

	for (auto thread : threads)
		pthread_join(thread, nullptr);
	threads.clear();

	queue.Drain();
}
