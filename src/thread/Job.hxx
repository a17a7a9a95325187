// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A job that shall be executed in a worker thread.
 */

#pragma once

#include <boost/intrusive/list_hook.hpp>

class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being worked on
		 * yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,

		/**
		 * The job has finished, but the Done() method has not been
		 * invoked yet.
		 */
		DONE,
	};

	State state = State::INITIAL;

	virtual ~ThreadJob() noexcept = default;

	/**
	 * Is this job currently idle, i.e. not being worked on by a
	 * worker thread?  This method may be called only from the main
	 * thread.
	 */
	bool IsIdle() const noexcept {
		return state == State::INITIAL;
	}

	/**
	 * Invoked in a worker thread.
	 */
	virtual void Run() noexcept = 0;

	/**
	 * Invoked in the main thread after Run() has finished, or after
	 * the queue was stopped before the job could run.
	 */
	virtual void Done() noexcept = 0;
};
