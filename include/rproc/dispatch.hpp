/*
 * dispatch.hpp
 *
 *  Created on: Oct 8, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_DISPATCH_HPP_
#define INCLUDE_RPROC_DISPATCH_HPP_

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <string>

#include "rproc/rproc.hpp"

namespace rproc {
namespace dispatch {

/**
 * \brief The ways the rows of a grid are divided among workers.
 */
enum class Partition {
	Striped,	///<! Worker t owns the rows where row % threads == t.
	Block		///<! Worker t owns a contiguous block of ceil(rows / threads) rows.
};

/**
 * \brief Return the number of hardware threads, or 1 if it can't be determined.
 */
R_DLL_EXPORT int defaultThreads();

/**
 * \brief Return the rows owned by the given worker, in ascending order.
 *
 * \param rows The total number of rows.
 * \param threads The number of workers.
 * \param thread The index of the worker.
 * \param partition The partition scheme.
 * \return The list of row indices.
 */
R_DLL_EXPORT std::vector<int> partitionRows(int rows, int threads, int thread, Partition partition);

/**
 * \brief The result of the computation for one row, tagged with the row index.
 *
 * If the computation failed, error holds the exception and the payload is undefined.
 */
template <class P>
class RowResult {
public:
	int row;
	P payload;
	std::exception_ptr error;

	RowResult() :
		row(-1) {}
};

/**
 * \brief A many-producer, one-consumer queue of row results.
 *
 * The consumer learns that the queue is exhausted when every producer
 * has called done() and the queue is empty.
 */
template <class P>
class ResultQueue {
private:
	std::queue<RowResult<P> > m_queue;
	int m_producers;
	std::mutex m_mtx;
	std::condition_variable m_cv;

public:

	ResultQueue(int producers) :
		m_producers(producers) {}

	void push(RowResult<P>&& result) {
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			m_queue.push(std::move(result));
		}
		m_cv.notify_one();
	}

	/**
	 * \brief Called by a producer when it will push no more results.
	 */
	void done() {
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			--m_producers;
		}
		m_cv.notify_one();
	}

	/**
	 * \brief Wait for a result.
	 *
	 * \param[out] result The result.
	 * \return False if there are no more results.
	 */
	bool pop(RowResult<P>& result) {
		std::unique_lock<std::mutex> lk(m_mtx);
		while(m_queue.empty() && m_producers > 0)
			m_cv.wait(lk);
		if(m_queue.empty())
			return false;
		result = std::move(m_queue.front());
		m_queue.pop();
		return true;
	}

};

/**
 * \brief Runs a per-row computation on a pool of workers and hands the
 * tagged results to a single consumer on the calling thread.
 *
 * Every row is computed exactly once, by the worker that owns it under the
 * partition scheme. The consumer receives results in arrival order, which
 * is not row order, and must use the row tag.
 *
 * The compute functor has the signature void(int row, P& payload). It is
 * called concurrently and must only read shared state. The consume functor
 * has the signature void(int row, P& payload) and is only called on the
 * thread that called run().
 *
 * If compute throws, the remaining workers stop claiming rows, all workers
 * are joined and the exception is rethrown from run(). The same applies to
 * an exception thrown by consume. No results are consumed after a failure.
 */
template <class P>
class RowDispatcher {
private:
	int m_rows;
	int m_threads;
	Partition m_partition;

public:

	/**
	 * \brief Configure a dispatcher.
	 *
	 * \param rows The number of rows.
	 * \param threads The number of workers. If less than 1, the hardware parallelism is used.
	 *                Never more than the number of rows.
	 * \param partition The partition scheme.
	 */
	RowDispatcher(int rows, int threads = 0, Partition partition = Partition::Block) :
		m_rows(rows),
		m_threads(threads < 1 ? defaultThreads() : threads),
		m_partition(partition) {
		if(rows < 0)
			r_argerr("The number of rows must not be negative.");
		if(m_threads > rows)
			m_threads = rproc::max(1, rows);
	}

	int rows() const {
		return m_rows;
	}

	int threads() const {
		return m_threads;
	}

	Partition partition() const {
		return m_partition;
	}

	/**
	 * \brief Run the computation over all rows and consume the results.
	 *
	 * \param compute The per-row computation.
	 * \param consume The consumer.
	 * \param monitor If not null, receives progress updates.
	 * \param message The status message.
	 */
	template <class Compute, class Consume>
	void run(Compute compute, Consume consume, Monitor* monitor = nullptr, const std::string& message = "") {

		if(m_rows == 0)
			return;

		ResultQueue<P> queue(m_threads);
		std::atomic<bool> failed(false);
		std::exception_ptr error;
		std::vector<std::thread> threads;

		for(int t = 0; t < m_threads; ++t) {
			try {
				threads.emplace_back([&, t]() {
					std::vector<int> rows;
					try {
						rows = partitionRows(m_rows, m_threads, t, m_partition);
					} catch(...) {
						RowResult<P> result;
						result.error = std::current_exception();
						failed.store(true);
						queue.push(std::move(result));
					}
					for(int row : rows) {
						if(failed.load())
							break;
						RowResult<P> result;
						result.row = row;
						try {
							compute(row, result.payload);
						} catch(...) {
							result.error = std::current_exception();
							failed.store(true);
						}
						queue.push(std::move(result));
					}
					queue.done();
				});
			} catch(const std::exception& ex) {
				// Couldn't start the worker. Its rows will never arrive.
				r_error("Failed to start worker " << t << ": " << ex.what());
				error = std::current_exception();
				failed.store(true);
				for(int i = t; i < m_threads; ++i)
					queue.done();
				break;
			}
		}

		RowResult<P> result;
		int received = 0;
		int lastPct = -1;
		while(queue.pop(result)) {
			if(error)
				continue;
			if(result.error) {
				error = result.error;
				continue;
			}
			try {
				consume(result.row, result.payload);
			} catch(...) {
				error = std::current_exception();
				failed.store(true);
				continue;
			}
			++received;
			if(monitor) {
				int pct = (int) ((float) received / m_rows * 100.0f);
				if(pct != lastPct) {
					lastPct = pct;
					monitor->status((float) received / m_rows, message);
				}
			}
		}

		for(std::thread& th : threads) {
			if(th.joinable())
				th.join();
		}

		if(error)
			std::rethrow_exception(error);

		if(received != m_rows)
			r_runerr("Expected " << m_rows << " row results but received " << received << ".");
	}

};

} // dispatch
} // rproc

#endif /* INCLUDE_RPROC_DISPATCH_HPP_ */
