// Node lifecycle: tracks in-flight tasks and coordinates shutdown.

#pragma once

#include "duckflow_common.hpp"

#include <arrow/util/cancel.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace duckflow {

class Stopper {
public:
	// Failures of async tasks are logged against `log_db` when it is set.
	explicit Stopper(duckdb::DatabaseInstance *log_db_p = nullptr);
	~Stopper();

	Stopper(const Stopper &) = delete;
	Stopper &operator=(const Stopper &) = delete;

	// Run `fn` in the calling thread as a tracked task. Throws IOException if the node is quiescing.
	void RunTask(const string &name, const std::function<void()> &fn);

	// Run `fn` on a new thread as a tracked task. Throws IOException if the node is quiescing.
	void RunAsyncTask(const string &name, std::function<void()> fn);

	// Token stopped once Stop() has been called.
	arrow::StopToken ShouldQuiesce() const {
		return stop_source.token();
	}
	bool IsQuiescing() const {
		return quiescing.load();
	}

	// Register a callback invoked when quiescing begins, before waiting for tasks. Callbacks registered after
	// Stop() are invoked immediately.
	void OnQuiesce(std::function<void()> callback);

	// Register a closer, invoked after all tasks finished. Closers run in reverse registration order.
	void AddCloser(std::function<void()> closer);

	// Number of tasks currently running.
	idx_t NumTasks() const;

	// Quiesce and wait for all tasks. Safe to call more than once.
	void Stop();

private:
	struct AsyncTask {
		std::thread thread;
		std::shared_ptr<std::atomic<bool>> done;
	};

	// Account a new task, throwing if quiescing. Caller holds `mu`.
	void BeginTaskLocked(const string &name);
	void EndTask();
	// Join async tasks which have finished. Caller holds `mu`.
	void ReapAsyncTasksLocked();

	duckdb::DatabaseInstance *log_db;
	mutable arrow::StopSource stop_source;
	std::atomic<bool> quiescing {false};

	mutable std::mutex mu;
	std::condition_variable tasks_done_cv;
	idx_t num_tasks = 0;
	bool stopped = false;
	vector<AsyncTask> async_tasks;
	vector<std::function<void()>> quiesce_callbacks;
	vector<std::function<void()>> closers;
};

} // namespace duckflow
