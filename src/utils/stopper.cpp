#include "utils/stopper.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"

namespace duckflow {

Stopper::Stopper(duckdb::DatabaseInstance *log_db_p) : log_db(log_db_p) {
}

Stopper::~Stopper() {
	Stop();
}

void Stopper::BeginTaskLocked(const string &name) {
	if (quiescing.load()) {
		throw IOException("node unavailable; try another peer: cannot run task %s while quiescing", name);
	}
	++num_tasks;
}

void Stopper::EndTask() {
	std::lock_guard<std::mutex> lck(mu);
	--num_tasks;
	if (num_tasks == 0) {
		tasks_done_cv.notify_all();
	}
}

void Stopper::RunTask(const string &name, const std::function<void()> &fn) {
	{
		std::lock_guard<std::mutex> lck(mu);
		BeginTaskLocked(name);
	}
	struct TaskGuard {
		Stopper &stopper;
		~TaskGuard() {
			stopper.EndTask();
		}
	} guard {*this};
	fn();
}

void Stopper::ReapAsyncTasksLocked() {
	for (auto iter = async_tasks.begin(); iter != async_tasks.end();) {
		if (iter->done->load()) {
			iter->thread.join();
			iter = async_tasks.erase(iter);
		} else {
			++iter;
		}
	}
}

void Stopper::RunAsyncTask(const string &name, std::function<void()> fn) {
	std::lock_guard<std::mutex> lck(mu);
	BeginTaskLocked(name);
	ReapAsyncTasksLocked();

	auto done = std::make_shared<std::atomic<bool>>(false);
	std::thread thread([this, name, done, fn = std::move(fn)]() {
		try {
			fn();
		} catch (std::exception &ex) {
			duckdb::ErrorData error(ex);
			if (log_db != nullptr) {
				DUCKDB_LOG_ERROR(*log_db, StringUtil::Format("task %s failed: %s", name, error.Message()));
			}
		}
		EndTask();
		done->store(true);
	});
	async_tasks.emplace_back(AsyncTask {std::move(thread), std::move(done)});
}

void Stopper::OnQuiesce(std::function<void()> callback) {
	{
		std::lock_guard<std::mutex> lck(mu);
		if (!quiescing.load()) {
			quiesce_callbacks.emplace_back(std::move(callback));
			return;
		}
	}
	callback();
}

void Stopper::AddCloser(std::function<void()> closer) {
	std::lock_guard<std::mutex> lck(mu);
	closers.emplace_back(std::move(closer));
}

idx_t Stopper::NumTasks() const {
	std::lock_guard<std::mutex> lck(mu);
	return num_tasks;
}

void Stopper::Stop() {
	vector<std::function<void()>> callbacks;
	{
		std::lock_guard<std::mutex> lck(mu);
		if (stopped) {
			return;
		}
		stopped = true;
		quiescing.store(true);
		callbacks = std::move(quiesce_callbacks);
		quiesce_callbacks.clear();
	}
	stop_source.RequestStop();
	for (auto &callback : callbacks) {
		callback();
	}

	vector<AsyncTask> tasks;
	vector<std::function<void()>> pending_closers;
	{
		std::unique_lock<std::mutex> lck(mu);
		tasks_done_cv.wait(lck, [this]() { return num_tasks == 0; });
		tasks = std::move(async_tasks);
		async_tasks.clear();
		pending_closers = std::move(closers);
		closers.clear();
	}
	for (auto &task : tasks) {
		task.thread.join();
	}
	for (auto iter = pending_closers.rbegin(); iter != pending_closers.rend(); ++iter) {
		(*iter)();
	}
}

} // namespace duckflow
