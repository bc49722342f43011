#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<signal.h>
#include<stdexcept>
#include<thread>
#include<vector>
#include"Ev/ThreadPool.hpp"
#include"Util/BacktraceException.hpp"

namespace Ev {

class ThreadPool::Impl {
private:
	/* Main-loop side.  Workers only use `loop` to
	 * send the wakeup.  */
	struct ev_loop* loop;
	std::vector<std::thread> workers;
	std::size_t outstanding;
	ev_async wakeup;

	/* Guarded by mtx.  */
	std::mutex mtx;
	std::condition_variable has_job;
	bool stopping;
	std::deque<Job> jobs;
	std::deque<std::function<void()>> done;

	void work() {
		for (;;) {
			auto job = Job();
			{
				auto lock = std::unique_lock<std::mutex>(mtx);
				has_job.wait(lock, [this]() {
					return stopping || !jobs.empty();
				});
				if (stopping)
					return;
				job = std::move(jobs.front());
				jobs.pop_front();
			}
			auto k = job();
			{
				auto lock = std::unique_lock<std::mutex>(mtx);
				done.push_back(std::move(k));
			}
			ev_async_send(loop, &wakeup);
		}
	}

	/* Several sends may coalesce into one callback,
	 * and a callback may find nothing new.
	 */
	void drain() {
		auto ready = std::deque<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			ready.swap(done);
		}
		outstanding -= ready.size();
		if (outstanding == 0)
			ev_async_stop(loop, &wakeup);
		for (auto& k : ready)
			k();
	}

	static
	void on_wakeup(EV_P_ ev_async* w, int) {
		static_cast<Impl*>(w->data)->drain();
	}

public:
	explicit
	Impl(std::size_t num_threads)
		: loop(EV_DEFAULT), outstanding(0), stopping(false) {
		if (num_threads == 0)
			throw Util::BacktraceException<std::invalid_argument>(
				"Ev::ThreadPool: zero threads"
			);
		ev_async_init(&wakeup, &on_wakeup);
		wakeup.data = this;

		/* Workers inherit a fully blocked mask so
		 * signals always land on the main thread.
		 */
		sigset_t all;
		sigset_t saved;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &saved);
		try {
			for (auto i = std::size_t(0); i < num_threads; ++i)
				workers.emplace_back([this]() { work(); });
		} catch (...) {
			pthread_sigmask(SIG_SETMASK, &saved, nullptr);
			shut_down();
			throw;
		}
		pthread_sigmask(SIG_SETMASK, &saved, nullptr);
	}

	void submit(Job job) {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			jobs.push_back(std::move(job));
		}
		has_job.notify_one();
		if (outstanding++ == 0)
			ev_async_start(loop, &wakeup);
	}

	void shut_down() {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		has_job.notify_all();
		for (auto& t : workers)
			t.join();
		workers.clear();
	}

	~Impl() {
		shut_down();
		if (ev_is_active(&wakeup))
			ev_async_stop(loop, &wakeup);
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(new Impl(num_threads)) { }
ThreadPool::~ThreadPool() =default;

void ThreadPool::submit(Job job) {
	pimpl->submit(std::move(job));
}

}
