#include<assert.h>
#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<signal.h>
#include<thread>
#include<vector>
#include"Ev/ThreadPool.hpp"
#include"Util/make_unique.hpp"

namespace {

/* Blocks all signals for the lifetime of the object, so
 * threads started meanwhile inherit an empty mask.
 */
class SigBlocker {
private:
	sigset_t old_set;
public:
	SigBlocker(SigBlocker const&) =delete;

	SigBlocker() {
		sigset_t all;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &old_set);
	}
	~SigBlocker() {
		pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
	}
};

}

namespace Ev {

class ThreadPool::Impl {
private:
	typedef std::function<std::function<void()>()> Work;
	typedef std::function<void()> Result;

	/* Main thread only.  */
	std::vector<std::thread> workers;
	std::size_t outstanding;
	ev_async wakeup;

	/* Guarded by mtx.  */
	std::mutex mtx;
	std::condition_variable cnd;
	bool stopping;
	std::deque<Work> work;
	std::deque<Result> results;

	void worker() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			cnd.wait(lock, [this]() {
				return stopping || !work.empty();
			});
			if (stopping)
				return;
			auto w = std::move(work.front());
			work.pop_front();

			lock.unlock();
			auto r = w();
			w = nullptr;
			lock.lock();

			results.push_back(std::move(r));
			ev_async_send(EV_DEFAULT_ &wakeup);
		}
	}

	/* Sends coalesce, so drain everything that is ready.  */
	void on_wakeup() {
		auto ready = std::deque<Result>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			ready.swap(results);
		}
		outstanding -= ready.size();
		/* An idle pool must not keep the loop alive.  */
		if (outstanding == 0)
			ev_async_stop(EV_DEFAULT_ &wakeup);
		for (auto& r : ready)
			r();
	}
	static
	void on_wakeup_static(EV_P_ ev_async* w, int) {
		static_cast<Impl*>(w->data)->on_wakeup();
	}

public:
	explicit
	Impl(std::size_t num_threads) : outstanding(0), stopping(false) {
		ev_async_init(&wakeup, &on_wakeup_static);
		wakeup.data = this;

		SigBlocker blocker;
		for (auto i = std::size_t(0); i < num_threads; ++i)
			workers.emplace_back([this]() { worker(); });
	}

	void add(Work w) {
		assert(w);
		if (outstanding == 0)
			ev_async_start(EV_DEFAULT_ &wakeup);
		++outstanding;
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			work.push_back(std::move(w));
		}
		cnd.notify_one();
	}

	~Impl() {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		cnd.notify_all();
		for (auto& t : workers)
			t.join();
		ev_async_stop(EV_DEFAULT_ &wakeup);
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(Util::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() =default;

void
ThreadPool::add(std::function<std::function<void()>()> work) {
	pimpl->add(std::move(work));
}

}
