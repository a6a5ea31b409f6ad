#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking calls (HTTP requests to the Ark
 * server) on background threads, resuming the calling
 * greenthread on the main loop with the result.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* The outer function runs on a background thread and
	 * returns the continuation to run on the main loop.
	 */
	void add(std::function<std::function<void()>()>);

public:
	explicit
	ThreadPool(std::size_t num_threads = 4);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto funptr = std::make_shared<std::function<a()>>
			( std::move(func) );
		return Ev::Io<a>([ funptr
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			auto stage1 = [funptr, pass, fail]() {
				auto stage2 = std::function<void()>();
				try {
					auto res = std::make_shared<a>(
						(*funptr)()
					);
					stage2 = [pass, res]() {
						pass(std::move(*res));
					};
				} catch (...) {
					auto e = std::current_exception();
					stage2 = [fail, e]() {
						fail(e);
					};
				}
				return stage2;
			};
			add(stage1);
		});
	}
};

}

#endif /* !defined(EV_THREADPOOL_HPP) */
