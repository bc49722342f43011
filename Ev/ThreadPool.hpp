#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/** Ev::ThreadPool
 *
 * @brief runs blocking functions on worker
 * threads and resumes the calling greenthread
 * on the main loop with the result.
 *
 * @desc Node RPC round trips go through here,
 * as does tree construction for larger pools.
 * The pool must outlive every action it creates.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* A job runs on a worker and returns the
	 * continuation to invoke on the main loop.
	 */
	typedef std::function<std::function<void()>()> Job;
	void submit(Job);

public:
	explicit
	ThreadPool(std::size_t num_threads = 4);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto shared = std::make_shared<std::function<a()>>(
			std::move(func)
		);
		return Ev::Io<a>([shared, this]( std::function<void(a)> pass
					       , std::function<void(std::exception_ptr)> fail
					       ) {
			submit([shared, pass, fail]() -> std::function<void()> {
				try {
					auto res = std::make_shared<a>((*shared)());
					return [pass, res]() { pass(std::move(*res)); };
				} catch (...) {
					auto e = std::current_exception();
					return [fail, e]() { fail(e); };
				}
			});
		});
	}
};

}

#endif /* !defined(EV_THREADPOOL_HPP) */
