#ifndef EV_SEMAPHORE_HPP
#define EV_SEMAPHORE_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<memory>
#include<utility>

namespace Ev {

/** class Ev::Semaphore
 *
 * @brief limits how many greenthreads may be
 * inside `run` at once.
 *
 * @desc With a maximum of 1 this is a mutex:
 * `Pool::Settlement` uses it so that only one
 * step is ever broadcasting.
 * Callers beyond the limit are suspended and
 * admitted oldest first as slots free up,
 * whether the holder finished or threw.
 */
class Semaphore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Semaphore() =delete;
	Semaphore(Semaphore const&) =delete;

	Semaphore(Semaphore&& o);
	~Semaphore();
	explicit
	Semaphore(std::size_t max);

	/* Runs `action` once a slot is free.  Other
	 * greenthreads run while this waits and while
	 * `action` runs.  Exceptions from `action`
	 * propagate after the slot is released.  */
	Ev::Io<void> run(Ev::Io<void> action);

	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		/* The slot bookkeeping is in terms of
		 * Io<void>; the value waits on the side.  */
		auto slot = std::make_shared<std::shared_ptr<a>>();
		auto inner = std::move(action).then([slot](a v) {
			*slot = std::make_shared<a>(std::move(v));
			return Ev::lift();
		});
		return run(std::move(inner)).then([slot]() {
			return Ev::lift(std::move(**slot));
		});
	}
};

}

#endif /* !defined(EV_SEMAPHORE_HPP) */
