#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<deque>
#include<functional>
#include<utility>

namespace Ev {

class Semaphore::Impl {
private:
	/* Free slots.  Zero whenever `waiting` is
	 * non-empty.  */
	std::size_t slots;

	struct Waiter {
		Ev::Io<void> action;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::deque<Waiter> waiting;

	/* Hand the slot just freed to the oldest waiter,
	 * or return it.  */
	void release() {
		if (waiting.empty()) {
			++slots;
			return;
		}
		auto next = std::move(waiting.front());
		waiting.pop_front();
		enter( std::move(next.action)
		     , std::move(next.pass)
		     , std::move(next.fail)
		     );
	}
	void enter( Ev::Io<void> action
		  , std::function<void()> pass
		  , std::function<void(std::exception_ptr)> fail
		  ) {
		auto ppass = std::make_shared<std::function<void()>>(std::move(pass));
		auto pfail = std::make_shared<std::function<void(std::exception_ptr)>>(std::move(fail));
		action.run([ppass, this]() {
			release();
			(*ppass)();
		}, [pfail, this](std::exception_ptr e) {
			release();
			(*pfail)(e);
		});
	}

public:
	explicit
	Impl(std::size_t max) : slots(max) { }
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	Ev::Io<void> run(Ev::Io<void> action_) {
		auto action = std::make_shared<Ev::Io<void>>(std::move(action_));
		return Ev::Io<void>([ this, action
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (slots == 0) {
				waiting.push_back(Waiter{
					std::move(*action), std::move(pass), std::move(fail)
				});
				return;
			}
			--slots;
			enter(std::move(*action), std::move(pass), std::move(fail));
		}) + Ev::yield();
	}
};

Semaphore::Semaphore(Semaphore&&) =default;
Semaphore::~Semaphore() =default;

Semaphore::Semaphore(std::size_t max)
	: pimpl(Util::make_unique<Impl>(max)) { }

Ev::Io<void> Semaphore::run(Ev::Io<void> action) {
	return pimpl->run(Ev::yield() + std::move(action));
}

}
