#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<memory>

namespace {

struct Resume {
	ev_idle watcher;
	std::function<void()> pass;
};

void on_resume(EV_P_ ev_idle* w, int) {
	auto resume = std::unique_ptr<Resume>(static_cast<Resume*>(w->data));
	ev_idle_stop(EV_A_ &resume->watcher);

	auto pass = std::move(resume->pass);
	resume.reset();

	pass();
}

}

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		auto resume = Util::make_unique<Resume>();
		resume->pass = std::move(pass);
		ev_idle_init(&resume->watcher, &on_resume);
		resume->watcher.data = resume.get();
		ev_idle_start(EV_DEFAULT_ &resume.release()->watcher);
	});
}

Io<void> yield(std::size_t num_yields) {
	auto act = Ev::lift();
	for (auto i = std::size_t(0); i < num_yields; ++i)
		act += yield();
	return act;
}

}
