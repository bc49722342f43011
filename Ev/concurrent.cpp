#include<ev.h>
#include<iostream>
#include<memory>
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"

namespace {

/* One allocation per spawned greenthread.  */
struct Spawn {
	ev_idle watcher;
	Ev::Io<void> action;

	explicit
	Spawn(Ev::Io<void> action_) : action(std::move(action_)) { }
};

void report(std::exception_ptr e) {
	std::cerr << "ctvpool: greenthread failed: ";
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& ex) {
		std::cerr << ex.what();
	} catch (...) {
		std::cerr << "(non-standard exception)";
	}
	std::cerr << std::endl;
}

void on_spawn(EV_P_ ev_idle* w, int) {
	auto spawn = std::unique_ptr<Spawn>(static_cast<Spawn*>(w->data));
	ev_idle_stop(EV_A_ &spawn->watcher);

	auto action = std::move(spawn->action);
	spawn.reset();

	action.run([]() { }, &report);
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		auto spawn = std::unique_ptr<Spawn>();
		try {
			spawn = Util::make_unique<Spawn>(io);
		} catch (...) {
			fail(std::current_exception());
			return;
		}
		ev_idle_init(&spawn->watcher, &on_spawn);
		spawn->watcher.data = spawn.get();
		/* Owned by the loop until on_spawn runs.  */
		ev_idle_start(EV_DEFAULT_ &spawn.release()->watcher);
		pass();
	});
}

}
