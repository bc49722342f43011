#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<ev.h>
#include<iostream>

namespace {

/* Lives on the stack of Ev::start for the
 * duration of ev_run.
 */
struct Boot {
	ev_idle watcher;
	Ev::Io<int> main;
	int code;
};

int const code_uncaught = 254;
int const code_no_loop = 255;

void on_boot(EV_P_ ev_idle* w, int) {
	auto& boot = *static_cast<Boot*>(w->data);
	ev_idle_stop(EV_A_ w);

	auto main = std::move(boot.main);
	main.run([&boot](int code) {
		boot.code = code;
	}, [&boot](std::exception_ptr e) {
		std::cerr << "ctvpool: uncaught exception: ";
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& ex) {
			std::cerr << ex.what();
		} catch (...) {
			std::cerr << "(non-standard exception)";
		}
		std::cerr << std::endl;
		boot.code = code_uncaught;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "ctvpool: cannot initialize libev" << std::endl;
		return code_no_loop;
	}

	auto boot = Boot{ ev_idle(), std::move(main), code_no_loop };
	ev_idle_init(&boot.watcher, &on_boot);
	boot.watcher.data = &boot;
	ev_idle_start(EV_DEFAULT_ &boot.watcher);

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "ctvpool: loop exited with watchers active"
			  << std::endl;

	return boot.code;
}

}
