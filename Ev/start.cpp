#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>
#include<memory>

namespace {

auto const exit_no_loop = 255;
auto const exit_unhandled = 254;
auto const exit_stalled = 253;

/* State shared between `Ev::start` and the idle
 * watcher that launches the main action.  */
struct MainContainer {
	std::ostream& diag;
	bool done;
	int exit_code;
	Ev::Io<int> main;
};

void start_idle_handler(EV_P_ ev_idle *raw_idler, int revents) {
	/* Recover control of idler back from C.  */
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto containerp = (MainContainer*) idler->data;
	auto main = std::move(containerp->main);

	main.run([containerp](int exit_code) {
		containerp->done = true;
		containerp->exit_code = exit_code;
	}, [containerp](std::exception_ptr e) {
		auto& diag = containerp->diag;
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& e) {
			diag << "Ev::start: unhandled exception: "
			     << e.what() << std::endl;
		} catch (...) {
			diag << "Ev::start: unhandled exception of unknown type"
			     << std::endl;
		}
		containerp->done = true;
		containerp->exit_code = exit_unhandled;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	return start(std::move(main), std::cerr);
}

int start(Io<int> main, std::ostream& diag) {
	if (!ev_default_loop(0)) {
		diag << "Ev::start: libev failed to initialize" << std::endl;
		return exit_no_loop;
	}

	auto container = MainContainer{ diag, false, exit_no_loop, std::move(main) };

	auto idler = Util::make_unique<ev_idle>();
	ev_idle_init(idler.get(), &start_idle_handler);
	idler->data = &container;

	/* Give control over to C code.  */
	ev_idle_start(EV_DEFAULT_ idler.release());

	auto result = ev_run(EV_DEFAULT_ 0);
	if (result)
		diag << "Ev::start: libev waiters still active" << std::endl;

	if (!container.done) {
		diag << "Ev::start: main action never completed" << std::endl;
		return exit_stalled;
	}
	return container.exit_code;
}

}
