#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

void concurrent_idle_handler(EV_P_ ev_idle* raw_idler, int) {
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto io = std::unique_ptr<Ev::Io<void>>((Ev::Io<void>*) idler->data);

	io->run([]() { }, [](std::exception_ptr ep) {
		std::cerr << "Unhandled exception in concurrent task: ";
		try {
			std::rethrow_exception(ep);
		} catch (std::exception const& e) {
			std::cerr << e.what() << std::endl;
		} catch (...) {
			std::cerr << "unknown type" << std::endl;
		}
	});
}

}

namespace Ev {

Io<void> concurrent(Io<void> io) {
	return Io<void>([io]( std::function<void()> pass
			    , std::function<void(std::exception_ptr)> fail
			    ) {
		try {
			auto io_ptr = Util::make_unique<Io<void>>(io);
			auto idler = Util::make_unique<ev_idle>();
			ev_idle_init(idler.get(), &concurrent_idle_handler);
			idler->data = (void*) io_ptr.release();
			ev_idle_start(EV_DEFAULT_ idler.release());
		} catch (...) {
			fail(std::current_exception());
			return;
		}
		pass();
	});
}

}
