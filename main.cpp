#include<Escrow/Main.hpp>
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<iostream>
#include<memory>
#include<sodium/core.h>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i)
		arg_vec.push_back(std::string(argv[i]));
	auto main_obj = std::make_shared<Escrow::Main>(
		arg_vec, std::cout, std::cerr
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Keeps main_obj alive until the run completes.  */
		return Ev::lift(ec);
	});
}

}

int main(int argc, char **argv) {
	if (sodium_init() < 0) {
		std::cerr << argv[0] << ": libsodium failed to initialize"
			  << std::endl;
		return 1;
	}
	auto code = io_main(argc, argv);
	return Ev::start(code);
}
