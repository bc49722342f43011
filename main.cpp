#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Pool/Main.hpp"
#include"Pool/NodeIF.hpp"
#include"Pool/open_bitcoind.hpp"
#include<curl/curl.h>
#include<iostream>
#include<memory>
#include<string>
#include<vector>

namespace {

Ev::Io<int> run_pool(std::vector<std::string> args) {
	auto pool = std::make_shared<Pool::Main>(
		std::move(args), std::cout, std::cerr,
		Pool::open_bitcoind
	);
	/* The capture keeps `pool` alive until it is done.  */
	return pool->run().then([pool](int code) {
		return Ev::lift(code);
	});
}

}

int main(int argc, char** argv) {
	/* Before any thread touches curl.  */
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		std::cerr << "ctvpool: curl initialization failed" << std::endl;
		return 1;
	}
	auto code = Ev::start(run_pool(std::vector<std::string>(argv, argv + argc)));
	curl_global_cleanup();
	return code;
}
