#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

namespace {

struct Refused : public std::runtime_error {
	Refused() : std::runtime_error("refused") { }
};

}

int main() {
	auto after_throw = false;
	auto unrelated_handler = false;

	auto code = Ev::yield().then([&]() {
		throw Refused();
		after_throw = true;
		return Ev::lift(std::string("unreachable"));
	}).catching<std::logic_error>([&](std::logic_error const&) {
		/* Not our type; must be skipped.  */
		unrelated_handler = true;
		return Ev::lift(std::string("wrong handler"));
	}).catching<std::runtime_error>([](std::runtime_error const& e) {
		/* Caught through the base class.  */
		return Ev::lift(std::string(e.what()));
	}).then([](std::string msg) {
		assert(msg == "refused");
		return Ev::lift(0);
	});

	auto rv = Ev::start(code);
	assert(rv == 0);
	assert(!after_throw);
	assert(!unrelated_handler);

	/* An exception escaping everything makes
	 * Ev::start report failure.  */
	rv = Ev::start(Ev::yield().then([]() {
		throw std::runtime_error("uncaught");
		return Ev::lift(0);
	}));
	assert(rv == 254);

	return 0;
}
