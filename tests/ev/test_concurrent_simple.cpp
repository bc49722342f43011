#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>

int main() {
	auto spawned_ran = false;
	auto parent_saw_spawned = true;

	auto ec = Ev::start(Ev::lift().then([&]() {
		return Ev::concurrent(Ev::lift().then([&]() {
			spawned_ran = true;
			return Ev::lift();
		}));
	}).then([&]() {
		/* The new greenthread waits for us to yield.  */
		parent_saw_spawned = spawned_ran;
		return Ev::yield(2);
	}).then([&]() {
		assert(spawned_ran);
		return Ev::lift(0);
	}));

	assert(ec == 0);
	assert(!parent_saw_spawned);
	assert(spawned_ran);
	return ec;
}
