#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<vector>

namespace {

Ev::Io<void> record(std::vector<int>& order, int n) {
	return Ev::yield().then([&order, n]() {
		order.push_back(n);
		return Ev::lift();
	});
}

}

int main() {
	auto order = std::vector<int>();

	/* Nothing runs until started.  */
	auto act = record(order, 1) + record(order, 2);
	assert(order.empty());

	act += record(order, 3);
	auto chain = Ev::lift();
	for (auto i = 4; i <= 10; ++i)
		chain += record(order, i);
	act = std::move(act) + std::move(chain);

	auto res = Ev::start(std::move(act).then([&]() {
		assert(order.size() == 10);
		return Ev::lift(int(order.back()) - 10);
	}));

	assert(res == 0);
	for (auto i = std::size_t(0); i < order.size(); ++i)
		assert(order[i] == int(i + 1));
	return res;
}
