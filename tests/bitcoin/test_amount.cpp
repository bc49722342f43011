#undef NDEBUG
#include"Bitcoin/Amount.hpp"
#include<assert.h>
#include<cstdint>
#include<sstream>
#include<stdexcept>

int main() {
	assert(Bitcoin::Amount("100000") == Bitcoin::Amount::sat(100000));
	assert(Bitcoin::Amount("100000sat") == Bitcoin::Amount::sat(100000));
	assert(Bitcoin::Amount::btc(0.005) == Bitcoin::Amount::sat(500000));
	assert(Bitcoin::Amount::btc(50.0) == Bitcoin::Amount::sat(5000000000ULL));
	/* bitcoind reports balances as doubles.  */
	assert(Bitcoin::Amount::btc(0.00000001) == Bitcoin::Amount::sat(1));
	assert(Bitcoin::Amount::btc(-1.0) == Bitcoin::Amount());

	assert(std::string(Bitcoin::Amount::sat(547)) == "547sat");
	assert(Bitcoin::Amount::sat(5000000000ULL).to_btc_string() == "50.00000000");
	assert(Bitcoin::Amount::sat(1).to_btc_string() == "0.00000001");
	assert(Bitcoin::Amount::sat(123456789).to_btc_string() == "1.23456789");

	/* Pool arithmetic: 4 users at 100000 with 1000 anchor fee
	 * after one exit.  */
	auto s = Bitcoin::Amount::sat(100000);
	auto f = Bitcoin::Amount::sat(1000);
	assert((4 - 1) * s - 1 * f == Bitcoin::Amount::sat(299000));
	assert(s - f == Bitcoin::Amount::sat(99000));

	/* Saturation.  */
	assert(f - s == Bitcoin::Amount());
	auto max = Bitcoin::Amount::sat(UINT64_MAX);
	assert(max + f == max);
	assert(max * 2 == max);
	assert(Bitcoin::Amount::sat(3) * 0 == Bitcoin::Amount());

	assert(f < s);
	assert(s > f);
	assert(s >= s && s <= s);
	assert(s != f);

	{
		auto os = std::ostringstream();
		os << s + f;
		assert(os.str() == "101000sat");
	}

	assert(!Bitcoin::Amount::valid_string(""));
	assert(!Bitcoin::Amount::valid_string("sat"));
	assert(!Bitcoin::Amount::valid_string("-5"));
	assert(!Bitcoin::Amount::valid_string("1.5"));
	assert(!Bitcoin::Amount::valid_string("12345678901234567"));
	assert(Bitcoin::Amount::valid_string("2100000000000000"));

	auto flag = false;
	try {
		auto tmp = Bitcoin::Amount("garbage");
		(void) tmp;
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
