#include"Bitcoin/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<cmath>
#include<sstream>
#include<stdexcept>

namespace Bitcoin {

bool Amount::valid_string(std::string const& s) {
	auto end = s.end();
	if (s.size() > 3 && std::string(s.end() - 3, s.end()) == "sat")
		end -= 3;
	if (end == s.begin())
		return false;
	bool flag = std::all_of( s.begin(), end
			       , [](char c) { return '0' <= c && c <= '9'; }
			       );
	if (!flag)
		return false;
	/* 21,000,000 BTC is 2,100,000,000,000,000 sat, 16 digits.  */
	if (end - s.begin() > 16)
		return false;
	return true;
}

Amount::Amount(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Amount string invalid: " + s
		);
	auto is = std::istringstream(s);
	is >> v;
}
Amount::operator std::string() const {
	auto os = std::ostringstream();
	os << v << "sat";
	return os.str();
}

Amount Amount::btc(double b) {
	if (!(b > 0))
		return Amount();
	auto sats = std::llround(b * 100000000.0);
	return Amount::sat(std::uint64_t(sats));
}

std::string Amount::to_btc_string() const {
	return Util::Str::fmt( "%llu.%08llu"
			     , (unsigned long long) (v / 100000000)
			     , (unsigned long long) (v % 100000000)
			     );
}

}
