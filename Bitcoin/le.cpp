#include"Bitcoin/le.hpp"

namespace Bitcoin { namespace Detail {

void put_le(std::ostream& os, std::uint64_t v, std::size_t width) {
	for (auto i = std::size_t(0); i < width; ++i)
		os.put(char((v >> (8 * i)) & 0xFF));
}

std::uint64_t get_le(std::istream& is, std::size_t width) {
	auto v = std::uint64_t(0);
	for (auto i = std::size_t(0); i < width; ++i) {
		auto c = is.get();
		if (c == std::char_traits<char>::eof())
			return v;
		v |= std::uint64_t(std::uint8_t(c)) << (8 * i);
	}
	return v;
}

}}
