#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

namespace Bitcoin { namespace Detail {

void put_compact(std::ostream& os, std::uint64_t v) {
	if (v < 0xFD) {
		os.put(char(v));
	} else if (v <= 0xFFFF) {
		os.put(char(0xFD));
		put_le(os, v, 2);
	} else if (v <= 0xFFFFFFFF) {
		os.put(char(0xFE));
		put_le(os, v, 4);
	} else {
		os.put(char(0xFF));
		put_le(os, v, 8);
	}
}

std::uint64_t get_compact(std::istream& is) {
	auto lead = is.get();
	if (lead == std::char_traits<char>::eof())
		return 0;
	switch (lead) {
	case 0xFD: return get_le(is, 2);
	case 0xFE: return get_le(is, 4);
	case 0xFF: return get_le(is, 8);
	default: return std::uint64_t(lead);
	}
}

}}

namespace Bitcoin {

void write_prefixed(std::ostream& os, std::vector<std::uint8_t> const& data) {
	os << varint(data.size());
	os.write(reinterpret_cast<char const*>(data.data()), data.size());
}

void read_prefixed(std::istream& is, std::vector<std::uint8_t>& out) {
	out.clear();
	auto len = std::uint64_t();
	is >> varint(len);
	if (!is)
		return;
	if (len > max_byte_string) {
		is.setstate(std::ios_base::failbit);
		return;
	}
	out.resize(std::size_t(len));
	if (len != 0 && !is.read(reinterpret_cast<char*>(out.data()), std::streamsize(len)))
		out.clear();
}

}
