#include"Util/BacktraceException.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<stdexcept>

namespace {

auto const charset = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t const bech32_const = 1;
std::uint32_t const bech32m_const = 0x2bc830a3;

int decode_char(char c) {
	if ('A' <= c && c <= 'Z')
		c = c - 'A' + 'a';
	auto pos = charset.find(c);
	if (pos == std::string::npos)
		return -1;
	return int(pos);
}

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = std::uint8_t(chk >> 25);
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		if (top & 0x01) chk ^= 0x3b6a57b2;
		if (top & 0x02) chk ^= 0x26508e6d;
		if (top & 0x04) chk ^= 0x1ea119fa;
		if (top & 0x08) chk ^= 0x3d4233dd;
		if (top & 0x10) chk ^= 0x2a1462b3;
	}
	return chk;
}

/* High bits of each char, a zero, then low bits of each.  */
std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto ret = std::vector<std::uint8_t>();
	ret.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) >> 5);
	ret.push_back(0);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) & 0x1f);
	return ret;
}

std::uint32_t const_of(Util::Bech32::Encoding e) {
	return (e == Util::Bech32::Encoding::Bech32m) ? bech32m_const
						      : bech32_const
						      ;
}

}

namespace Util { namespace Bech32 {

Encoding decode( std::string& hrp
	       , std::vector<std::uint8_t>& data
	       , std::string const& s
	       ) {
	if (s.size() > 90)
		return Encoding::Invalid;

	auto lower = false;
	auto upper = false;
	for (auto c : s) {
		if (std::uint8_t(c) < 33 || std::uint8_t(c) > 126)
			return Encoding::Invalid;
		if ('a' <= c && c <= 'z')
			lower = true;
		if ('A' <= c && c <= 'Z')
			upper = true;
	}
	if (lower && upper)
		return Encoding::Invalid;

	/* The last `1` is the separator; the hrp may contain `1`s.  */
	auto sep = s.rfind('1');
	if (sep == std::string::npos || sep == 0 || s.size() - sep - 1 < 6)
		return Encoding::Invalid;

	auto my_hrp = s.substr(0, sep);
	std::transform( my_hrp.begin(), my_hrp.end(), my_hrp.begin()
		      , [](char c) {
		return ('A' <= c && c <= 'Z') ? char(c - 'A' + 'a') : c;
	});

	auto values = std::vector<std::uint8_t>();
	for (auto i = sep + 1; i < s.size(); ++i) {
		auto v = decode_char(s[i]);
		if (v < 0)
			return Encoding::Invalid;
		values.push_back(std::uint8_t(v));
	}

	auto check = hrp_expand(my_hrp);
	check.insert(check.end(), values.begin(), values.end());
	auto residue = polymod(check);

	auto enc = Encoding::Invalid;
	if (residue == bech32_const)
		enc = Encoding::Bech32;
	else if (residue == bech32m_const)
		enc = Encoding::Bech32m;
	else
		return Encoding::Invalid;

	values.resize(values.size() - 6);
	hrp = std::move(my_hrp);
	data = std::move(values);
	return enc;
}

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data
		  , Encoding encoding
		  ) {
	if (encoding == Encoding::Invalid)
		throw Util::BacktraceException<std::invalid_argument>(
			"Util::Bech32::encode: no encoding given"
		);
	if (hrp.empty() || hrp.size() + 1 + data.size() + 6 > 90)
		throw Util::BacktraceException<std::invalid_argument>(
			"Util::Bech32::encode: length out of range"
		);
	for (auto c : hrp)
		if (std::uint8_t(c) < 33 || std::uint8_t(c) > 126
		 || ('A' <= c && c <= 'Z'))
			throw Util::BacktraceException<std::invalid_argument>(
				"Util::Bech32::encode: hrp must be lowercase printable"
			);

	auto check = hrp_expand(hrp);
	check.insert(check.end(), data.begin(), data.end());
	check.resize(check.size() + 6, 0);
	auto mod = polymod(check) ^ const_of(encoding);

	auto ret = hrp + "1";
	for (auto v : data) {
		if (v > 31)
			throw Util::BacktraceException<std::invalid_argument>(
				"Util::Bech32::encode: value exceeds 5 bits"
			);
		ret.push_back(charset[v]);
	}
	for (auto i = 0; i < 6; ++i)
		ret.push_back(charset[(mod >> (5 * (5 - i))) & 0x1f]);
	return ret;
}

bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , unsigned int from
		 , unsigned int to
		 , bool pad
		 ) {
	auto acc = std::uint32_t(0);
	auto bits = 0u;
	auto const maxv = (std::uint32_t(1) << to) - 1;
	auto const max_acc = (std::uint32_t(1) << (from + to - 1)) - 1;

	for (auto v : in) {
		if ((std::uint32_t(v) >> from) != 0)
			return false;
		acc = ((acc << from) | v) & max_acc;
		bits += from;
		while (bits >= to) {
			bits -= to;
			out.push_back(std::uint8_t((acc >> bits) & maxv));
		}
	}

	if (pad) {
		if (bits > 0)
			out.push_back(std::uint8_t((acc << (to - bits)) & maxv));
	} else if (bits >= from || ((acc << (to - bits)) & maxv) != 0) {
		return false;
	}
	return true;
}

}}
