#ifndef BITCOIN_VARINT_HPP
#define BITCOIN_VARINT_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin { namespace Detail {

void put_compact(std::ostream&, std::uint64_t);
std::uint64_t get_compact(std::istream&);

class VarIntConst {
private:
	std::uint64_t v;

public:
	explicit
	VarIntConst(std::uint64_t v_) : v(v_) { }

	friend
	std::ostream& operator<<(std::ostream& os, VarIntConst o) {
		put_compact(os, o.v);
		return os;
	}
};

class VarInt {
private:
	std::uint64_t& v;

public:
	explicit
	VarInt(std::uint64_t& v_) : v(v_) { }

	friend
	std::istream& operator>>(std::istream& is, VarInt o) {
		o.v = get_compact(is);
		return is;
	}
	friend
	std::ostream& operator<<(std::ostream& os, VarInt o) {
		return os << VarIntConst(o.v);
	}
};

}}

namespace Bitcoin {

/** Bitcoin::varint
 *
 * @brief wraps a count so it goes through a
 * stream as a Bitcoin CompactSize.
 *
 * @desc
 *
 *     os << Bitcoin::varint(tx.outputs.size());
 *
 * A truncated read sets failbit.
 */
inline
Detail::VarInt varint(std::uint64_t& v) { return Detail::VarInt(v); }
inline
Detail::VarIntConst varint(std::uint64_t const& v) { return Detail::VarIntConst(v); }

/* Largest byte string a reader will allocate for.
 * Nothing in a valid transaction exceeds a block.  */
std::uint64_t constexpr max_byte_string = 4000000;

/* CompactSize length, then the bytes.  */
void write_prefixed(std::ostream&, std::vector<std::uint8_t> const&);
/* Sets failbit, leaving `out` empty, if the length
 * is over max_byte_string or the input runs out.  */
void read_prefixed(std::istream&, std::vector<std::uint8_t>& out);

}

#endif /* !defined(BITCOIN_VARINT_HPP) */
